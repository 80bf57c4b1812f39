// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#include "fuzz.h"
#include <primitives/compactsize.h>
#include <cassert>
#include <vector>

/**
 * Fuzz target: CompactSize decoding
 *
 * Tests:
 * - Decoding arbitrary bytes never reads past the buffer
 * - Consumed width matches the prefix byte
 * - Failed decodes leave the target untouched
 * - Re-encoding a decoded value gives the minimal form, which decodes
 *   back to the same value
 *
 * Coverage:
 * - src/primitives/compactsize.cpp
 */
FUZZ_TARGET(compactsize)
{
    const uint64_t sentinel = 0x5a5a5a5a5a5a5a5aULL;
    CCompactSize decoded(sentinel);
    size_t consumed = 0;
    CodecError error = CodecError::NONE;

    if (!decoded.Deserialize(data, size, &consumed, &error)) {
        assert(error == CodecError::INSUFFICIENT_BYTES);
        assert(decoded.nValue == sentinel);
        return;
    }

    assert(error == CodecError::NONE);
    assert(consumed <= size);
    switch (data[0]) {
        case CCompactSize::PREFIX_UINT16: assert(consumed == 3); break;
        case CCompactSize::PREFIX_UINT32: assert(consumed == 5); break;
        case CCompactSize::PREFIX_UINT64: assert(consumed == 9); break;
        default: assert(consumed == 1); break;
    }

    std::vector<uint8_t> minimal = decoded.Serialize();
    assert(minimal.size() == GetCompactSizeLength(decoded.nValue));
    assert(minimal.size() <= consumed);

    CCompactSize again;
    size_t again_consumed = 0;
    bool reparsed = again.Deserialize(minimal, &again_consumed);
    assert(reparsed);
    assert(again == decoded);
    assert(again_consumed == minimal.size());
}
