// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#include <primitives/codec_error.h>
#include <util/logging.h>

const char* CodecErrorString(CodecError error) {
    switch (error) {
        case CodecError::NONE: return "none";
        case CodecError::INSUFFICIENT_BYTES: return "insufficient bytes";
        case CodecError::INVALID_FORMAT: return "invalid format";
    }
    return "unknown";
}

bool DecodeFailure(CodecError* error, CodecError kind, const char* field, size_t offset) {
    LogPrintCodec(DEBUG, "Decode failed: %s at offset %zu (%s)", field, offset, CodecErrorString(kind));
    if (error) *error = kind;
    return false;
}
