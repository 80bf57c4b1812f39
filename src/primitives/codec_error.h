// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_PRIMITIVES_CODEC_ERROR_H
#define BITWIRE_PRIMITIVES_CODEC_ERROR_H

#include <cstddef>

/**
 * Failure kinds reported by the decoders.
 *
 * Binary decode paths only ever report INSUFFICIENT_BYTES: the wire format
 * has no other ill-formed state. INVALID_FORMAT is used for content that is
 * present but malformed (identifier text, JSON documents).
 */
enum class CodecError {
    NONE = 0,
    INSUFFICIENT_BYTES,
    INVALID_FORMAT
};

/** Stable human-readable name for an error kind. */
const char* CodecErrorString(CodecError error);

/**
 * Record a decode failure: logs the failing field at DEBUG in the CODEC
 * category and stores the kind in *error when error is non-null.
 * @return always false, so decoders can `return DecodeFailure(...)`
 */
bool DecodeFailure(CodecError* error, CodecError kind, const char* field, size_t offset);

#endif // BITWIRE_PRIMITIVES_CODEC_ERROR_H
