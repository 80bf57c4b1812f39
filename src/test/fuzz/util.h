// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_TEST_FUZZ_UTIL_H
#define BITWIRE_TEST_FUZZ_UTIL_H

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

/**
 * FuzzedDataProvider - Split one fuzz input into structured pieces
 *
 * Consumption is deterministic in the input; reads past the end yield
 * shorter (possibly empty) results.
 */
class FuzzedDataProvider {
private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;

public:
    FuzzedDataProvider(const uint8_t* data, size_t size)
        : data_(data), size_(size), offset_(0) {}

    size_t remaining_bytes() const {
        return size_ > offset_ ? size_ - offset_ : 0;
    }

    /**
     * Consume bytes into a vector (up to max_length)
     */
    std::vector<uint8_t> ConsumeBytes(size_t max_length) {
        size_t length = std::min(max_length, remaining_bytes());
        std::vector<uint8_t> result(data_ + offset_, data_ + offset_ + length);
        offset_ += length;
        return result;
    }

    std::string ConsumeRemainingAsString() {
        std::vector<uint8_t> bytes = ConsumeBytes(remaining_bytes());
        return std::string(bytes.begin(), bytes.end());
    }
};

/**
 * Helper: Extract fixed-size array from fuzz input
 */
template<size_t N>
inline bool ConsumeFixedBytes(FuzzedDataProvider& provider, uint8_t (&output)[N]) {
    if (provider.remaining_bytes() < N) {
        return false;
    }
    std::vector<uint8_t> bytes = provider.ConsumeBytes(N);
    std::memcpy(output, bytes.data(), N);
    return true;
}

#endif // BITWIRE_TEST_FUZZ_UTIL_H
