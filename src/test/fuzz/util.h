// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_TEST_FUZZ_UTIL_H
#define ABIFUZZ_TEST_FUZZ_UTIL_H

#include <abi/type.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

/**
 * FuzzedDataProvider - Consume fuzz input in structured ways
 *
 * Every accessor is total: once the input is exhausted it returns zero
 * values, so targets never need to check remaining_bytes() for safety.
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

    uint8_t ConsumeUint8() {
        if (remaining_bytes() < 1) return 0;
        return data_[offset_++];
    }

    /**
     * Consume a 64-bit unsigned integer (big-endian, zero-padded when short)
     */
    uint64_t ConsumeUint64() {
        uint64_t result = 0;
        for (int i = 0; i < 8; ++i) {
            result = (result << 8) | ConsumeUint8();
        }
        return result;
    }

    bool ConsumeBool() {
        return ConsumeUint8() & 1;
    }

    /**
     * Consume integer in range [min, max]
     */
    size_t ConsumeSizeInRange(size_t min, size_t max) {
        if (min >= max) return min;
        return min + static_cast<size_t>(ConsumeUint8()) % (max - min + 1);
    }

    std::vector<uint8_t> ConsumeBytes(size_t max_length) {
        size_t length = std::min(max_length, remaining_bytes());
        std::vector<uint8_t> result(data_ + offset_, data_ + offset_ + length);
        offset_ += length;
        return result;
    }

    std::string ConsumeRemainingAsString() {
        auto bytes = ConsumeBytes(remaining_bytes());
        return std::string(bytes.begin(), bytes.end());
    }
};

/**
 * Helper: Build a type descriptor tree from fuzz input
 *
 * Containers nest at most max_depth levels; fixed arrays and tuples stay
 * small so that generated values remain cheap to mutate and encode.
 */
inline AbiTypePtr ConsumeAbiType(FuzzedDataProvider& provider, int max_depth = 3) {
    int choice = provider.ConsumeUint8() % (max_depth > 0 ? 10 : 7);
    switch (choice) {
        case 0: return CAbiType::Bool();
        case 1: return CAbiType::Address();
        case 2: return CAbiType::String();
        case 3: return CAbiType::Bytes();
        case 4: return CAbiType::FixedBytes(provider.ConsumeSizeInRange(1, ABI_MAX_FIXED_BYTES));
        case 5: return CAbiType::Int(8 * provider.ConsumeSizeInRange(1, ABI_MAX_INTEGER_BITS / 8));
        case 6: return CAbiType::Uint(8 * provider.ConsumeSizeInRange(1, ABI_MAX_INTEGER_BITS / 8));
        case 7: return CAbiType::Array(ConsumeAbiType(provider, max_depth - 1), provider.ConsumeSizeInRange(1, 4));
        case 8: return CAbiType::Slice(ConsumeAbiType(provider, max_depth - 1));
        default: {
            std::vector<CAbiTupleField> fields;
            size_t count = provider.ConsumeSizeInRange(1, 3);
            bool named = provider.ConsumeBool();
            for (size_t i = 0; i < count; ++i) {
                std::string name = named ? "f" + std::to_string(i) : std::string();
                fields.push_back(CAbiTupleField{name, ConsumeAbiType(provider, max_depth - 1)});
            }
            return CAbiType::Tuple(std::move(fields));
        }
    }
}

#endif // ABIFUZZ_TEST_FUZZ_UTIL_H
