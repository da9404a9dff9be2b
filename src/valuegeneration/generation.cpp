// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <valuegeneration/generation.h>
#include <valuegeneration/value_generator.h>
#include <util/random.h>

#include <string>
#include <vector>

CAbiValue GenerateAbiValue(CValueGenerator& generator, const CAbiType& type) {
    CRandomContext& random = generator.GetRandom();
    const CGeneratorConfig& config = generator.GetConfig();

    switch (type.GetKind()) {
        case AbiKind::BOOL:
            return CAbiValue::FromBool(generator.GenerateBool());
        case AbiKind::ADDRESS:
            return CAbiValue::FromAddress(generator.GenerateAddress());
        case AbiKind::STRING: {
            size_t length = random.RandRange(config.string_min_size, config.string_max_size);
            return CAbiValue::FromString(generator.GenerateString(length));
        }
        case AbiKind::BYTES: {
            size_t length = random.RandRange(config.bytes_min_size, config.bytes_max_size);
            return CAbiValue::FromBytes(generator.GenerateBytes(length));
        }
        case AbiKind::FIXED_BYTES:
            return CAbiValue::FromFixedBytes(generator.GenerateFixedBytes(type.GetSize()));
        case AbiKind::INT:
            return CAbiValue::FromInteger(true, generator.GenerateInteger(true, type.GetSize()));
        case AbiKind::UINT:
            return CAbiValue::FromInteger(false, generator.GenerateInteger(false, type.GetSize()));
        case AbiKind::ARRAY:
        case AbiKind::SLICE: {
            size_t length = type.GetKind() == AbiKind::ARRAY
                                ? type.GetSize()
                                : random.RandRange(config.array_min_size, config.array_max_size);
            std::vector<CAbiValue> elements;
            elements.reserve(length);
            for (size_t i = 0; i < length; ++i) {
                elements.push_back(GenerateAbiValue(generator, *type.GetElem()));
            }
            return type.GetKind() == AbiKind::ARRAY ? CAbiValue::FromArray(std::move(elements))
                                                    : CAbiValue::FromSlice(std::move(elements));
        }
        case AbiKind::TUPLE: {
            std::vector<std::string> names;
            std::vector<CAbiValue> elements;
            names.reserve(type.GetFields().size());
            elements.reserve(type.GetFields().size());
            for (const CAbiTupleField& field : type.GetFields()) {
                names.push_back(field.name);
                elements.push_back(GenerateAbiValue(generator, *field.type));
            }
            return CAbiValue::FromTuple(std::move(names), std::move(elements));
        }
    }
    return CAbiValue();
}
