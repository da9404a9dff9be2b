// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <valuegeneration/mutation.h>
#include <valuegeneration/errors.h>
#include <valuegeneration/generation.h>
#include <valuegeneration/mutating_generator.h>
#include <valuegeneration/random_generator.h>
#include <valuegeneration/value_generator.h>
#include <util/logging.h>
#include <util/random.h>
#include <util/strencodings.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

/** Largest donor requested from the generator for a splice */
const size_t MAX_SPLICE_DONOR = 32;

enum class NodeAction {
    KEEP,
    REGENERATE,
    RESIZE,
    MUTATE
};

/**
 * Insert or delete one unit so the length moves within [min, max].
 * A sequence already outside the bounds may only move towards them.
 * @return false if neither direction is allowed
 */
template <typename T, typename MakeUnit>
bool ResizeSequence(std::vector<T>& seq, uint64_t min, uint64_t max, CRandomContext& random, MakeUnit make_unit) {
    bool can_grow = seq.size() < max;
    bool can_shrink = seq.size() > min;
    if (!can_grow && !can_shrink) {
        return false;
    }

    bool grow = can_grow && (!can_shrink || random.RandBool());
    if (grow) {
        size_t pos = random.RandRange(0, seq.size());
        seq.insert(seq.begin() + pos, make_unit());
    } else {
        seq.erase(seq.begin() + random.RandIndex(seq.size()));
    }
    return true;
}

/**
 * Perturb a dynamic sequence in place: substitute one unit, splice a chunk
 * of donor over it, or truncate it. Never grows past max(max, size) nor
 * truncates below min.
 */
template <typename T, typename MakeUnit, typename MakeDonor>
void PerturbSequence(std::vector<T>& seq, uint64_t min, uint64_t max, CRandomContext& random,
                     MakeUnit make_unit, MakeDonor make_donor) {
    const size_t limit = std::max<size_t>(seq.size(), max);

    std::vector<int> ops;
    if (!seq.empty()) ops.push_back(0);   // substitute
    if (limit > 0) ops.push_back(1);      // splice
    if (seq.size() > min) ops.push_back(2);  // truncate
    if (ops.empty()) {
        return;
    }

    switch (ops[random.RandIndex(ops.size())]) {
        case 0:
            seq[random.RandIndex(seq.size())] = make_unit();
            break;
        case 1: {
            std::vector<T> donor = make_donor();
            if (donor.empty()) {
                break;
            }
            size_t start = random.RandIndex(donor.size());
            size_t pos = random.RandRange(0, std::min(seq.size(), limit - 1));
            size_t chunk = random.RandRange(1, std::min(donor.size() - start, limit - pos));

            if (pos + chunk > seq.size()) {
                seq.resize(pos + chunk);
            }
            std::copy(donor.begin() + start, donor.begin() + start + chunk, seq.begin() + pos);
            break;
        }
        case 2:
            seq.resize(random.RandRange(min, seq.size() - 1));
            break;
    }
}

class CValueMutator {
public:
    CValueMutator(CValueGenerator& generator, const CMutationConfig& config)
        : m_generator(generator), m_config(config), m_random(generator.GetRandom()) {}

    CAbiValue MutateNode(const CAbiType& type, const CAbiValue& value);

private:
    NodeAction ChooseAction(const CAbiType& type);
    CAbiValue Regenerate(const CAbiType& type);
    CAbiValue MutateChildren(const CAbiType& type, const CAbiValue& value);
    CAbiValue Resize(const CAbiType& type, const CAbiValue& value);
    CAbiValue PerturbLeaf(const CAbiType& type, const CAbiValue& value);

    AbiInt PerturbInteger(const AbiInt& value, bool is_signed, size_t bits);
    void PerturbFixedBytes(std::vector<uint8_t>& bytes);
    void PerturbBytes(std::vector<uint8_t>& bytes);
    void PerturbString(std::string& str);

    CAbiValue Finalize(const CAbiType& type, CAbiValue value) {
        m_generator.ObserveValue(type, value);
        return value;
    }

    CValueGenerator& m_generator;
    const CMutationConfig& m_config;
    CRandomContext& m_random;
};

NodeAction CValueMutator::ChooseAction(const CAbiType& type) {
    double roll = m_random.RandDouble();

    if (roll < m_config.keep_probability) {
        return NodeAction::KEEP;
    }
    roll -= m_config.keep_probability;

    if (roll < m_config.regenerate_probability) {
        return NodeAction::REGENERATE;
    }
    roll -= m_config.regenerate_probability;

    if (roll < m_config.resize_probability && type.IsDynamicLength()) {
        return NodeAction::RESIZE;
    }
    return NodeAction::MUTATE;
}

CAbiValue CValueMutator::MutateNode(const CAbiType& type, const CAbiValue& value) {
    switch (ChooseAction(type)) {
        case NodeAction::KEEP:
            return Finalize(type, value);
        case NodeAction::REGENERATE:
            return Regenerate(type);
        case NodeAction::RESIZE:
            return Resize(type, value);
        case NodeAction::MUTATE:
            return type.IsLeaf() ? PerturbLeaf(type, value) : MutateChildren(type, value);
    }
    return value;
}

CAbiValue CValueMutator::Regenerate(const CAbiType& type) {
    return Finalize(type, GenerateAbiValue(m_generator, type));
}

CAbiValue CValueMutator::MutateChildren(const CAbiType& type, const CAbiValue& value) {
    CAbiValue result = value;
    std::vector<CAbiValue>& elements = result.GetElements();

    switch (type.GetKind()) {
        case AbiKind::ARRAY:
        case AbiKind::SLICE:
            for (CAbiValue& element : elements) {
                element = MutateNode(*type.GetElem(), element);
            }
            return result;
        case AbiKind::TUPLE: {
            const std::vector<CAbiTupleField>& fields = type.GetFields();
            for (size_t i = 0; i < fields.size(); ++i) {
                elements[i] = MutateNode(*fields[i].type, elements[i]);
            }
            return result;
        }
        case AbiKind::BOOL:
        case AbiKind::ADDRESS:
        case AbiKind::STRING:
        case AbiKind::BYTES:
        case AbiKind::FIXED_BYTES:
        case AbiKind::INT:
        case AbiKind::UINT:
            return PerturbLeaf(type, value);
    }
    return result;
}

CAbiValue CValueMutator::Resize(const CAbiType& type, const CAbiValue& value) {
    const CGeneratorConfig& bounds = m_generator.GetConfig();

    switch (type.GetKind()) {
        case AbiKind::SLICE: {
            std::vector<CAbiValue> elements = value.GetElements();
            const CAbiType& elem = *type.GetElem();
            bool resized = ResizeSequence(elements, bounds.array_min_size, bounds.array_max_size, m_random,
                                          [&]() { return Regenerate(elem); });
            if (!resized) {
                return MutateChildren(type, value);
            }
            return CAbiValue::FromSlice(std::move(elements));
        }
        case AbiKind::BYTES: {
            std::vector<uint8_t> bytes = value.GetBytes();
            bool resized = ResizeSequence(bytes, bounds.bytes_min_size, bounds.bytes_max_size, m_random,
                                          [&]() { return static_cast<uint8_t>(m_random.Rand64() & 0xff); });
            if (!resized) {
                return PerturbLeaf(type, value);
            }
            return Finalize(type, CAbiValue::FromBytes(std::move(bytes)));
        }
        case AbiKind::STRING: {
            std::vector<std::string> chars = SplitUtf8(value.GetString());
            bool resized = ResizeSequence(chars, bounds.string_min_size, bounds.string_max_size, m_random,
                                          [&]() { return std::string(1, RandomPrintableChar(m_random)); });
            if (!resized) {
                return PerturbLeaf(type, value);
            }
            std::string joined;
            for (const std::string& c : chars) joined += c;
            return Finalize(type, CAbiValue::FromString(std::move(joined)));
        }
        case AbiKind::BOOL:
        case AbiKind::ADDRESS:
        case AbiKind::FIXED_BYTES:
        case AbiKind::INT:
        case AbiKind::UINT:
            return PerturbLeaf(type, value);
        case AbiKind::ARRAY:
        case AbiKind::TUPLE:
            return MutateChildren(type, value);
    }
    return value;
}

CAbiValue CValueMutator::PerturbLeaf(const CAbiType& type, const CAbiValue& value) {
    switch (type.GetKind()) {
        case AbiKind::BOOL:
            return Finalize(type, CAbiValue::FromBool(!value.GetBool()));
        case AbiKind::INT:
        case AbiKind::UINT: {
            bool is_signed = type.GetKind() == AbiKind::INT;
            return Finalize(type, CAbiValue::FromInteger(
                                      is_signed, PerturbInteger(value.GetInteger(), is_signed, type.GetSize())));
        }
        case AbiKind::ADDRESS: {
            std::vector<uint8_t> bytes = value.GetBytes();
            PerturbFixedBytes(bytes);
            return Finalize(type, CAbiValue::FromAddress(std::move(bytes)));
        }
        case AbiKind::FIXED_BYTES: {
            std::vector<uint8_t> bytes = value.GetBytes();
            PerturbFixedBytes(bytes);
            return Finalize(type, CAbiValue::FromFixedBytes(std::move(bytes)));
        }
        case AbiKind::BYTES: {
            std::vector<uint8_t> bytes = value.GetBytes();
            PerturbBytes(bytes);
            return Finalize(type, CAbiValue::FromBytes(std::move(bytes)));
        }
        case AbiKind::STRING: {
            std::string str = value.GetString();
            PerturbString(str);
            return Finalize(type, CAbiValue::FromString(std::move(str)));
        }
        case AbiKind::ARRAY:
        case AbiKind::SLICE:
        case AbiKind::TUPLE:
            return MutateChildren(type, value);
    }
    return value;
}

AbiInt CValueMutator::PerturbInteger(const AbiInt& value, bool is_signed, size_t bits) {
    switch (m_random.RandRange(0, 2)) {
        case 0: {
            // Small additive delta
            AbiInt delta = m_random.RandRange(1, static_cast<uint64_t>(m_config.max_integer_delta));
            return WrapInteger(m_random.RandBool() ? AbiInt(value + delta) : AbiInt(value - delta), is_signed, bits);
        }
        case 1: {
            // Single bit flip on the two's-complement representation
            AbiInt raw = WrapInteger(value, false, bits);
            boost::multiprecision::bit_flip(raw, static_cast<unsigned>(m_random.RandIndex(bits)));
            return WrapInteger(raw, is_signed, bits);
        }
        default:
            // Sign flip; wraps for the minimum signed value and for unsigned
            return WrapInteger(AbiInt(-value), is_signed, bits);
    }
}

void CValueMutator::PerturbFixedBytes(std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return;
    }

    size_t index = m_random.RandIndex(bytes.size());
    if (m_random.RandBool()) {
        bytes[index] = static_cast<uint8_t>(m_random.Rand64() & 0xff);
    } else {
        bytes[index] ^= static_cast<uint8_t>(1u << m_random.RandRange(0, 7));
    }
}

void CValueMutator::PerturbBytes(std::vector<uint8_t>& bytes) {
    const CGeneratorConfig& bounds = m_generator.GetConfig();
    PerturbSequence(
        bytes, bounds.bytes_min_size, bounds.bytes_max_size, m_random,
        [&]() { return static_cast<uint8_t>(m_random.Rand64() & 0xff); },
        [&]() { return m_generator.GenerateBytes(m_random.RandRange(1, MAX_SPLICE_DONOR)); });
}

void CValueMutator::PerturbString(std::string& str) {
    const CGeneratorConfig& bounds = m_generator.GetConfig();
    std::vector<std::string> chars = SplitUtf8(str);
    PerturbSequence(
        chars, bounds.string_min_size, bounds.string_max_size, m_random,
        [&]() { return std::string(1, RandomPrintableChar(m_random)); },
        [&]() { return SplitUtf8(m_generator.GenerateString(m_random.RandRange(1, MAX_SPLICE_DONOR))); });

    str.clear();
    for (const std::string& c : chars) str += c;
}

} // namespace

CAbiValue MutateAbiValue(CValueGenerator& generator, const CMutationConfig& config,
                         const CAbiType& type, const CAbiValue& value) {
    config.Validate();

    auto mismatch = value.FindShapeMismatch(type);
    if (mismatch) {
        LogPrintMutation(DEBUG, "Rejecting %s mutation target: %s", type.ToString().c_str(), mismatch->c_str());
        throw ShapeMismatchError(type.GetTypeKey(), *mismatch);
    }

    uint64_t rounds = generator.GetRandom().RandRange(static_cast<uint64_t>(config.min_rounds),
                                                      static_cast<uint64_t>(config.max_rounds));
    LogPrintMutation(DEBUG, "Mutating %s value for %llu round(s)", type.ToString().c_str(),
                     static_cast<unsigned long long>(rounds));

    CValueMutator mutator(generator, config);
    CAbiValue result = value;
    for (uint64_t round = 0; round < rounds; ++round) {
        result = mutator.MutateNode(type, result);
    }
    return result;
}

CAbiValue MutateAbiValue(CMutatingValueGenerator& generator, const CAbiType& type, const CAbiValue& value) {
    return MutateAbiValue(generator, generator.GetMutationConfig(), type, value);
}
