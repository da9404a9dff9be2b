// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <valuegeneration/value_set.h>
#include <util/logging.h>
#include <util/random.h>

bool CValueSet::Add(const std::string& typeKey, const CAbiValue& value) {
    Bucket& bucket = m_buckets[typeKey];
    if (!bucket.fingerprints.insert(value.ToString()).second) {
        return false;  // Already present
    }

    bucket.values.push_back(value);
    m_total++;
    LogPrintCorpus(DEBUG, "Added %s seed (%zu stored)", typeKey.c_str(), bucket.values.size());
    return true;
}

size_t CValueSet::AddValueTree(const CAbiType& type, const CAbiValue& value) {
    switch (type.GetKind()) {
        case AbiKind::BOOL:
        case AbiKind::ADDRESS:
        case AbiKind::STRING:
        case AbiKind::BYTES:
        case AbiKind::FIXED_BYTES:
        case AbiKind::INT:
        case AbiKind::UINT:
            return Add(type.GetTypeKey(), value) ? 1 : 0;
        case AbiKind::ARRAY:
        case AbiKind::SLICE: {
            size_t added = 0;
            for (const CAbiValue& element : value.GetElements()) {
                added += AddValueTree(*type.GetElem(), element);
            }
            return added;
        }
        case AbiKind::TUPLE: {
            const std::vector<CAbiTupleField>& fields = type.GetFields();
            const std::vector<CAbiValue>& elements = value.GetElements();
            size_t added = 0;
            for (size_t i = 0; i < fields.size() && i < elements.size(); ++i) {
                added += AddValueTree(*fields[i].type, elements[i]);
            }
            return added;
        }
    }
    return 0;
}

std::optional<CAbiValue> CValueSet::Sample(const std::string& typeKey, CRandomContext& random) const {
    auto it = m_buckets.find(typeKey);
    if (it == m_buckets.end() || it->second.values.empty()) {
        return std::nullopt;
    }

    const std::vector<CAbiValue>& values = it->second.values;
    return values[random.RandIndex(values.size())];
}

bool CValueSet::Contains(const std::string& typeKey, const CAbiValue& value) const {
    auto it = m_buckets.find(typeKey);
    if (it == m_buckets.end()) {
        return false;
    }
    return it->second.fingerprints.count(value.ToString()) > 0;
}

size_t CValueSet::Size(const std::string& typeKey) const {
    auto it = m_buckets.find(typeKey);
    return it == m_buckets.end() ? 0 : it->second.values.size();
}

std::vector<std::string> CValueSet::GetTypeKeys() const {
    std::vector<std::string> keys;
    for (const auto& pair : m_buckets) {
        if (!pair.second.values.empty()) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

const std::vector<CAbiValue>& CValueSet::GetValues(const std::string& typeKey) const {
    static const std::vector<CAbiValue> empty;
    auto it = m_buckets.find(typeKey);
    return it == m_buckets.end() ? empty : it->second.values;
}
