// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_VALUE_SET_H
#define ABIFUZZ_VALUEGENERATION_VALUE_SET_H

#include <abi/type.h>
#include <abi/value.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

class CRandomContext;

/**
 * CValueSet - corpus of previously observed leaf values
 *
 * Values are bucketed by type key (CAbiType::GetTypeKey()), so a uint8
 * seed is never offered for a uint16 request. Within a bucket entries are
 * unique by structural equality and keep insertion order, which keeps
 * Sample() reproducible for a given PRNG stream.
 *
 * The set only grows. It performs no locking: workers either own a set or
 * serialize their Add/Sample calls on a shared one. Copying a set gives a
 * worker its own snapshot.
 */
class CValueSet {
public:
    /**
     * Insert value under typeKey unless a structurally equal entry exists
     * @return true if the value was inserted
     */
    bool Add(const std::string& typeKey, const CAbiValue& value);

    /**
     * Add every leaf of a value tree under its own leaf type key
     * @return number of newly inserted leaves
     */
    size_t AddValueTree(const CAbiType& type, const CAbiValue& value);

    /**
     * Draw one entry uniformly for typeKey
     * @return std::nullopt if nothing is stored under typeKey
     */
    std::optional<CAbiValue> Sample(const std::string& typeKey, CRandomContext& random) const;

    bool Contains(const std::string& typeKey, const CAbiValue& value) const;

    /** Entries stored for typeKey */
    size_t Size(const std::string& typeKey) const;

    /** Entries across all keys */
    size_t TotalSize() const { return m_total; }

    std::vector<std::string> GetTypeKeys() const;

    /** Entries of one bucket, in insertion order */
    const std::vector<CAbiValue>& GetValues(const std::string& typeKey) const;

private:
    struct Bucket {
        std::vector<CAbiValue> values;
        std::set<std::string> fingerprints;
    };

    std::map<std::string, Bucket> m_buckets;
    size_t m_total{0};
};

#endif // ABIFUZZ_VALUEGENERATION_VALUE_SET_H
