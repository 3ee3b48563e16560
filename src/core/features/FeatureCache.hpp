#pragma once

#include "photo_pairing/types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace photo_pairing::features {

/**
 * @brief FeatureSets of one report run, keyed by photo identity
 *
 * Entries are immutable once inserted and may be shared freely between
 * threads. A changed file has a different identity and misses the cache.
 */
class FeatureCache {
public:
    using Entry = std::shared_ptr<const FeatureSet>;

    Entry find(const PhotoIdentity& identity) const;

    /// Insert unless present; returns the entry that ends up cached.
    Entry insert(const PhotoIdentity& identity, FeatureSet features);

    /**
     * @brief Cached entry, or the result of @p compute (which then gets cached)
     *
     * @p compute runs without the lock held. Exceptions propagate and nothing
     * is cached.
     */
    Entry getOrCompute(const PhotoIdentity& identity, const std::function<FeatureSet()>& compute);

    size_t size() const;
    void clear();

    size_t hits() const;
    size_t misses() const;

private:
    mutable std::mutex mutex_;
    std::map<PhotoIdentity, Entry> entries_;
    mutable size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace photo_pairing::features
