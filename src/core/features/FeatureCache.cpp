#include "FeatureCache.hpp"

namespace photo_pairing::features {

FeatureCache::Entry FeatureCache::find(const PhotoIdentity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return nullptr;
    }
    ++hits_;
    return it->second;
}

FeatureCache::Entry FeatureCache::insert(const PhotoIdentity& identity, FeatureSet features) {
    auto entry = std::make_shared<const FeatureSet>(std::move(features));
    std::lock_guard<std::mutex> lock(mutex_);
    const auto result = entries_.emplace(identity, entry);
    return result.first->second;
}

FeatureCache::Entry FeatureCache::getOrCompute(const PhotoIdentity& identity,
                                               const std::function<FeatureSet()>& compute) {
    if (auto cached = find(identity)) {
        return cached;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++misses_;
    }
    return insert(identity, compute());
}

size_t FeatureCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void FeatureCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

size_t FeatureCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t FeatureCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace photo_pairing::features
