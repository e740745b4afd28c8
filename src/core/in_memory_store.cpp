/// @file src/core/in_memory_store.cpp
/// @brief InMemoryStore implementation.

#include "wxs/collaborators.hpp"

#include <utility>

namespace wxs::core {

std::shared_ptr<const NormalizedSeries>
InMemoryStore::get_series(const std::string& location_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = series_.find(location_id);
    return it == series_.end() ? nullptr : it->second;
}

void InMemoryStore::put_series(const std::string& location_id, NormalizedSeries series) {
    auto snapshot = std::make_shared<const NormalizedSeries>(std::move(series));
    std::lock_guard<std::mutex> lock(mutex_);
    series_[location_id] = std::move(snapshot);
}

std::optional<profile::UserProfile>
InMemoryStore::get_profile(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = profiles_.find(user_id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryStore::put_profile(profile::UserProfile profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = profile.user_id;
    profiles_[key] = std::move(profile);
}

}  // namespace wxs::core
