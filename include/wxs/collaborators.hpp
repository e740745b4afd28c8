#pragma once

/// @file include/wxs/collaborators.hpp
/// @brief Narrow interfaces to ingestion and storage, plus an in-memory store.
///
/// The scoring core never performs I/O itself. Samples arrive through a
/// SampleSource; normalised series and user profiles live in a SeriesStore.
/// Both are synchronous. Stored values are immutable, so a store needs no
/// transactions.

#include "wxs/normalizer.hpp"
#include "wxs/profile.hpp"
#include "wxs/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wxs::core {

/// Ingestion collaborator.
class SampleSource {
public:
    virtual ~SampleSource() = default;

    /// Raw samples for `location_id` within `range`.
    ///
    /// # Throws
    /// TransientNetworkError on retrievable failures. Retrying is the
    /// caller's decision.
    [[nodiscard]] virtual std::vector<WeatherSample>
    fetch_samples(const std::string& location_id, TimeRange range) = 0;
};

/// Storage collaborator.
class SeriesStore {
public:
    virtual ~SeriesStore() = default;

    /// `nullptr` if nothing is stored for `location_id`.
    [[nodiscard]] virtual std::shared_ptr<const NormalizedSeries>
    get_series(const std::string& location_id) const = 0;

    virtual void put_series(const std::string& location_id, NormalizedSeries series) = 0;

    [[nodiscard]] virtual std::optional<profile::UserProfile>
    get_profile(const std::string& user_id) const = 0;

    virtual void put_profile(profile::UserProfile profile) = 0;
};

/// Thread-safe map-backed store. Readers receive shared snapshots that stay
/// valid after the entry is replaced.
class InMemoryStore final : public SeriesStore {
public:
    [[nodiscard]] std::shared_ptr<const NormalizedSeries>
    get_series(const std::string& location_id) const override;

    void put_series(const std::string& location_id, NormalizedSeries series) override;

    [[nodiscard]] std::optional<profile::UserProfile>
    get_profile(const std::string& user_id) const override;

    void put_profile(profile::UserProfile profile) override;

private:
    mutable std::mutex                                             mutex_;
    std::map<std::string, std::shared_ptr<const NormalizedSeries>> series_;
    std::map<std::string, profile::UserProfile>                    profiles_;
};

}  // namespace wxs::core
