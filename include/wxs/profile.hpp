#pragma once

/// @file include/wxs/profile.hpp
/// @brief UserProfileResolver: validates user weights and thresholds.
///
/// # Module: User Profile Resolver
///
/// ## Responsibility
/// Check a raw UserProfile against the enumerated keys of the catalog and
/// produce the immutable ResolvedParameters the formulas consume.
///
/// ## Weights
/// Recognised keys (see catalog::weight_specs()):
///   day_quality: temperature (temp), wind, precipitation (rain), fog
///   visibility:  visibility.fog, visibility.cloud, visibility.precipitation
///
/// Each weight must lie in [0, 1]. If a profile names at least one weight of
/// an index, the unnamed weights of that index are 0; if it names none, the
/// catalog defaults apply. Weights are then rescaled to sum to 1.
///
/// ## Thresholds
/// Only keys with ParameterScope::UserThreshold are accepted. Thresholds not
/// given keep the catalog defaults. Paired thresholds (the comfort
/// temperature range) are given both or neither; one without the other is a
/// missing required threshold when its index is requested.
///
/// ## Failure modes
/// ConfigurationError for: unknown key, weight outside [0, 1] or non-finite,
/// the same weight given twice via an alias, catalog-only key used as a
/// threshold, missing required threshold, inconsistent thresholds, or all
/// weights of a requested index zero.

#include "wxs/catalog.hpp"

#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace wxs::profile {

/// Raw, user-owned preferences. Persisted by the storage collaborator.
struct UserProfile {
    std::string                   user_id;
    std::map<std::string, double> weights;     ///< weight key → [0, 1]
    std::map<std::string, double> thresholds;  ///< parameter key → value

    bool operator==(const UserProfile&) const = default;
};

/// Canonical, immutable result of resolution. Cheap to copy.
struct ResolvedProfile {
    std::string                                          user_id;
    std::vector<catalog::IndexId>                        indices;
    std::shared_ptr<const catalog::ResolvedParameters>   parameters;
};

class UserProfileResolver {
public:
    explicit UserProfileResolver(const catalog::IndexCatalog& catalog) noexcept
        : catalog_(catalog) {}

    /// Resolve `profile` for the indices in `requested` (empty means all).
    ///
    /// # Throws
    /// ConfigurationError as described above.
    [[nodiscard]] ResolvedProfile resolve(const UserProfile& profile,
                                          std::span<const catalog::IndexId> requested) const;

private:
    const catalog::IndexCatalog& catalog_;
};

}  // namespace wxs::profile
