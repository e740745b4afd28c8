/// @file src/profile/profile_resolver.cpp
/// @brief UserProfileResolver implementation.

#include "wxs/profile.hpp"
#include "wxs/errors.hpp"
#include "wxs/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace wxs::profile {

using catalog::IndexId;

namespace {

/// Weight vector of one index, tracking which slots the profile set.
template <typename Vector>
struct WeightDraft {
    Vector                       values = Vector::Zero();
    std::array<std::string, 4>   set_by{};  ///< key that set each slot, empty if unset
    bool                         any    = false;
};

template <typename Vector>
void assign(WeightDraft<Vector>& draft, const catalog::WeightSpec& spec,
            const std::string& key, double value) {
    auto& previous = draft.set_by[spec.slot];
    if (!previous.empty()) {
        throw ConfigurationError(
            key, fmt::format("weight already given as '{}'", previous));
    }
    previous = key;
    draft.values[static_cast<Eigen::Index>(spec.slot)] = value;
    draft.any = true;
}

/// Defaults when the profile named nothing, then rescale to sum 1.
template <typename Vector>
Vector finish(const WeightDraft<Vector>& draft, const Vector& defaults,
              IndexId index, bool requested) {
    Vector w = draft.any ? draft.values : defaults;
    const double total = w.sum();
    if (total <= 0.0) {
        if (requested) {
            throw ConfigurationError(
                fmt::format("{}.weights", catalog::to_string(index)),
                "all weights are zero");
        }
        return Vector::Zero();
    }
    return w / total;
}

}  // namespace

ResolvedProfile UserProfileResolver::resolve(const UserProfile& profile,
                                             std::span<const IndexId> requested) const {
    std::vector<IndexId> indices(requested.begin(), requested.end());
    if (indices.empty()) {
        indices.assign(catalog::ALL_INDICES.begin(), catalog::ALL_INDICES.end());
    }
    std::set<IndexId> seen;
    for (IndexId id : indices) {
        if (!seen.insert(id).second) {
            throw ConfigurationError(
                "indices", fmt::format("index '{}' requested twice", catalog::to_string(id)));
        }
    }
    auto is_requested = [&](IndexId id) {
        return std::find(indices.begin(), indices.end(), id) != indices.end();
    };

    const auto& defaults = catalog_.parameters();

    // ── weights ──────────────────────────────────────────────────────────────
    WeightDraft<DayQualityWeights> day;
    WeightDraft<VisibilityWeights> vis;
    for (const auto& [key, value] : profile.weights) {
        const catalog::WeightSpec* spec = catalog::find_weight(key);
        if (spec == nullptr) {
            throw ConfigurationError(key, "unknown weight key");
        }
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            throw ConfigurationError(key, fmt::format("weight {} is outside [0, 1]", value));
        }
        if (spec->index == IndexId::DayQuality) {
            assign(day, *spec, key, value);
        } else {
            assign(vis, *spec, key, value);
        }
    }

    // ── thresholds ───────────────────────────────────────────────────────────
    auto resolved = std::make_shared<catalog::ResolvedParameters>();
    resolved->params = defaults;

    for (const auto& [key, value] : profile.thresholds) {
        const catalog::ParameterSpec* spec = catalog::find_parameter(key);
        if (spec == nullptr) {
            throw ConfigurationError(key, "unknown threshold key");
        }
        if (spec->scope != catalog::ParameterScope::UserThreshold) {
            throw ConfigurationError(key, "parameter cannot be set from a user profile");
        }
        if (!std::isfinite(value)) {
            throw ConfigurationError(key, "threshold must be finite");
        }
        spec->set(resolved->params, value);
    }

    // Paired bounds: both or neither.
    for (const auto& spec : catalog::parameter_specs()) {
        if (spec.paired_with.empty() || !is_requested(spec.index)) continue;
        const bool has_self    = profile.thresholds.count(std::string(spec.key)) != 0;
        const bool has_partner = profile.thresholds.count(std::string(spec.paired_with)) != 0;
        if (has_partner && !has_self) {
            throw ConfigurationError(
                std::string(spec.key),
                fmt::format("required threshold missing for index '{}': '{}' was given without it",
                            catalog::to_string(spec.index), spec.paired_with));
        }
    }

    catalog::validate_parameters(resolved->params);
    resolved->clothing_rules = catalog::standard_rules(resolved->params.clothing);
    catalog::validate_rules(resolved->clothing_rules);

    resolved->day_quality_weights = finish(day, defaults.day_quality.default_weights,
                                           IndexId::DayQuality, is_requested(IndexId::DayQuality));
    resolved->visibility_weights  = finish(vis, defaults.visibility.default_weights,
                                           IndexId::Visibility, is_requested(IndexId::Visibility));

    WXS_DEBUG("resolved profile '{}' for {} indices ({} weights, {} thresholds)",
              profile.user_id, indices.size(), profile.weights.size(), profile.thresholds.size());

    return ResolvedProfile{profile.user_id, std::move(indices), std::move(resolved)};
}

}  // namespace wxs::profile
