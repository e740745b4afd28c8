#pragma once

/// @file include/wxs/recommendation.hpp
/// @brief RecommendationMapper: scores to ordered categorical bands.
///
/// # Module: Recommendation Mapper
///
/// ## Banding
/// Band i of a continuous index covers [edge_i, edge_{i+1}). A value within
/// BAND_EDGE_TOLERANCE below an edge counts as on the edge, so boundary ties
/// always resolve to the higher band: the more severe band for risk indices,
/// the more favourable band for quality indices.
///
/// ## Monotonicity
/// Ordinals are non-decreasing in value. For quality indices a higher ordinal
/// is better; for risk indices a higher ordinal is worse.
///
/// ## Aggregation (summarize)
///   - risk:        maximum value (worst hour)
///   - quality:     mean of available values
///   - categorical: heaviest category
/// Degraded results are skipped; nothing available means no recommendation.

#include "wxs/catalog.hpp"
#include "wxs/scoring.hpp"

#include <array>
#include <optional>
#include <span>
#include <string>

namespace wxs::recommend {

struct Recommendation {
    catalog::IndexId            index    = catalog::IndexId::DayQuality;
    std::string                 label;
    std::size_t                 ordinal  = 0;
    catalog::Polarity           polarity = catalog::Polarity::Quality;
    std::optional<EpochSeconds> timestamp;  ///< unset for summaries
    double                      confidence = 0.0;

    bool operator==(const Recommendation&) const = default;
};

class RecommendationMapper {
public:
    /// Band scales are taken from `params` (usually the resolved profile's).
    RecommendationMapper(const catalog::IndexCatalog& catalog,
                         const catalog::CatalogParameters& params);

    /// Ordinal of `value` on the scale of `index`. Precondition: the index is
    /// continuous.
    [[nodiscard]] std::size_t band_of(catalog::IndexId index, double value) const;

    /// Recommendation for one result, or nullopt if it is degraded.
    [[nodiscard]] std::optional<Recommendation> map(const scoring::ScoreResult& result) const;

    /// Aggregate the results of `index` found in `results`.
    [[nodiscard]] std::optional<Recommendation>
    summarize(std::span<const scoring::ScoreResult> results, catalog::IndexId index) const;

    [[nodiscard]] const catalog::BandScale& scale(catalog::IndexId index) const noexcept {
        return scales_[static_cast<std::size_t>(index)];
    }

private:
    [[nodiscard]] Recommendation make(catalog::IndexId index, std::size_t ordinal) const;

    const catalog::IndexCatalog&                              catalog_;
    std::array<catalog::BandScale, catalog::INDEX_COUNT>      scales_;
};

}  // namespace wxs::recommend
