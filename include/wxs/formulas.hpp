#pragma once

/// @file include/wxs/formulas.hpp
/// @brief The four index formulas.
///
/// Each formula is a pure function of one sample and the resolved parameters.
/// Callers check required fields first; a formula may still return nullopt
/// when the fields it does have carry zero total weight.

#include "wxs/catalog.hpp"

#include <optional>

namespace wxs::catalog::formulas {

/// Weighted mean of trapezoidal sub-scores for temperature, wind,
/// precipitation and fog, scaled to 0–100. Missing fog is dropped and the
/// remaining weights are renormalised; confidence is the weight mass used.
[[nodiscard]] std::optional<IndexOutput>
day_quality(const WeatherSample& s, const ResolvedParameters& r);

/// First-match clothing layer plus an exposure score: thermal exposure from
/// the effective temperature blended with precipitation exposure.
[[nodiscard]] std::optional<IndexOutput>
clothing(const WeatherSample& s, const ResolvedParameters& r);

/// Thermal stress on leaving the water:
///   stress = k_w · max(0, neutral − water) + k_v · wind · (1 − d · rh / 100)
/// Risk is stress scaled so that stress_at_max_risk maps to 100. Minutes to
/// discomfort decay exponentially with stress. Air temperature stands in for
/// a missing water temperature at reduced confidence; with neither there is
/// no result.
[[nodiscard]] std::optional<IndexOutput>
cold_shock(const WeatherSample& s, const ResolvedParameters& r);

/// 100 · (1 − w · [fog, cloud/100, precip/heavy]), capped by reported
/// visibility when present.
[[nodiscard]] std::optional<IndexOutput>
visibility(const WeatherSample& s, const ResolvedParameters& r);

}  // namespace wxs::catalog::formulas
