/**
 * @file  prop_score_range.cpp
 * @brief Property: every ScoreResult has value ∈ [0, 100] or is degraded,
 *        and confidence ∈ [0, 1], for any physically valid sample.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_score_range
 *
 * Samples are generated field by field. Each field is present or missing at
 * random; present values are drawn from the field's physical range, so every
 * generated sample passes TimeSeriesNormalizer::validate.
 */

#include <rapidcheck.h>

#include <cmath>
#include <optional>
#include <vector>

#include "wxs/scoring.hpp"

using namespace wxs;
using namespace wxs::catalog;

namespace {

/// Optional value in [lo, hi].
rc::Gen<std::optional<double>> maybe_in(double lo, double hi) {
    return rc::gen::map(
        rc::gen::pair(rc::gen::arbitrary<bool>(), rc::gen::inRange(0, 1'000'001)),
        [lo, hi](const std::pair<bool, int>& p) -> std::optional<double> {
            if (!p.first) return std::nullopt;
            return lo + (hi - lo) * static_cast<double>(p.second) / 1'000'000.0;
        });
}

WeatherSample draw_sample() {
    WeatherSample s;
    s.temperature       = *maybe_in(-40.0, 50.0);
    s.wind_speed        = *maybe_in(0.0, 150.0);
    s.precipitation     = *maybe_in(0.0, 60.0);
    s.cloud_cover       = *maybe_in(0.0, 100.0);
    s.fog_density       = *maybe_in(0.0, 1.0);
    s.visibility        = *maybe_in(0.0, 50'000.0);
    s.relative_humidity = *maybe_in(0.0, 100.0);
    s.water_temperature = *maybe_in(-2.0, 35.0);
    return s;
}

profile::ResolvedProfile resolved_profile() {
    profile::UserProfile p;
    p.user_id = "prop";
    p.thresholds = {
        {"day_quality.comfort_temperature_min", 16.0},
        {"day_quality.comfort_temperature_max", 24.0},
    };
    return profile::UserProfileResolver(IndexCatalog::standard()).resolve(p, {});
}

}  // namespace

int main() {
    const scoring::ScoringEngine engine(IndexCatalog::standard());
    const profile::ResolvedProfile resolved = resolved_profile();

    // ── Property 1: value in range or degraded ───────────────────────────────
    rc::check(
        "score_range: value in [0, 100] and confidence in [0, 1]",
        [&] {
            const WeatherSample s = draw_sample();
            for (IndexId id : ALL_INDICES) {
                const auto r = engine.score_one(s, id, *resolved.parameters);
                RC_ASSERT(r.confidence >= 0.0);
                RC_ASSERT(r.confidence <= 1.0);
                if (r.value) {
                    RC_ASSERT(std::isfinite(*r.value));
                    RC_ASSERT(*r.value >= 0.0);
                    RC_ASSERT(*r.value <= 100.0);
                } else {
                    RC_ASSERT(r.confidence == 0.0);
                    RC_ASSERT(r.warning == WarningTag::ComputationDegraded);
                }
            }
        });

    // ── Property 2: reduced confidence is always tagged ──────────────────────
    rc::check(
        "score_range: confidence < 1 carries ComputationDegraded",
        [&] {
            const WeatherSample s = draw_sample();
            for (IndexId id : ALL_INDICES) {
                const auto r = engine.score_one(s, id, *resolved.parameters);
                if (r.confidence < 1.0) {
                    RC_ASSERT(r.warning.has_value());
                }
            }
        });

    // ── Property 3: missing required field → degraded ────────────────────────
    rc::check(
        "score_range: any missing required field degrades the pair",
        [&] {
            const WeatherSample s = draw_sample();
            for (IndexId id : ALL_INDICES) {
                const auto& def = IndexCatalog::standard().definition(id);
                if (s.has_all(def.required_fields)) continue;
                const auto r = engine.score_one(s, id, *resolved.parameters);
                RC_ASSERT(!r.value.has_value());
            }
        });

    return 0;
}
