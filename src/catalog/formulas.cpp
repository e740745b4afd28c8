/// @file src/catalog/formulas.cpp
/// @brief Index formulas.

#include "wxs/formulas.hpp"
#include "wxs/clothing.hpp"
#include "wxs/constants.hpp"

#include <algorithm>
#include <cmath>

namespace wxs::catalog::formulas {

namespace {

double clamp01(double x) noexcept {
    return std::clamp(x, 0.0, 1.0);
}

double clamp_score(double x) noexcept {
    return std::clamp(x, constants::SCORE_MIN, constants::SCORE_MAX);
}

}  // namespace

// ── day_quality ──────────────────────────────────────────────────────────────

std::optional<IndexOutput>
day_quality(const WeatherSample& s, const ResolvedParameters& r) {
    const auto& p = r.params.day_quality;
    const DayQualityWeights& w = r.day_quality_weights;

    Eigen::Vector4d sub = Eigen::Vector4d::Zero();
    Eigen::Vector4d mask = Eigen::Vector4d::Zero();

    if (s.temperature)   { sub[0] = p.temperature.evaluate(*s.temperature);     mask[0] = 1.0; }
    if (s.wind_speed)    { sub[1] = p.wind.evaluate(*s.wind_speed);             mask[1] = 1.0; }
    if (s.precipitation) { sub[2] = p.precipitation.evaluate(*s.precipitation); mask[2] = 1.0; }
    if (s.fog_density)   { sub[3] = p.fog.evaluate(*s.fog_density);             mask[3] = 1.0; }

    const Eigen::Vector4d used = w.cwiseProduct(mask);
    const double mass = used.sum();
    if (mass <= constants::FLOAT_EPSILON) {
        return std::nullopt;
    }

    IndexOutput out;
    out.value      = clamp_score(100.0 * used.dot(sub) / mass);
    out.confidence = std::min(1.0, mass / std::max(w.sum(), constants::FLOAT_EPSILON));
    return out;
}

// ── clothing ─────────────────────────────────────────────────────────────────

std::optional<IndexOutput>
clothing(const WeatherSample& s, const ResolvedParameters& r) {
    const auto& p = r.params.clothing;
    const double t    = *s.temperature;
    const double wind = *s.wind_speed;
    const double rain = *s.precipitation;

    const double eff = effective_temperature(t, wind, p);
    const ClothingLayer layer = first_match(r.clothing_rules, {eff, rain, wind});

    const double thermal = clamp01((p.exposure_warm_c - eff) / (p.exposure_warm_c - p.exposure_cold_c));
    const double wet     = clamp01(rain / p.exposure_heavy_rain_mmh);
    const double share   = p.exposure_rain_share;

    IndexOutput out;
    out.value    = clamp_score(100.0 * ((1.0 - share) * thermal + share * wet));
    out.category = static_cast<std::size_t>(layer);
    return out;
}

// ── cold_shock ───────────────────────────────────────────────────────────────

std::optional<IndexOutput>
cold_shock(const WeatherSample& s, const ResolvedParameters& r) {
    const auto& p = r.params.cold_shock;
    double confidence = 1.0;

    double water = 0.0;
    if (s.water_temperature) {
        water = *s.water_temperature;
    } else if (s.temperature) {
        water = *s.temperature;
        confidence -= p.air_proxy_penalty;
    } else {
        return std::nullopt;
    }

    double rh = p.default_humidity;
    if (s.relative_humidity) {
        rh = *s.relative_humidity;
    } else {
        confidence -= p.humidity_penalty;
    }

    const double wind = *s.wind_speed;
    const double evaporative = 1.0 - p.humidity_damping * std::clamp(rh, 0.0, 100.0) / 100.0;
    const double stress = p.water_coefficient * std::max(0.0, p.neutral_water_c - water)
                        + p.wind_coefficient * wind * evaporative;

    IndexOutput out;
    out.value                 = clamp_score(100.0 * stress / p.stress_at_max_risk);
    out.confidence            = confidence;
    out.minutes_to_discomfort = p.max_minutes * std::exp(-stress / p.minutes_decay_stress);
    return out;
}

// ── visibility ───────────────────────────────────────────────────────────────

std::optional<IndexOutput>
visibility(const WeatherSample& s, const ResolvedParameters& r) {
    const auto& p = r.params.visibility;

    const Eigen::Vector3d terms{
        clamp01(*s.fog_density),
        clamp01(*s.cloud_cover / 100.0),
        clamp01(*s.precipitation / p.heavy_precipitation_mmh),
    };
    const double penalty = r.visibility_weights.dot(terms);

    double value = 100.0 * (1.0 - penalty);
    if (s.visibility) {
        value = std::min(value, 100.0 * clamp01(*s.visibility / p.clear_visibility_m));
    }

    IndexOutput out;
    out.value = clamp_score(value);
    return out;
}

}  // namespace wxs::catalog::formulas
