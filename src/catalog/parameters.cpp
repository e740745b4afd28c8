/// @file src/catalog/parameters.cpp
/// @brief Enumerated parameter and weight keys, and parameter validation.
///
/// Every tunable constant has exactly one dotted key here. User profiles may
/// only set keys with ParameterScope::UserThreshold; catalog YAML files may
/// set any key.

#include "wxs/catalog.hpp"
#include "wxs/errors.hpp"

#include <fmt/format.h>

#include <array>
#include <cmath>

namespace wxs::catalog {

namespace {

using S = ParameterScope;
using P = CatalogParameters;

const std::array PARAMETERS = {
    // ── day_quality ──────────────────────────────────────────────────────────
    ParameterSpec{"day_quality.comfort_temperature_min", IndexId::DayQuality, S::UserThreshold,
        "day_quality.comfort_temperature_max",
        [](const P& p) { return p.day_quality.temperature.optimal_min; },
        [](P& p, double v) { p.day_quality.temperature.optimal_min = v; },
        "lower edge of the comfortable temperature range, °C"},
    ParameterSpec{"day_quality.comfort_temperature_max", IndexId::DayQuality, S::UserThreshold,
        "day_quality.comfort_temperature_min",
        [](const P& p) { return p.day_quality.temperature.optimal_max; },
        [](P& p, double v) { p.day_quality.temperature.optimal_max = v; },
        "upper edge of the comfortable temperature range, °C"},
    ParameterSpec{"day_quality.comfort_wind_max", IndexId::DayQuality, S::UserThreshold, {},
        [](const P& p) { return p.day_quality.wind.optimal_max; },
        [](P& p, double v) { p.day_quality.wind.optimal_max = v; },
        "highest fully comfortable wind speed, km/h"},
    ParameterSpec{"day_quality.comfort_precipitation_max", IndexId::DayQuality, S::UserThreshold, {},
        [](const P& p) { return p.day_quality.precipitation.optimal_max; },
        [](P& p, double v) { p.day_quality.precipitation.optimal_max = v; },
        "highest fully comfortable precipitation rate, mm/h"},
    ParameterSpec{"day_quality.comfort_fog_max", IndexId::DayQuality, S::UserThreshold, {},
        [](const P& p) { return p.day_quality.fog.optimal_max; },
        [](P& p, double v) { p.day_quality.fog.optimal_max = v; },
        "highest fully comfortable fog density"},
    ParameterSpec{"day_quality.temperature_falloff_below", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.temperature.falloff_below; },
        [](P& p, double v) { p.day_quality.temperature.falloff_below = v; },
        "°C below the comfort range at which the temperature score reaches 0"},
    ParameterSpec{"day_quality.temperature_falloff_above", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.temperature.falloff_above; },
        [](P& p, double v) { p.day_quality.temperature.falloff_above = v; },
        "°C above the comfort range at which the temperature score reaches 0"},
    ParameterSpec{"day_quality.wind_falloff", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.wind.falloff_above; },
        [](P& p, double v) { p.day_quality.wind.falloff_above = v; },
        "km/h above the comfortable wind at which the wind score reaches 0"},
    ParameterSpec{"day_quality.precipitation_falloff", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.precipitation.falloff_above; },
        [](P& p, double v) { p.day_quality.precipitation.falloff_above = v; },
        "mm/h above the comfortable rate at which the rain score reaches 0"},
    ParameterSpec{"day_quality.fog_falloff", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.fog.falloff_above; },
        [](P& p, double v) { p.day_quality.fog.falloff_above = v; },
        "density above the comfortable fog at which the fog score reaches 0"},
    ParameterSpec{"day_quality.weight.temperature", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.default_weights[0]; },
        [](P& p, double v) { p.day_quality.default_weights[0] = v; },
        "default temperature weight"},
    ParameterSpec{"day_quality.weight.wind", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.default_weights[1]; },
        [](P& p, double v) { p.day_quality.default_weights[1] = v; },
        "default wind weight"},
    ParameterSpec{"day_quality.weight.precipitation", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.default_weights[2]; },
        [](P& p, double v) { p.day_quality.default_weights[2] = v; },
        "default precipitation weight"},
    ParameterSpec{"day_quality.weight.fog", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.default_weights[3]; },
        [](P& p, double v) { p.day_quality.default_weights[3] = v; },
        "default fog weight"},
    ParameterSpec{"day_quality.band.fair", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.band_edges[1]; },
        [](P& p, double v) { p.day_quality.band_edges[1] = v; },
        "lowest score rated fair"},
    ParameterSpec{"day_quality.band.good", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.band_edges[2]; },
        [](P& p, double v) { p.day_quality.band_edges[2] = v; },
        "lowest score rated good"},
    ParameterSpec{"day_quality.band.excellent", IndexId::DayQuality, S::CatalogOnly, {},
        [](const P& p) { return p.day_quality.band_edges[3]; },
        [](P& p, double v) { p.day_quality.band_edges[3] = v; },
        "lowest score rated excellent"},

    // ── clothing ─────────────────────────────────────────────────────────────
    ParameterSpec{"clothing.light_layer_below", IndexId::Clothing, S::UserThreshold, {},
        [](const P& p) { return p.clothing.light_layer_below_c; },
        [](P& p, double v) { p.clothing.light_layer_below_c = v; },
        "effective °C below which a light layer is advised"},
    ParameterSpec{"clothing.windproof_below", IndexId::Clothing, S::UserThreshold, {},
        [](const P& p) { return p.clothing.windproof_below_c; },
        [](P& p, double v) { p.clothing.windproof_below_c = v; },
        "effective °C below which a windproof layer is advised"},
    ParameterSpec{"clothing.insulated_below", IndexId::Clothing, S::UserThreshold, {},
        [](const P& p) { return p.clothing.insulated_below_c; },
        [](P& p, double v) { p.clothing.insulated_below_c = v; },
        "effective °C below which insulation is advised"},
    ParameterSpec{"clothing.windproof_wind", IndexId::Clothing, S::UserThreshold, {},
        [](const P& p) { return p.clothing.windproof_wind_kmh; },
        [](P& p, double v) { p.clothing.windproof_wind_kmh = v; },
        "wind speed, km/h, from which a windproof layer is advised"},
    ParameterSpec{"clothing.rain_threshold", IndexId::Clothing, S::UserThreshold, {},
        [](const P& p) { return p.clothing.rain_threshold_mmh; },
        [](P& p, double v) { p.clothing.rain_threshold_mmh = v; },
        "precipitation, mm/h, from which waterproofs are advised"},
    ParameterSpec{"clothing.wind_chill_calm", IndexId::Clothing, S::CatalogOnly, {},
        [](const P& p) { return p.clothing.wind_chill_calm_kmh; },
        [](P& p, double v) { p.clothing.wind_chill_calm_kmh = v; },
        "wind speed, km/h, up to which no chill offset applies"},
    ParameterSpec{"clothing.wind_chill_per_kmh", IndexId::Clothing, S::CatalogOnly, {},
        [](const P& p) { return p.clothing.wind_chill_per_kmh; },
        [](P& p, double v) { p.clothing.wind_chill_per_kmh = v; },
        "°C of chill per km/h above calm"},
    ParameterSpec{"clothing.wind_chill_max_offset", IndexId::Clothing, S::CatalogOnly, {},
        [](const P& p) { return p.clothing.wind_chill_max_offset_c; },
        [](P& p, double v) { p.clothing.wind_chill_max_offset_c = v; },
        "largest chill offset, °C"},
    ParameterSpec{"clothing.exposure_warm", IndexId::Clothing, S::CatalogOnly, {},
        [](const P& p) { return p.clothing.exposure_warm_c; },
        [](P& p, double v) { p.clothing.exposure_warm_c = v; },
        "effective °C at or above which thermal exposure is 0"},
    ParameterSpec{"clothing.exposure_cold", IndexId::Clothing, S::CatalogOnly, {},
        [](const P& p) { return p.clothing.exposure_cold_c; },
        [](P& p, double v) { p.clothing.exposure_cold_c = v; },
        "effective °C at or below which thermal exposure is 1"},
    ParameterSpec{"clothing.exposure_rain_share", IndexId::Clothing, S::CatalogOnly, {},
        [](const P& p) { return p.clothing.exposure_rain_share; },
        [](P& p, double v) { p.clothing.exposure_rain_share = v; },
        "fraction of the exposure score driven by precipitation"},
    ParameterSpec{"clothing.exposure_heavy_rain", IndexId::Clothing, S::CatalogOnly, {},
        [](const P& p) { return p.clothing.exposure_heavy_rain_mmh; },
        [](P& p, double v) { p.clothing.exposure_heavy_rain_mmh = v; },
        "precipitation, mm/h, at which the rain exposure saturates"},

    // ── cold_shock ───────────────────────────────────────────────────────────
    ParameterSpec{"cold_shock.neutral_water_temperature", IndexId::ColdShock, S::UserThreshold, {},
        [](const P& p) { return p.cold_shock.neutral_water_c; },
        [](P& p, double v) { p.cold_shock.neutral_water_c = v; },
        "water °C at or above which there is no thermal stress"},
    ParameterSpec{"cold_shock.water_coefficient", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.water_coefficient; },
        [](P& p, double v) { p.cold_shock.water_coefficient = v; },
        "stress per °C below neutral"},
    ParameterSpec{"cold_shock.wind_coefficient", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.wind_coefficient; },
        [](P& p, double v) { p.cold_shock.wind_coefficient = v; },
        "stress per km/h of exit wind"},
    ParameterSpec{"cold_shock.humidity_damping", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.humidity_damping; },
        [](P& p, double v) { p.cold_shock.humidity_damping = v; },
        "share of the evaporative term removed at 100 % humidity"},
    ParameterSpec{"cold_shock.default_humidity", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.default_humidity; },
        [](P& p, double v) { p.cold_shock.default_humidity = v; },
        "humidity, %, assumed when the sample has none"},
    ParameterSpec{"cold_shock.stress_at_max_risk", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.stress_at_max_risk; },
        [](P& p, double v) { p.cold_shock.stress_at_max_risk = v; },
        "stress mapped to a risk score of 100"},
    ParameterSpec{"cold_shock.max_minutes", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.max_minutes; },
        [](P& p, double v) { p.cold_shock.max_minutes = v; },
        "minutes to discomfort with no stress"},
    ParameterSpec{"cold_shock.minutes_decay_stress", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.minutes_decay_stress; },
        [](P& p, double v) { p.cold_shock.minutes_decay_stress = v; },
        "stress over which minutes to discomfort fall by a factor e"},
    ParameterSpec{"cold_shock.air_proxy_penalty", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.air_proxy_penalty; },
        [](P& p, double v) { p.cold_shock.air_proxy_penalty = v; },
        "confidence lost when air temperature stands in for water"},
    ParameterSpec{"cold_shock.humidity_penalty", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.humidity_penalty; },
        [](P& p, double v) { p.cold_shock.humidity_penalty = v; },
        "confidence lost when the default humidity is used"},
    ParameterSpec{"cold_shock.band.moderate", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.band_edges[1]; },
        [](P& p, double v) { p.cold_shock.band_edges[1] = v; },
        "lowest risk rated moderate"},
    ParameterSpec{"cold_shock.band.high", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.band_edges[2]; },
        [](P& p, double v) { p.cold_shock.band_edges[2] = v; },
        "lowest risk rated high"},
    ParameterSpec{"cold_shock.band.severe", IndexId::ColdShock, S::CatalogOnly, {},
        [](const P& p) { return p.cold_shock.band_edges[3]; },
        [](P& p, double v) { p.cold_shock.band_edges[3] = v; },
        "lowest risk rated severe"},

    // ── visibility ───────────────────────────────────────────────────────────
    ParameterSpec{"visibility.heavy_precipitation", IndexId::Visibility, S::CatalogOnly, {},
        [](const P& p) { return p.visibility.heavy_precipitation_mmh; },
        [](P& p, double v) { p.visibility.heavy_precipitation_mmh = v; },
        "precipitation, mm/h, at which the precipitation term saturates"},
    ParameterSpec{"visibility.clear_distance", IndexId::Visibility, S::CatalogOnly, {},
        [](const P& p) { return p.visibility.clear_visibility_m; },
        [](P& p, double v) { p.visibility.clear_visibility_m = v; },
        "reported visibility, m, that scores 100"},
    ParameterSpec{"visibility.weight.fog", IndexId::Visibility, S::CatalogOnly, {},
        [](const P& p) { return p.visibility.default_weights[0]; },
        [](P& p, double v) { p.visibility.default_weights[0] = v; },
        "default fog weight"},
    ParameterSpec{"visibility.weight.cloud", IndexId::Visibility, S::CatalogOnly, {},
        [](const P& p) { return p.visibility.default_weights[1]; },
        [](P& p, double v) { p.visibility.default_weights[1] = v; },
        "default cloud weight"},
    ParameterSpec{"visibility.weight.precipitation", IndexId::Visibility, S::CatalogOnly, {},
        [](const P& p) { return p.visibility.default_weights[2]; },
        [](P& p, double v) { p.visibility.default_weights[2] = v; },
        "default precipitation weight"},
    ParameterSpec{"visibility.band.poor", IndexId::Visibility, S::CatalogOnly, {},
        [](const P& p) { return p.visibility.band_edges[1]; },
        [](P& p, double v) { p.visibility.band_edges[1] = v; },
        "lowest score rated poor"},
    ParameterSpec{"visibility.band.reduced", IndexId::Visibility, S::CatalogOnly, {},
        [](const P& p) { return p.visibility.band_edges[2]; },
        [](P& p, double v) { p.visibility.band_edges[2] = v; },
        "lowest score rated reduced"},
    ParameterSpec{"visibility.band.clear", IndexId::Visibility, S::CatalogOnly, {},
        [](const P& p) { return p.visibility.band_edges[3]; },
        [](P& p, double v) { p.visibility.band_edges[3] = v; },
        "lowest score rated clear"},
};

constexpr std::array WEIGHTS = {
    WeightSpec{"temperature",              "temp", IndexId::DayQuality, 0},
    WeightSpec{"wind",                     "",     IndexId::DayQuality, 1},
    WeightSpec{"precipitation",            "rain", IndexId::DayQuality, 2},
    WeightSpec{"fog",                      "",     IndexId::DayQuality, 3},
    WeightSpec{"visibility.fog",           "",     IndexId::Visibility, 0},
    WeightSpec{"visibility.cloud",         "",     IndexId::Visibility, 1},
    WeightSpec{"visibility.precipitation", "",     IndexId::Visibility, 2},
};

void require(bool ok, std::string_view key, std::string_view message) {
    if (!ok) {
        throw ConfigurationError(std::string(key), std::string(message));
    }
}

void check_range(const ComfortRange& r, std::string_view key) {
    require(r.optimal_min <= r.optimal_max, key, "comfort range minimum exceeds maximum");
    require(r.falloff_below >= 0.0 && r.falloff_above >= 0.0, key, "fall-off must be non-negative");
}

template <typename Array>
void check_edges(const Array& edges, std::string_view key) {
    require(edges[0] == 0.0, key, "first band must start at 0");
    for (std::size_t i = 1; i < edges.size(); ++i) {
        require(edges[i] > edges[i - 1], key, "band edges must be strictly increasing");
        require(edges[i] <= 100.0, key, "band edges must lie within [0, 100]");
    }
}

template <typename Vector>
void check_weights(const Vector& w, std::string_view key) {
    require((w.array() >= 0.0).all(), key, "weights must be non-negative");
    require(w.sum() > 0.0, key, "weights must not all be zero");
}

bool unit(double v) noexcept { return v >= 0.0 && v <= 1.0; }

}  // namespace

std::span<const ParameterSpec> parameter_specs() noexcept {
    return PARAMETERS;
}

const ParameterSpec* find_parameter(std::string_view key) noexcept {
    for (const auto& spec : PARAMETERS) {
        if (spec.key == key) {
            return &spec;
        }
    }
    return nullptr;
}

std::span<const WeightSpec> weight_specs() noexcept {
    return WEIGHTS;
}

const WeightSpec* find_weight(std::string_view key) noexcept {
    for (const auto& spec : WEIGHTS) {
        if (spec.key == key || (!spec.alias.empty() && spec.alias == key)) {
            return &spec;
        }
    }
    return nullptr;
}

void validate_parameters(const CatalogParameters& params) {
    for (const auto& spec : PARAMETERS) {
        require(std::isfinite(spec.get(params)), spec.key, "value must be finite");
    }

    const auto& dq = params.day_quality;
    check_range(dq.temperature,   "day_quality.comfort_temperature_min");
    check_range(dq.wind,          "day_quality.comfort_wind_max");
    check_range(dq.precipitation, "day_quality.comfort_precipitation_max");
    check_range(dq.fog,           "day_quality.comfort_fog_max");
    check_weights(dq.default_weights, "day_quality.weight");
    check_edges(dq.band_edges, "day_quality.band");

    const auto& cl = params.clothing;
    require(cl.insulated_below_c <= cl.windproof_below_c, "clothing.insulated_below",
            "must not exceed clothing.windproof_below");
    require(cl.windproof_below_c <= cl.light_layer_below_c, "clothing.windproof_below",
            "must not exceed clothing.light_layer_below");
    require(cl.windproof_wind_kmh >= 0.0, "clothing.windproof_wind", "must be non-negative");
    require(cl.rain_threshold_mmh >= 0.0, "clothing.rain_threshold", "must be non-negative");
    require(cl.wind_chill_per_kmh >= 0.0, "clothing.wind_chill_per_kmh", "must be non-negative");
    require(cl.wind_chill_max_offset_c >= 0.0, "clothing.wind_chill_max_offset", "must be non-negative");
    require(cl.exposure_warm_c > cl.exposure_cold_c, "clothing.exposure_warm",
            "must exceed clothing.exposure_cold");
    require(unit(cl.exposure_rain_share), "clothing.exposure_rain_share", "must lie in [0, 1]");
    require(cl.exposure_heavy_rain_mmh > 0.0, "clothing.exposure_heavy_rain", "must be positive");

    const auto& cs = params.cold_shock;
    require(cs.water_coefficient >= 0.0, "cold_shock.water_coefficient", "must be non-negative");
    require(cs.wind_coefficient >= 0.0, "cold_shock.wind_coefficient", "must be non-negative");
    require(unit(cs.humidity_damping), "cold_shock.humidity_damping", "must lie in [0, 1]");
    require(cs.default_humidity >= 0.0 && cs.default_humidity <= 100.0,
            "cold_shock.default_humidity", "must lie in [0, 100]");
    require(cs.stress_at_max_risk > 0.0, "cold_shock.stress_at_max_risk", "must be positive");
    require(cs.max_minutes > 0.0, "cold_shock.max_minutes", "must be positive");
    require(cs.minutes_decay_stress > 0.0, "cold_shock.minutes_decay_stress", "must be positive");
    require(unit(cs.air_proxy_penalty), "cold_shock.air_proxy_penalty", "must lie in [0, 1]");
    require(unit(cs.humidity_penalty), "cold_shock.humidity_penalty", "must lie in [0, 1]");
    require(cs.air_proxy_penalty + cs.humidity_penalty < 1.0, "cold_shock.air_proxy_penalty",
            "penalties together must stay below 1");
    check_edges(cs.band_edges, "cold_shock.band");

    const auto& vis = params.visibility;
    require(vis.heavy_precipitation_mmh > 0.0, "visibility.heavy_precipitation", "must be positive");
    require(vis.clear_visibility_m > 0.0, "visibility.clear_distance", "must be positive");
    check_weights(vis.default_weights, "visibility.weight");
    check_edges(vis.band_edges, "visibility.band");
}

}  // namespace wxs::catalog
