#pragma once

/// @file include/wxs/clothing.hpp
/// @brief Clothing decision rules: ordered guarded variants, first match wins.
///
/// A rule list is evaluated top to bottom; the first rule whose guard holds
/// decides the layer. Lists are validated so that layers never increase
/// further down the list and the last rule is unconditional. Together with
/// guards that are monotone in temperature, this makes the recommendation
/// monotone: a colder effective temperature never yields a lighter layer.

#include <cstddef>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace wxs::catalog {

struct ClothingParameters;

/// Ordered lightest → heaviest.
enum class ClothingLayer : std::size_t {
    None,
    LightLayer,
    Windproof,
    Waterproof,
    Insulated,
};

inline constexpr std::size_t CLOTHING_LAYER_COUNT = 5;

/// "none", "light_layer", "windproof", "waterproof", "insulated".
[[nodiscard]] std::string_view to_string(ClothingLayer layer) noexcept;

// ─── Guards ───────────────────────────────────────────────────────────────────

/// Effective (wind-chill adjusted) temperature strictly below `celsius`.
struct EffectiveBelow {
    double celsius;
};

/// Precipitation rate at or above `mm_per_hour`.
struct PrecipitationAtLeast {
    double mm_per_hour;
};

/// Wind speed at or above `kmh`.
struct WindAtLeast {
    double kmh;
};

/// Unconditional fallback.
struct Always {};

using RuleGuard = std::variant<EffectiveBelow, PrecipitationAtLeast, WindAtLeast, Always>;

struct ClothingRule {
    ClothingLayer layer;
    RuleGuard     guard;
};

/// Inputs the guards look at.
struct ClothingConditions {
    double effective_temperature;  ///< °C after wind-chill offset
    double precipitation;          ///< mm/h
    double wind_speed;             ///< km/h
};

/// Whether `guard` holds under `c`.
[[nodiscard]] bool matches(const RuleGuard& guard, const ClothingConditions& c) noexcept;

/// Layer of the first matching rule. Returns ClothingLayer::None if no rule
/// matches (cannot happen for a validated list).
[[nodiscard]] ClothingLayer first_match(std::span<const ClothingRule> rules,
                                        const ClothingConditions& c) noexcept;

/// The standard list:
///   1. insulated   if effective < insulated_below
///   2. waterproof  if precipitation >= rain_threshold
///   3. windproof   if wind >= windproof_wind
///   4. windproof   if effective < windproof_below
///   5. light_layer if effective < light_layer_below
///   6. none
[[nodiscard]] std::vector<ClothingRule> standard_rules(const ClothingParameters& p);

/// # Throws
/// ConfigurationError if the list is empty, does not end with Always, or a
/// rule names a heavier layer than one above it.
void validate_rules(std::span<const ClothingRule> rules);

/// Temperature minus the wind-chill offset
///   min(max_offset, per_kmh · max(0, wind − calm)).
[[nodiscard]] double effective_temperature(double temperature_c,
                                           double wind_kmh,
                                           const ClothingParameters& p) noexcept;

}  // namespace wxs::catalog
