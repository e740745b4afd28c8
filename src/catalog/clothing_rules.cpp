/// @file src/catalog/clothing_rules.cpp
/// @brief Clothing rule evaluation and the standard rule list.

#include "wxs/clothing.hpp"
#include "wxs/catalog.hpp"
#include "wxs/errors.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace wxs::catalog {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string_view to_string(ClothingLayer layer) noexcept {
    switch (layer) {
        case ClothingLayer::None:       return "none";
        case ClothingLayer::LightLayer: return "light_layer";
        case ClothingLayer::Windproof:  return "windproof";
        case ClothingLayer::Waterproof: return "waterproof";
        case ClothingLayer::Insulated:  return "insulated";
    }
    return "unknown";
}

bool matches(const RuleGuard& guard, const ClothingConditions& c) noexcept {
    return std::visit(
        overloaded{
            [&](const EffectiveBelow& g)       { return c.effective_temperature < g.celsius; },
            [&](const PrecipitationAtLeast& g) { return c.precipitation >= g.mm_per_hour; },
            [&](const WindAtLeast& g)          { return c.wind_speed >= g.kmh; },
            [](const Always&)                  { return true; },
        },
        guard);
}

ClothingLayer first_match(std::span<const ClothingRule> rules,
                          const ClothingConditions& c) noexcept {
    for (const auto& rule : rules) {
        if (matches(rule.guard, c)) {
            return rule.layer;
        }
    }
    return ClothingLayer::None;
}

std::vector<ClothingRule> standard_rules(const ClothingParameters& p) {
    return {
        {ClothingLayer::Insulated,  EffectiveBelow{p.insulated_below_c}},
        {ClothingLayer::Waterproof, PrecipitationAtLeast{p.rain_threshold_mmh}},
        {ClothingLayer::Windproof,  WindAtLeast{p.windproof_wind_kmh}},
        {ClothingLayer::Windproof,  EffectiveBelow{p.windproof_below_c}},
        {ClothingLayer::LightLayer, EffectiveBelow{p.light_layer_below_c}},
        {ClothingLayer::None,       Always{}},
    };
}

void validate_rules(std::span<const ClothingRule> rules) {
    if (rules.empty()) {
        throw ConfigurationError("clothing.rules", "rule list is empty");
    }
    if (!std::holds_alternative<Always>(rules.back().guard)) {
        throw ConfigurationError("clothing.rules", "last rule must be unconditional");
    }
    for (std::size_t i = 1; i < rules.size(); ++i) {
        if (rules[i].layer > rules[i - 1].layer) {
            throw ConfigurationError(
                "clothing.rules",
                fmt::format("rule {} ({}) is heavier than rule {} ({})",
                            i, to_string(rules[i].layer),
                            i - 1, to_string(rules[i - 1].layer)));
        }
    }
}

double effective_temperature(double temperature_c,
                             double wind_kmh,
                             const ClothingParameters& p) noexcept {
    const double excess = std::max(0.0, wind_kmh - p.wind_chill_calm_kmh);
    const double offset = std::min(p.wind_chill_max_offset_c, p.wind_chill_per_kmh * excess);
    return temperature_c - offset;
}

}  // namespace wxs::catalog
