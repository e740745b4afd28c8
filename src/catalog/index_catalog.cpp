/// @file src/catalog/index_catalog.cpp
/// @brief IndexCatalog construction, identifiers and band scales.

#include "wxs/catalog.hpp"
#include "wxs/errors.hpp"
#include "wxs/formulas.hpp"
#include "wxs/logging.hpp"

#include <utility>

namespace wxs::catalog {

namespace {

std::array<IndexDefinition, INDEX_COUNT> make_definitions() {
    return {{
        IndexDefinition{
            IndexId::DayQuality, "day_quality",
            {Field::Temperature, Field::WindSpeed, Field::Precipitation},
            {Field::FogDensity},
            OutputDomain::Continuous, Polarity::Quality,
            {"poor", "fair", "good", "excellent"},
            &formulas::day_quality,
        },
        IndexDefinition{
            IndexId::Clothing, "clothing",
            {Field::Temperature, Field::WindSpeed, Field::Precipitation},
            {},
            OutputDomain::Categorical, Polarity::Risk,
            {"none", "light_layer", "windproof", "waterproof", "insulated"},
            &formulas::clothing,
        },
        IndexDefinition{
            IndexId::ColdShock, "cold_shock",
            {Field::WindSpeed},
            {Field::WaterTemperature, Field::Temperature, Field::RelativeHumidity},
            OutputDomain::Continuous, Polarity::Risk,
            {"low", "moderate", "high", "severe"},
            &formulas::cold_shock,
        },
        IndexDefinition{
            IndexId::Visibility, "visibility",
            {Field::CloudCover, Field::FogDensity, Field::Precipitation},
            {Field::Visibility},
            OutputDomain::Continuous, Polarity::Quality,
            {"hazardous", "poor", "reduced", "clear"},
            &formulas::visibility,
        },
    }};
}

}  // namespace

// ── identifiers ──────────────────────────────────────────────────────────────

std::string_view to_string(IndexId id) noexcept {
    switch (id) {
        case IndexId::DayQuality: return "day_quality";
        case IndexId::Clothing:   return "clothing";
        case IndexId::ColdShock:  return "cold_shock";
        case IndexId::Visibility: return "visibility";
    }
    return "unknown";
}

std::optional<IndexId> index_from_string(std::string_view name) noexcept {
    for (IndexId id : ALL_INDICES) {
        if (to_string(id) == name) {
            return id;
        }
    }
    return std::nullopt;
}

const char* to_string(Polarity p) noexcept {
    switch (p) {
        case Polarity::Quality: return "quality";
        case Polarity::Risk:    return "risk";
    }
    return "unknown";
}

// ── ComfortRange ─────────────────────────────────────────────────────────────

double ComfortRange::evaluate(double x) const noexcept {
    if (x >= optimal_min && x <= optimal_max) {
        return 1.0;
    }
    if (x < optimal_min) {
        if (falloff_below <= 0.0) return 0.0;
        const double s = 1.0 - (optimal_min - x) / falloff_below;
        return s > 0.0 ? s : 0.0;
    }
    if (falloff_above <= 0.0) return 0.0;
    const double s = 1.0 - (x - optimal_max) / falloff_above;
    return s > 0.0 ? s : 0.0;
}

// ── band_scale ───────────────────────────────────────────────────────────────

BandScale band_scale(const IndexDefinition& def, const CatalogParameters& params) {
    BandScale scale;
    scale.polarity = def.polarity;
    scale.labels   = def.category_labels;

    switch (def.id) {
        case IndexId::DayQuality:
            scale.lower_edges.assign(params.day_quality.band_edges.begin(),
                                     params.day_quality.band_edges.end());
            break;
        case IndexId::ColdShock:
            scale.lower_edges.assign(params.cold_shock.band_edges.begin(),
                                     params.cold_shock.band_edges.end());
            break;
        case IndexId::Visibility:
            scale.lower_edges.assign(params.visibility.band_edges.begin(),
                                     params.visibility.band_edges.end());
            break;
        case IndexId::Clothing:
            // Categorical: the formula reports the ordinal, no edges.
            break;
    }
    return scale;
}

// ── IndexCatalog ─────────────────────────────────────────────────────────────

IndexCatalog::IndexCatalog(CatalogParameters params)
    : params_(std::move(params))
    , definitions_(make_definitions())
{
    validate_parameters(params_);
    validate_rules(standard_rules(params_.clothing));
    WXS_DEBUG("index catalog built with {} indices", definitions_.size());
}

const IndexCatalog& IndexCatalog::standard() {
    static const IndexCatalog catalog{};
    return catalog;
}

}  // namespace wxs::catalog
