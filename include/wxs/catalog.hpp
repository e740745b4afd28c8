#pragma once

/// @file include/wxs/catalog.hpp
/// @brief IndexCatalog: immutable registry of index definitions and formulas.
///
/// # Module: Index Catalog
///
/// ## Responsibility
/// Map each IndexId to an IndexDefinition: required and optional sample
/// fields, recognised profile keys, output domain, band scale and a pure
/// formula `(sample, resolved parameters) → IndexOutput`.
///
/// ## Indices
///   - day_quality: weighted piecewise-linear comfort score, 0–100 (quality)
///   - clothing   : first-match clothing rule + exposure score (categorical)
///   - cold_shock : post-swim cold-shock risk, 0–100 + minutes (risk)
///   - visibility : maritime visibility, 0–100 (quality)
///
/// ## Parameters
/// Every coefficient, threshold, default weight and band edge is a member of
/// CatalogParameters and is addressable by a dotted key through
/// parameter_specs(). Nothing numeric is embedded in the formulas.
///
/// ## Guarantees
/// - Built once, never mutated: concurrent reads need no synchronisation
/// - Formulas are deterministic and side-effect free
/// - Construction validates parameters and throws ConfigurationError

#include "wxs/clothing.hpp"
#include "wxs/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wxs::catalog {

// ─── Identifiers ──────────────────────────────────────────────────────────────

enum class IndexId : std::uint8_t {
    DayQuality,
    Clothing,
    ColdShock,
    Visibility,
};

inline constexpr std::size_t INDEX_COUNT = 4;

inline constexpr std::array<IndexId, INDEX_COUNT> ALL_INDICES = {
    IndexId::DayQuality, IndexId::Clothing, IndexId::ColdShock, IndexId::Visibility,
};

/// "day_quality", "clothing", "cold_shock", "visibility".
[[nodiscard]] std::string_view to_string(IndexId id) noexcept;
[[nodiscard]] std::optional<IndexId> index_from_string(std::string_view name) noexcept;

/// Whether a higher value is better (Quality) or worse (Risk).
enum class Polarity {
    Quality,
    Risk,
};

[[nodiscard]] const char* to_string(Polarity p) noexcept;

// ─── Parameters ───────────────────────────────────────────────────────────────

/// Trapezoidal comfort curve: 1 inside [optimal_min, optimal_max], falling
/// linearly to 0 over `falloff_below` below and `falloff_above` above.
/// A zero fall-off is a hard edge.
struct ComfortRange {
    double optimal_min;
    double optimal_max;
    double falloff_below;
    double falloff_above;

    /// Sub-score in [0, 1].
    [[nodiscard]] double evaluate(double x) const noexcept;
};

struct DayQualityParameters {
    ComfortRange temperature   {16.0, 24.0, 12.0, 10.0};  ///< °C
    ComfortRange wind          { 0.0, 15.0,  0.0, 25.0};  ///< km/h
    ComfortRange precipitation { 0.0,  0.2,  0.0,  3.0};  ///< mm/h
    ComfortRange fog           { 0.0,  0.1,  0.0,  0.6};  ///< density

    /// Used when a profile specifies no day-quality weight.
    DayQualityWeights default_weights{0.4, 0.25, 0.25, 0.1};

    /// Lower edges of poor / fair / good / excellent.
    std::array<double, 4> band_edges{0.0, 40.0, 60.0, 80.0};
};

struct ClothingParameters {
    double light_layer_below_c     = 20.0;  ///< effective °C
    double windproof_below_c       = 12.0;
    double insulated_below_c       =  5.0;
    double windproof_wind_kmh      = 30.0;
    double rain_threshold_mmh      =  0.5;

    double wind_chill_calm_kmh     =  5.0;  ///< no offset at or below
    double wind_chill_per_kmh      =  0.15; ///< °C of chill per km/h above calm
    double wind_chill_max_offset_c =  8.0;

    double exposure_warm_c         = 25.0;  ///< thermal exposure 0 at/above
    double exposure_cold_c         = -10.0; ///< thermal exposure 1 at/below
    double exposure_rain_share     =  0.3;  ///< share of exposure from rain
    double exposure_heavy_rain_mmh =  5.0;
};

struct ColdShockParameters {
    double neutral_water_c      = 22.0;  ///< no thermal stress at/above
    double water_coefficient    =  1.0;  ///< stress per °C below neutral
    double wind_coefficient     =  0.25; ///< stress per km/h of exit wind
    double humidity_damping     =  0.5;  ///< evaporative share removed at 100 % RH
    double default_humidity     = 60.0;  ///< % used when humidity is missing
    double stress_at_max_risk   = 20.0;  ///< stress mapped to a risk of 100
    double max_minutes          = 120.0; ///< minutes to discomfort at zero stress
    double minutes_decay_stress =  8.0;  ///< e-folding stress for minutes
    double air_proxy_penalty    =  0.25; ///< confidence lost using air temperature
    double humidity_penalty     =  0.1;  ///< confidence lost using default humidity

    /// Lower edges of low / moderate / high / severe.
    std::array<double, 4> band_edges{0.0, 25.0, 50.0, 75.0};
};

struct VisibilityParameters {
    /// Layout [fog, cloud, precipitation]; used when a profile sets none.
    VisibilityWeights default_weights{0.6, 0.15, 0.25};
    double heavy_precipitation_mmh = 8.0;      ///< precipitation term saturates
    double clear_visibility_m      = 10000.0;  ///< reported distance for 100

    /// Lower edges of hazardous / poor / reduced / clear.
    std::array<double, 4> band_edges{0.0, 25.0, 50.0, 75.0};
};

/// Every tunable constant of every formula.
struct CatalogParameters {
    DayQualityParameters day_quality;
    ClothingParameters   clothing;
    ColdShockParameters  cold_shock;
    VisibilityParameters visibility;
};

/// Check internal consistency.
///
/// # Throws
/// ConfigurationError naming the first offending key.
void validate_parameters(const CatalogParameters& params);

/// Who may set a parameter.
enum class ParameterScope {
    UserThreshold,  ///< settable from a user profile and catalog files
    CatalogOnly,    ///< settable from catalog files only
};

/// One addressable parameter, e.g. "day_quality.comfort_temperature_min".
struct ParameterSpec {
    std::string_view key;
    IndexId          index;
    ParameterScope   scope;
    std::string_view paired_with;  ///< key that must be given together with this one, or empty
    double (*get)(const CatalogParameters&);
    void   (*set)(CatalogParameters&, double);
    std::string_view description;
};

/// All parameter keys, grouped by index.
[[nodiscard]] std::span<const ParameterSpec> parameter_specs() noexcept;
[[nodiscard]] const ParameterSpec* find_parameter(std::string_view key) noexcept;

/// One recognised profile weight key.
struct WeightSpec {
    std::string_view key;    ///< canonical, e.g. "temperature"
    std::string_view alias;  ///< accepted synonym, may be empty
    IndexId          index;  ///< DayQuality or Visibility
    std::size_t      slot;   ///< position in the index's weight vector
};

[[nodiscard]] std::span<const WeightSpec> weight_specs() noexcept;
[[nodiscard]] const WeightSpec* find_weight(std::string_view key) noexcept;

// ─── Resolved parameters ──────────────────────────────────────────────────────

/// Canonical parameter object consumed by formulas. Produced by the profile
/// resolver: catalog defaults with user thresholds applied, weights rescaled
/// to sum to 1, and the clothing rule list.
struct ResolvedParameters {
    CatalogParameters          params;
    DayQualityWeights          day_quality_weights = DayQualityWeights::Zero();
    VisibilityWeights          visibility_weights  = VisibilityWeights::Zero();
    std::vector<ClothingRule>  clothing_rules;
};

// ─── Definitions ──────────────────────────────────────────────────────────────

/// Formula output. `value` is in [0, 100].
struct IndexOutput {
    double                     value      = 0.0;
    double                     confidence = 1.0;  ///< < 1 when optional inputs were substituted
    std::optional<std::size_t> category;          ///< categorical ordinal (clothing)
    std::optional<double>      minutes_to_discomfort;  ///< cold shock only
};

/// Pure formula. Precondition: every required field of the index is present.
/// Returns `nullopt` when the available inputs carry no usable information.
using Formula = std::optional<IndexOutput> (*)(const WeatherSample&, const ResolvedParameters&);

enum class OutputDomain {
    Continuous,   ///< value banded by lower edges
    Categorical,  ///< formula reports the category directly
};

/// Ordered band labels, worst-to-best (quality) or least-to-most severe (risk).
/// For continuous domains lower_edges[i] is the inclusive lower bound of
/// labels[i]; lower_edges[0] == 0.
struct BandScale {
    Polarity                 polarity = Polarity::Quality;
    std::vector<std::string> labels;
    std::vector<double>      lower_edges;
};

struct IndexDefinition {
    IndexId                  id;
    std::string              name;
    std::vector<Field>       required_fields;
    std::vector<Field>       optional_fields;
    OutputDomain             domain;
    Polarity                 polarity;
    std::vector<std::string> category_labels;  ///< band / category names in order
    Formula                  formula;
};

/// Band scale of `id` under `params`.
[[nodiscard]] BandScale band_scale(const IndexDefinition& def, const CatalogParameters& params);

// ─── IndexCatalog ─────────────────────────────────────────────────────────────

class IndexCatalog {
public:
    /// Build the registry from `params`.
    ///
    /// # Throws
    /// ConfigurationError if the parameters are inconsistent.
    explicit IndexCatalog(CatalogParameters params = CatalogParameters{});

    /// Process-wide catalog built from default parameters on first use.
    [[nodiscard]] static const IndexCatalog& standard();

    [[nodiscard]] const IndexDefinition& definition(IndexId id) const noexcept {
        return definitions_[static_cast<std::size_t>(id)];
    }

    [[nodiscard]] std::span<const IndexDefinition> definitions() const noexcept {
        return definitions_;
    }

    [[nodiscard]] const CatalogParameters& parameters() const noexcept { return params_; }

private:
    CatalogParameters                            params_;
    std::array<IndexDefinition, INDEX_COUNT>     definitions_;
};

}  // namespace wxs::catalog
