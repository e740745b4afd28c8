#pragma once

/// @file include/wxs/config_loader.hpp
/// @brief YAML loading of user profiles and catalog parameters.
///
/// Profile document:
/// ```yaml
/// user: alice
/// weights:
///   temperature: 0.5
///   wind: 0.3
///   rain: 0.2
///   visibility:
///     fog: 0.7
/// thresholds:
///   day_quality:
///     comfort_temperature_min: 15
///     comfort_temperature_max: 23
/// ```
/// Nested maps are flattened into dotted keys ("visibility.fog"), so the
/// flat form `visibility.fog: 0.7` is equivalent. Key validity is checked by
/// the resolver, except that every leaf must be numeric.
///
/// Catalog parameter document: any nesting of the keys listed by
/// catalog::parameter_specs(), e.g. `cold_shock: {wind_coefficient: 0.3}`.
/// Unknown keys are rejected here.

#include "wxs/catalog.hpp"
#include "wxs/profile.hpp"

#include <string>

namespace wxs::core {

class ConfigLoader {
public:
    /// # Throws
    /// ConfigurationError on YAML syntax errors, unknown top-level keys or
    /// non-numeric weights / thresholds.
    [[nodiscard]] static profile::UserProfile parse_profile(const std::string& yaml);
    [[nodiscard]] static profile::UserProfile load_profile(const std::string& path);

    /// Apply the document's overrides on top of `base` and validate.
    ///
    /// # Throws
    /// ConfigurationError on YAML errors, unknown or non-numeric keys, or
    /// inconsistent parameters.
    [[nodiscard]] static catalog::CatalogParameters
    parse_parameters(const std::string& yaml,
                     const catalog::CatalogParameters& base = catalog::CatalogParameters{});
    [[nodiscard]] static catalog::CatalogParameters
    load_parameters(const std::string& path,
                    const catalog::CatalogParameters& base = catalog::CatalogParameters{});

    /// Serialise a profile in the flat-key form accepted by parse_profile().
    [[nodiscard]] static std::string emit_profile(const profile::UserProfile& profile);
};

}  // namespace wxs::core
