#pragma once

/// @file include/wxs/data_loader.hpp
/// @brief CSV loader for weather samples.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV exports of the forecast API into `std::vector<WeatherSample>`.
/// Columns are matched by header name, so any subset and order of fields
/// is accepted. Malformed rows are skipped with a warning.
///
/// ## Expected CSV Format
/// ```
/// timestamp,temperature,wind_module,wind_direction,precipitation_amount,cloud_area_fraction
/// 2024-06-01T10:00:00+02:00,18.5,12.0,270,0.0,40
/// 1717236000,19.1,14.4,265,,35
/// ```
/// - `timestamp` (or `time`, `timeInstant`): epoch seconds or ISO-8601 with
///   `Z` / `±HH:MM` offset
/// - Field columns use either the Field names (`wind_speed`, `cloud_cover`,
///   ...) or the forecast API variable names (`wind_module`,
///   `precipitation_amount`, `cloud_area_fraction`,
///   `air_pressure_at_sea_level`, `significative_wave_height`,
///   `relative_peak_period`, `mean_wave_direction`, `sea_water_temperature`)
/// - An empty cell marks the field missing
/// - Unknown columns are ignored
///
/// ## Guarantees
/// - Values are not range-checked here; the normalizer rejects impossible
///   ones with ValidationError
/// - Does not modify any file or external state

#include "wxs/collaborators.hpp"
#include "wxs/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wxs::core {

/// Loads weather samples from CSV files and strings.
class CsvSampleLoader {
public:
    /// Load samples from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has no usable header or rows
    [[nodiscard]] static std::optional<std::vector<WeatherSample>>
    load_csv(const std::string& filepath);

    /// Parse samples from CSV text; the first non-comment line is the header.
    [[nodiscard]] static std::vector<WeatherSample>
    parse_csv_string(const std::string& csv_content);

    /// Parse an epoch-seconds or ISO-8601 timestamp.
    [[nodiscard]] static std::optional<EpochSeconds>
    parse_timestamp(std::string_view text) noexcept;

    /// Field named by a CSV column header, if recognised.
    [[nodiscard]] static std::optional<Field>
    field_for_column(std::string_view header) noexcept;
};

/// SampleSource reading `<directory>/<location_id>.csv`.
class CsvSampleSource final : public SampleSource {
public:
    explicit CsvSampleSource(std::string directory) : directory_(std::move(directory)) {}

    /// Samples of the location's file inside `range`.
    ///
    /// # Throws
    /// TransientNetworkError if the file cannot be read.
    [[nodiscard]] std::vector<WeatherSample>
    fetch_samples(const std::string& location_id, TimeRange range) override;

private:
    std::string directory_;
};

}  // namespace wxs::core
