#pragma once

/// @file include/wxs/types.hpp
/// @brief Shared primitive types for the weather decision-support scoring
///        engine (WXS).
///
/// Every module includes this file. It defines the weather sample value type,
/// the enumerated field set used for required-input bookkeeping, and the
/// Eigen aliases used for weight vectors.

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace wxs {

/// UTC seconds since the Unix epoch.
using EpochSeconds = std::int64_t;

// ─── Field ────────────────────────────────────────────────────────────────────

/// Every measurable quantity a WeatherSample may carry.
enum class Field : std::uint8_t {
    Temperature,       ///< Air temperature, °C
    WindSpeed,         ///< Wind speed, km/h
    WindDirection,     ///< Direction wind blows from, degrees [0, 360]
    Precipitation,     ///< Precipitation rate, mm/h
    CloudCover,        ///< Cloud area fraction, percent [0, 100]
    FogDensity,        ///< Fog density, dimensionless [0, 1]
    Visibility,        ///< Horizontal visibility distance, m
    RelativeHumidity,  ///< Relative humidity, percent [0, 100]
    AirPressure,       ///< Air pressure at sea level, hPa
    WaveHeight,        ///< Significant wave height, m
    WavePeriod,        ///< Relative peak wave period, s
    WaveDirection,     ///< Mean direction waves come from, degrees [0, 360]
    WaterTemperature,  ///< Sea water temperature, °C
};

/// Number of Field enumerators.
inline constexpr std::size_t FIELD_COUNT = 13;

/// All fields in declaration order, for iteration.
inline constexpr std::array<Field, FIELD_COUNT> ALL_FIELDS = {
    Field::Temperature,      Field::WindSpeed,   Field::WindDirection,
    Field::Precipitation,    Field::CloudCover,  Field::FogDensity,
    Field::Visibility,       Field::RelativeHumidity, Field::AirPressure,
    Field::WaveHeight,       Field::WavePeriod,  Field::WaveDirection,
    Field::WaterTemperature,
};

/// Directions in degrees: interpolated and averaged on the circle.
[[nodiscard]] constexpr bool is_direction(Field f) noexcept {
    return f == Field::WindDirection || f == Field::WaveDirection;
}

/// Stable snake_case name of a field (used in errors, logs and CSV headers).
[[nodiscard]] std::string_view to_string(Field f) noexcept;

/// Parse a field name produced by to_string(Field).
[[nodiscard]] std::optional<Field> field_from_string(std::string_view name) noexcept;

// ─── WeatherSample ────────────────────────────────────────────────────────────

/// One observation or forecast step for a single location.
///
/// A field that is `nullopt` is explicitly missing. Present values are finite.
/// Samples are value types and are never mutated once ingested; transforms
/// return new samples.
struct WeatherSample {
    EpochSeconds          timestamp = 0;
    std::optional<double> temperature;
    std::optional<double> wind_speed;
    std::optional<double> wind_direction;
    std::optional<double> precipitation;
    std::optional<double> cloud_cover;
    std::optional<double> fog_density;
    std::optional<double> visibility;
    std::optional<double> relative_humidity;
    std::optional<double> air_pressure;
    std::optional<double> wave_height;
    std::optional<double> wave_period;
    std::optional<double> wave_direction;
    std::optional<double> water_temperature;

    /// Read a field by enumerator.
    [[nodiscard]] std::optional<double> get(Field f) const noexcept;

    /// Copy of this sample with `f` replaced by `value`.
    [[nodiscard]] WeatherSample with(Field f, std::optional<double> value) const noexcept;

    /// True if every field in `fields` is present.
    template <typename Range>
    [[nodiscard]] bool has_all(const Range& fields) const noexcept {
        for (Field f : fields) {
            if (!get(f)) return false;
        }
        return true;
    }

    bool operator==(const WeatherSample&) const = default;
};

// ─── Time range ───────────────────────────────────────────────────────────────

/// Half-open interval [begin, end) of epoch seconds.
struct TimeRange {
    EpochSeconds begin = 0;
    EpochSeconds end   = 0;

    [[nodiscard]] bool empty() const noexcept { return end <= begin; }
    [[nodiscard]] bool contains(EpochSeconds t) const noexcept {
        return t >= begin && t < end;
    }

    bool operator==(const TimeRange&) const = default;
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Day-quality metric weights, layout [temperature, wind, precipitation, fog].
using DayQualityWeights = Eigen::Vector4d;

/// Visibility penalty weights, layout [fog, cloud, precipitation].
using VisibilityWeights = Eigen::Vector3d;

}  // namespace wxs
