/// @file src/core/types.cpp
/// @brief WeatherSample field accessors and Field name table.

#include "wxs/types.hpp"

namespace wxs {

namespace {

// Indexed by static_cast<std::size_t>(Field).
constexpr std::array<std::string_view, FIELD_COUNT> FIELD_NAMES = {
    "temperature",
    "wind_speed",
    "wind_direction",
    "precipitation",
    "cloud_cover",
    "fog_density",
    "visibility",
    "relative_humidity",
    "air_pressure",
    "wave_height",
    "wave_period",
    "wave_direction",
    "water_temperature",
};

// Member pointer for each field, same order as FIELD_NAMES.
using Member = std::optional<double> WeatherSample::*;
constexpr std::array<Member, FIELD_COUNT> FIELD_MEMBERS = {
    &WeatherSample::temperature,
    &WeatherSample::wind_speed,
    &WeatherSample::wind_direction,
    &WeatherSample::precipitation,
    &WeatherSample::cloud_cover,
    &WeatherSample::fog_density,
    &WeatherSample::visibility,
    &WeatherSample::relative_humidity,
    &WeatherSample::air_pressure,
    &WeatherSample::wave_height,
    &WeatherSample::wave_period,
    &WeatherSample::wave_direction,
    &WeatherSample::water_temperature,
};

}  // namespace

std::string_view to_string(Field f) noexcept {
    return FIELD_NAMES[static_cast<std::size_t>(f)];
}

std::optional<Field> field_from_string(std::string_view name) noexcept {
    for (std::size_t i = 0; i < FIELD_COUNT; ++i) {
        if (FIELD_NAMES[i] == name) {
            return ALL_FIELDS[i];
        }
    }
    return std::nullopt;
}

std::optional<double> WeatherSample::get(Field f) const noexcept {
    return this->*FIELD_MEMBERS[static_cast<std::size_t>(f)];
}

WeatherSample WeatherSample::with(Field f, std::optional<double> value) const noexcept {
    WeatherSample copy = *this;
    copy.*FIELD_MEMBERS[static_cast<std::size_t>(f)] = value;
    return copy;
}

}  // namespace wxs
