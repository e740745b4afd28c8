/// @file src/core/data_loader.cpp
/// @brief CSV loader for weather samples.

#include "wxs/data_loader.hpp"
#include "wxs/errors.hpp"
#include "wxs/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace wxs::core {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n";

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> cells;
    std::size_t start = 0;
    for (;;) {
        const auto comma = line.find(',', start);
        cells.push_back(trim(line.substr(start, comma - start)));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return cells;
}

template <typename T>
bool parse_number(std::string_view s, T& out) noexcept {
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, out);
    return ec == std::errc{} && ptr == end;
}

/// Parse exactly `n` digits at `pos`, advancing it.
bool digits(std::string_view s, std::size_t& pos, std::size_t n, int& out) noexcept {
    if (pos + n > s.size()) {
        return false;
    }
    int v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const char c = s[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

bool expect(std::string_view s, std::size_t& pos, char c) noexcept {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

/// Days since 1970-01-01 of a proleptic Gregorian date.
std::int64_t days_from_civil(int y, int m, int d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153u * static_cast<unsigned>(m + (m > 2 ? -3 : 9)) + 2u) / 5u
                       + static_cast<unsigned>(d) - 1u;
    const unsigned doe = yoe * 365u + yoe / 4u - yoe / 100u + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::optional<EpochSeconds> parse_iso8601(std::string_view s) noexcept {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!digits(s, pos, 4, year) || !expect(s, pos, '-') ||
        !digits(s, pos, 2, month) || !expect(s, pos, '-') ||
        !digits(s, pos, 2, day)) {
        return std::nullopt;
    }
    if (!expect(s, pos, 'T') && !expect(s, pos, ' ')) {
        return std::nullopt;
    }
    if (!digits(s, pos, 2, hour) || !expect(s, pos, ':') || !digits(s, pos, 2, minute)) {
        return std::nullopt;
    }
    if (expect(s, pos, ':') && !digits(s, pos, 2, second)) {
        return std::nullopt;
    }
    if (expect(s, pos, '.')) {
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    }

    std::int64_t offset = 0;
    if (pos < s.size()) {
        const char sign = s[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!digits(s, pos, 2, oh)) return std::nullopt;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (pos < s.size() && !digits(s, pos, 2, om)) return std::nullopt;
            offset = (sign == '+' ? 1 : -1) * (oh * 3600 + om * 60);
        }
    }
    if (pos != s.size()) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    return days_from_civil(year, month, day) * 86400
         + hour * 3600 + minute * 60 + second - offset;
}

struct ColumnMap {
    std::optional<std::size_t>                       timestamp;
    std::vector<std::pair<std::size_t, Field>>       fields;
};

ColumnMap map_header(std::string_view header) {
    ColumnMap map;
    const auto cells = split(header);
    for (std::size_t i = 0; i < cells.size(); ++i) {
        const std::string name = lower(cells[i]);
        if (name == "timestamp" || name == "time" || name == "timeinstant") {
            map.timestamp = i;
        } else if (const auto f = CsvSampleLoader::field_for_column(name)) {
            map.fields.emplace_back(i, *f);
        } else {
            WXS_DEBUG("ignoring unknown CSV column '{}'", cells[i]);
        }
    }
    return map;
}

/// Parse one data row; nullopt if the row is malformed.
std::optional<WeatherSample> parse_row(std::string_view line, const ColumnMap& map) {
    const auto cells = split(line);
    if (cells.size() <= *map.timestamp) {
        return std::nullopt;
    }
    const auto ts = CsvSampleLoader::parse_timestamp(cells[*map.timestamp]);
    if (!ts) {
        return std::nullopt;
    }

    WeatherSample sample;
    sample.timestamp = *ts;
    for (const auto& [column, field] : map.fields) {
        if (column >= cells.size() || cells[column].empty()) {
            continue;
        }
        double value = 0.0;
        if (!parse_number(cells[column], value) || !std::isfinite(value)) {
            return std::nullopt;
        }
        sample = sample.with(field, value);
    }
    return sample;
}

}  // namespace

// ─── CsvSampleLoader ──────────────────────────────────────────────────────────

std::optional<Field> CsvSampleLoader::field_for_column(std::string_view header) noexcept {
    if (const auto f = field_from_string(header)) {
        return f;
    }
    if (header == "wind_module")                return Field::WindSpeed;
    if (header == "precipitation_amount")       return Field::Precipitation;
    if (header == "cloud_area_fraction")        return Field::CloudCover;
    if (header == "air_pressure_at_sea_level")  return Field::AirPressure;
    if (header == "significative_wave_height")  return Field::WaveHeight;
    if (header == "relative_peak_period")       return Field::WavePeriod;
    if (header == "mean_wave_direction")        return Field::WaveDirection;
    if (header == "sea_water_temperature")      return Field::WaterTemperature;
    return std::nullopt;
}

std::optional<EpochSeconds> CsvSampleLoader::parse_timestamp(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t epoch = 0;
    if (parse_number(text, epoch)) {
        return epoch;
    }
    return parse_iso8601(text);
}

std::vector<WeatherSample>
CsvSampleLoader::parse_csv_string(const std::string& csv_content) {
    std::vector<WeatherSample> samples;
    std::istringstream stream(csv_content);
    std::string line;
    std::optional<ColumnMap> columns;
    std::size_t line_no = 0;
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        const std::string_view row = trim(line);
        if (row.empty() || row.front() == '#') {
            continue;
        }

        if (!columns) {
            columns = map_header(row);
            if (!columns->timestamp) {
                WXS_WARN("CSV header has no timestamp column; no samples loaded");
                return samples;
            }
            continue;
        }

        if (auto sample = parse_row(row, *columns)) {
            samples.push_back(*sample);
        } else {
            ++skipped;
            WXS_WARN("skipping malformed CSV row {}", line_no);
        }
    }

    WXS_DEBUG("parsed {} samples ({} rows skipped)", samples.size(), skipped);
    return samples;
}

std::optional<std::vector<WeatherSample>>
CsvSampleLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

// ─── CsvSampleSource ──────────────────────────────────────────────────────────

std::vector<WeatherSample>
CsvSampleSource::fetch_samples(const std::string& location_id, TimeRange range) {
    const std::string path = fmt::format("{}/{}.csv", directory_, location_id);
    auto samples = CsvSampleLoader::load_csv(path);
    if (!samples) {
        throw TransientNetworkError(fmt::format("cannot read samples from '{}'", path));
    }
    std::erase_if(*samples, [&](const WeatherSample& s) { return !range.contains(s.timestamp); });
    WXS_INFO("fetched {} samples for '{}'", samples->size(), location_id);
    return std::move(*samples);
}

}  // namespace wxs::core
