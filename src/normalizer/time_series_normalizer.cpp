/// @file src/normalizer/time_series_normalizer.cpp
/// @brief TimeSeriesNormalizer: validation, deduplication and grid filling.
///
/// normalize() runs in three passes:
///   1. Validate every sample (throws on the first invalid field)
///   2. Stable-sort by timestamp, keeping the last sample of each duplicate
///   3. For each field, sweep the grid once, copying exact hits and
///      interpolating across gaps no longer than max_gap intervals

#include "wxs/normalizer.hpp"
#include "wxs/errors.hpp"
#include "wxs/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace wxs {

namespace {

// Preconditions: |t| <= MAX_ABS_TIMESTAMP, 0 < step <= MAX_INTERVAL_SECONDS.
EpochSeconds floor_to(EpochSeconds t, std::int64_t step) noexcept {
    std::int64_t rem = t % step;
    if (rem < 0) rem += step;
    return t - rem;
}

EpochSeconds ceil_to(EpochSeconds t, std::int64_t step) noexcept {
    const EpochSeconds f = floor_to(t, step);
    return f == t ? t : f + step;
}

bool in_range(double v, double lo, double hi) noexcept {
    return v >= lo && v <= hi;
}

/// True if `v` is acceptable for `field`. Precondition: v is finite.
bool physically_valid(Field field, double v) noexcept {
    using namespace constants;
    switch (field) {
        case Field::Temperature:      return in_range(v, AIR_TEMPERATURE_MIN, AIR_TEMPERATURE_MAX);
        case Field::WaterTemperature: return in_range(v, WATER_TEMPERATURE_MIN, WATER_TEMPERATURE_MAX);
        case Field::WindSpeed:        return v >= 0.0;
        case Field::WindDirection:    return in_range(v, DIRECTION_MIN, DIRECTION_MAX);
        case Field::Precipitation:    return v >= 0.0;
        case Field::CloudCover:       return in_range(v, CLOUD_COVER_MIN, CLOUD_COVER_MAX);
        case Field::FogDensity:       return in_range(v, FOG_DENSITY_MIN, FOG_DENSITY_MAX);
        case Field::Visibility:       return v >= 0.0;
        case Field::RelativeHumidity: return in_range(v, HUMIDITY_MIN, HUMIDITY_MAX);
        case Field::AirPressure:      return v > 0.0;
        case Field::WaveHeight:       return v >= 0.0;
        case Field::WavePeriod:       return v >= 0.0;
        case Field::WaveDirection:    return in_range(v, DIRECTION_MIN, DIRECTION_MAX);
    }
    return false;
}

/// Linear interpolation; directions take the shortest arc.
double interpolate(Field field, double v0, double v1, double frac) noexcept {
    if (is_direction(field)) {
        const double delta = std::fmod(v1 - v0 + 540.0, 360.0) - 180.0;
        double v = std::fmod(v0 + delta * frac, 360.0);
        if (v < 0.0) v += 360.0;
        return v;
    }
    return v0 + (v1 - v0) * frac;
}

}  // namespace

// ─── NormalizedSeries ─────────────────────────────────────────────────────────

NormalizedSeries::NormalizedSeries(std::int64_t interval,
                                   std::vector<WeatherSample> samples) noexcept
    : interval_(interval)
    , samples_(std::move(samples))
{}

std::optional<NormalizedSeries>
NormalizedSeries::make(std::int64_t interval_seconds, std::vector<WeatherSample> samples) {
    if (interval_seconds <= 0) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < samples.size(); ++i) {
        if (samples[i].timestamp - samples[i - 1].timestamp != interval_seconds) {
            return std::nullopt;
        }
    }
    return NormalizedSeries(interval_seconds, std::move(samples));
}

TimeRange NormalizedSeries::coverage() const noexcept {
    if (samples_.empty()) {
        return TimeRange{};
    }
    return TimeRange{samples_.front().timestamp, samples_.back().timestamp + interval_};
}

std::optional<std::size_t> NormalizedSeries::index_of(EpochSeconds t) const noexcept {
    if (samples_.empty()) {
        return std::nullopt;
    }
    const EpochSeconds offset = t - samples_.front().timestamp;
    if (offset < 0 || offset % interval_ != 0) {
        return std::nullopt;
    }
    const auto idx = static_cast<std::size_t>(offset / interval_);
    if (idx >= samples_.size()) {
        return std::nullopt;
    }
    return idx;
}

// ─── TimeSeriesNormalizer ─────────────────────────────────────────────────────

TimeSeriesNormalizer::TimeSeriesNormalizer(NormalizerConfig config)
    : config_(config)
{
    if (config_.interval_seconds <= 0) {
        throw ConfigurationError("interval_seconds", "normalisation interval must be positive");
    }
    if (config_.interval_seconds > constants::MAX_INTERVAL_SECONDS) {
        throw ConfigurationError("interval_seconds",
                                 fmt::format("normalisation interval exceeds {}s",
                                             constants::MAX_INTERVAL_SECONDS));
    }
}

void TimeSeriesNormalizer::validate(const WeatherSample& sample, std::size_t index) {
    if (sample.timestamp > constants::MAX_ABS_TIMESTAMP ||
        sample.timestamp < -constants::MAX_ABS_TIMESTAMP) {
        throw ValidationError(index, sample.timestamp, "timestamp outside the supported range");
    }
    for (Field f : ALL_FIELDS) {
        const auto v = sample.get(f);
        if (!v) {
            continue;
        }
        if (!std::isfinite(*v) || !physically_valid(f, *v)) {
            throw ValidationError(index, sample.timestamp, f, *v);
        }
    }
}

std::vector<WeatherSample>
TimeSeriesNormalizer::deduplicate(std::span<const WeatherSample> raw) {
    std::vector<WeatherSample> sorted(raw.begin(), raw.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const WeatherSample& a, const WeatherSample& b) {
                         return a.timestamp < b.timestamp;
                     });

    // Stable sort keeps input order within a timestamp, so the last element
    // of each run is the last write.
    std::vector<WeatherSample> unique;
    unique.reserve(sorted.size());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const bool last_of_run = (i + 1 == sorted.size()) ||
                                 (sorted[i + 1].timestamp != sorted[i].timestamp);
        if (last_of_run) {
            unique.push_back(std::move(sorted[i]));
        }
    }
    return unique;
}

void TimeSeriesNormalizer::fill_field(std::span<const WeatherSample> observations,
                                      Field field,
                                      std::vector<WeatherSample>& grid) const {
    std::vector<std::pair<EpochSeconds, double>> valid;
    valid.reserve(observations.size());
    for (const auto& s : observations) {
        if (const auto v = s.get(field)) {
            valid.emplace_back(s.timestamp, *v);
        }
    }
    if (valid.empty()) {
        return;
    }

    const std::int64_t max_span =
        static_cast<std::int64_t>(config_.max_gap_intervals + 1) * config_.interval_seconds;

    std::size_t next = 0;  // first valid observation with time >= t
    for (auto& point : grid) {
        const EpochSeconds t = point.timestamp;
        while (next < valid.size() && valid[next].first < t) {
            ++next;
        }

        if (next < valid.size() && valid[next].first == t) {
            point = point.with(field, valid[next].second);
            continue;
        }
        if (next == 0 || next == valid.size()) {
            continue;  // before first / after last observation
        }

        const auto& [t0, v0] = valid[next - 1];
        const auto& [t1, v1] = valid[next];
        if (t1 - t0 > max_span) {
            continue;  // gap too long to guess
        }
        const double frac = static_cast<double>(t - t0) / static_cast<double>(t1 - t0);
        point = point.with(field, interpolate(field, v0, v1, frac));
    }
}

NormalizedSeries TimeSeriesNormalizer::normalize(std::span<const WeatherSample> raw) const {
    for (std::size_t i = 0; i < raw.size(); ++i) {
        validate(raw[i], i);
    }

    const auto observations = deduplicate(raw);
    if (observations.empty()) {
        return NormalizedSeries(config_.interval_seconds, {});
    }

    const std::int64_t step  = config_.interval_seconds;
    const EpochSeconds first = ceil_to(observations.front().timestamp, step);
    const EpochSeconds last  = floor_to(observations.back().timestamp, step);
    if (last < first) {
        WXS_DEBUG("normalize: {} samples do not straddle a grid point", observations.size());
        return NormalizedSeries(config_.interval_seconds, {});
    }

    const auto count = static_cast<std::size_t>((last - first) / step + 1);
    if (count > constants::MAX_GRID_POINTS) {
        const auto latest = std::max_element(
            raw.begin(), raw.end(),
            [](const WeatherSample& a, const WeatherSample& b) { return a.timestamp < b.timestamp; });
        throw ValidationError(static_cast<std::size_t>(latest - raw.begin()), latest->timestamp,
                              fmt::format("span needs {} grid points, more than {}",
                                          count, constants::MAX_GRID_POINTS));
    }
    std::vector<WeatherSample> grid(count);
    for (std::size_t k = 0; k < count; ++k) {
        grid[k].timestamp = first + static_cast<EpochSeconds>(k) * step;
    }

    for (Field f : ALL_FIELDS) {
        fill_field(observations, f, grid);
    }

    WXS_DEBUG("normalize: {} raw ({} unique) -> {} grid points at {}s",
              raw.size(), observations.size(), count, step);
    return NormalizedSeries(config_.interval_seconds, std::move(grid));
}

}  // namespace wxs
