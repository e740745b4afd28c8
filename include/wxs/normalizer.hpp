#pragma once

/// @file include/wxs/normalizer.hpp
/// @brief TimeSeriesNormalizer: aligns raw samples to a fixed-interval grid.
///
/// # Module: Time Series Normalizer
///
/// ## Responsibility
/// Turn an unordered, irregularly spaced batch of WeatherSample (possibly with
/// duplicate timestamps and missing fields) into a NormalizedSeries: one
/// sample per grid point, strictly increasing and evenly spaced timestamps.
///
/// ## Grid
/// The grid runs from the earliest timestamp rounded up to a multiple of the
/// interval to the latest timestamp rounded down. Inputs that do not straddle
/// a grid point produce an empty series.
///
/// ## Gap filling
/// For each field independently, a grid point with no exact observation is
/// linearly interpolated between the nearest valid observations before and
/// after it, provided they are at most (max_gap + 1) intervals apart. Wind
/// and wave directions interpolate along the shortest arc. Otherwise the field stays
/// missing. There is no extrapolation past the first/last valid observation.
///
/// ## Edge Cases
/// - Duplicate timestamps: the later sample in input order replaces the
///   earlier one entirely.
/// - Physically invalid values raise ValidationError; nothing is clamped.
/// - Timestamps beyond ±MAX_ABS_TIMESTAMP, or a span needing more than
///   MAX_GRID_POINTS grid points, raise ValidationError.
///
/// ## Guarantees
/// - Stateless and const: safe to call concurrently
/// - Idempotent: normalize(series.samples()) == series

#include "wxs/constants.hpp"
#include "wxs/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace wxs {

// ─── NormalizedSeries ─────────────────────────────────────────────────────────

/// Immutable, evenly spaced sequence of samples.
///
/// Only the normalizer and make() create instances, so the spacing invariant
/// holds for every live object.
class NormalizedSeries {
public:
    /// Empty series with the default interval.
    NormalizedSeries() noexcept = default;

    /// Rebuild a series from stored samples.
    ///
    /// # Returns
    /// `nullopt` if `interval_seconds <= 0` or timestamps are not strictly
    /// increasing in steps of exactly `interval_seconds`.
    [[nodiscard]] static std::optional<NormalizedSeries>
    make(std::int64_t interval_seconds, std::vector<WeatherSample> samples);

    [[nodiscard]] std::int64_t interval() const noexcept { return interval_; }
    [[nodiscard]] std::span<const WeatherSample> samples() const noexcept { return samples_; }
    [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }

    /// Range backed by data: [first timestamp, last timestamp + interval).
    /// Empty range when the series is empty.
    [[nodiscard]] TimeRange coverage() const noexcept;

    /// Index of the sample at exactly `t`, if on the grid and in range.
    [[nodiscard]] std::optional<std::size_t> index_of(EpochSeconds t) const noexcept;

    bool operator==(const NormalizedSeries&) const = default;

private:
    friend class TimeSeriesNormalizer;

    NormalizedSeries(std::int64_t interval, std::vector<WeatherSample> samples) noexcept;

    std::int64_t               interval_ = constants::DEFAULT_INTERVAL_SECONDS;
    std::vector<WeatherSample> samples_;
};

// ─── NormalizerConfig ─────────────────────────────────────────────────────────

struct NormalizerConfig {
    /// Grid spacing in seconds, in (0, MAX_INTERVAL_SECONDS].
    std::int64_t interval_seconds = constants::DEFAULT_INTERVAL_SECONDS;

    /// Longest run of missing grid points filled by interpolation.
    std::size_t max_gap_intervals = constants::DEFAULT_MAX_GAP_INTERVALS;
};

// ─── TimeSeriesNormalizer ─────────────────────────────────────────────────────

class TimeSeriesNormalizer {
public:
    /// # Throws
    /// ConfigurationError if `config.interval_seconds <= 0`.
    explicit TimeSeriesNormalizer(NormalizerConfig config = NormalizerConfig{});

    /// Validate and align `raw` to the configured grid.
    ///
    /// # Throws
    /// ValidationError naming the first offending sample (input index) and
    /// field when any present value is physically invalid.
    [[nodiscard]] NormalizedSeries normalize(std::span<const WeatherSample> raw) const;

    /// Validate one sample. `index` is reported in the error.
    ///
    /// # Throws
    /// ValidationError on the first invalid field.
    static void validate(const WeatherSample& sample, std::size_t index);

    [[nodiscard]] const NormalizerConfig& config() const noexcept { return config_; }

private:
    /// Sort by timestamp, keeping the last of each duplicate group.
    [[nodiscard]] static std::vector<WeatherSample>
    deduplicate(std::span<const WeatherSample> raw);

    /// Fill `field` on every grid sample from the sorted observations.
    void fill_field(std::span<const WeatherSample> observations,
                    Field field,
                    std::vector<WeatherSample>& grid) const;

    NormalizerConfig config_;
};

}  // namespace wxs
