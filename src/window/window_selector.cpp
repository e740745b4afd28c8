/// @file src/window/window_selector.cpp
/// @brief WindowSelector / WindowView: horizon extraction and downsampling.

#include "wxs/window.hpp"
#include "wxs/constants.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace wxs::window {

namespace {

/// ceil(a / b) for b > 0 and any sign of a.
std::int64_t ceil_div(std::int64_t a, std::int64_t b) noexcept {
    const std::int64_t q = a / b;
    return (a % b != 0 && a > 0) ? q + 1 : q;
}

/// floor(a / b) for b > 0 and any sign of a.
std::int64_t floor_div(std::int64_t a, std::int64_t b) noexcept {
    const std::int64_t q = a / b;
    return (a % b != 0 && a < 0) ? q - 1 : q;
}

std::optional<double> mean_of(std::span<const WeatherSample> members, Field f) noexcept {
    double sum = 0.0;
    std::size_t n = 0;
    for (const auto& s : members) {
        if (const auto v = s.get(f)) {
            sum += *v;
            ++n;
        }
    }
    if (n == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(n);
}

/// Circular mean of directions in degrees. Missing if the resultant vanishes.
std::optional<double> mean_direction(std::span<const WeatherSample> members, Field f) noexcept {
    constexpr double DEG = 3.14159265358979323846 / 180.0;
    double sx = 0.0;
    double sy = 0.0;
    std::size_t n = 0;
    for (const auto& s : members) {
        if (const auto d = s.get(f)) {
            sx += std::cos(*d * DEG);
            sy += std::sin(*d * DEG);
            ++n;
        }
    }
    if (n == 0 || std::hypot(sx, sy) < 1e-9 * static_cast<double>(n)) {
        return std::nullopt;
    }
    double deg = std::atan2(sy, sx) / DEG;
    if (deg < 0.0) deg += 360.0;
    return deg;
}

}  // namespace

const char* to_string(DownsampleMode m) noexcept {
    switch (m) {
        case DownsampleMode::Nearest: return "nearest";
        case DownsampleMode::Average: return "average";
    }
    return "unknown";
}

// ─── WindowView ───────────────────────────────────────────────────────────────

WindowView::WindowView(std::shared_ptr<const NormalizedSeries> series,
                       Horizon horizon,
                       TimeRange requested) noexcept
    : series_(std::move(series))
    , horizon_(horizon)
    , requested_(requested)
{
    const std::int64_t g = horizon_.granularity_seconds;
    const auto n_buckets = static_cast<std::size_t>(ceil_div(horizon_.duration_seconds, g));

    const TimeRange cov = series_->coverage();
    const TimeRange covered{std::max(requested_.begin, cov.begin),
                            std::min(requested_.end, cov.end)};

    if (covered.empty()) {
        warning_ = DataCoverageWarning{requested_, TimeRange{}};
        first_bucket_ = end_bucket_ = 0;
        return;
    }
    if (covered != requested_) {
        warning_ = DataCoverageWarning{requested_, covered};
    }

    // Emitted buckets are contiguous because the series has no holes. Start
    // from the arithmetic estimate and step past empty edge buckets.
    std::size_t first = static_cast<std::size_t>(
        std::max<std::int64_t>(0, floor_div(covered.begin - requested_.begin, g)));
    std::size_t last_excl = std::min<std::size_t>(
        n_buckets,
        static_cast<std::size_t>(ceil_div(covered.end - requested_.begin, g)));

    auto non_empty = [this](std::size_t k) {
        const auto [lo, hi] = members(k);
        return lo < hi;
    };
    while (first < last_excl && !non_empty(first)) ++first;
    while (last_excl > first && !non_empty(last_excl - 1)) --last_excl;

    first_bucket_ = first;
    end_bucket_   = last_excl;
}

std::pair<std::size_t, std::size_t> WindowView::members(std::size_t k) const noexcept {
    const std::int64_t g  = horizon_.granularity_seconds;
    const EpochSeconds b0 = requested_.begin + static_cast<std::int64_t>(k) * g;
    const EpochSeconds b1 = std::min(b0 + g, requested_.end);

    const auto samples = series_->samples();
    if (samples.empty() || b1 <= b0) {
        return {0, 0};
    }
    const EpochSeconds c0 = samples.front().timestamp;
    const std::int64_t step = series_->interval();
    const auto n = static_cast<std::int64_t>(samples.size());

    const std::int64_t lo = std::clamp<std::int64_t>(ceil_div(b0 - c0, step), 0, n);
    const std::int64_t hi = std::clamp<std::int64_t>(ceil_div(b1 - c0, step), 0, n);
    return {static_cast<std::size_t>(lo), static_cast<std::size_t>(std::max(lo, hi))};
}

WeatherSample WindowView::bucket(std::size_t k) const {
    const auto [lo, hi] = members(k);
    const auto all = series_->samples();
    const EpochSeconds stamp =
        requested_.begin + static_cast<std::int64_t>(k) * horizon_.granularity_seconds;

    if (horizon_.mode == DownsampleMode::Nearest) {
        WeatherSample s = all[lo];
        s.timestamp = stamp;
        return s;
    }

    const auto bucket_members = all.subspan(lo, hi - lo);
    WeatherSample s;
    s.timestamp = stamp;
    for (Field f : ALL_FIELDS) {
        if (is_direction(f)) {
            s = s.with(f, mean_direction(bucket_members, f));
        } else {
            s = s.with(f, mean_of(bucket_members, f));
        }
    }
    return s;
}

WeatherSample WindowView::at(std::size_t i) const {
    return bucket(first_bucket_ + i);
}

std::vector<WeatherSample> WindowView::materialize() const {
    std::vector<WeatherSample> out;
    out.reserve(size());
    for (auto it = begin(); it != end(); ++it) {
        out.push_back(*it);
    }
    return out;
}

WeatherSample WindowView::Iterator::operator*() const {
    return view_->bucket(bucket_);
}

// ─── WindowSelector ───────────────────────────────────────────────────────────

WindowView WindowSelector::select(std::shared_ptr<const NormalizedSeries> series,
                                  const Horizon& horizon,
                                  EpochSeconds now) {
    if (!series) {
        series = std::make_shared<const NormalizedSeries>();
    }
    if (horizon.duration_seconds <= 0) {
        throw ConfigurationError("duration", "window duration must be positive");
    }
    if (horizon.granularity_seconds <= 0) {
        throw ConfigurationError("granularity", "window granularity must be positive");
    }
    if (horizon.granularity_seconds % series->interval() != 0) {
        throw ConfigurationError(
            "granularity",
            "window granularity must be a whole multiple of the series interval");
    }

    const EpochSeconds start = now + horizon.start_offset_seconds;
    const TimeRange requested{start, start + horizon.duration_seconds};
    return WindowView(std::move(series), horizon, requested);
}

}  // namespace wxs::window
