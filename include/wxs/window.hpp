#pragma once

/// @file include/wxs/window.hpp
/// @brief WindowSelector: lazy, resampled view of a forecast horizon.
///
/// # Module: Window Selector
///
/// ## Responsibility
/// Cut the user's forecast horizon out of a NormalizedSeries and resample it
/// to a granularity at or coarser than the series interval.
///
/// ## Buckets
/// With window start s = now + start_offset and granularity g, bucket k covers
/// [s + k·g, s + (k+1)·g) and yields one sample stamped s + k·g:
///   - Nearest: the series sample inside the bucket closest to the bucket
///     start
///   - Average: per-field mean of present values in the bucket; wind and
///     wave directions by unit-vector mean; a field absent from every member
///     stays missing
///
/// Buckets with no series sample are not emitted.
///
/// ## Coverage
/// If any part of [s, s + duration) is not backed by data, the view carries a
/// DataCoverageWarning. This is never an error; a window completely outside
/// the data is simply empty.
///
/// ## Guarantees
/// - Lazy: samples are computed on dereference
/// - Restartable: every begin() starts over; the view never changes
/// - The view shares ownership of the series, so it may outlive the caller's
///   handle

#include "wxs/errors.hpp"
#include "wxs/normalizer.hpp"
#include "wxs/types.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace wxs::window {

/// How a bucket with several series samples is reduced to one.
enum class DownsampleMode {
    Nearest,
    Average,
};

[[nodiscard]] const char* to_string(DownsampleMode m) noexcept;

/// Requested forecast horizon, relative to a reference "now".
struct Horizon {
    std::int64_t   start_offset_seconds = 0;      ///< May be negative (past data)
    std::int64_t   duration_seconds     = 86400;  ///< > 0
    std::int64_t   granularity_seconds  = 3600;   ///< Multiple of series interval
    DownsampleMode mode                 = DownsampleMode::Nearest;
};

// ─── WindowView ───────────────────────────────────────────────────────────────

class WindowView {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = WeatherSample;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = WeatherSample;

        Iterator() noexcept = default;

        [[nodiscard]] WeatherSample operator*() const;
        Iterator& operator++() noexcept { ++bucket_; return *this; }
        Iterator  operator++(int) noexcept { Iterator tmp = *this; ++bucket_; return tmp; }

        bool operator==(const Iterator& other) const noexcept {
            return view_ == other.view_ && bucket_ == other.bucket_;
        }

    private:
        friend class WindowView;
        Iterator(const WindowView* view, std::size_t bucket) noexcept
            : view_(view), bucket_(bucket) {}

        const WindowView* view_   = nullptr;
        std::size_t       bucket_ = 0;
    };

    [[nodiscard]] Iterator begin() const noexcept { return Iterator(this, first_bucket_); }
    [[nodiscard]] Iterator end()   const noexcept { return Iterator(this, end_bucket_); }

    /// Number of emitted samples.
    [[nodiscard]] std::size_t size() const noexcept { return end_bucket_ - first_bucket_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// Resampled sample for the i-th emitted bucket. Precondition: i < size().
    [[nodiscard]] WeatherSample at(std::size_t i) const;

    /// Evaluate every bucket into a vector.
    [[nodiscard]] std::vector<WeatherSample> materialize() const;

    [[nodiscard]] const std::optional<DataCoverageWarning>& coverage_warning() const noexcept {
        return warning_;
    }

    [[nodiscard]] TimeRange requested() const noexcept { return requested_; }
    [[nodiscard]] const Horizon& horizon() const noexcept { return horizon_; }

private:
    friend class WindowSelector;

    WindowView(std::shared_ptr<const NormalizedSeries> series,
               Horizon horizon,
               TimeRange requested) noexcept;

    /// Compute bucket `k` (absolute bucket index within the requested window).
    [[nodiscard]] WeatherSample bucket(std::size_t k) const;

    /// Series index range [lo, hi) falling inside bucket `k`.
    [[nodiscard]] std::pair<std::size_t, std::size_t> members(std::size_t k) const noexcept;

    std::shared_ptr<const NormalizedSeries> series_;
    Horizon                                 horizon_;
    TimeRange                               requested_;
    std::size_t                             first_bucket_ = 0;
    std::size_t                             end_bucket_   = 0;
    std::optional<DataCoverageWarning>      warning_;
};

// ─── WindowSelector ───────────────────────────────────────────────────────────

/// Stateless factory for WindowView.
class WindowSelector {
public:
    /// Select `horizon` relative to `now` from `series`.
    ///
    /// # Throws
    /// ConfigurationError if duration or granularity is not positive, or the
    /// granularity is not a whole multiple of the series interval.
    [[nodiscard]] static WindowView
    select(std::shared_ptr<const NormalizedSeries> series,
           const Horizon& horizon,
           EpochSeconds now);
};

}  // namespace wxs::window
