#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/wxs/constants.hpp
/// @brief Physical bounds and engine defaults for WXS.
///
/// Formula coefficients are NOT here: they live in CatalogParameters so users
/// can retune them. This file only holds validation bounds and structural
/// defaults.

namespace wxs::constants {

// ─── Grid Defaults ────────────────────────────────────────────────────────────

/// Default normalisation interval: hourly.
static constexpr std::int64_t DEFAULT_INTERVAL_SECONDS = 3600;

/// Default maximum gap (in intervals) filled by linear interpolation.
static constexpr std::size_t DEFAULT_MAX_GAP_INTERVALS = 3;

/// Largest accepted normalisation interval: one year.
static constexpr std::int64_t MAX_INTERVAL_SECONDS = 366LL * 24 * 3600;

/// Accepted sample timestamps lie in [−MAX_ABS_TIMESTAMP, MAX_ABS_TIMESTAMP]
/// (roughly years −1200 to 5100), so grid arithmetic cannot overflow.
static constexpr std::int64_t MAX_ABS_TIMESTAMP = 100'000'000'000LL;

/// Largest grid a single normalize() call builds (~114 years hourly).
static constexpr std::size_t MAX_GRID_POINTS = 1'000'000;

// ─── Physical Bounds ──────────────────────────────────────────────────────────

/// Plausible air temperature range, °C.
static constexpr double AIR_TEMPERATURE_MIN = -100.0;
static constexpr double AIR_TEMPERATURE_MAX = 70.0;

/// Plausible liquid water temperature range, °C.
static constexpr double WATER_TEMPERATURE_MIN = -5.0;
static constexpr double WATER_TEMPERATURE_MAX = 45.0;

static constexpr double CLOUD_COVER_MIN = 0.0;
static constexpr double CLOUD_COVER_MAX = 100.0;

static constexpr double HUMIDITY_MIN = 0.0;
static constexpr double HUMIDITY_MAX = 100.0;

static constexpr double FOG_DENSITY_MIN = 0.0;
static constexpr double FOG_DENSITY_MAX = 1.0;

static constexpr double DIRECTION_MIN = 0.0;
static constexpr double DIRECTION_MAX = 360.0;

// ─── Score Domain ─────────────────────────────────────────────────────────────

/// Every numeric index value lies in [SCORE_MIN, SCORE_MAX].
static constexpr double SCORE_MIN = 0.0;
static constexpr double SCORE_MAX = 100.0;

/// Values within this distance of a band edge are treated as on the edge.
static constexpr double BAND_EDGE_TOLERANCE = 1e-9;

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

// ─── Engine Defaults ──────────────────────────────────────────────────────────

/// Batches smaller than this are evaluated on the calling thread.
static constexpr std::size_t MIN_PARALLEL_PAIRS = 64;

}  // namespace wxs::constants
