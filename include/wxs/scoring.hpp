#pragma once

/// @file include/wxs/scoring.hpp
/// @brief ScoringEngine: evaluates every (timestamp, index) pair of a window.
///
/// # Module: Scoring Engine
///
/// ## Responsibility
/// For each sample of a window and each requested index, run the catalog
/// formula under the resolved profile and produce a ScoreResult.
///
/// ## Degradation
///   - all required fields present → value, confidence from the formula
///     (1 unless an optional input was substituted)
///   - a required field missing → value null, confidence 0,
///     WarningTag::ComputationDegraded
///   - confidence < 1 always carries ComputationDegraded
/// Missing data never throws and never affects other pairs.
///
/// ## Concurrency
/// Pairs are independent. Large batches are split into contiguous chunks
/// scored by an OpenMP parallel loop and written into preallocated slots, so the output order is always timestamp
/// then requested index order regardless of scheduling.
///
/// ## Supersession
/// A BatchTicket records the generation of its stream at issue time. Once a
/// newer ticket is issued for the same stream, the older batch stops at the
/// next chunk boundary and returns nullopt; its partial results are dropped.

#include "wxs/catalog.hpp"
#include "wxs/constants.hpp"
#include "wxs/errors.hpp"
#include "wxs/profile.hpp"
#include "wxs/window.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace wxs::scoring {

// ─── ScoreResult ──────────────────────────────────────────────────────────────

struct ScoreResult {
    EpochSeconds                 timestamp  = 0;
    catalog::IndexId             index      = catalog::IndexId::DayQuality;
    std::optional<double>        value;              ///< in [0, 100] when present
    double                       confidence = 0.0;   ///< in [0, 1]
    std::optional<WarningTag>    warning;
    std::optional<std::size_t>   category;           ///< clothing layer ordinal
    std::optional<double>        minutes_to_discomfort;

    [[nodiscard]] bool degraded() const noexcept { return !value.has_value(); }

    bool operator==(const ScoreResult&) const = default;
};

// ─── Supersession ─────────────────────────────────────────────────────────────

/// Handle of one evaluation batch within a stream.
class BatchTicket {
public:
    BatchTicket() = default;

    /// True while no newer ticket exists for the same stream. A default
    /// ticket is always current.
    [[nodiscard]] bool current() const noexcept {
        return !counter_ || counter_->load(std::memory_order_acquire) == generation_;
    }

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

private:
    friend class SupersessionGate;

    BatchTicket(std::shared_ptr<const std::atomic<std::uint64_t>> counter,
                std::uint64_t generation) noexcept
        : counter_(std::move(counter)), generation_(generation) {}

    std::shared_ptr<const std::atomic<std::uint64_t>> counter_;
    std::uint64_t                                     generation_ = 0;
};

/// Generation counters keyed by stream (e.g. "user@location").
///
/// Generations are drawn from one gate-wide sequence, so they increase
/// strictly within a stream even after the stream's entry has been dropped.
/// An entry is dropped once no ticket of that stream is alive.
class SupersessionGate {
public:
    /// Issue a new ticket for `stream`, superseding every earlier one.
    [[nodiscard]] BatchTicket issue(const std::string& stream);

    /// Streams with at least one live ticket as of the last issue().
    [[nodiscard]] std::size_t tracked_streams() const;

private:
    mutable std::mutex                                                  mutex_;
    std::uint64_t                                                       last_generation_ = 0;
    std::map<std::string, std::shared_ptr<std::atomic<std::uint64_t>>> counters_;
};

// ─── ScoringEngine ────────────────────────────────────────────────────────────

struct EngineConfig {
    /// OpenMP threads per batch; 0 means omp_get_max_threads().
    std::size_t max_workers        = 0;
    /// Batches with fewer pairs run on the calling thread.
    std::size_t min_parallel_pairs = constants::MIN_PARALLEL_PAIRS;
};

class ScoringEngine {
public:
    explicit ScoringEngine(const catalog::IndexCatalog& catalog,
                           EngineConfig config = EngineConfig{});

    /// Score every sample of `window` for `resolved.indices`.
    ///
    /// # Returns
    /// `nullopt` only if `ticket` was superseded before the batch completed.
    [[nodiscard]] std::optional<std::vector<ScoreResult>>
    score(const window::WindowView& window,
          const profile::ResolvedProfile& resolved,
          const BatchTicket& ticket = BatchTicket{}) const;

    /// As above over an explicit sample sequence.
    [[nodiscard]] std::optional<std::vector<ScoreResult>>
    score(std::span<const WeatherSample> samples,
          const profile::ResolvedProfile& resolved,
          const BatchTicket& ticket = BatchTicket{}) const;

    /// Evaluate a single pair.
    [[nodiscard]] ScoreResult score_one(const WeatherSample& sample,
                                        catalog::IndexId index,
                                        const catalog::ResolvedParameters& params) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    const catalog::IndexCatalog& catalog_;
    EngineConfig                 config_;
};

}  // namespace wxs::scoring
