/// @file src/scoring/scoring_engine.cpp
/// @brief ScoringEngine and SupersessionGate implementation.

#include "wxs/scoring.hpp"
#include "wxs/logging.hpp"

#include <omp.h>

#include <algorithm>
#include <cmath>

namespace wxs::scoring {

using catalog::IndexId;

namespace {

constexpr std::size_t CHUNKS_PER_WORKER = 4;

}  // namespace

// ── SupersessionGate ─────────────────────────────────────────────────────────

BatchTicket SupersessionGate::issue(const std::string& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Only the map holds the counter: no batch of that stream is in flight.
    std::erase_if(counters_, [](const auto& entry) { return entry.second.use_count() == 1; });

    const std::uint64_t generation = ++last_generation_;
    auto& counter = counters_[stream];
    if (!counter) {
        counter = std::make_shared<std::atomic<std::uint64_t>>(generation);
    } else {
        counter->store(generation, std::memory_order_release);
    }
    return BatchTicket(counter, generation);
}

std::size_t SupersessionGate::tracked_streams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_.size();
}

// ── ScoringEngine ────────────────────────────────────────────────────────────

ScoringEngine::ScoringEngine(const catalog::IndexCatalog& catalog, EngineConfig config)
    : catalog_(catalog)
    , config_(config)
{
    if (config_.max_workers == 0) {
        config_.max_workers = static_cast<std::size_t>(std::max(1, omp_get_max_threads()));
    }
}

ScoreResult ScoringEngine::score_one(const WeatherSample& sample,
                                     IndexId index,
                                     const catalog::ResolvedParameters& params) const {
    const catalog::IndexDefinition& def = catalog_.definition(index);

    ScoreResult r;
    r.timestamp = sample.timestamp;
    r.index     = index;

    if (!sample.has_all(def.required_fields)) {
        r.confidence = 0.0;
        r.warning    = WarningTag::ComputationDegraded;
        return r;
    }

    const std::optional<catalog::IndexOutput> out = def.formula(sample, params);
    if (!out || !std::isfinite(out->value)) {
        r.confidence = 0.0;
        r.warning    = WarningTag::ComputationDegraded;
        return r;
    }

    r.value                 = std::clamp(out->value, constants::SCORE_MIN, constants::SCORE_MAX);
    r.confidence            = std::clamp(out->confidence, 0.0, 1.0);
    r.category              = out->category;
    r.minutes_to_discomfort = out->minutes_to_discomfort;
    if (r.confidence < 1.0 - constants::FLOAT_EPSILON) {
        r.warning = WarningTag::ComputationDegraded;
    }
    return r;
}

std::optional<std::vector<ScoreResult>>
ScoringEngine::score(const window::WindowView& window,
                     const profile::ResolvedProfile& resolved,
                     const BatchTicket& ticket) const {
    const std::vector<WeatherSample> samples = window.materialize();
    return score(std::span<const WeatherSample>(samples), resolved, ticket);
}

std::optional<std::vector<ScoreResult>>
ScoringEngine::score(std::span<const WeatherSample> samples,
                     const profile::ResolvedProfile& resolved,
                     const BatchTicket& ticket) const {
    if (!resolved.parameters) {
        throw ConfigurationError("profile", "profile has not been resolved");
    }
    if (!ticket.current()) {
        return std::nullopt;
    }

    const auto& indices = resolved.indices;
    const auto& params  = *resolved.parameters;
    const std::size_t n_idx   = indices.size();
    const std::size_t n_pairs = samples.size() * n_idx;

    std::vector<ScoreResult> results(n_pairs);
    std::atomic<bool> abandoned{false};

    auto run = [&](std::size_t begin, std::size_t end) {
        if (abandoned.load(std::memory_order_relaxed) || !ticket.current()) {
            abandoned.store(true, std::memory_order_relaxed);
            return;
        }
        for (std::size_t k = begin; k < end; ++k) {
            results[k] = score_one(samples[k / n_idx], indices[k % n_idx], params);
        }
    };

    if (n_pairs < config_.min_parallel_pairs || config_.max_workers <= 1) {
        run(0, n_pairs);
    } else {
        // Contiguous chunks, a few per thread, so supersession is noticed
        // between chunks.
        const std::size_t n_chunks = std::min(n_pairs, config_.max_workers * CHUNKS_PER_WORKER);
        const std::size_t chunk    = (n_pairs + n_chunks - 1) / n_chunks;
        const auto        n_loop   = static_cast<std::int64_t>(n_chunks);

        #pragma omp parallel for num_threads(static_cast<int>(config_.max_workers)) schedule(static)
        for (std::int64_t c = 0; c < n_loop; ++c) {
            const std::size_t begin = static_cast<std::size_t>(c) * chunk;
            run(std::min(begin, n_pairs), std::min(begin + chunk, n_pairs));
        }
    }

    if (abandoned.load(std::memory_order_relaxed) || !ticket.current()) {
        WXS_INFO("batch generation {} for '{}' superseded; {} pairs discarded",
                 ticket.generation(), resolved.user_id, n_pairs);
        return std::nullopt;
    }

    WXS_DEBUG("scored {} samples x {} indices", samples.size(), n_idx);
    return results;
}

}  // namespace wxs::scoring
