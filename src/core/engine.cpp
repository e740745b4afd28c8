/// @file src/core/engine.cpp
/// @brief Evaluator: request orchestration.

#include "wxs/engine.hpp"
#include "wxs/logging.hpp"

#include <fmt/format.h>

#include <utility>

namespace wxs::core {

// ─── Evaluator constructor ────────────────────────────────────────────────────

Evaluator::Evaluator(const catalog::IndexCatalog& catalog,
                     SeriesStore& store,
                     NormalizerConfig normalizer,
                     scoring::EngineConfig engine)
    : catalog_(catalog)
    , store_(store)
    , normalizer_(normalizer)
    , resolver_(catalog)
    , engine_(catalog, engine)
{}

// ─── Ingestion ────────────────────────────────────────────────────────────────

void Evaluator::ingest(const std::string& location_id, std::span<const WeatherSample> raw) {
    NormalizedSeries series = normalizer_.normalize(raw);
    WXS_INFO("ingested {} raw samples for '{}' as {} grid points",
             raw.size(), location_id, series.size());
    store_.put_series(location_id, std::move(series));
}

void Evaluator::refresh(const std::string& location_id, SampleSource& source, TimeRange range) {
    const std::vector<WeatherSample> raw = source.fetch_samples(location_id, range);
    ingest(location_id, raw);
}

// ─── Evaluator::evaluate ──────────────────────────────────────────────────────

std::optional<Evaluation>
Evaluator::evaluate(const std::string& location_id,
                    const window::Horizon& horizon,
                    const profile::UserProfile& profile,
                    std::span<const catalog::IndexId> indices,
                    EpochSeconds now) {
    // ── Step 1: Supersede any in-flight request of this stream ───────────────
    const scoring::BatchTicket ticket =
        gate_.issue(fmt::format("{}@{}", profile.user_id, location_id));

    // ── Step 2: Structural checks, before any scoring ─────────────────────────
    const profile::ResolvedProfile resolved = resolver_.resolve(profile, indices);

    auto series = store_.get_series(location_id);
    if (!series) {
        WXS_WARN("no series stored for '{}'", location_id);
        series = std::make_shared<const NormalizedSeries>();
    }
    const window::WindowView view = window::WindowSelector::select(series, horizon, now);
    if (view.coverage_warning()) {
        WXS_DEBUG("{}", view.coverage_warning()->to_string());
    }

    // ── Step 3: Score ─────────────────────────────────────────────────────────
    auto scores = engine_.score(view, resolved, ticket);
    if (!scores) {
        return std::nullopt;
    }

    // ── Step 4: Map to recommendations ────────────────────────────────────────
    const recommend::RecommendationMapper mapper(catalog_, resolved.parameters->params);

    Evaluation out;
    out.location_id = location_id;
    out.indices     = resolved.indices;
    out.coverage    = view.coverage_warning();
    out.generation  = ticket.generation();

    out.recommendations.reserve(scores->size());
    for (const auto& r : *scores) {
        out.recommendations.push_back(mapper.map(r));
    }
    for (catalog::IndexId id : resolved.indices) {
        if (auto rec = mapper.summarize(*scores, id)) {
            out.summary.push_back(std::move(*rec));
        }
    }
    out.scores = std::move(*scores);

    if (!ticket.current()) {
        WXS_INFO("evaluation generation {} for '{}' superseded", ticket.generation(), location_id);
        return std::nullopt;
    }
    return out;
}

std::optional<Evaluation>
Evaluator::evaluate_for_user(const std::string& location_id,
                             const window::Horizon& horizon,
                             const std::string& user_id,
                             std::span<const catalog::IndexId> indices,
                             EpochSeconds now) {
    const auto profile = store_.get_profile(user_id);
    if (!profile) {
        throw ConfigurationError("user", fmt::format("no profile stored for '{}'", user_id));
    }
    return evaluate(location_id, horizon, *profile, indices, now);
}

}  // namespace wxs::core
