#pragma once

/// @file include/wxs/engine.hpp
/// @brief Evaluator: the presentation boundary of the scoring engine.
///
/// # Module: Evaluator
///
/// ## Responsibility
/// Orchestrate the full pipeline for one request:
///   stored NormalizedSeries → WindowSelector → UserProfileResolver →
///   ScoringEngine → RecommendationMapper → Evaluation
///
/// ## Usage
/// ```cpp
/// core::InMemoryStore store;
/// core::Evaluator evaluator(catalog::IndexCatalog::standard(), store);
/// auto raw = core::CsvSampleLoader::load_csv("vigo.csv");
/// if (raw) evaluator.ingest("vigo", *raw);
/// auto result = evaluator.evaluate("vigo", horizon, profile, {}, now);
/// if (result) fmt::print("{} scores\n", result->scores.size());
/// ```
///
/// ## Guarantees
/// - ValidationError / ConfigurationError are raised before any scoring
/// - Coverage gaps and missing fields are reported in the result, never thrown
/// - A request superseded by a newer one for the same user and location
///   returns nullopt; nothing from it is merged into later results
/// - Safe to call concurrently for any mix of users and locations

#include "wxs/catalog.hpp"
#include "wxs/collaborators.hpp"
#include "wxs/errors.hpp"
#include "wxs/normalizer.hpp"
#include "wxs/profile.hpp"
#include "wxs/recommendation.hpp"
#include "wxs/scoring.hpp"
#include "wxs/window.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace wxs::core {

// ─── Evaluation ───────────────────────────────────────────────────────────────

/// Result of one evaluate() call.
struct Evaluation {
    std::string                                  location_id;
    std::vector<catalog::IndexId>                indices;          ///< in request order
    std::vector<scoring::ScoreResult>            scores;           ///< timestamp, then index order
    std::vector<std::optional<recommend::Recommendation>> recommendations;  ///< parallel to scores
    std::vector<recommend::Recommendation>       summary;          ///< one per index with data
    std::optional<DataCoverageWarning>           coverage;
    std::uint64_t                                generation = 0;
};

// ─── Evaluator ────────────────────────────────────────────────────────────────

class Evaluator {
public:
    Evaluator(const catalog::IndexCatalog& catalog,
              SeriesStore& store,
              NormalizerConfig normalizer = NormalizerConfig{},
              scoring::EngineConfig engine = scoring::EngineConfig{});

    /// Normalise `raw` and store it for `location_id`.
    ///
    /// # Throws
    /// ValidationError if any sample is physically invalid; nothing is stored.
    void ingest(const std::string& location_id, std::span<const WeatherSample> raw);

    /// Fetch samples for `range` from `source`, then ingest them.
    ///
    /// # Throws
    /// TransientNetworkError from the source; ValidationError as ingest().
    void refresh(const std::string& location_id, SampleSource& source, TimeRange range);

    /// Score `indices` (empty means all) over `horizon` relative to `now`.
    ///
    /// # Throws
    /// ConfigurationError for an invalid profile or horizon.
    ///
    /// # Returns
    /// `nullopt` if a newer request for the same user and location
    /// superseded this one while it ran.
    [[nodiscard]] std::optional<Evaluation>
    evaluate(const std::string& location_id,
             const window::Horizon& horizon,
             const profile::UserProfile& profile,
             std::span<const catalog::IndexId> indices,
             EpochSeconds now);

    /// As above with the profile read from the store.
    ///
    /// # Throws
    /// ConfigurationError if the store has no profile for `user_id`.
    [[nodiscard]] std::optional<Evaluation>
    evaluate_for_user(const std::string& location_id,
                      const window::Horizon& horizon,
                      const std::string& user_id,
                      std::span<const catalog::IndexId> indices,
                      EpochSeconds now);

    [[nodiscard]] const scoring::ScoringEngine& engine() const noexcept { return engine_; }

private:
    const catalog::IndexCatalog&  catalog_;
    SeriesStore&                  store_;
    TimeSeriesNormalizer          normalizer_;
    profile::UserProfileResolver  resolver_;
    scoring::ScoringEngine        engine_;
    scoring::SupersessionGate     gate_;
};

}  // namespace wxs::core
