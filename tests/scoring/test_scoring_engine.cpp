/// @file tests/scoring/test_scoring_engine.cpp
/// @brief Tests for ScoringEngine and SupersessionGate.

#include "wxs/scoring.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

using namespace wxs;
using namespace wxs::catalog;
using namespace wxs::scoring;

namespace {

constexpr EpochSeconds H = 3600;

profile::ResolvedProfile resolve(std::vector<IndexId> indices = {}) {
    profile::UserProfile p;
    p.user_id = "ana";
    p.thresholds = {
        {"day_quality.comfort_temperature_min", 16.0},
        {"day_quality.comfort_temperature_max", 24.0},
    };
    return profile::UserProfileResolver(IndexCatalog::standard()).resolve(p, indices);
}

WeatherSample full_sample(EpochSeconds t, double temp) {
    WeatherSample s;
    s.timestamp         = t;
    s.temperature       = temp;
    s.wind_speed        = 10.0;
    s.precipitation     = 0.0;
    s.cloud_cover       = 20.0;
    s.fog_density       = 0.0;
    s.relative_humidity = 60.0;
    s.water_temperature = 18.0;
    return s;
}

std::vector<WeatherSample> day(std::size_t n) {
    std::vector<WeatherSample> out;
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(full_sample(static_cast<EpochSeconds>(i) * H, 5.0 + static_cast<double>(i % 25)));
    }
    return out;
}

}  // namespace

// ─── score_one ────────────────────────────────────────────────────────────────

TEST(ScoreOne, CompleteSampleIsNotDegraded) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve();
    for (IndexId id : ALL_INDICES) {
        const ScoreResult r = engine.score_one(full_sample(0, 20.0), id, *resolved.parameters);
        ASSERT_TRUE(r.value.has_value()) << to_string(id);
        EXPECT_GE(*r.value, 0.0);
        EXPECT_LE(*r.value, 100.0);
        EXPECT_DOUBLE_EQ(r.confidence, 1.0) << to_string(id);
        EXPECT_FALSE(r.warning.has_value()) << to_string(id);
    }
}

TEST(ScoreOne, MissingRequiredFieldDegrades) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve();
    WeatherSample s = full_sample(H, 20.0);
    s.wind_speed.reset();

    const ScoreResult r = engine.score_one(s, IndexId::DayQuality, *resolved.parameters);
    EXPECT_EQ(r.timestamp, H);
    EXPECT_EQ(r.index, IndexId::DayQuality);
    EXPECT_FALSE(r.value.has_value());
    EXPECT_TRUE(r.degraded());
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
    EXPECT_EQ(r.warning, WarningTag::ComputationDegraded);

    // Visibility does not need wind.
    const ScoreResult v = engine.score_one(s, IndexId::Visibility, *resolved.parameters);
    EXPECT_TRUE(v.value.has_value());
}

TEST(ScoreOne, MissingOptionalFieldKeepsValueButTagsResult) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve();
    WeatherSample s = full_sample(0, 20.0);
    s.water_temperature.reset();

    const ScoreResult r = engine.score_one(s, IndexId::ColdShock, *resolved.parameters);
    ASSERT_TRUE(r.value.has_value());
    EXPECT_LT(r.confidence, 1.0);
    EXPECT_GT(r.confidence, 0.0);
    EXPECT_EQ(r.warning, WarningTag::ComputationDegraded);
    EXPECT_TRUE(r.minutes_to_discomfort.has_value());
}

TEST(ScoreOne, MissingFogDegradesVisibility) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve();
    WeatherSample s = full_sample(2 * H, 20.0);
    s.fog_density.reset();

    const ScoreResult r = engine.score_one(s, IndexId::Visibility, *resolved.parameters);
    EXPECT_EQ(r.index, IndexId::Visibility);
    EXPECT_FALSE(r.value.has_value());
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
    EXPECT_EQ(r.warning, WarningTag::ComputationDegraded);
}

TEST(ScoreOne, ColdShockFromWaterTemperatureWithoutAirTemperature) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve();
    WeatherSample s;
    s.wind_speed        = 20.0;
    s.water_temperature = 12.0;
    s.relative_humidity = 60.0;

    const ScoreResult r = engine.score_one(s, IndexId::ColdShock, *resolved.parameters);
    ASSERT_TRUE(r.value.has_value());
    EXPECT_NEAR(*r.value, 67.5, 1e-9);
    EXPECT_DOUBLE_EQ(r.confidence, 1.0);
    EXPECT_FALSE(r.warning.has_value());

    s.water_temperature.reset();
    const ScoreResult none = engine.score_one(s, IndexId::ColdShock, *resolved.parameters);
    EXPECT_FALSE(none.value.has_value());
    EXPECT_EQ(none.warning, WarningTag::ComputationDegraded);
}

TEST(ScoreOne, ClothingCarriesCategory) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve();
    const ScoreResult r = engine.score_one(full_sample(0, 2.0), IndexId::Clothing, *resolved.parameters);
    ASSERT_TRUE(r.category.has_value());
    EXPECT_EQ(*r.category, static_cast<std::size_t>(ClothingLayer::Insulated));
}

// ─── day-quality weighting ────────────────────────────────────────────────────

namespace {

profile::ResolvedProfile weights_only(double temp, double wind, double rain) {
    profile::UserProfile p;
    p.user_id = "weights";
    p.weights = {{"temp", temp}, {"wind", wind}, {"rain", rain}};
    const std::vector<IndexId> wanted = {IndexId::DayQuality};
    return profile::UserProfileResolver(IndexCatalog::standard()).resolve(p, wanted);
}

}  // namespace

TEST(DayQualityWeighting, EqualSubScoresGiveEqualScores) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto a = weights_only(0.5, 0.3, 0.2);
    const auto b = weights_only(0.2, 0.3, 0.5);

    WeatherSample s;
    s.temperature   = 18.0;
    s.wind_speed    = 5.0;
    s.precipitation = 0.0;

    const ScoreResult ra = engine.score_one(s, IndexId::DayQuality, *a.parameters);
    const ScoreResult rb = engine.score_one(s, IndexId::DayQuality, *b.parameters);
    ASSERT_TRUE(ra.value && rb.value);
    EXPECT_NEAR(*ra.value, *rb.value, 1e-9);
    EXPECT_NEAR(*ra.value, 100.0, 1e-9);
}

TEST(DayQualityWeighting, FavourableMetricWeightedHigherScoresAtLeastAsHigh) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto temp_heavy = weights_only(0.5, 0.3, 0.2);
    const auto rain_heavy = weights_only(0.2, 0.3, 0.5);

    WeatherSample s;
    s.temperature   = 18.0;  // comfortable
    s.wind_speed    = 5.0;
    s.precipitation = 2.0;   // not

    const ScoreResult rt = engine.score_one(s, IndexId::DayQuality, *temp_heavy.parameters);
    const ScoreResult rr = engine.score_one(s, IndexId::DayQuality, *rain_heavy.parameters);
    ASSERT_TRUE(rt.value && rr.value);
    EXPECT_GE(*rt.value, *rr.value);
}

// ─── batches ──────────────────────────────────────────────────────────────────

TEST(ScoreBatch, OrderIsTimestampThenRequestedIndex) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve({IndexId::Visibility, IndexId::DayQuality});
    const auto samples = day(3);

    const auto results = engine.score(samples, resolved);
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 6u);
    for (std::size_t k = 0; k < results->size(); ++k) {
        EXPECT_EQ((*results)[k].timestamp, static_cast<EpochSeconds>(k / 2) * H);
        EXPECT_EQ((*results)[k].index, resolved.indices[k % 2]);
    }
}

TEST(ScoreBatch, EmptyWindowGivesEmptyResult) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto results = engine.score(std::span<const WeatherSample>{}, resolve());
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE(results->empty());
}

TEST(ScoreBatch, ParallelMatchesSequential) {
    const ScoringEngine sequential(IndexCatalog::standard(), EngineConfig{1, 1u << 30});
    const ScoringEngine parallel(IndexCatalog::standard(), EngineConfig{4, 1});
    const auto resolved = resolve();
    auto samples = day(500);
    for (std::size_t i = 0; i < samples.size(); i += 7) {
        samples[i].precipitation.reset();
    }

    const auto a = sequential.score(samples, resolved);
    const auto b = parallel.score(samples, resolved);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(*a, *b);
}

TEST(ScoreBatch, DefaultWorkerCountComesFromOpenMP) {
    const ScoringEngine engine(IndexCatalog::standard());
    EXPECT_GE(engine.config().max_workers, 1u);
    const ScoringEngine pinned(IndexCatalog::standard(), EngineConfig{3, 1});
    EXPECT_EQ(pinned.config().max_workers, 3u);
}

TEST(ScoreBatch, ParallelBatchKeepsOrder) {
    const ScoringEngine engine(IndexCatalog::standard(), EngineConfig{4, 1});
    const auto resolved = resolve({IndexId::Clothing, IndexId::DayQuality});
    // Not a multiple of the chunk count.
    const auto samples = day(37);

    const auto results = engine.score(samples, resolved);
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 74u);
    for (std::size_t k = 0; k < results->size(); ++k) {
        EXPECT_EQ((*results)[k].timestamp, static_cast<EpochSeconds>(k / 2) * H);
        EXPECT_EQ((*results)[k].index, resolved.indices[k % 2]);
    }
}

TEST(ScoreBatch, MissingDataNeverAffectsOtherPairs) {
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve({IndexId::ColdShock});
    auto samples = day(3);
    samples[1].wind_speed.reset();

    const auto results = engine.score(samples, resolved);
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE((*results)[0].value.has_value());
    EXPECT_FALSE((*results)[1].value.has_value());
    EXPECT_TRUE((*results)[2].value.has_value());
}

TEST(ScoreBatch, UnresolvedProfileIsConfigurationError) {
    const ScoringEngine engine(IndexCatalog::standard());
    profile::ResolvedProfile bare;
    bare.indices = {IndexId::DayQuality};
    EXPECT_THROW((void)engine.score(day(2), bare), ConfigurationError);
}

TEST(ScoreBatch, ScoresWindowView) {
    const ScoringEngine engine(IndexCatalog::standard());
    auto series = std::make_shared<const NormalizedSeries>(*NormalizedSeries::make(H, day(24)));
    const auto view = window::WindowSelector::select(series, window::Horizon{0, 12 * H, 3 * H}, 0);

    const auto results = engine.score(view, resolve({IndexId::Clothing}));
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 4u);
    EXPECT_EQ((*results)[3].timestamp, 9 * H);
}

// ─── supersession ─────────────────────────────────────────────────────────────

TEST(Supersession, NewerTicketSupersedesOlder) {
    SupersessionGate gate;
    const BatchTicket first  = gate.issue("ana@vigo");
    EXPECT_TRUE(first.current());
    const BatchTicket second = gate.issue("ana@vigo");
    EXPECT_FALSE(first.current());
    EXPECT_TRUE(second.current());
    EXPECT_GT(second.generation(), first.generation());
}

TEST(Supersession, StreamsAreIndependent) {
    SupersessionGate gate;
    const BatchTicket a = gate.issue("ana@vigo");
    const BatchTicket b = gate.issue("bo@vigo");
    EXPECT_TRUE(a.current());
    EXPECT_TRUE(b.current());
}

TEST(Supersession, DefaultTicketIsAlwaysCurrent) {
    EXPECT_TRUE(BatchTicket{}.current());
}

TEST(Supersession, SupersededBatchReturnsNothing) {
    SupersessionGate gate;
    const ScoringEngine engine(IndexCatalog::standard());
    const auto resolved = resolve();

    const BatchTicket stale = gate.issue("ana@vigo");
    const BatchTicket fresh = gate.issue("ana@vigo");

    EXPECT_FALSE(engine.score(day(100), resolved, stale).has_value());
    const auto results = engine.score(day(100), resolved, fresh);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(results->size(), 100u * INDEX_COUNT);
}

TEST(Supersession, ParallelSupersededBatchReturnsNothing) {
    SupersessionGate gate;
    const ScoringEngine engine(IndexCatalog::standard(), EngineConfig{4, 1});
    const auto resolved = resolve();

    const BatchTicket stale = gate.issue("ana@vigo");
    const BatchTicket fresh = gate.issue("ana@vigo");
    EXPECT_FALSE(engine.score(day(200), resolved, stale).has_value());
    EXPECT_TRUE(engine.score(day(200), resolved, fresh).has_value());
}

TEST(Supersession, IdleStreamsAreDropped) {
    SupersessionGate gate;
    {
        const BatchTicket a = gate.issue("ana@vigo");
        const BatchTicket b = gate.issue("bo@vigo");
        EXPECT_EQ(gate.tracked_streams(), 2u);
    }
    const BatchTicket c = gate.issue("cy@vigo");
    EXPECT_EQ(gate.tracked_streams(), 1u);
    EXPECT_TRUE(c.current());
}

TEST(Supersession, GenerationsKeepIncreasingAfterDrop) {
    SupersessionGate gate;
    std::uint64_t first = 0;
    {
        first = gate.issue("ana@vigo").generation();
    }
    (void)gate.issue("bo@vigo");
    const BatchTicket again = gate.issue("ana@vigo");
    EXPECT_GT(again.generation(), first);
    EXPECT_TRUE(again.current());
}

TEST(Supersession, ConcurrentIssueGivesDistinctGenerations) {
    SupersessionGate gate;
    std::vector<std::uint64_t> generations(8);
    std::vector<BatchTicket> tickets(generations.size());
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < generations.size(); ++i) {
        threads.emplace_back([&, i] {
            tickets[i]     = gate.issue("ana@vigo");
            generations[i] = tickets[i].generation();
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    std::sort(generations.begin(), generations.end());
    EXPECT_EQ(std::adjacent_find(generations.begin(), generations.end()), generations.end());
    EXPECT_EQ(generations.back(), generations.size());
}
