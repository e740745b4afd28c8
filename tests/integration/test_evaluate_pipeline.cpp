/// @file tests/integration/test_evaluate_pipeline.cpp
/// @brief End-to-end tests for the evaluation pipeline.
///
/// These tests exercise the complete path:
///   CSV → CsvSampleLoader → TimeSeriesNormalizer → SeriesStore →
///   WindowSelector → UserProfileResolver → ScoringEngine →
///   RecommendationMapper → Evaluation

#include "wxs/config_loader.hpp"
#include "wxs/data_loader.hpp"
#include "wxs/engine.hpp"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <map>
#include <string>
#include <vector>

using namespace wxs;
using namespace wxs::catalog;
using namespace wxs::core;

namespace {

constexpr EpochSeconds JUNE_1_2024 = 1717200000;
constexpr EpochSeconds H = 3600;

/// Hourly forecast rows in the column layout of the regional forecast feed.
std::string forecast_csv(std::size_t hours, double temperature, double wind) {
    std::string csv =
        "timeInstant,temperature,wind_module,precipitation_amount,cloud_area_fraction,"
        "fog_density,relative_humidity,sea_water_temperature\n";
    for (std::size_t i = 0; i < hours; ++i) {
        csv += fmt::format("{},{},{},0.0,20,0.0,60,18\n",
                           JUNE_1_2024 + static_cast<EpochSeconds>(i) * H, temperature, wind);
    }
    return csv;
}

profile::UserProfile profile_with(std::map<std::string, double> weights) {
    profile::UserProfile p;
    p.user_id = "ana";
    p.weights = std::move(weights);
    p.thresholds = {
        {"day_quality.comfort_temperature_min", 16.0},
        {"day_quality.comfort_temperature_max", 24.0},
    };
    return p;
}

window::Horizon hours(EpochSeconds n) {
    return window::Horizon{0, n * H, H, window::DownsampleMode::Nearest};
}

/// Source serving a fixed sample list, optionally failing.
class FakeSource final : public SampleSource {
public:
    explicit FakeSource(std::vector<WeatherSample> samples, bool fail = false)
        : samples_(std::move(samples)), fail_(fail) {}

    std::vector<WeatherSample> fetch_samples(const std::string& location_id,
                                             TimeRange range) override {
        ++calls;
        if (fail_) {
            throw TransientNetworkError("forecast service unavailable for " + location_id);
        }
        std::vector<WeatherSample> out;
        for (const auto& s : samples_) {
            if (range.contains(s.timestamp)) out.push_back(s);
        }
        return out;
    }

    int calls = 0;

private:
    std::vector<WeatherSample> samples_;
    bool                       fail_;
};

}  // namespace

// ─── Full evaluation ──────────────────────────────────────────────────────────

TEST(EvaluatePipeline, ScoresEveryPairAndSummarises) {
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(forecast_csv(24, 20.0, 10.0)));

    const auto ev = evaluator.evaluate("vigo", hours(6), profile_with({}), {}, JUNE_1_2024);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->location_id, "vigo");
    EXPECT_FALSE(ev->coverage.has_value());
    ASSERT_EQ(ev->indices.size(), INDEX_COUNT);
    ASSERT_EQ(ev->scores.size(), 6 * INDEX_COUNT);
    ASSERT_EQ(ev->recommendations.size(), ev->scores.size());
    ASSERT_EQ(ev->summary.size(), INDEX_COUNT);

    for (std::size_t k = 0; k < ev->scores.size(); ++k) {
        const auto& r = ev->scores[k];
        EXPECT_EQ(r.timestamp, JUNE_1_2024 + static_cast<EpochSeconds>(k / INDEX_COUNT) * H);
        ASSERT_TRUE(r.value.has_value());
        EXPECT_GE(*r.value, 0.0);
        EXPECT_LE(*r.value, 100.0);
        ASSERT_TRUE(ev->recommendations[k].has_value());
        EXPECT_EQ(ev->recommendations[k]->timestamp, r.timestamp);
    }
}

TEST(EvaluatePipeline, DifferentWeightsGiveDifferentDayQuality) {
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(forecast_csv(6, 30.0, 5.0)));
    const std::vector<IndexId> wanted = {IndexId::DayQuality};

    auto heat_averse = profile_with({{"temperature", 0.5}, {"wind", 0.3}, {"precipitation", 0.2}});
    auto rain_averse = profile_with({{"temperature", 0.2}, {"wind", 0.3}, {"precipitation", 0.5}});
    rain_averse.user_id = "bo";

    const auto a = evaluator.evaluate("vigo", hours(3), heat_averse, wanted, JUNE_1_2024);
    const auto b = evaluator.evaluate("vigo", hours(3), rain_averse, wanted, JUNE_1_2024);
    ASSERT_TRUE(a && b);
    ASSERT_EQ(a->scores.size(), 3u);
    EXPECT_NEAR(*a->scores[0].value, 70.0, 1e-9);
    EXPECT_NEAR(*b->scores[0].value, 88.0, 1e-9);
    EXPECT_EQ(a->summary.front().label, "good");
    EXPECT_EQ(b->summary.front().label, "excellent");
}

TEST(EvaluatePipeline, MissingWindDegradesOnlyWindIndices) {
    std::string csv = forecast_csv(4, 20.0, 10.0);
    // Two more hours without wind: nothing to interpolate towards.
    csv += fmt::format("{},20,,0.0,20,0.0,60,18\n", JUNE_1_2024 + 4 * H);
    csv += fmt::format("{},20,,0.0,20,0.0,60,18\n", JUNE_1_2024 + 5 * H);

    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(csv));

    const std::vector<IndexId> wanted = {IndexId::ColdShock, IndexId::Visibility};
    const auto ev = evaluator.evaluate("vigo", hours(6), profile_with({}), wanted, JUNE_1_2024);
    ASSERT_TRUE(ev.has_value());
    ASSERT_EQ(ev->scores.size(), 12u);

    const auto& cold_late = ev->scores[5 * 2];
    EXPECT_EQ(cold_late.index, IndexId::ColdShock);
    EXPECT_FALSE(cold_late.value.has_value());
    EXPECT_EQ(cold_late.warning, WarningTag::ComputationDegraded);
    EXPECT_FALSE(ev->recommendations[5 * 2].has_value());

    const auto& vis_late = ev->scores[5 * 2 + 1];
    EXPECT_TRUE(vis_late.value.has_value());

    // The summary still covers cold shock from the hours that had wind.
    ASSERT_EQ(ev->summary.size(), 2u);
}

TEST(EvaluatePipeline, WindowPastDataCarriesCoverageWarning) {
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(forecast_csv(24, 20.0, 10.0)));

    const auto ev = evaluator.evaluate("vigo", hours(10), profile_with({}),
                                       std::vector<IndexId>{IndexId::Visibility},
                                       JUNE_1_2024 + 20 * H);
    ASSERT_TRUE(ev.has_value());
    ASSERT_TRUE(ev->coverage.has_value());
    EXPECT_EQ(ev->coverage->covered, (TimeRange{JUNE_1_2024 + 20 * H, JUNE_1_2024 + 24 * H}));
    EXPECT_EQ(ev->scores.size(), 4u);
}

TEST(EvaluatePipeline, UnknownLocationIsEmptyWithWarning) {
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    const auto ev = evaluator.evaluate("nowhere", hours(6), profile_with({}), {}, JUNE_1_2024);
    ASSERT_TRUE(ev.has_value());
    EXPECT_TRUE(ev->scores.empty());
    EXPECT_TRUE(ev->summary.empty());
    EXPECT_TRUE(ev->coverage.has_value());
}

// ─── Failures ─────────────────────────────────────────────────────────────────

TEST(EvaluatePipeline, InvalidProfileFailsBeforeScoring) {
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(forecast_csv(6, 20.0, 10.0)));
    EXPECT_THROW((void)evaluator.evaluate("vigo", hours(6), profile_with({{"wind", 2.0}}), {},
                                          JUNE_1_2024),
                 ConfigurationError);
}

TEST(EvaluatePipeline, InvalidSampleRejectsIngestion) {
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    std::string csv = forecast_csv(2, 20.0, 10.0);
    csv += fmt::format("{},20,-3,0.0,20,0.0,60,18\n", JUNE_1_2024 + 2 * H);
    EXPECT_THROW(evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(csv)), ValidationError);
    EXPECT_EQ(store.get_series("vigo"), nullptr);
}

TEST(EvaluatePipeline, GranularityNotMultipleOfIntervalIsRejected) {
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(forecast_csv(6, 20.0, 10.0)));
    const window::Horizon bad{0, 6 * H, H / 2, window::DownsampleMode::Nearest};
    EXPECT_THROW((void)evaluator.evaluate("vigo", bad, profile_with({}), {}, JUNE_1_2024),
                 ConfigurationError);
}

// ─── Collaborators ────────────────────────────────────────────────────────────

TEST(EvaluatePipeline, RefreshPullsFromSource) {
    FakeSource source(CsvSampleLoader::parse_csv_string(forecast_csv(12, 20.0, 10.0)));
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.refresh("vigo", source, TimeRange{JUNE_1_2024, JUNE_1_2024 + 6 * H});

    EXPECT_EQ(source.calls, 1);
    const auto series = store.get_series("vigo");
    ASSERT_NE(series, nullptr);
    EXPECT_EQ(series->size(), 6u);
}

TEST(EvaluatePipeline, TransientFailureLeavesStoreUntouched) {
    FakeSource source({}, true);
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    EXPECT_THROW(evaluator.refresh("vigo", source, TimeRange{0, H}), TransientNetworkError);
    EXPECT_EQ(store.get_series("vigo"), nullptr);
}

TEST(EvaluatePipeline, EvaluateForStoredUser) {
    InMemoryStore store;
    store.put_profile(ConfigLoader::parse_profile(R"(
user: ana
thresholds:
  day_quality:
    comfort_temperature_min: 16
    comfort_temperature_max: 24
)"));
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(forecast_csv(6, 20.0, 10.0)));

    const auto ev = evaluator.evaluate_for_user("vigo", hours(3), "ana", {}, JUNE_1_2024);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->scores.size(), 3 * INDEX_COUNT);

    EXPECT_THROW((void)evaluator.evaluate_for_user("vigo", hours(3), "bo", {}, JUNE_1_2024),
                 ConfigurationError);
}

// ─── Supersession ─────────────────────────────────────────────────────────────

TEST(EvaluatePipeline, GenerationsIncreasePerStream) {
    InMemoryStore store;
    Evaluator evaluator(IndexCatalog::standard(), store);
    evaluator.ingest("vigo", CsvSampleLoader::parse_csv_string(forecast_csv(6, 20.0, 10.0)));

    const auto first  = evaluator.evaluate("vigo", hours(3), profile_with({}), {}, JUNE_1_2024);
    const auto second = evaluator.evaluate("vigo", hours(3), profile_with({}), {}, JUNE_1_2024);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(second->generation, first->generation + 1);

    auto other = profile_with({});
    other.user_id = "bo";
    const auto third = evaluator.evaluate("vigo", hours(3), other, {}, JUNE_1_2024);
    ASSERT_TRUE(third.has_value());
    EXPECT_GT(third->generation, second->generation);
}
