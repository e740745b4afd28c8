/**
 * @file  bench/bench_scoring.cpp
 * @brief Google Benchmark suite for normalisation and batch scoring.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize                 raw hourly-ish samples → uniform grid
 *   BM_ScoreOne/<index>          single (sample, index) pair
 *   BM_Score_Sequential          N samples × all indices, one thread
 *   BM_Score_Parallel            N samples × all indices, worker pool
 *   BM_Summarize                 aggregate a scored batch into bands
 *
 * Build (CMake):
 *   cmake -DWXS_BENCH=ON ..
 *   cmake --build . --target bench_scoring
 *   ./bench_scoring --benchmark_format=json
 *
 * Throughput units: items/second (samples or pairs processed).
 */

#include "benchmark/benchmark.h"

#include "wxs/normalizer.hpp"
#include "wxs/profile.hpp"
#include "wxs/recommendation.hpp"
#include "wxs/scoring.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

using namespace wxs;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N samples with a diurnal temperature cycle and every field present.
static std::vector<WeatherSample> make_samples(std::size_t n, EpochSeconds step = 3600) {
    std::vector<WeatherSample> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double h = static_cast<double>(i % 24);
        WeatherSample& s = v[i];
        s.timestamp         = static_cast<EpochSeconds>(i) * step;
        s.temperature       = 15.0 + 8.0 * std::sin(h / 24.0 * 6.283185307179586);
        s.wind_speed        = 5.0 + static_cast<double>(i % 30);
        s.wind_direction    = static_cast<double>((i * 17) % 360);
        s.precipitation     = (i % 7 == 0) ? 1.5 : 0.0;
        s.cloud_cover       = static_cast<double>((i * 13) % 101);
        s.fog_density       = (i % 11 == 0) ? 0.4 : 0.0;
        s.relative_humidity = 55.0 + static_cast<double>(i % 40);
        s.water_temperature = 14.0 + 0.1 * static_cast<double>(i % 20);
    }
    return v;
}

/// Irregular samples: 40-minute spacing with a dropped reading every 9th step.
static std::vector<WeatherSample> make_raw(std::size_t n) {
    auto v = make_samples(n, 2400);
    std::vector<WeatherSample> out;
    out.reserve(n);
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i % 9 != 4) out.push_back(v[i]);
    }
    return out;
}

static profile::ResolvedProfile default_profile() {
    return profile::UserProfileResolver(catalog::IndexCatalog::standard())
        .resolve(profile::UserProfile{}, {});
}

// ── Normalizer ─────────────────────────────────────────────────────────────────

static void BM_Normalize(benchmark::State& state) {
    const auto raw = make_raw(static_cast<std::size_t>(state.range(0)));
    const TimeSeriesNormalizer normalizer;
    for (auto _ : state) {
        auto series = normalizer.normalize(raw);
        benchmark::DoNotOptimize(series);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(raw.size()));
}
BENCHMARK(BM_Normalize)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMicrosecond);

// ── Single pair ────────────────────────────────────────────────────────────────

static void BM_ScoreOne(benchmark::State& state) {
    const auto id      = static_cast<catalog::IndexId>(state.range(0));
    const auto sample  = make_samples(1).front();
    const auto profile = default_profile();
    const scoring::ScoringEngine engine(catalog::IndexCatalog::standard());
    for (auto _ : state) {
        auto r = engine.score_one(sample, id, *profile.parameters);
        benchmark::DoNotOptimize(r);
    }
    state.SetLabel(std::string(catalog::to_string(id)));
}
BENCHMARK(BM_ScoreOne)->DenseRange(0, static_cast<int>(catalog::INDEX_COUNT) - 1);

// ── Batch scoring ──────────────────────────────────────────────────────────────

static void score_batch(benchmark::State& state, std::size_t min_parallel_pairs) {
    const auto samples = make_samples(static_cast<std::size_t>(state.range(0)));
    const auto profile = default_profile();
    scoring::EngineConfig config;
    config.min_parallel_pairs = min_parallel_pairs;
    const scoring::ScoringEngine engine(catalog::IndexCatalog::standard(), config);
    for (auto _ : state) {
        auto results = engine.score(samples, profile);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(samples.size() * catalog::INDEX_COUNT));
}

static void BM_Score_Sequential(benchmark::State& state) {
    score_batch(state, static_cast<std::size_t>(-1));
}
BENCHMARK(BM_Score_Sequential)->RangeMultiplier(4)->Range(24, 24576)->Unit(benchmark::kMicrosecond);

static void BM_Score_Parallel(benchmark::State& state) {
    score_batch(state, constants::MIN_PARALLEL_PAIRS);
}
BENCHMARK(BM_Score_Parallel)->RangeMultiplier(4)->Range(24, 24576)->Unit(benchmark::kMicrosecond)->UseRealTime();

// ── Recommendation ─────────────────────────────────────────────────────────────

static void BM_Summarize(benchmark::State& state) {
    const auto samples = make_samples(static_cast<std::size_t>(state.range(0)));
    const auto profile = default_profile();
    const scoring::ScoringEngine engine(catalog::IndexCatalog::standard());
    const auto results = engine.score(samples, profile);
    const recommend::RecommendationMapper mapper(catalog::IndexCatalog::standard(),
                                                 profile.parameters->params);
    for (auto _ : state) {
        for (catalog::IndexId id : catalog::ALL_INDICES) {
            auto rec = mapper.summarize(*results, id);
            benchmark::DoNotOptimize(rec);
        }
    }
}
BENCHMARK(BM_Summarize)->Arg(168)->Arg(24 * 14);

BENCHMARK_MAIN();
