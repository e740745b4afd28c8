/// @file tests/core/test_in_memory_store.cpp
/// @brief Tests for InMemoryStore.

#include "wxs/collaborators.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace wxs;
using namespace wxs::core;

namespace {

NormalizedSeries series_of(std::size_t n) {
    std::vector<WeatherSample> samples(n);
    for (std::size_t i = 0; i < n; ++i) {
        samples[i].timestamp   = static_cast<EpochSeconds>(i) * 3600;
        samples[i].temperature = 10.0;
    }
    return *NormalizedSeries::make(3600, std::move(samples));
}

}  // namespace

TEST(InMemoryStoreSeries, MissingLocationIsNull) {
    InMemoryStore store;
    EXPECT_EQ(store.get_series("vigo"), nullptr);
}

TEST(InMemoryStoreSeries, PutReplacesSnapshot) {
    InMemoryStore store;
    store.put_series("vigo", series_of(3));
    const auto before = store.get_series("vigo");
    store.put_series("vigo", series_of(5));
    const auto after = store.get_series("vigo");

    ASSERT_NE(before, nullptr);
    ASSERT_NE(after, nullptr);
    // Readers holding the old snapshot keep it.
    EXPECT_EQ(before->size(), 3u);
    EXPECT_EQ(after->size(), 5u);
}

TEST(InMemoryStoreProfile, RoundTrip) {
    InMemoryStore store;
    EXPECT_FALSE(store.get_profile("ana").has_value());

    profile::UserProfile p;
    p.user_id = "ana";
    p.weights = {{"wind", 0.4}};
    store.put_profile(p);

    const auto loaded = store.get_profile("ana");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, p);
}

TEST(InMemoryStoreSeries, ConcurrentWritersAndReaders) {
    InMemoryStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < 50; ++i) {
                store.put_series("loc" + std::to_string(t), series_of(static_cast<std::size_t>(i % 5 + 1)));
                const auto s = store.get_series("loc" + std::to_string((t + 1) % 4));
                if (s) {
                    EXPECT_GE(s->size(), 1u);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (int t = 0; t < 4; ++t) {
        EXPECT_NE(store.get_series("loc" + std::to_string(t)), nullptr);
    }
}
