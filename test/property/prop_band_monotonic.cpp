/**
 * @file  prop_band_monotonic.cpp
 * @brief Property: band ordinals are non-decreasing in value for every
 *        continuous index, and the cold-shock risk is non-decreasing as the
 *        water gets colder.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_band_monotonic
 */

#include <rapidcheck.h>

#include <algorithm>

#include "wxs/formulas.hpp"
#include "wxs/recommendation.hpp"

using namespace wxs;
using namespace wxs::catalog;

int main() {
    const auto& catalog = IndexCatalog::standard();
    const recommend::RecommendationMapper mapper(catalog, catalog.parameters());

    // ── Property 1: band_of is monotone ──────────────────────────────────────
    rc::check(
        "bands: higher value never maps to a lower ordinal",
        [&] {
            const int a = *rc::gen::inRange(0, 100'001);
            const int b = *rc::gen::inRange(0, 100'001);
            const double lo = static_cast<double>(std::min(a, b)) / 1000.0;
            const double hi = static_cast<double>(std::max(a, b)) / 1000.0;
            for (IndexId id : {IndexId::DayQuality, IndexId::ColdShock, IndexId::Visibility}) {
                RC_ASSERT(mapper.band_of(id, lo) <= mapper.band_of(id, hi));
                RC_ASSERT(mapper.band_of(id, hi) < mapper.scale(id).labels.size());
            }
        });

    // ── Property 2: colder water never lowers cold-shock risk ────────────────
    rc::check(
        "bands: cold-shock risk is non-increasing in water temperature",
        [&] {
            ResolvedParameters r;
            r.params = catalog.parameters();

            const int wa   = *rc::gen::inRange(-20, 350);
            const int wb   = *rc::gen::inRange(-20, 350);
            const int wind = *rc::gen::inRange(0, 800);

            WeatherSample s;
            s.temperature       = 20.0;
            s.wind_speed        = static_cast<double>(wind) / 10.0;
            s.relative_humidity = 60.0;

            s.water_temperature = static_cast<double>(std::min(wa, wb)) / 10.0;
            const auto cold = formulas::cold_shock(s, r);
            s.water_temperature = static_cast<double>(std::max(wa, wb)) / 10.0;
            const auto warm = formulas::cold_shock(s, r);

            RC_ASSERT(cold.has_value());
            RC_ASSERT(warm.has_value());
            RC_ASSERT(cold->value >= warm->value);
            RC_ASSERT(*cold->minutes_to_discomfort <= *warm->minutes_to_discomfort);
            RC_ASSERT(mapper.band_of(IndexId::ColdShock, cold->value) >=
                      mapper.band_of(IndexId::ColdShock, warm->value));
        });

    return 0;
}
