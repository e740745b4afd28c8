/**
 * @file  prop_normalizer_idempotent.cpp
 * @brief Property: normalize(normalize(x)) == normalize(x), and the output is
 *        strictly increasing on a uniform grid.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_normalizer_idempotent
 */

#include <rapidcheck.h>

#include <vector>

#include "wxs/normalizer.hpp"

using namespace wxs;

namespace {

struct RawPoint {
    int  minute;       ///< minutes since epoch, may repeat
    int  temperature;  ///< tenths of °C
    bool has_wind;
    int  wind;         ///< km/h
    int  direction;    ///< degrees
};

std::vector<WeatherSample> to_samples(const std::vector<RawPoint>& raw) {
    std::vector<WeatherSample> out;
    out.reserve(raw.size());
    for (const auto& p : raw) {
        WeatherSample s;
        s.timestamp   = static_cast<EpochSeconds>(p.minute) * 60;
        s.temperature = static_cast<double>(p.temperature) / 10.0;
        if (p.has_wind) {
            s.wind_speed     = static_cast<double>(p.wind);
            s.wind_direction = static_cast<double>(p.direction);
        }
        out.push_back(s);
    }
    return out;
}

}  // namespace

namespace rc {

template <>
struct Arbitrary<RawPoint> {
    static Gen<RawPoint> arbitrary() {
        return gen::build<RawPoint>(
            gen::set(&RawPoint::minute,      gen::inRange(0, 48 * 60)),
            gen::set(&RawPoint::temperature, gen::inRange(-300, 450)),
            gen::set(&RawPoint::has_wind,    gen::arbitrary<bool>()),
            gen::set(&RawPoint::wind,        gen::inRange(0, 120)),
            gen::set(&RawPoint::direction,   gen::inRange(0, 360)));
    }
};

}  // namespace rc

int main() {
    const TimeSeriesNormalizer normalizer;

    // ── Property 1: idempotence ───────────────────────────────────────────────
    rc::check(
        "normalizer: normalize is idempotent",
        [&](const std::vector<RawPoint>& raw) {
            const auto once  = normalizer.normalize(to_samples(raw));
            const auto twice = normalizer.normalize(once.samples());
            RC_ASSERT(once == twice);
        });

    // ── Property 2: uniform, strictly increasing grid ────────────────────────
    rc::check(
        "normalizer: output timestamps are a uniform grid",
        [&](const std::vector<RawPoint>& raw) {
            const auto series = normalizer.normalize(to_samples(raw));
            const auto samples = series.samples();
            for (std::size_t i = 0; i < samples.size(); ++i) {
                RC_ASSERT(samples[i].timestamp % series.interval() == 0);
                if (i > 0) {
                    RC_ASSERT(samples[i].timestamp - samples[i - 1].timestamp == series.interval());
                }
            }
        });

    // ── Property 3: interpolated values stay within observed bounds ──────────
    rc::check(
        "normalizer: temperature never leaves the observed range",
        [&](const std::vector<RawPoint>& raw) {
            RC_PRE(!raw.empty());
            const auto input = to_samples(raw);
            double lo = *input.front().temperature;
            double hi = lo;
            for (const auto& s : input) {
                lo = std::min(lo, *s.temperature);
                hi = std::max(hi, *s.temperature);
            }
            for (const auto& s : normalizer.normalize(input).samples()) {
                if (s.temperature) {
                    RC_ASSERT(*s.temperature >= lo - 1e-9);
                    RC_ASSERT(*s.temperature <= hi + 1e-9);
                }
            }
        });

    return 0;
}
