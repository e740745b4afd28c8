/**
 * @file  fuzz_normalizer.cpp
 * @brief libFuzzer target for TimeSeriesNormalizer::normalize
 *
 * Build:
 *   cmake -DWXS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_normalizer
 *
 * Run for 60 seconds:
 *   ./fuzz_normalizer -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. Either ValidationError is thrown or a series is returned.
 *   2. Output timestamps are a strictly increasing uniform grid.
 *   3. Normalising the output again returns it unchanged.
 *   4. Coverage ⊆ span of the input timestamps.
 *
 * Fuzzer strategy:
 *   Every 8 input bytes become one sample: a 16-bit minute offset (keeps the
 *   grid bounded), then six bytes mapped onto field values. A mapped byte of
 *   0xFF marks the field missing; the rest span slightly beyond each field's
 *   valid range so rejection paths are reached too.
 */

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "wxs/errors.hpp"
#include "wxs/normalizer.hpp"

using namespace wxs;

namespace {

std::optional<double> decode(uint8_t b, double lo, double hi) {
    if (b == 0xFF) return std::nullopt;
    return lo + (hi - lo) * static_cast<double>(b) / 254.0;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::vector<WeatherSample> raw;
    raw.reserve(size / 8);
    for (size_t i = 0; i + 8 <= size; i += 8) {
        const uint8_t* p = data + i;
        WeatherSample s;
        s.timestamp         = static_cast<EpochSeconds>(p[0] | (p[1] << 8)) * 60;
        s.temperature       = decode(p[2], -110.0, 80.0);
        s.wind_speed        = decode(p[3], -5.0, 200.0);
        s.wind_direction    = decode(p[4], -10.0, 370.0);
        s.precipitation     = decode(p[5], -1.0, 80.0);
        s.relative_humidity = decode(p[6], -5.0, 105.0);
        s.fog_density       = decode(p[7], -0.1, 1.1);
        raw.push_back(s);
    }

    const TimeSeriesNormalizer normalizer;
    NormalizedSeries series;
    try {
        series = normalizer.normalize(raw);
    } catch (const ValidationError&) {
        return 0;  // Invariant 1
    }

    // Invariant 2
    const auto samples = series.samples();
    for (size_t i = 1; i < samples.size(); ++i) {
        assert(samples[i].timestamp - samples[i - 1].timestamp == series.interval());
    }

    // Invariant 3
    assert(normalizer.normalize(samples) == series);

    // Invariant 4
    if (!samples.empty()) {
        EpochSeconds lo = raw.front().timestamp;
        EpochSeconds hi = lo;
        for (const auto& s : raw) {
            lo = std::min(lo, s.timestamp);
            hi = std::max(hi, s.timestamp);
        }
        assert(samples.front().timestamp >= lo);
        assert(samples.back().timestamp <= hi);
    }
    return 0;
}
