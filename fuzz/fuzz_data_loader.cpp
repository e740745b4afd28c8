/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for CsvSampleLoader::parse_csv_string
 *
 * Build:
 *   cmake -DWXS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence.
 *   2. Every present field of every parsed sample is finite.
 *   3. Empty input parses to no samples.
 *
 * Fuzzer strategy:
 *   Input is the whole CSV document. The parser must handle binary garbage,
 *   missing or duplicated headers, ragged rows, CRLF line endings, "nan" and
 *   "inf" cells, and timestamps with arbitrary offsets.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "wxs/data_loader.hpp"

using namespace wxs;
using namespace wxs::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto samples = CsvSampleLoader::parse_csv_string(input);

    // Invariant 3
    if (size == 0) {
        assert(samples.empty());
    }

    // Invariant 2
    for (const auto& s : samples) {
        for (Field f : ALL_FIELDS) {
            const auto v = s.get(f);
            if (v) {
                assert(std::isfinite(*v));
            }
        }
    }
    return 0;
}
