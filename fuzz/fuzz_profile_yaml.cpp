/**
 * @file  fuzz_profile_yaml.cpp
 * @brief libFuzzer target for ConfigLoader::parse_profile and the resolver
 *
 * Build:
 *   cmake -DWXS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_profile_yaml
 *
 * Run for 60 seconds:
 *   ./fuzz_profile_yaml -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. The only exception that escapes parsing or resolution is
 *      ConfigurationError.
 *   2. A resolved profile has weight vectors summing to 1.
 *   3. emit_profile() output parses back to the same profile.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "wxs/config_loader.hpp"
#include "wxs/errors.hpp"
#include "wxs/profile.hpp"

using namespace wxs;
using namespace wxs::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    profile::UserProfile parsed;
    try {
        parsed = ConfigLoader::parse_profile(input);
    } catch (const ConfigurationError&) {
        return 0;
    }

    // Invariant 3
    assert(ConfigLoader::parse_profile(ConfigLoader::emit_profile(parsed)) == parsed);

    try {
        const profile::UserProfileResolver resolver(catalog::IndexCatalog::standard());
        const auto resolved = resolver.resolve(parsed, {});
        // Invariant 2
        assert(std::abs(resolved.parameters->day_quality_weights.sum() - 1.0) < 1e-9);
        assert(std::abs(resolved.parameters->visibility_weights.sum() - 1.0) < 1e-9);
    } catch (const ConfigurationError&) {
        return 0;
    }
    return 0;
}
