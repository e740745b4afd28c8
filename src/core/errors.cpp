/// @file src/core/errors.cpp
/// @brief Exception constructors and warning formatting.

#include "wxs/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace wxs {

ValidationError::ValidationError(std::size_t sample_index,
                                 EpochSeconds timestamp,
                                 Field field,
                                 double value)
    : Error(fmt::format("invalid sample #{} at t={}: field '{}' has value {}",
                        sample_index, timestamp, to_string(field), value))
    , sample_index_(sample_index)
    , timestamp_(timestamp)
    , field_(field)
    , value_(value)
{}

ValidationError::ValidationError(std::size_t sample_index,
                                 EpochSeconds timestamp,
                                 const std::string& reason)
    : Error(fmt::format("invalid sample #{} at t={}: {}", sample_index, timestamp, reason))
    , sample_index_(sample_index)
    , timestamp_(timestamp)
{}

ConfigurationError::ConfigurationError(std::string key, const std::string& message)
    : Error(key.empty() ? message : fmt::format("'{}': {}", key, message))
    , key_(std::move(key))
{}

const char* to_string(WarningTag tag) noexcept {
    switch (tag) {
        case WarningTag::ComputationDegraded: return "ComputationDegraded";
    }
    return "Unknown";
}

std::string DataCoverageWarning::to_string() const {
    if (covered.empty()) {
        return fmt::format("DataCoverageWarning: no data in requested window [{}, {})",
                           requested.begin, requested.end);
    }
    return fmt::format("DataCoverageWarning: requested [{}, {}) but data covers [{}, {})",
                       requested.begin, requested.end, covered.begin, covered.end);
}

}  // namespace wxs
