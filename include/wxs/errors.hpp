#pragma once

/// @file include/wxs/errors.hpp
/// @brief Error taxonomy for WXS.
///
/// Structural failures are exceptions and stop processing before scoring:
///   - ValidationError      : a sample field is malformed or impossible
///   - ConfigurationError   : profile, catalog parameters or horizon invalid
///   - TransientNetworkError: raised by ingestion collaborators
///
/// Partial-data conditions are values, never thrown:
///   - DataCoverageWarning  : attached to a window / evaluation
///   - WarningTag::ComputationDegraded: attached to one ScoreResult

#include "wxs/types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace wxs {

/// Base of every WXS exception.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A sample carried a physically impossible or non-finite field value.
class ValidationError : public Error {
public:
    ValidationError(std::size_t sample_index,
                    EpochSeconds timestamp,
                    Field field,
                    double value);

    /// The timestamp itself is unusable; field() is empty.
    ValidationError(std::size_t sample_index,
                    EpochSeconds timestamp,
                    const std::string& reason);

    [[nodiscard]] std::size_t          sample_index() const noexcept { return sample_index_; }
    [[nodiscard]] EpochSeconds         timestamp()    const noexcept { return timestamp_; }
    [[nodiscard]] std::optional<Field> field()        const noexcept { return field_; }
    [[nodiscard]] double               value()        const noexcept { return value_; }

private:
    std::size_t          sample_index_;
    EpochSeconds         timestamp_;
    std::optional<Field> field_;
    double               value_ = 0.0;
};

/// User profile, catalog parameters or evaluation request are invalid.
class ConfigurationError : public Error {
public:
    /// `key` names the offending configuration key (may be empty).
    ConfigurationError(std::string key, const std::string& message);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// Raised by ingestion collaborators; retry policy belongs to the caller.
class TransientNetworkError : public Error {
public:
    using Error::Error;
};

// ─── Non-fatal conditions ─────────────────────────────────────────────────────

/// Non-fatal tag carried on a single ScoreResult.
enum class WarningTag {
    ComputationDegraded,  ///< Required or optional input missing for this pair
};

[[nodiscard]] const char* to_string(WarningTag tag) noexcept;

/// The requested window extends beyond the series' data coverage.
struct DataCoverageWarning {
    TimeRange requested;  ///< Window the caller asked for
    TimeRange covered;    ///< Part of it backed by data (may be empty)

    /// Human-readable description.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const DataCoverageWarning&) const = default;
};

}  // namespace wxs
