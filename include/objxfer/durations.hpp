#pragma once

#include "objxfer/error.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace objxfer {

using TimePoint = std::chrono::system_clock::time_point;

/// Parse an age such as "90d", "7d10h" or "1d2h30m" (units d, h, m, s).
std::optional<Error> parse_age(const std::string& text, std::chrono::seconds& out);

/// --older-than / --newer-than filtering for bulk removal.
struct AgeFilter {
    std::optional<std::chrono::seconds> older_than;
    std::optional<std::chrono::seconds> newer_than;

    static std::optional<Error> parse(const std::string& older_than,
                                      const std::string& newer_than, AgeFilter& out);

    bool active() const { return older_than.has_value() || newer_than.has_value(); }

    /// True when an entry modified at t must be skipped: younger than
    /// older_than, or at least as old as newer_than.
    bool excludes(TimePoint t, TimePoint now = std::chrono::system_clock::now()) const;
};

/// Validate GOVERNANCE|COMPLIANCE (any case); returns the upper-case form.
std::optional<Error> parse_retention_mode(const std::string& mode, std::string& normalized);

/// Parse "Nd" (days) or "Ny" (years of 365 days), N > 0.
std::optional<Error> parse_retention_validity(const std::string& validity,
                                              std::chrono::hours& out);

/// Compute the retain-until instant for a validity from now.
std::optional<Error> retain_until_date(const std::string& validity, TimePoint& out,
                                       TimePoint now = std::chrono::system_clock::now());

/// Legal hold must be ON or OFF.
std::optional<Error> validate_legal_hold(const std::string& value);

std::string format_rfc3339(TimePoint t);
/// Accepts "2024-01-02T03:04:05Z" with optional fractional seconds.
std::optional<TimePoint> parse_rfc3339(const std::string& text);
/// Accepts "Tue, 02 Jan 2024 03:04:05 GMT".
std::optional<TimePoint> parse_http_date(const std::string& text);

}  // namespace objxfer
