// SPDX-License-Identifier: MIT
/**
 * @file timestamp.hpp
 * @brief Valuation times and expiration dates on a UTC seconds clock
 */

#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace condor {

/// UTC instant with one-second resolution
///
/// Built from a clock reading or parsed from "YYYY-MM-DD" (midnight UTC)
/// or "YYYY-MM-DDTHH:MM:SS". Parsing is strict: the whole string must
/// match and the calendar date must exist, so "2026-02-31" and
/// "2026-01-31xyz" are errors rather than silently shifted dates.
class Timestamp {
public:
    using TimePoint = std::chrono::sys_seconds;

    explicit Timestamp(TimePoint tp)
        : tp_(tp) {}

    /// Current system time, truncated to whole seconds
    static Timestamp now() {
        return Timestamp{std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())};
    }

    /// Parse an ISO date or date-time
    static std::expected<Timestamp, std::string> parse(std::string_view text);

    TimePoint time_point() const { return tp_; }

    /// "YYYY-MM-DD"
    std::string date() const;

    /// "YYYY-MM-DDTHH:MM:SSZ"
    std::string to_string() const;

    friend bool operator==(const Timestamp&, const Timestamp&) = default;

private:
    TimePoint tp_;
};

/// Whole calendar days from valuation to expiry, floored
///
/// An expiry 36 hours away is 1 day; one 12 hours in the past is -1.
int days_to_expiration(const Timestamp& valuation, const Timestamp& expiry);

}  // namespace condor
