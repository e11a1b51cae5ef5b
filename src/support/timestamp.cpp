// SPDX-License-Identifier: MIT
#include "condor/support/timestamp.hpp"
#include <charconv>
#include <iomanip>
#include <optional>
#include <sstream>

namespace condor {

namespace {

constexpr size_t kDateLength = 10;      // YYYY-MM-DD
constexpr size_t kDateTimeLength = 19;  // YYYY-MM-DDTHH:MM:SS

/// Fixed-width run of decimal digits; no sign, no padding
std::optional<unsigned> digits(std::string_view text, size_t pos, size_t len) {
    std::string_view field = text.substr(pos, len);
    for (char ch : field) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc{} || ptr != field.data() + field.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::expected<Timestamp, std::string> Timestamp::parse(std::string_view text) {
    using namespace std::chrono;

    auto fail = [&](const char* why) {
        return std::unexpected(std::string(why) + ": " + std::string(text));
    };

    if (text.size() != kDateLength && text.size() != kDateTimeLength) {
        return fail("Expected YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS");
    }
    if (text[4] != '-' || text[7] != '-') {
        return fail("Malformed date");
    }

    auto y = digits(text, 0, 4);
    auto m = digits(text, 5, 2);
    auto d = digits(text, 8, 2);
    if (!y || !m || !d) {
        return fail("Malformed date");
    }

    year_month_day ymd{year{static_cast<int>(*y)}, month{*m}, day{*d}};
    if (!ymd.ok()) {
        return fail("No such calendar date");
    }

    sys_seconds tp = sys_days{ymd};
    if (text.size() == kDateTimeLength) {
        if (text[10] != 'T' || text[13] != ':' || text[16] != ':') {
            return fail("Malformed time of day");
        }
        auto hh = digits(text, 11, 2);
        auto mm = digits(text, 14, 2);
        auto ss = digits(text, 17, 2);
        if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 59) {
            return fail("Invalid time of day");
        }
        tp += hours{*hh} + minutes{*mm} + seconds{*ss};
    }

    return Timestamp{tp};
}

std::string Timestamp::date() const {
    using namespace std::chrono;
    year_month_day ymd{floor<days>(tp_)};
    std::ostringstream os;
    os << std::setfill('0')
       << std::setw(4) << static_cast<int>(ymd.year()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.day());
    return os.str();
}

std::string Timestamp::to_string() const {
    using namespace std::chrono;
    auto midnight = floor<days>(tp_);
    hh_mm_ss<seconds> tod{tp_ - midnight};
    std::ostringstream os;
    os << date() << 'T' << std::setfill('0')
       << std::setw(2) << tod.hours().count() << ':'
       << std::setw(2) << tod.minutes().count() << ':'
       << std::setw(2) << tod.seconds().count() << 'Z';
    return os.str();
}

int days_to_expiration(const Timestamp& valuation, const Timestamp& expiry) {
    auto span = expiry.time_point() - valuation.time_point();
    return static_cast<int>(std::chrono::floor<std::chrono::days>(span).count());
}

}  // namespace condor
