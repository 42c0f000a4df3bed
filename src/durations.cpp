#include "objxfer/durations.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <limits>

namespace objxfer {

std::optional<Error> parse_age(const std::string& text, std::chrono::seconds& out) {
    if (text.empty()) {
        return invalid_argument("empty age value");
    }

    int64_t total = 0;
    int64_t value = 0;
    bool have_digits = false;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (value > (std::numeric_limits<int64_t>::max() - 9) / 10) {
                return invalid_argument("age '" + text + "' is out of range");
            }
            value = value * 10 + (c - '0');
            have_digits = true;
            continue;
        }
        if (!have_digits) {
            return invalid_argument("invalid age '" + text + "': expected a number before '" +
                                    std::string(1, c) + "'");
        }
        int64_t unit = 0;
        switch (c) {
            case 'd': unit = 86400; break;
            case 'h': unit = 3600; break;
            case 'm': unit = 60; break;
            case 's': unit = 1; break;
            default:
                return invalid_argument("invalid age '" + text + "': unknown unit '" +
                                        std::string(1, c) + "' (use d, h, m or s)");
        }
        total += value * unit;
        value = 0;
        have_digits = false;
    }
    if (have_digits) {
        return invalid_argument("invalid age '" + text + "': missing unit after " +
                                std::to_string(value));
    }

    out = std::chrono::seconds(total);
    return std::nullopt;
}

std::optional<Error> AgeFilter::parse(const std::string& older_than,
                                      const std::string& newer_than, AgeFilter& out) {
    AgeFilter filter;
    if (!older_than.empty()) {
        std::chrono::seconds age{};
        if (auto err = parse_age(older_than, age)) return err->with_trace({"--older-than"});
        filter.older_than = age;
    }
    if (!newer_than.empty()) {
        std::chrono::seconds age{};
        if (auto err = parse_age(newer_than, age)) return err->with_trace({"--newer-than"});
        filter.newer_than = age;
    }
    out = filter;
    return std::nullopt;
}

bool AgeFilter::excludes(TimePoint t, TimePoint now) const {
    auto age = now - t;
    if (older_than && age < *older_than) return true;
    if (newer_than && age >= *newer_than) return true;
    return false;
}

std::optional<Error> parse_retention_mode(const std::string& mode, std::string& normalized) {
    std::string upper = mode;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper != "GOVERNANCE" && upper != "COMPLIANCE") {
        return invalid_argument("invalid retention mode '" + mode +
                                "', expected GOVERNANCE or COMPLIANCE");
    }
    normalized = upper;
    return std::nullopt;
}

std::optional<Error> parse_retention_validity(const std::string& validity,
                                              std::chrono::hours& out) {
    if (validity.size() < 2) {
        return invalid_argument("invalid retention duration '" + validity + "'");
    }
    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(validity.back())));
    std::string digits = validity.substr(0, validity.size() - 1);
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return invalid_argument("invalid retention duration '" + validity + "'");
    }

    uint64_t n = 0;
    try {
        n = std::stoull(digits);
    } catch (const std::exception&) {
        return invalid_argument("invalid retention duration '" + validity + "'");
    }
    if (n == 0 || n > 36500) {
        return invalid_argument("retention duration '" + validity + "' out of range");
    }

    if (unit == 'd') {
        out = std::chrono::hours(24 * n);
    } else if (unit == 'y') {
        out = std::chrono::hours(24 * 365 * n);
    } else {
        return invalid_argument("invalid retention duration unit in '" + validity +
                                "', expected d or y");
    }
    return std::nullopt;
}

std::optional<Error> retain_until_date(const std::string& validity, TimePoint& out, TimePoint now) {
    std::chrono::hours duration{};
    if (auto err = parse_retention_validity(validity, duration)) return err;
    out = now + duration;
    return std::nullopt;
}

std::optional<Error> validate_legal_hold(const std::string& value) {
    if (value == "ON" || value == "OFF") return std::nullopt;
    return invalid_argument("invalid legal hold status '" + value + "', expected ON or OFF");
}

std::string format_rfc3339(TimePoint t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::optional<TimePoint> parse_rfc3339(const std::string& text) {
    std::tm tm = {};
    int year, month, day, hour, min, sec;
    int millis = 0;
    if (std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
                    &year, &month, &day, &hour, &min, &sec, &millis) < 6 &&
        std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%dZ",
                    &year, &month, &day, &hour, &min, &sec) != 6) {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t tt = timegm(&tm);
    if (tt == -1) return std::nullopt;
    auto result = std::chrono::system_clock::from_time_t(tt);
    if (millis > 0 && millis < 1000) {
        result += std::chrono::milliseconds(millis);
    }
    return result;
}

std::optional<TimePoint> parse_http_date(const std::string& text) {
    std::tm tm = {};
    const char* end = strptime(text.c_str(), "%a, %d %b %Y %H:%M:%S", &tm);
    if (!end) return std::nullopt;
    time_t tt = timegm(&tm);
    if (tt == -1) return std::nullopt;
    return std::chrono::system_clock::from_time_t(tt);
}

}  // namespace objxfer
