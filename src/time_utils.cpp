#include "time_utils.hpp"
#include <cstdio>
#include <ctime>

namespace {

std::string formatTm(const std::tm& tm, const char* format) {
    char buf[64];
    std::size_t len = std::strftime(buf, sizeof(buf), format, &tm);
    return std::string(buf, len);
}

std::tm toUtc(Clock::time_point time) {
    std::time_t timeT = Clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&timeT, &tm);
    return tm;
}

}

std::string formatIso8601(Clock::time_point time) {
    return formatTm(toUtc(time), "%Y-%m-%dT%H:%M:%SZ");
}

std::string formatCompactTimestamp(Clock::time_point time) {
    return formatTm(toUtc(time), "%Y%m%d_%H%M%S");
}

std::string formatLocalTime(Clock::time_point time) {
    std::time_t timeT = Clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&timeT, &tm);
    return formatTm(tm, "%Y-%m-%d %H:%M:%S");
}

std::optional<Clock::time_point> parseIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) < 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t timeT = timegm(&tm);
    if (timeT == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    auto result = Clock::from_time_t(timeT);
    // Fractional seconds, S3 reports milliseconds
    if (static_cast<std::size_t>(consumed) < text.size() && text[consumed] == '.') {
        std::size_t pos = consumed + 1;
        int millis = 0;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits > 0 && digits < 3) {
            millis *= 10;
            ++digits;
        }
        result += std::chrono::milliseconds(millis);
    }
    return result;
}

std::string compactIsoTimestamp(const std::string& iso) {
    std::string compact;
    for (char c : iso) {
        if (c == '.' || c == 'Z' || c == '+') {
            break;
        }
        if (c == '-' || c == ':') {
            continue;
        }
        compact += (c == 'T') ? '_' : c;
    }
    return compact;
}
