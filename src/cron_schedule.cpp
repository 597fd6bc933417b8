#include "cron_schedule.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <format>
#include <map>
#include <sstream>
#include <vector>

namespace {

const std::map<std::string, std::string> kMacros = {
    {"@yearly", "0 0 1 1 *"},
    {"@annually", "0 0 1 1 *"},
    {"@monthly", "0 0 1 * *"},
    {"@weekly", "0 0 * * 0"},
    {"@daily", "0 0 * * *"},
    {"@midnight", "0 0 * * *"},
    {"@hourly", "0 * * * *"}
};

const std::map<std::string, int> kMonthNames = {
    {"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4}, {"may", 5}, {"jun", 6},
    {"jul", 7}, {"aug", 8}, {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12}
};

const std::map<std::string, int> kDayNames = {
    {"sun", 0}, {"mon", 1}, {"tue", 2}, {"wed", 3}, {"thu", 4}, {"fri", 5}, {"sat", 6}
};

constexpr int kSearchDays = 366 * 5;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::expected<int, std::string> parseValue(const std::string& text, const std::map<std::string, int>* names) {
    if (text.empty()) {
        return std::unexpected("empty value");
    }
    if (names) {
        auto it = names->find(toLower(text));
        if (it != names->end()) {
            return it->second;
        }
    }
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::unexpected(std::format("invalid value '{}'", text));
    }
    if (text.size() > 4) {
        return std::unexpected(std::format("value out of range '{}'", text));
    }
    return std::stoi(text);
}

/**
 * Parses one field into the list of values it selects.
 */
std::expected<std::vector<int>, std::string> parseField(const std::string& field, int min, int max,
                                                        const std::map<std::string, int>* names) {
    std::vector<int> values;
    std::stringstream parts(field);
    std::string part;
    while (std::getline(parts, part, ',')) {
        if (part.empty()) {
            return std::unexpected(std::format("empty list element in '{}'", field));
        }

        int step = 1;
        std::string range = part;
        auto slash = part.find('/');
        if (slash != std::string::npos) {
            range = part.substr(0, slash);
            auto stepValue = parseValue(part.substr(slash + 1), nullptr);
            if (!stepValue || *stepValue <= 0) {
                return std::unexpected(std::format("invalid step in '{}'", part));
            }
            step = *stepValue;
        }

        int low = min;
        int high = max;
        if (range != "*") {
            auto dash = range.find('-');
            if (dash == std::string::npos) {
                auto value = parseValue(range, names);
                if (!value) {
                    return std::unexpected(value.error());
                }
                low = *value;
                high = (slash != std::string::npos) ? max : *value;
            } else {
                auto first = parseValue(range.substr(0, dash), names);
                auto last = parseValue(range.substr(dash + 1), names);
                if (!first) {
                    return std::unexpected(first.error());
                }
                if (!last) {
                    return std::unexpected(last.error());
                }
                low = *first;
                high = *last;
            }
        }

        if (low < min || high > max || low > high) {
            return std::unexpected(std::format("value out of range in '{}'", part));
        }
        for (int v = low; v <= high; v += step) {
            values.push_back(v);
        }
    }
    if (values.empty()) {
        return std::unexpected("empty field");
    }
    return values;
}

}

std::expected<CronSchedule, std::string> CronSchedule::parse(const std::string& expression) {
    std::string normalized = expression;
    auto macro = kMacros.find(toLower(expression));
    if (macro != kMacros.end()) {
        normalized = macro->second;
    }

    std::istringstream stream(normalized);
    std::vector<std::string> fields;
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        return std::unexpected(std::format("expected 5 fields, got {}", fields.size()));
    }

    CronSchedule schedule;
    schedule.expression_ = expression;

    auto minutes = parseField(fields[0], 0, 59, nullptr);
    if (!minutes) {
        return std::unexpected(std::format("minute: {}", minutes.error()));
    }
    auto hours = parseField(fields[1], 0, 23, nullptr);
    if (!hours) {
        return std::unexpected(std::format("hour: {}", hours.error()));
    }
    auto days = parseField(fields[2], 1, 31, nullptr);
    if (!days) {
        return std::unexpected(std::format("day of month: {}", days.error()));
    }
    auto months = parseField(fields[3], 1, 12, &kMonthNames);
    if (!months) {
        return std::unexpected(std::format("month: {}", months.error()));
    }
    auto weekdays = parseField(fields[4], 0, 7, &kDayNames);
    if (!weekdays) {
        return std::unexpected(std::format("day of week: {}", weekdays.error()));
    }

    for (int v : *minutes) schedule.minutes_.set(v);
    for (int v : *hours) schedule.hours_.set(v);
    for (int v : *days) schedule.daysOfMonth_.set(v);
    for (int v : *months) schedule.months_.set(v);
    for (int v : *weekdays) schedule.daysOfWeek_.set(v % 7);

    schedule.domRestricted_ = fields[2].front() != '*';
    schedule.dowRestricted_ = fields[4].front() != '*';
    return schedule;
}

bool CronSchedule::matchesDay(int dayOfMonth, int month, int dayOfWeek) const {
    if (!months_.test(month)) {
        return false;
    }
    bool domMatch = daysOfMonth_.test(dayOfMonth);
    bool dowMatch = daysOfWeek_.test(dayOfWeek);
    if (domRestricted_ && dowRestricted_) {
        return domMatch || dowMatch;
    }
    return domMatch && dowMatch;
}

std::optional<std::chrono::system_clock::time_point> CronSchedule::next(std::chrono::system_clock::time_point after) const {
    std::time_t start = std::chrono::system_clock::to_time_t(after) + 60;
    std::tm day{};
    localtime_r(&start, &day);
    int startHour = day.tm_hour;
    int startMinute = day.tm_min;

    for (int i = 0; i < kSearchDays; ++i) {
        if (matchesDay(day.tm_mday, day.tm_mon + 1, day.tm_wday)) {
            for (int h = (i == 0 ? startHour : 0); h < 24; ++h) {
                if (!hours_.test(h)) {
                    continue;
                }
                int firstMinute = (i == 0 && h == startHour) ? startMinute : 0;
                for (int m = firstMinute; m < 60; ++m) {
                    if (!minutes_.test(m)) {
                        continue;
                    }
                    std::tm candidate = day;
                    candidate.tm_hour = h;
                    candidate.tm_min = m;
                    candidate.tm_sec = 0;
                    candidate.tm_isdst = -1;
                    std::time_t t = std::mktime(&candidate);
                    if (t != static_cast<std::time_t>(-1) && t > std::chrono::system_clock::to_time_t(after)) {
                        return std::chrono::system_clock::from_time_t(t);
                    }
                }
            }
        }

        day.tm_mday += 1;
        day.tm_hour = 12;
        day.tm_min = 0;
        day.tm_sec = 0;
        day.tm_isdst = -1;
        std::mktime(&day);
    }
    return std::nullopt;
}
