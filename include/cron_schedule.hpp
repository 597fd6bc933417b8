/**
 * @file cron_schedule.hpp
 * @brief Five-field cron expressions for per-source backup schedules.
 *
 * Supports '*', lists, ranges, steps, month and weekday names, 7 as Sunday
 * and the usual '@daily'-style macros. Times are evaluated in local time.
 */

#ifndef CRON_SCHEDULE_HPP
#define CRON_SCHEDULE_HPP

#include <bitset>
#include <chrono>
#include <expected>
#include <optional>
#include <string>

/**
 * @brief A parsed cron expression.
 */
class CronSchedule {
public:
    /**
     * @brief Parses a cron expression.
     *
     * @param expression "minute hour day-of-month month day-of-week" or a macro.
     * @return std::expected<CronSchedule, std::string> The schedule or a parse error.
     */
    static std::expected<CronSchedule, std::string> parse(const std::string& expression);

    /**
     * @brief Computes the next firing time strictly after a point in time.
     *
     * When both day-of-month and day-of-week are restricted, a day matches if
     * either field matches.
     *
     * @param after Reference time.
     * @return std::optional<std::chrono::system_clock::time_point> The next
     *         matching minute, or nothing if none exists within five years.
     */
    std::optional<std::chrono::system_clock::time_point> next(std::chrono::system_clock::time_point after) const;

    const std::string& expression() const { return expression_; }

private:
    CronSchedule() = default;

    bool matchesDay(int dayOfMonth, int month, int dayOfWeek) const;

    std::string expression_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;
    std::bitset<13> months_;
    std::bitset<7> daysOfWeek_;
    bool domRestricted_ = false;
    bool dowRestricted_ = false;
};

#endif // CRON_SCHEDULE_HPP
