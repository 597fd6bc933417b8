#include "retention.hpp"
#include "logger.hpp"
#include "uploader.hpp"
#include <algorithm>
#include <format>
#include <functional>
#include <map>
#include <utility>

namespace {

using BucketKey = std::pair<int, int>;

struct Candidate {
    const RemoteObject* object;
    Date date;
    bool marked = false;
};

/// Week of the year with Sunday as the first day, as strftime's %U.
int sundayWeekOfYear(Date date) {
    const std::chrono::year_month_day ymd(date);
    const Date firstOfYear = std::chrono::sys_days(ymd.year() / std::chrono::January / 1);
    const int dayOfYear = static_cast<int>((date - firstOfYear).count());
    const int weekday = static_cast<int>(std::chrono::weekday(date).c_encoding());
    return (dayOfYear + 7 - weekday) / 7;
}

/**
 * Groups the unmarked candidates by bucket and, for every bucket whose
 * representative (newest) date is strictly before the cutoff, marks all
 * members but the newest. Candidates must be sorted newest first.
 */
void collapseBuckets(std::vector<Candidate>& candidates, Date cutoff,
                     const std::function<BucketKey(Date)>& bucketOf) {
    std::map<BucketKey, std::vector<Candidate*>> buckets;
    for (auto& candidate : candidates) {
        if (!candidate.marked) {
            buckets[bucketOf(candidate.date)].push_back(&candidate);
        }
    }
    for (auto& [key, members] : buckets) {
        if (members.front()->date >= cutoff) {
            continue;
        }
        for (std::size_t i = 1; i < members.size(); ++i) {
            members[i]->marked = true;
        }
    }
}

}

Date utcDate(std::chrono::system_clock::time_point time) {
    return std::chrono::floor<std::chrono::days>(time);
}

std::vector<std::string> computeRetentionDeletions(const std::vector<RemoteObject>& backups,
                                                   const RetentionPolicy& policy, Date today) {
    std::vector<Candidate> candidates;
    candidates.reserve(backups.size());
    for (const auto& backup : backups) {
        candidates.push_back({&backup, utcDate(backup.lastModified)});
    }
    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return a.object->lastModified > b.object->lastModified;
    });

    if (policy.keepLast && *policy.keepLast >= 0) {
        for (std::size_t i = static_cast<std::size_t>(*policy.keepLast); i < candidates.size(); ++i) {
            candidates[i].marked = true;
        }
    }

    if (policy.daily) {
        collapseBuckets(candidates, today - std::chrono::days(*policy.daily), [](Date date) {
            return BucketKey(static_cast<int>(date.time_since_epoch().count()), 0);
        });
    }

    if (policy.weekly) {
        collapseBuckets(candidates, today - std::chrono::days(7 * *policy.weekly), [](Date date) {
            const std::chrono::year_month_day ymd(date);
            return BucketKey(static_cast<int>(ymd.year()), sundayWeekOfYear(date));
        });
    }

    if (policy.monthly) {
        collapseBuckets(candidates, today - std::chrono::days(30 * *policy.monthly), [](Date date) {
            const std::chrono::year_month_day ymd(date);
            return BucketKey(static_cast<int>(ymd.year()), static_cast<int>(static_cast<unsigned>(ymd.month())));
        });
    }

    std::vector<std::string> deletions;
    for (const auto& candidate : candidates) {
        if (candidate.marked) {
            deletions.push_back(candidate.object->key);
        }
    }
    return deletions;
}

RetentionEngine::RetentionEngine(Uploader& uploader) : uploader(uploader) {}

RetentionResult RetentionEngine::enforce(const Source& source) {
    return enforce(source, utcDate(std::chrono::system_clock::now()));
}

RetentionResult RetentionEngine::enforce(const Source& source, Date today) {
    RetentionResult result;

    auto backups = uploader.listBackups(source.name);
    if (!backups) {
        Logger::logError(std::format("RetentionError: listing backups of {} failed: {}", source.name, backups.error().message));
        return result;
    }

    for (const auto& key : computeRetentionDeletions(*backups, source.retention, today)) {
        auto deleted = uploader.deleteBackup(key);
        if (deleted) {
            result.deletedKeys.push_back(key);
        } else {
            Logger::logError(describeError(deleted.error()));
            result.failedKeys.push_back(key);
        }
    }
    result.deletedCount = result.deletedKeys.size();

    if (result.deletedCount > 0 || !result.failedKeys.empty()) {
        Logger::logMessage(std::format("Retention for {}: deleted {}, failed {}", source.name, result.deletedCount,
                                       result.failedKeys.size()));
    }
    return result;
}
