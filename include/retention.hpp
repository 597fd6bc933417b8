/**
 * @file retention.hpp
 * @brief Layered keep-policy applied to a source's stored backups.
 *
 * Four tiers run in order over the backups not yet marked by an earlier tier:
 * keep_last, daily, weekly (Sunday-first weeks) and monthly. Each time-based
 * tier keeps only the most recently modified backup of every bucket older
 * than its cutoff. Dates are UTC calendar dates.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include "backup_types.hpp"
#include <chrono>
#include <string>
#include <vector>

class Uploader;

/**
 * @brief A UTC calendar day.
 */
using Date = std::chrono::sys_days;

/**
 * @brief Returns the UTC calendar date of a point in time.
 */
Date utcDate(std::chrono::system_clock::time_point time);

/**
 * @brief Computes the keys a policy deletes.
 *
 * Pure function: the input order does not matter; it is sorted newest first
 * internally.
 *
 * @param backups Stored backups of one source.
 * @param policy Keep-policy.
 * @param today Current UTC date.
 * @return std::vector<std::string> Keys to delete, newest first, each once.
 */
std::vector<std::string> computeRetentionDeletions(const std::vector<RemoteObject>& backups,
                                                   const RetentionPolicy& policy, Date today);

/**
 * @brief Outcome of one retention pass.
 */
struct RetentionResult {
    std::size_t deletedCount = 0;         ///< Keys actually deleted.
    std::vector<std::string> deletedKeys;
    std::vector<std::string> failedKeys;  ///< Keys whose deletion failed.
};

class RetentionEngine {
public:
    explicit RetentionEngine(Uploader& uploader);

    /**
     * @brief Applies a source's policy against its current listing.
     *
     * Never fails: a failed listing yields an empty result and a failed
     * delete is recorded in failedKeys without stopping the pass.
     */
    RetentionResult enforce(const Source& source);

    /**
     * @brief Same as enforce(source) with an explicit current date.
     */
    RetentionResult enforce(const Source& source, Date today);

private:
    Uploader& uploader;
};

#endif // RETENTION_HPP
