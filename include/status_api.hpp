/**
 * @file status_api.hpp
 * @brief Read-only status and metrics documents for SnapVault.
 *
 * Every document is built from scheduler snapshots and object listings; the
 * API holds no handle that can change core state.
 */

#ifndef STATUS_API_HPP
#define STATUS_API_HPP

#include "backup_error.hpp"
#include "backup_types.hpp"
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

class Scheduler;

/**
 * @brief Lists the stored backups of a source, newest first.
 */
using BackupLister = std::function<std::expected<std::vector<RemoteObject>, BackupError>(const std::string&)>;

class StatusApi {
public:
    /**
     * @brief Constructs the status API.
     *
     * @param scheduler Source of running markers and job history.
     * @param lister Object listing per source.
     */
    StatusApi(const Scheduler& scheduler, BackupLister lister);

    /**
     * @brief {"status": "healthy", "timestamp": ...}.
     */
    Json::Value health() const;

    /**
     * @brief Per source: running flag, last successful backup and schedule.
     */
    Json::Value status() const;

    /**
     * @brief Per source: stored backup count and size, job counts, success
     *        rate, average duration, running flag and last backup time.
     */
    Json::Value metrics() const;

    /**
     * @brief Sanitized job history, for one source or grouped by source.
     *
     * Entries carry no object keys and no error text.
     */
    Json::Value history(const std::optional<std::string>& sourceName = std::nullopt) const;

    /**
     * @brief Stored backups of a source; an invalid name yields an empty list.
     */
    Json::Value backups(const std::string& sourceName) const;

    /**
     * @brief Serializes a document with jsoncpp's stream writer.
     */
    static std::string toJson(const Json::Value& document);

private:
    const Scheduler& scheduler;
    BackupLister lister;
};

#endif // STATUS_API_HPP
