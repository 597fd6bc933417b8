#include "status_api.hpp"
#include "backup_config.hpp"
#include "logger.hpp"
#include "scheduler.hpp"
#include "time_utils.hpp"
#include <cmath>
#include <format>
#include <memory>
#include <sstream>

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double toMegabytes(std::uint64_t bytes) {
    return round2(static_cast<double>(bytes) / 1048576.0);
}

Json::Value historyEntry(const JobRecord& record) {
    Json::Value entry;
    entry["job_id"] = record.jobId;
    entry["source"] = record.sourceName;
    entry["started_at"] = formatIso8601(record.startedAt);
    entry["completed_at"] = formatIso8601(record.completedAt);
    entry["status"] = jobStatusName(record.status);
    if (record.metadata) {
        entry["size_mb"] = toMegabytes(record.metadata->size);
        entry["duration_seconds"] = record.metadata->durationSeconds;
    } else {
        entry["size_mb"] = Json::Value();
        entry["duration_seconds"] = Json::Value();
    }
    return entry;
}

bool isRunning(const std::map<std::string, RunningJobState>& running, const std::string& name) {
    auto it = running.find(name);
    return it != running.end() && it->second.status == JobStatus::Running;
}

}

StatusApi::StatusApi(const Scheduler& scheduler, BackupLister lister)
    : scheduler(scheduler), lister(std::move(lister)) {}

Json::Value StatusApi::health() const {
    Json::Value doc;
    doc["status"] = "healthy";
    doc["timestamp"] = formatIso8601(Clock::now());
    return doc;
}

Json::Value StatusApi::status() const {
    const auto running = scheduler.runningJobs();
    const auto records = scheduler.jobHistory(1000);

    Json::Value sources(Json::arrayValue);
    for (const auto& source : scheduler.sources()) {
        Json::Value entry;
        entry["source"] = source.name;
        entry["running"] = isRunning(running, source.name);
        entry["schedule"] = source.schedule;

        const JobRecord* last = nullptr;
        for (const auto& record : records) {
            if (record.sourceName == source.name && record.status == JobStatus::Success &&
                (!last || record.completedAt > last->completedAt)) {
                last = &record;
            }
        }
        if (last && last->metadata) {
            Json::Value info;
            info["timestamp"] = formatIso8601(last->completedAt);
            info["size_mb"] = toMegabytes(last->metadata->size);
            info["duration_seconds"] = last->metadata->durationSeconds;
            entry["last_backup"] = info;
        } else {
            entry["last_backup"] = Json::Value();
        }
        sources.append(entry);
    }

    Json::Value doc;
    doc["sources"] = sources;
    doc["timestamp"] = formatIso8601(Clock::now());
    return doc;
}

Json::Value StatusApi::metrics() const {
    const auto running = scheduler.runningJobs();

    Json::Value sources(Json::arrayValue);
    for (const auto& source : scheduler.sources()) {
        const auto records = scheduler.jobHistory(1000, source.name);

        std::vector<RemoteObject> stored;
        auto listed = lister(source.name);
        if (listed) {
            stored = std::move(*listed);
        } else {
            Logger::logWarning(std::format("Metrics: listing backups of {} failed: {}", source.name, listed.error().message));
        }

        std::uint64_t totalSize = 0;
        for (const auto& object : stored) {
            totalSize += object.size;
        }

        std::size_t succeeded = 0;
        std::size_t failed = 0;
        double durationSum = 0.0;
        std::size_t durationCount = 0;
        for (const auto& record : records) {
            if (record.status == JobStatus::Success) {
                ++succeeded;
                if (record.metadata) {
                    durationSum += record.metadata->durationSeconds;
                    ++durationCount;
                }
            } else if (record.status == JobStatus::Failed) {
                ++failed;
            }
        }

        Json::Value entry;
        entry["source"] = source.name;
        entry["total_backups"] = static_cast<Json::UInt64>(stored.size());
        entry["total_size_bytes"] = static_cast<Json::UInt64>(totalSize);
        entry["total_size_mb"] = toMegabytes(totalSize);
        entry["successful_backups"] = static_cast<Json::UInt64>(succeeded);
        entry["failed_backups"] = static_cast<Json::UInt64>(failed);
        entry["success_rate"] = records.empty() ? 0.0 : round2(100.0 * succeeded / records.size());
        entry["avg_duration_seconds"] = durationCount == 0 ? 0.0 : round2(durationSum / durationCount);
        entry["currently_running"] = isRunning(running, source.name);
        if (stored.empty()) {
            entry["last_backup_time"] = Json::Value();
        } else {
            entry["last_backup_time"] = formatIso8601(stored.front().lastModified);
        }
        sources.append(entry);
    }

    Json::Value doc;
    doc["sources"] = sources;
    doc["timestamp"] = formatIso8601(Clock::now());
    return doc;
}

Json::Value StatusApi::history(const std::optional<std::string>& sourceName) const {
    Json::Value doc;
    if (sourceName) {
        Json::Value entries(Json::arrayValue);
        if (BackupConfig::isValidSourceName(*sourceName)) {
            for (const auto& record : scheduler.jobHistory(1000, *sourceName)) {
                entries.append(historyEntry(record));
            }
        }
        doc["source"] = *sourceName;
        doc["history"] = entries;
        return doc;
    }

    Json::Value grouped(Json::objectValue);
    for (const auto& source : scheduler.sources()) {
        Json::Value entries(Json::arrayValue);
        for (const auto& record : scheduler.jobHistory(1000, source.name)) {
            entries.append(historyEntry(record));
        }
        grouped[source.name] = entries;
    }
    doc["history"] = grouped;
    return doc;
}

Json::Value StatusApi::backups(const std::string& sourceName) const {
    Json::Value list(Json::arrayValue);
    if (!BackupConfig::isValidSourceName(sourceName)) {
        return list;
    }
    auto listed = lister(sourceName);
    if (!listed) {
        Logger::logWarning(std::format("Listing backups of {} failed: {}", sourceName, listed.error().message));
        return list;
    }
    for (const auto& object : *listed) {
        Json::Value entry;
        entry["key"] = object.key;
        entry["size"] = static_cast<Json::UInt64>(object.size);
        entry["size_mb"] = toMegabytes(object.size);
        entry["last_modified"] = formatIso8601(object.lastModified);
        list.append(entry);
    }
    return list;
}

std::string StatusApi::toJson(const Json::Value& document) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    std::ostringstream out;
    writer->write(document, &out);
    return out.str();
}
