#include "backup.hpp"
#include "logger.hpp"
#include "temp_dir.hpp"
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <thread>
#include <sys/resource.h>

namespace fs = std::filesystem;

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

namespace {

constexpr rlim_t kMinOpenFiles = 1024;

void checkOpenFileLimit() {
    struct rlimit limit{};
    if (getrlimit(RLIMIT_NOFILE, &limit) != 0) {
        return;
    }
    if (limit.rlim_cur != RLIM_INFINITY && limit.rlim_cur < kMinOpenFiles) {
        Logger::logWarning(std::format("Open file limit is {}; at least {} is recommended",
                                       static_cast<unsigned long long>(limit.rlim_cur), kMinOpenFiles));
    }
}

}

Backup::Backup(ArchiveBuilder& builder, Uploader& uploader, RetentionEngine& retention)
    : builder(builder), uploader(uploader), retention(retention) {}

std::expected<PipelineResult, BackupError> Backup::run(const Source& source) {
    auto artifact = builder.build(source);
    if (!artifact) {
        return std::unexpected(artifact.error());
    }

    UploadResult upload = uploader.upload(artifact->filePath, artifact->metadata);
    if (!upload.success) {
        return std::unexpected(BackupError(ErrorKind::Upload, upload.error));
    }

    std::error_code ec;
    fs::remove(artifact->filePath, ec);
    if (ec) {
        Logger::logWarning(std::format("Failed to remove local backup file: {}", ec.message()));
    }
    artifact->scratch.reset();

    RetentionResult pruned = retention.enforce(source);

    PipelineResult result;
    result.metadata = artifact->metadata;
    result.objectKey = upload.key;
    result.retentionDeleted = pruned.deletedCount;
    return result;
}

BackupService::BackupService(BackupConfig config)
    : config(std::move(config)),
      client(this->config.s3),
      encryptor(makeEncryptionStrategy(this->config.encryption)),
      builder(*encryptor, this->config.workDir),
      uploader(client),
      retention(uploader),
      pipeline(builder, uploader, retention),
      scheduler(this->config.sources, pipeline,
                SchedulerOptions{1000, std::chrono::hours(1), this->config.debug,
                                 [this](const JobRecord&) { writeStatusFile(); }}),
      statusApi(scheduler, [this](const std::string& name) { return uploader.listBackups(name); }) {}

int BackupService::runDaemon() {
    fs::path logPath(config.logFile);
    std::error_code ec;
    fs::create_directories(logPath.parent_path(), ec);

    std::size_t swept = sweepStaleWorkDirs(config.workDir);
    if (swept > 0) {
        Logger::logMessage(std::format("Removed {} stale work director{}", swept, swept == 1 ? "y" : "ies"));
    }
    checkOpenFileLimit();

    struct sigaction sa{};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto started = scheduler.start();
    if (!started) {
        Logger::logError(std::format("Failed to start scheduler: {}", started.error()));
        return 1;
    }
    Logger::logMessage(std::format("SnapVault daemon started with {} source(s). Encryption: {}",
                                   config.sources.size(), encryptionMethodName(encryptor->method())));

    while (!gShutdownFlag) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    Logger::logMessage("Shutdown requested, waiting for running jobs");
    scheduler.stop();
    Logger::logMessage("Daemon shutting down gracefully");
    return 0;
}

int BackupService::runOnce(const std::string& sourceName) {
    const Source* source = scheduler.findSource(sourceName);
    if (!source) {
        Logger::logError(std::format("Unknown source: {}", sourceName));
        return 1;
    }

    sweepStaleWorkDirs(config.workDir);
    if (!scheduler.trigger(*source)) {
        return 1;
    }
    auto records = scheduler.jobHistory(1, source->name);
    return !records.empty() && records.back().status == JobStatus::Success ? 0 : 1;
}

void BackupService::writeStatusFile() {
    if (config.statusFile.empty()) {
        return;
    }

    Json::Value doc;
    doc["status"] = statusApi.status();
    doc["metrics"] = statusApi.metrics();
    const std::string text = StatusApi::toJson(doc);

    std::lock_guard<std::mutex> lock(statusFileMutex);
    fs::path target(config.statusFile);
    fs::path staging = target;
    staging += ".tmp";

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out.is_open()) {
            Logger::logWarning(std::format("Cannot write status file: {}", staging.string()));
            return;
        }
        out << text << '\n';
    }
    fs::rename(staging, target, ec);
    if (ec) {
        Logger::logWarning(std::format("Cannot replace status file {}: {}", target.string(), ec.message()));
    }
}
