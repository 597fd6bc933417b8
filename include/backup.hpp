/**
 * @file backup.hpp
 * @brief Backup orchestration for SnapVault.
 *
 * Backup runs one job for a source: build the encrypted archive, upload it,
 * drop the local copy and apply the retention policy. BackupService wires the
 * components together from the configuration and runs the daemon.
 *
 * @note Requires libarchive, libcurl, OpenSSL, GPGME and jsoncpp.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include "archive_builder.hpp"
#include "backup_config.hpp"
#include "encryption.hpp"
#include "retention.hpp"
#include "s3_client.hpp"
#include "scheduler.hpp"
#include "status_api.hpp"
#include "uploader.hpp"
#include <csignal>
#include <memory>
#include <mutex>
#include <string>

/// Set by SIGINT/SIGTERM; the daemon loop exits once it is non-zero.
extern volatile std::sig_atomic_t gShutdownFlag;

/**
 * @brief Signal handler that only raises gShutdownFlag.
 */
void signalHandler(int sig);

/**
 * @brief The complete job run for one trigger.
 */
class Backup : public JobPipeline {
public:
    /**
     * @brief Constructs the pipeline. All components must outlive it.
     */
    Backup(ArchiveBuilder& builder, Uploader& uploader, RetentionEngine& retention);

    /**
     * @brief Archives, encrypts and uploads a source, then enforces retention.
     *
     * The local encrypted file is removed once the upload is confirmed, and
     * on every failure path through the artifact's scratch directory.
     *
     * @param source Source to back up.
     * @return std::expected<PipelineResult, BackupError> Metadata, object key
     *         and retention count, or the error of the failed step.
     */
    std::expected<PipelineResult, BackupError> run(const Source& source) override;

private:
    ArchiveBuilder& builder;
    Uploader& uploader;
    RetentionEngine& retention;
};

/**
 * @brief Daemon composition root.
 */
class BackupService {
public:
    /**
     * @brief Builds every component from a validated configuration.
     *
     * @param config Loaded configuration.
     */
    explicit BackupService(BackupConfig config);

    /**
     * @brief Runs the scheduler until SIGINT or SIGTERM, then drains running jobs.
     *
     * @return int Process exit status.
     */
    int runDaemon();

    /**
     * @brief Runs one job for a source synchronously.
     *
     * @param sourceName Configured source name.
     * @return int 0 on success, 1 on failure or unknown source.
     */
    int runOnce(const std::string& sourceName);

    /**
     * @brief Writes the status and metrics documents to the configured status file.
     *
     * Failures are logged only.
     */
    void writeStatusFile();

    const StatusApi& status() const { return statusApi; }

private:
    BackupConfig config;
    S3Client client;
    std::unique_ptr<EncryptionStrategy> encryptor;
    ArchiveBuilder builder;
    Uploader uploader;
    RetentionEngine retention;
    Backup pipeline;
    Scheduler scheduler;
    StatusApi statusApi;
    std::mutex statusFileMutex;
};

#endif // BACKUP_HPP
