/**
 * @file backup_config.hpp
 * @brief Configuration loading and validation for SnapVault.
 *
 * Settings come from a JSON file; credentials and key material come from the
 * process environment only. Every invalid setting raises ConfigError, which
 * stops the daemon before any job is scheduled.
 *
 * @note Environment: AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, GPG_PUBLIC_KEY,
 * GPG_KEY_ID, ENCRYPTION_PASSWORD, SNAPVAULT_DEBUG.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include "backup_types.hpp"
#include "encryption.hpp"
#include "s3_client.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

/**
 * @brief Validated daemon configuration.
 */
class BackupConfig {
public:
    /// Looks up an environment variable.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /// Largest accepted configuration file.
    static constexpr std::uintmax_t kMaxConfigBytes = 1024 * 1024;

    /**
     * @brief Loads a configuration file, reading secrets from the process environment.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws ConfigError If the file is unreadable, too large or invalid.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from a parsed document.
     *
     * @param root Parsed JSON document.
     * @param env Environment lookup.
     * @throws ConfigError If any setting is invalid.
     */
    BackupConfig(const Json::Value& root, const EnvLookup& env);

    /**
     * @brief Environment lookup backed by getenv().
     */
    static EnvLookup processEnvironment();

    /**
     * @brief Checks that a source path is safe to archive.
     *
     * The path must be absolute, contain no "..", stay out of system
     * directories, lie under one of the allowed roots and exist.
     *
     * @param path Path from the configuration.
     * @param allowedRoots Permitted parent directories.
     * @return std::string The normalized path.
     * @throws ConfigError If the path is rejected.
     */
    static std::string validateSourcePath(const std::string& path, const std::vector<std::string>& allowedRoots);

    /**
     * @brief Checks a bucket name (3-63 of [a-z0-9.-], alphanumeric at both ends).
     */
    static bool isValidBucketName(const std::string& bucket);

    /**
     * @brief Checks an endpoint is a bare hostname.
     */
    static bool isValidEndpoint(const std::string& endpoint);

    /**
     * @brief Checks a source name against ^[A-Za-z0-9_-]+$.
     */
    static bool isValidSourceName(const std::string& name);

    /**
     * @brief Looks up a source by name.
     */
    const Source* findSource(const std::string& name) const;

    std::string workDir = "/var/tmp";                               ///< Parent of per-job scratch directories.
    std::string logFile = "/var/log/snapvault/snapvault.log";       ///< General log.
    std::string errorLogFile = "/var/log/snapvault/errors.log";     ///< Error log.
    std::string statusFile;                                         ///< Status document written after each job.
    bool debug = false;                                             ///< Diagnostic mode.
    std::vector<std::string> allowedSourceRoots;                    ///< Permitted source parents.
    S3Settings s3;                                                  ///< Object store connection.
    EncryptionSettings encryption;                                  ///< Encryption scheme and materials.
    std::vector<Source> sources;                                    ///< Backup targets.

private:
    void load(const Json::Value& root, const EnvLookup& env);
    void loadS3(const Json::Value& node, const EnvLookup& env);
    void loadEncryption(const Json::Value& node, const EnvLookup& env);
    Source loadSource(const Json::Value& node) const;
};

#endif // BACKUP_CONFIG_HPP
