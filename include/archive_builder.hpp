/**
 * @file archive_builder.hpp
 * @brief Produces encrypted tar.gz archives of backup sources.
 *
 * The builder runs the source's hooks, packs the source into a gzip-compressed
 * tar with libarchive inside an exclusively owned scratch directory, verifies
 * the archive, encrypts it and describes the result with BackupMetadata.
 */

#ifndef ARCHIVE_BUILDER_HPP
#define ARCHIVE_BUILDER_HPP

#include "backup_error.hpp"
#include "backup_types.hpp"
#include "encryption.hpp"
#include "temp_dir.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <string>

/**
 * @brief Hard ceilings applied to the produced files.
 */
struct BuildLimits {
    std::uint64_t maxArchiveBytes = 100ULL * 1024 * 1024 * 1024;   ///< Plaintext archive ceiling.
    std::uint64_t maxEncryptedBytes = 110ULL * 1024 * 1024 * 1024; ///< Encrypted file ceiling.
};

/**
 * @brief One encrypted archive ready for upload.
 *
 * Owns the scratch directory holding the file; the directory and anything
 * left in it are removed when the artifact is destroyed.
 */
struct BackupArtifact {
    ScopedTempDir scratch;   ///< Directory containing filePath.
    fs::path filePath;       ///< Encrypted archive.
    BackupMetadata metadata; ///< Description of filePath.
};

/**
 * @brief Runs a hook command; injectable for tests.
 */
using HookRunner = std::function<std::expected<void, BackupError>(const std::string&)>;

class ArchiveBuilder {
public:
    /**
     * @brief Constructs an archive builder.
     *
     * @param encryptor Strategy applied to every archive; must outlive the builder.
     * @param workDir Directory receiving the per-build scratch directories.
     * @param limits Size ceilings.
     * @param hookRunner Hook executor, runHook by default.
     */
    ArchiveBuilder(EncryptionStrategy& encryptor, fs::path workDir, BuildLimits limits = {},
                   HookRunner hookRunner = {});

    /**
     * @brief Builds the encrypted archive of a source.
     *
     * The pre-hook runs first; a failing pre-hook aborts the build. Once it
     * has succeeded, the post-hook runs on every exit path. A failing
     * post-hook fails an otherwise successful build and is only logged when
     * the build already failed. On failure nothing is left on disk.
     *
     * @param source Source to archive.
     * @return std::expected<BackupArtifact, BackupError> The artifact, or a
     *         SourceAccessError, ArchiveError, SizeLimitExceeded,
     *         EncryptionError or HookError.
     */
    std::expected<BackupArtifact, BackupError> build(const Source& source);

private:
    std::expected<BackupArtifact, BackupError> buildArtifact(const Source& source);

    EncryptionStrategy& encryptor;
    fs::path workDir;
    BuildLimits limits;
    HookRunner hookRunner;
};

/**
 * @brief Writes a gzip-compressed POSIX tar of a directory.
 *
 * Entry names are relative to the directory's parent, so the top-level entry
 * is the directory's own name. Directories, regular files and symlinks keep
 * their mode and modification time.
 *
 * @param sourceDir Directory to pack.
 * @param outputFile Archive to create.
 * @return std::expected<std::uint64_t, BackupError> Number of entries written or an ArchiveError.
 */
std::expected<std::uint64_t, BackupError> writeTarGz(const fs::path& sourceDir, const fs::path& outputFile);

/**
 * @brief Reads an archive back completely to prove it is intact.
 *
 * @param archiveFile Archive to check.
 * @return std::expected<std::uint64_t, BackupError> Number of entries or an ArchiveError.
 */
std::expected<std::uint64_t, BackupError> verifyArchive(const fs::path& archiveFile);

/**
 * @brief SHA-256 of a file as lower-case hex.
 */
std::expected<std::string, BackupError> computeChecksum(const fs::path& file);

#endif // ARCHIVE_BUILDER_HPP
