#include "archive_builder.hpp"
#include "hook_runner.hpp"
#include "logger.hpp"
#include "time_utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <format>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace {

using WriteArchive = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using ReadArchive = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using Entry = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;
using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr std::size_t kIoBufferSize = 64 * 1024;

BackupError archiveError(struct archive* a, const std::string& context) {
    const char* detail = archive_error_string(a);
    return BackupError(ErrorKind::Archive, detail ? std::format("{}: {}", context, detail) : context);
}

std::expected<void, BackupError> checkSourceAccess(const Source& source) {
    std::error_code ec;
    fs::path path(source.path);
    if (!fs::exists(path, ec)) {
        return std::unexpected(BackupError(ErrorKind::SourceAccess, std::format("Source path does not exist: {}", source.path)));
    }
    if (!fs::is_directory(path, ec)) {
        return std::unexpected(BackupError(ErrorKind::SourceAccess, std::format("Source path is not a directory: {}", source.path)));
    }
    if (access(path.c_str(), R_OK | X_OK) != 0) {
        return std::unexpected(BackupError(ErrorKind::SourceAccess,
            std::format("Source path is not readable: {} ({})", source.path, strerror(errno))));
    }
    return {};
}

/**
 * Appends one filesystem object. Sockets, FIFOs and device nodes are skipped.
 */
std::expected<bool, BackupError> addEntry(struct archive* a, const fs::path& path, const std::string& name) {
    struct stat st{};
    if (lstat(path.c_str(), &st) != 0) {
        return std::unexpected(BackupError(ErrorKind::Archive,
            std::format("Cannot stat {}: {}", path.string(), strerror(errno))));
    }

    Entry entry(archive_entry_new(), &archive_entry_free);
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_perm(entry.get(), st.st_mode & 07777);
    archive_entry_set_mtime(entry.get(), st.st_mtime, 0);
    archive_entry_set_uid(entry.get(), st.st_uid);
    archive_entry_set_gid(entry.get(), st.st_gid);

    std::ifstream file;
    if (S_ISDIR(st.st_mode)) {
        archive_entry_set_filetype(entry.get(), AE_IFDIR);
        archive_entry_set_size(entry.get(), 0);
    } else if (S_ISLNK(st.st_mode)) {
        std::error_code ec;
        fs::path target = fs::read_symlink(path, ec);
        if (ec) {
            return std::unexpected(BackupError(ErrorKind::Archive,
                std::format("Cannot read symlink {}: {}", path.string(), ec.message())));
        }
        archive_entry_set_filetype(entry.get(), AE_IFLNK);
        archive_entry_set_symlink(entry.get(), target.c_str());
        archive_entry_set_size(entry.get(), 0);
    } else if (S_ISREG(st.st_mode)) {
        file.open(path, std::ios::binary);
        if (!file) {
            return std::unexpected(BackupError(ErrorKind::Archive,
                std::format("Failed to open file: {} ({})", path.string(), strerror(errno))));
        }
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_size(entry.get(), st.st_size);
    } else {
        Logger::logDebug(std::format("Skipping special file: {}", path.string()));
        return false;
    }

    if (archive_write_header(a, entry.get()) != ARCHIVE_OK) {
        return std::unexpected(archiveError(a, std::format("Failed to write archive header for {}", name)));
    }

    if (file.is_open()) {
        std::vector<char> buf(kIoBufferSize);
        std::uint64_t written = 0;
        while (file) {
            file.read(buf.data(), buf.size());
            std::streamsize got = file.gcount();
            if (got <= 0) {
                break;
            }
            if (archive_write_data(a, buf.data(), static_cast<std::size_t>(got)) < 0) {
                return std::unexpected(archiveError(a, std::format("Failed to write archive data for {}", name)));
            }
            written += static_cast<std::uint64_t>(got);
        }
        if (file.bad() || written != static_cast<std::uint64_t>(st.st_size)) {
            return std::unexpected(BackupError(ErrorKind::Archive,
                std::format("File changed or could not be read while archiving: {}", path.string())));
        }
    }
    return true;
}

std::uint64_t fileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::string megabytes(std::uint64_t bytes) {
    return std::format("{}MB", bytes / (1024 * 1024));
}

}

std::expected<std::uint64_t, BackupError> writeTarGz(const fs::path& sourceDir, const fs::path& outputFile) {
    WriteArchive a(archive_write_new(), &archive_write_free);
    if (!a) {
        return std::unexpected(BackupError(ErrorKind::Archive, "Failed to allocate archive writer"));
    }
    archive_write_add_filter_gzip(a.get());
    archive_write_set_format_pax_restricted(a.get());
    if (archive_write_open_filename(a.get(), outputFile.c_str()) != ARCHIVE_OK) {
        return std::unexpected(archiveError(a.get(), std::format("Failed to open archive file {}", outputFile.string())));
    }

    fs::path root = sourceDir.lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    const fs::path base = root.parent_path();
    std::uint64_t entries = 0;

    auto added = addEntry(a.get(), root, root.filename().string());
    if (!added) {
        return std::unexpected(added.error());
    }
    entries += *added ? 1 : 0;

    try {
        for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
            std::string name = it->path().lexically_relative(base).string();
            auto result = addEntry(a.get(), it->path(), name);
            if (!result) {
                return std::unexpected(result.error());
            }
            entries += *result ? 1 : 0;
        }
    } catch (const fs::filesystem_error& e) {
        return std::unexpected(BackupError(ErrorKind::Archive, std::format("Failed to read source tree: {}", e.what())));
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        return std::unexpected(archiveError(a.get(), "Failed to finalize archive"));
    }
    return entries;
}

std::expected<std::uint64_t, BackupError> verifyArchive(const fs::path& archiveFile) {
    ReadArchive a(archive_read_new(), &archive_read_free);
    if (!a) {
        return std::unexpected(BackupError(ErrorKind::Archive, "Failed to allocate archive reader"));
    }
    archive_read_support_filter_gzip(a.get());
    archive_read_support_format_tar(a.get());
    if (archive_read_open_filename(a.get(), archiveFile.c_str(), 10240) != ARCHIVE_OK) {
        return std::unexpected(archiveError(a.get(), "Failed to open archive for verification"));
    }

    struct archive_entry* entry = nullptr;
    std::uint64_t entries = 0;
    int status = ARCHIVE_OK;
    while ((status = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
            return std::unexpected(archiveError(a.get(), "Archive verification failed"));
        }
        ++entries;
    }
    if (status != ARCHIVE_EOF) {
        return std::unexpected(archiveError(a.get(), "Archive verification failed"));
    }
    archive_read_close(a.get());
    return entries;
}

std::expected<std::string, BackupError> computeChecksum(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return std::unexpected(BackupError(ErrorKind::Archive, std::format("Failed to open file for checksum: {}", file.string())));
    }

    DigestCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::unexpected(BackupError(ErrorKind::Archive, "Failed to initialise SHA-256"));
    }

    std::vector<char> buf(kIoBufferSize);
    while (in) {
        in.read(buf.data(), buf.size());
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(got)) != 1) {
            return std::unexpected(BackupError(ErrorKind::Archive, "SHA-256 update failed"));
        }
    }
    if (in.bad()) {
        return std::unexpected(BackupError(ErrorKind::Archive, std::format("Failed to read file for checksum: {}", file.string())));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        return std::unexpected(BackupError(ErrorKind::Archive, "SHA-256 finalisation failed"));
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}

ArchiveBuilder::ArchiveBuilder(EncryptionStrategy& encryptor, fs::path workDir, BuildLimits limits, HookRunner hookRunner)
    : encryptor(encryptor), workDir(std::move(workDir)), limits(limits),
      hookRunner(hookRunner ? std::move(hookRunner) : HookRunner(runHook)) {}

std::expected<BackupArtifact, BackupError> ArchiveBuilder::build(const Source& source) {
    if (source.hooks.preBackup) {
        auto pre = hookRunner(*source.hooks.preBackup);
        if (!pre) {
            return std::unexpected(pre.error());
        }
    }

    auto result = buildArtifact(source);

    if (source.hooks.postBackup) {
        auto post = hookRunner(*source.hooks.postBackup);
        if (!post) {
            if (result) {
                Logger::logError(std::format("Post-backup hook failed for {}: {}", source.name, post.error().message));
                return std::unexpected(post.error());
            }
            Logger::logWarning(std::format("Post-backup hook failed for {} after build failure: {}", source.name, post.error().message));
        }
    }
    return result;
}

std::expected<BackupArtifact, BackupError> ArchiveBuilder::buildArtifact(const Source& source) {
    const auto startedAt = Clock::now();

    auto readable = checkSourceAccess(source);
    if (!readable) {
        return std::unexpected(readable.error());
    }

    auto scratch = ScopedTempDir::create(workDir);
    if (!scratch) {
        return std::unexpected(BackupError(ErrorKind::Archive, std::format("Failed to prepare work directory: {}", scratch.error())));
    }

    const std::string baseName = std::format("{}_{}", source.name, formatCompactTimestamp(startedAt));
    const fs::path tarFile = scratch->path() / std::format("{}.tar.gz", baseName);
    const fs::path encryptedFile = scratch->path() / std::format("{}.tar.gz.{}", baseName, encryptor.fileExtension());

    auto entries = writeTarGz(source.path, tarFile);
    if (!entries) {
        return std::unexpected(entries.error());
    }

    const std::uint64_t archiveSize = fileSize(tarFile);
    if (archiveSize > limits.maxArchiveBytes) {
        return std::unexpected(BackupError(ErrorKind::SizeLimitExceeded,
            std::format("Backup size ({}) exceeds maximum allowed size ({})", megabytes(archiveSize),
                        megabytes(limits.maxArchiveBytes))));
    }

    auto verified = verifyArchive(tarFile);
    if (!verified) {
        return std::unexpected(verified.error());
    }
    Logger::logDebug(std::format("Archived {} entries for {}", *entries, source.name));

    auto encrypted = encryptor.encrypt(tarFile.string(), encryptedFile.string());
    if (!encrypted) {
        return std::unexpected(encrypted.error());
    }

    const std::uint64_t encryptedSize = fileSize(encryptedFile);
    if (encryptedSize > limits.maxEncryptedBytes) {
        return std::unexpected(BackupError(ErrorKind::SizeLimitExceeded,
            std::format("Encrypted backup size ({}) exceeds maximum allowed size ({})", megabytes(encryptedSize),
                        megabytes(limits.maxEncryptedBytes))));
    }

    auto checksum = computeChecksum(encryptedFile);
    if (!checksum) {
        return std::unexpected(checksum.error());
    }
    if (encryptedSize == 0 || checksum->empty()) {
        return std::unexpected(BackupError(ErrorKind::Archive, std::format("Backup file is empty: {}", encryptedFile.filename().string())));
    }

    std::error_code ec;
    fs::remove(tarFile, ec);
    if (ec) {
        Logger::logWarning(std::format("Failed to remove plaintext archive: {}", ec.message()));
    }

    const std::chrono::duration<double> elapsed = Clock::now() - startedAt;

    BackupArtifact artifact;
    artifact.filePath = encryptedFile;
    artifact.metadata.sourceName = source.name;
    artifact.metadata.timestamp = formatIso8601(startedAt);
    artifact.metadata.filename = encryptedFile.filename().string();
    artifact.metadata.size = encryptedSize;
    artifact.metadata.archiveSize = archiveSize;
    artifact.metadata.checksum = *checksum;
    artifact.metadata.durationSeconds = std::round(elapsed.count() * 100.0) / 100.0;
    artifact.metadata.encryptionMethod = encryptor.method();
    artifact.metadata.sourceKind = source.kind;
    artifact.scratch = std::move(*scratch);

    Logger::logMessage(std::format("Built backup {} ({})", artifact.metadata.filename, megabytes(encryptedSize)));
    return artifact;
}
