/**
 * @file temp_dir.hpp
 * @brief Exclusively owned scratch directories for backup jobs.
 */

#ifndef TEMP_DIR_HPP
#define TEMP_DIR_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <utility>

namespace fs = std::filesystem;

/**
 * @brief Owner-only temporary directory removed when the owner goes away.
 *
 * Created with mkdtemp under a work directory and mode 0700. Movable, not
 * copyable; the destructor removes the directory tree on every exit path
 * and never throws.
 */
class ScopedTempDir {
public:
    /// Prefix of every directory created by create().
    static constexpr const char* kPrefix = "snapvault.";

    /**
     * @brief Creates a new directory "<parent>/snapvault.XXXXXX".
     *
     * @param parent Existing directory that receives the new one.
     * @return std::expected<ScopedTempDir, std::string> The directory or an error message.
     */
    static std::expected<ScopedTempDir, std::string> create(const fs::path& parent);

    ScopedTempDir() = default;
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ~ScopedTempDir();

    const fs::path& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    /**
     * @brief Removes the directory now. Failures are logged.
     */
    void reset();

    /**
     * @brief Gives up ownership; the directory is kept on destruction.
     */
    fs::path release();

private:
    explicit ScopedTempDir(fs::path path) : path_(std::move(path)) {}

    fs::path path_;
};

/**
 * @brief Removes leftover "snapvault.*" directories from an earlier run.
 *
 * Best-effort: failures are logged, never raised.
 *
 * @param workDir Directory holding the per-job scratch directories.
 * @return std::size_t Number of directories removed.
 */
std::size_t sweepStaleWorkDirs(const fs::path& workDir);

#endif // TEMP_DIR_HPP
