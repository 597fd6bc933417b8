#include "temp_dir.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include <format>
#include <vector>

std::expected<ScopedTempDir, std::string> ScopedTempDir::create(const fs::path& parent) {
    std::error_code ec;
    if (!fs::is_directory(parent, ec)) {
        return std::unexpected(std::format("Work directory does not exist: {}", parent.string()));
    }

    std::string pattern = (parent / std::format("{}XXXXXX", kPrefix)).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        return std::unexpected(std::format("Failed to create temporary directory: {}", strerror(errno)));
    }

    fs::path created(buf.data());
    if (chmod(created.c_str(), S_IRWXU) != 0) {
        std::string error = strerror(errno);
        fs::remove_all(created, ec);
        return std::unexpected(std::format("Failed to restrict temporary directory permissions: {}", error));
    }
    return ScopedTempDir(created);
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        reset();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScopedTempDir::~ScopedTempDir() {
    reset();
}

void ScopedTempDir::reset() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        Logger::logWarning(std::format("Failed to remove temporary directory {}: {}", path_.string(), ec.message()));
    }
    path_.clear();
}

fs::path ScopedTempDir::release() {
    fs::path released = std::move(path_);
    path_.clear();
    return released;
}

std::size_t sweepStaleWorkDirs(const fs::path& workDir) {
    std::size_t removed = 0;
    std::error_code ec;
    if (!fs::is_directory(workDir, ec)) {
        return 0;
    }

    const std::string prefix = ScopedTempDir::kPrefix;
    for (fs::directory_iterator it(workDir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.rfind(prefix, 0) != 0 || !it->is_directory(ec)) {
            continue;
        }
        std::error_code removeEc;
        fs::remove_all(it->path(), removeEc);
        if (removeEc) {
            Logger::logWarning(std::format("Failed to remove stale work directory {}: {}", it->path().string(), removeEc.message()));
        } else {
            ++removed;
            Logger::logMessage(std::format("Removed stale work directory: {}", it->path().string()));
        }
    }
    if (ec) {
        Logger::logWarning(std::format("Failed to scan work directory {}: {}", workDir.string(), ec.message()));
    }
    return removed;
}
