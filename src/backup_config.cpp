#include "backup_config.hpp"
#include "backup_error.hpp"
#include "cron_schedule.hpp"
#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <regex>
#include <set>

namespace fs = std::filesystem;

namespace {

const std::array<const char*, 10> kDisallowedPrefixes = {
    "/etc", "/root", "/home", "/usr/bin", "/usr/sbin", "/bin", "/sbin", "/proc", "/sys", "/dev"
};

const std::vector<std::string> kDefaultSourceRoots = {
    "/var/lib/docker/volumes", "/data", "/backups", "/opt", "/srv"
};

bool isUnder(const fs::path& path, const fs::path& root) {
    auto rootIt = root.begin();
    auto pathIt = path.begin();
    for (; rootIt != root.end(); ++rootIt, ++pathIt) {
        if (rootIt->empty()) {
            continue;
        }
        if (pathIt == path.end() || *pathIt != *rootIt) {
            return false;
        }
    }
    return true;
}

std::string requireString(const Json::Value& node, const char* key, const std::string& context) {
    if (!node.isMember(key) || !node[key].isString() || node[key].asString().empty()) {
        throw ConfigError(std::format("{}: missing required setting '{}'", context, key));
    }
    return node[key].asString();
}

std::optional<std::string> optionalString(const Json::Value& node, const char* key) {
    if (!node.isMember(key) || node[key].isNull()) {
        return std::nullopt;
    }
    if (!node[key].isString()) {
        throw ConfigError(std::format("Setting '{}' must be a string", key));
    }
    return node[key].asString();
}

std::optional<int> boundedTier(const Json::Value& retention, const char* key, int min, int max,
                               const std::string& sourceName) {
    if (!retention.isMember(key) || retention[key].isNull()) {
        return std::nullopt;
    }
    const Json::Value& value = retention[key];
    if (!value.isInt()) {
        throw ConfigError(std::format("Source {}: retention '{}' must be an integer", sourceName, key));
    }
    int tier = value.asInt();
    if (tier < min || tier > max) {
        throw ConfigError(std::format("Source {}: retention '{}' must be between {} and {}", sourceName, key, min, max));
    }
    return tier;
}

long positiveNumber(const Json::Value& node, const char* key, long fallback) {
    if (!node.isMember(key)) {
        return fallback;
    }
    if (!node[key].isInt() || node[key].asInt() < 0) {
        throw ConfigError(std::format("Setting 's3.{}' must be a non-negative integer", key));
    }
    return node[key].asInt();
}

}

BackupConfig::BackupConfig(const std::string& configFile) {
    std::error_code ec;
    auto size = fs::file_size(configFile, ec);
    if (ec) {
        throw ConfigError(std::format("Failed to open config file: {}", configFile));
    }
    if (size > kMaxConfigBytes) {
        throw ConfigError(std::format("Config file is too large (limit 1 MiB): {}", configFile));
    }

    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw ConfigError(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw ConfigError(std::format("Failed to parse config file: {}", reader.getFormattedErrorMessages()));
    }
    load(configJson, processEnvironment());
}

BackupConfig::BackupConfig(const Json::Value& root, const EnvLookup& env) {
    load(root, env);
}

BackupConfig::EnvLookup BackupConfig::processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

void BackupConfig::load(const Json::Value& root, const EnvLookup& env) {
    if (!root.isObject()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    workDir = root.get("work_dir", workDir).asString();
    logFile = root.get("log_file", logFile).asString();
    errorLogFile = root.get("error_log_file", errorLogFile).asString();
    statusFile = root.get("status_file", "").asString();
    debug = root.get("debug", false).asBool() || env("SNAPVAULT_DEBUG").has_value();

    allowedSourceRoots.clear();
    if (root.isMember("allowed_source_roots")) {
        for (const auto& entry : root["allowed_source_roots"]) {
            allowedSourceRoots.push_back(entry.asString());
        }
    }
    if (allowedSourceRoots.empty()) {
        allowedSourceRoots = kDefaultSourceRoots;
    }

    if (!root.isMember("s3") || !root["s3"].isObject()) {
        throw ConfigError("Missing 's3' section");
    }
    loadS3(root["s3"], env);
    loadEncryption(root.get("encryption", Json::Value(Json::objectValue)), env);

    const Json::Value& sourceList = root["sources"];
    if (!sourceList.isArray() || sourceList.empty()) {
        throw ConfigError("At least one source must be configured in 'sources'");
    }
    std::set<std::string> names;
    for (const auto& node : sourceList) {
        Source source = loadSource(node);
        if (!names.insert(source.name).second) {
            throw ConfigError(std::format("Duplicate source name: {}", source.name));
        }
        sources.push_back(std::move(source));
    }
}

void BackupConfig::loadS3(const Json::Value& node, const EnvLookup& env) {
    s3.bucket = requireString(node, "bucket", "s3");
    if (!isValidBucketName(s3.bucket)) {
        throw ConfigError(std::format("Invalid S3 bucket name: {}", s3.bucket));
    }
    s3.endpoint = node.get("endpoint", s3.endpoint).asString();
    if (!isValidEndpoint(s3.endpoint)) {
        throw ConfigError(std::format("Invalid S3 endpoint (hostname only): {}", s3.endpoint));
    }
    s3.region = node.get("region", s3.region).asString();
    s3.connectTimeoutSeconds = positiveNumber(node, "connect_timeout", s3.connectTimeoutSeconds);
    s3.readTimeoutSeconds = positiveNumber(node, "read_timeout", s3.readTimeoutSeconds);
    s3.maxRetries = static_cast<int>(positiveNumber(node, "max_retries", s3.maxRetries));

    auto accessKey = env("AWS_ACCESS_KEY_ID");
    auto secretKey = env("AWS_SECRET_ACCESS_KEY");
    if (!accessKey || accessKey->empty() || !secretKey || secretKey->empty()) {
        throw ConfigError("AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY must be set");
    }
    s3.accessKeyId = *accessKey;
    s3.secretAccessKey = *secretKey;
}

void BackupConfig::loadEncryption(const Json::Value& node, const EnvLookup& env) {
    std::string method = node.get("method", "gpg").asString();
    auto parsed = parseEncryptionMethod(method);
    if (!parsed) {
        throw ConfigError(std::format("Unsupported encryption method: {} (use gpg or aes256)", method));
    }
    encryption.method = *parsed;
    encryption.trustModel = node.get("trust_model", "pgp").asString();
    encryption.gnupgHome = optionalString(node, "gnupg_home");

    if (encryption.method == EncryptionMethod::Gpg) {
        auto publicKey = env("GPG_PUBLIC_KEY");
        if (!publicKey || publicKey->empty()) {
            throw ConfigError("GPG_PUBLIC_KEY must be set for gpg encryption");
        }
        encryption.publicKey = *publicKey;
        encryption.keyId = optionalString(node, "key_id");
        if (!encryption.keyId) {
            auto envKeyId = env("GPG_KEY_ID");
            if (envKeyId && !envKeyId->empty()) {
                encryption.keyId = envKeyId;
            }
        }
    } else {
        auto password = env("ENCRYPTION_PASSWORD");
        if (!password || password->empty()) {
            throw ConfigError("ENCRYPTION_PASSWORD must be set for aes256 encryption");
        }
        encryption.password = *password;
    }
}

Source BackupConfig::loadSource(const Json::Value& node) const {
    if (!node.isObject()) {
        throw ConfigError("Every entry of 'sources' must be an object");
    }

    Source source;
    source.name = requireString(node, "name", "source");
    if (!isValidSourceName(source.name)) {
        throw ConfigError(std::format("Invalid source name (allowed: letters, digits, '_' and '-'): {}", source.name));
    }
    const std::string context = std::format("Source {}", source.name);

    std::string type = requireString(node, "type", context);
    auto kind = parseSourceKind(type);
    if (!kind) {
        throw ConfigError(std::format("{}: unsupported type '{}' (use volume or directory)", context, type));
    }
    source.kind = *kind;

    source.path = validateSourcePath(requireString(node, "source", context), allowedSourceRoots);

    source.schedule = requireString(node, "schedule", context);
    auto schedule = CronSchedule::parse(source.schedule);
    if (!schedule) {
        throw ConfigError(std::format("{}: invalid schedule '{}': {}", context, source.schedule, schedule.error()));
    }

    const Json::Value& retention = node["retention"];
    if (!retention.isNull()) {
        if (!retention.isObject()) {
            throw ConfigError(std::format("{}: 'retention' must be an object", context));
        }
        source.retention.keepLast = boundedTier(retention, "keep_last", 1, 1000, source.name);
        source.retention.daily = boundedTier(retention, "daily", 1, 365, source.name);
        source.retention.weekly = boundedTier(retention, "weekly", 1, 104, source.name);
        source.retention.monthly = boundedTier(retention, "monthly", 1, 120, source.name);
    }

    const Json::Value& hooks = node["hooks"];
    if (!hooks.isNull()) {
        if (!hooks.isObject()) {
            throw ConfigError(std::format("{}: 'hooks' must be an object", context));
        }
        source.hooks.preBackup = optionalString(hooks, "pre_backup");
        source.hooks.postBackup = optionalString(hooks, "post_backup");
    }
    return source;
}

std::string BackupConfig::validateSourcePath(const std::string& path, const std::vector<std::string>& allowedRoots) {
    fs::path raw(path);
    if (path.empty() || !raw.is_absolute()) {
        throw ConfigError(std::format("Source path must be absolute: {}", path));
    }
    for (const auto& part : raw) {
        if (part == "..") {
            throw ConfigError(std::format("Source path must not contain '..': {}", path));
        }
    }

    std::error_code ec;
    if (!fs::exists(raw, ec)) {
        throw ConfigError(std::format("Source path does not exist: {}", path));
    }
    fs::path resolved = fs::canonical(raw, ec);
    if (ec) {
        throw ConfigError(std::format("Cannot resolve source path: {}", path));
    }

    for (const fs::path candidate : {raw.lexically_normal(), resolved}) {
        for (const char* prefix : kDisallowedPrefixes) {
            if (isUnder(candidate, prefix)) {
                throw ConfigError(std::format("Source path is in a protected system directory: {}", path));
            }
        }
    }

    bool allowed = std::any_of(allowedRoots.begin(), allowedRoots.end(), [&](const std::string& root) {
        fs::path rootPath = fs::weakly_canonical(fs::path(root), ec);
        return isUnder(resolved, ec ? fs::path(root).lexically_normal() : rootPath);
    });
    if (!allowed) {
        throw ConfigError(std::format("Source path is outside the allowed source roots: {}", path));
    }
    return resolved.string();
}

bool BackupConfig::isValidBucketName(const std::string& bucket) {
    static const std::regex pattern(R"(^[a-z0-9][a-z0-9.\-]{1,61}[a-z0-9]$)");
    return std::regex_match(bucket, pattern);
}

bool BackupConfig::isValidEndpoint(const std::string& endpoint) {
    static const std::regex pattern(R"(^[A-Za-z0-9]([A-Za-z0-9\-]*[A-Za-z0-9])?(\.[A-Za-z0-9]([A-Za-z0-9\-]*[A-Za-z0-9])?)*$)");
    return std::regex_match(endpoint, pattern);
}

bool BackupConfig::isValidSourceName(const std::string& name) {
    static const std::regex pattern(R"(^[A-Za-z0-9_-]+$)");
    return std::regex_match(name, pattern);
}

const Source* BackupConfig::findSource(const std::string& name) const {
    auto it = std::find_if(sources.begin(), sources.end(), [&](const Source& s) { return s.name == name; });
    return it == sources.end() ? nullptr : &*it;
}
