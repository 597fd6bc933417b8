#include "backup_types.hpp"

const char* sourceKindName(SourceKind kind) {
    return kind == SourceKind::Volume ? "volume" : "directory";
}

std::optional<SourceKind> parseSourceKind(const std::string& name) {
    if (name == "volume") {
        return SourceKind::Volume;
    }
    if (name == "directory") {
        return SourceKind::Directory;
    }
    return std::nullopt;
}

const char* encryptionMethodName(EncryptionMethod method) {
    return method == EncryptionMethod::Gpg ? "gpg" : "aes256";
}

std::optional<EncryptionMethod> parseEncryptionMethod(const std::string& name) {
    if (name == "gpg") {
        return EncryptionMethod::Gpg;
    }
    if (name == "aes256") {
        return EncryptionMethod::Aes256;
    }
    return std::nullopt;
}

const char* jobStatusName(JobStatus status) {
    switch (status) {
        case JobStatus::Running: return "running";
        case JobStatus::Success: return "success";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}
