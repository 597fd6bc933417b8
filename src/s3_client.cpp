#include "s3_client.hpp"
#include "logger.hpp"
#include "time_utils.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using FileHandle = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

constexpr const char* kAwsEndpoint = "s3.amazonaws.com";
constexpr const char* kMetaPrefix = "x-amz-meta-";

std::once_flag curlInitFlag;

struct Payload {
    const char* data = nullptr;
    std::size_t size = 0;
    std::size_t offset = 0;
    std::FILE* file = nullptr;
};

size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(contents, size * nmemb);
    return size * nmemb;
}

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* payload = static_cast<Payload*>(userp);
    const std::size_t capacity = size * nitems;
    if (payload->file) {
        std::size_t got = std::fread(buffer, 1, capacity, payload->file);
        if (got == 0 && std::ferror(payload->file)) {
            return CURL_READFUNC_ABORT;
        }
        return got;
    }
    std::size_t remaining = payload->size - payload->offset;
    std::size_t count = std::min(capacity, remaining);
    std::memcpy(buffer, payload->data + payload->offset, count);
    payload->offset += count;
    return count;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    const std::size_t length = size * nitems;
    std::string line(buffer, length);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        std::string value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        value = (first == std::string::npos) ? std::string() : value.substr(first, last - first + 1);
        (*headers)[name] = value;
    }
    return length;
}

std::string escape(const std::string& text) {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return text;
    }
    char* escaped = curl_easy_escape(curl.get(), text.c_str(), static_cast<int>(text.size()));
    if (!escaped) {
        return text;
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string escapeKey(const std::string& key) {
    std::string result;
    std::size_t start = 0;
    while (true) {
        auto slash = key.find('/', start);
        result += escape(key.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) {
            break;
        }
        result += '/';
        start = slash + 1;
    }
    return result;
}

std::string xmlUnescape(std::string text) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&quot;", "\""}, {"&apos;", "'"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&amp;", "&"}
    };
    for (const auto& [entity, replacement] : entities) {
        std::size_t pos = 0;
        while ((pos = text.find(entity, pos)) != std::string::npos) {
            text.replace(pos, std::strlen(entity), replacement);
            pos += std::strlen(replacement);
        }
    }
    return text;
}

std::string xmlEscape(const std::string& text) {
    std::string result;
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            default: result += c;
        }
    }
    return result;
}

bool isSuccess(long status) {
    return status >= 200 && status < 300;
}

bool isTransient(long status) {
    return status >= 500 || status == 429;
}

BackupError s3Error(const std::string& operation, long status, const std::string& body) {
    std::string code = extractXmlElement(body, "Code");
    std::string message = extractXmlElement(body, "Message");
    std::string text = std::format("{} failed with HTTP {}", operation, status);
    if (!code.empty()) {
        text += std::format(" {}", code);
    }
    if (!message.empty()) {
        text += std::format(": {}", message);
    }
    return BackupError(ErrorKind::Upload, text);
}

void addMetadataHeaders(std::vector<std::string>& headers, const ObjectMetadata& metadata) {
    for (const auto& [name, value] : metadata) {
        headers.push_back(std::format("{}{}: {}", kMetaPrefix, name, value));
    }
}

// Raw text of the first <tag> element at or after *from, entities left as they are.
std::optional<std::string> findXmlElement(const std::string& xml, const std::string& tag, std::size_t* from) {
    const std::string open = std::format("<{}>", tag);
    const std::string close = std::format("</{}>", tag);
    std::size_t start = xml.find(open, from ? *from : 0);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += open.size();
    std::size_t end = xml.find(close, start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    if (from) {
        *from = end + close.size();
    }
    return xml.substr(start, end - start);
}

}

std::string extractXmlElement(const std::string& xml, const std::string& tag, std::size_t* from) {
    auto text = findXmlElement(xml, tag, from);
    return text ? xmlUnescape(*text) : std::string();
}

std::string parseListObjectsPage(const std::string& xml, std::vector<RemoteObject>& objects) {
    std::size_t pos = 0;
    while (true) {
        auto contents = findXmlElement(xml, "Contents", &pos);
        if (!contents) {
            break;
        }
        RemoteObject object;
        object.key = extractXmlElement(*contents, "Key");
        if (object.key.empty()) {
            continue;
        }

        const std::string size = extractXmlElement(*contents, "Size");
        auto [end, ec] = std::from_chars(size.data(), size.data() + size.size(), object.size);
        if (ec != std::errc() || end != size.data() + size.size()) {
            Logger::logWarning(std::format("Skipping listed object {}: invalid size '{}'", object.key, size));
            continue;
        }

        auto modified = parseIso8601(extractXmlElement(*contents, "LastModified"));
        if (!modified) {
            Logger::logWarning(std::format("Skipping listed object {}: missing modification time", object.key));
            continue;
        }
        object.lastModified = *modified;
        objects.push_back(std::move(object));
    }

    if (extractXmlElement(xml, "IsTruncated") == "true") {
        return extractXmlElement(xml, "NextContinuationToken");
    }
    return {};
}

S3Client::S3Client(S3Settings settings) : settings(std::move(settings)) {
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string S3Client::bucketUrl() const {
    if (settings.endpoint.empty() || settings.endpoint == kAwsEndpoint) {
        return std::format("https://{}.s3.{}.amazonaws.com", settings.bucket, settings.region);
    }
    return std::format("https://{}/{}", settings.endpoint, settings.bucket);
}

std::string S3Client::objectUrl(const std::string& key) const {
    return std::format("{}/{}", bucketUrl(), escapeKey(key));
}

std::expected<S3Client::Response, BackupError> S3Client::performOnce(const Request& request) const {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return std::unexpected(BackupError(ErrorKind::Upload, "Failed to initialize CURL"));
    }

    Response response;
    const std::string sigv4 = std::format("aws:amz:{}:s3", settings.region);

    curl_slist* rawHeaders = nullptr;
    rawHeaders = curl_slist_append(rawHeaders, "x-amz-content-sha256: UNSIGNED-PAYLOAD");
    for (const auto& header : request.headers) {
        rawHeaders = curl_slist_append(rawHeaders, header.c_str());
    }
    HeaderList headers(rawHeaders, &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_AWS_SIGV4, sigv4.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, settings.accessKeyId.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, settings.secretAccessKey.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, settings.connectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, settings.readTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

    Payload payload;
    FileHandle file(nullptr, &std::fclose);
    if (request.method == "PUT") {
        curl_off_t length = 0;
        if (request.file) {
            file.reset(std::fopen(request.file->c_str(), "rb"));
            if (!file) {
                return std::unexpected(BackupError(ErrorKind::Upload,
                    std::format("Failed to open file for upload: {} ({})", request.file->string(), strerror(errno))));
            }
            std::error_code ec;
            length = static_cast<curl_off_t>(std::filesystem::file_size(*request.file, ec));
            payload.file = file.get();
        } else {
            payload.data = request.data;
            payload.size = request.dataSize;
            length = static_cast<curl_off_t>(request.dataSize);
        }
        curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readCallback);
        curl_easy_setopt(curl.get(), CURLOPT_READDATA, &payload);
        curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, length);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(BackupError(ErrorKind::Upload,
            std::format("S3 request failed: {}", curl_easy_strerror(res))));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::expected<S3Client::Response, BackupError> S3Client::perform(const Request& request) const {
    for (int attempt = 0;; ++attempt) {
        auto response = performOnce(request);
        bool transient = !response || isTransient(response->status);
        if (!transient || attempt >= settings.maxRetries) {
            return response;
        }
        auto delay = std::chrono::seconds(1LL << attempt);
        Logger::logWarning(std::format("S3 {} attempt {} failed ({}), retrying in {}s", request.method, attempt + 1,
                                       response ? std::format("HTTP {}", response->status) : response.error().message,
                                       delay.count()));
        std::this_thread::sleep_for(delay);
    }
}

std::expected<void, BackupError> S3Client::putObject(const std::string& key, const std::filesystem::path& file,
                                                     const ObjectMetadata& metadata) {
    Request request;
    request.method = "PUT";
    request.url = objectUrl(key);
    request.file = &file;
    request.headers.push_back("x-amz-server-side-encryption: AES256");
    addMetadataHeaders(request.headers, metadata);

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!isSuccess(response->status)) {
        return std::unexpected(s3Error("PutObject", response->status, response->body));
    }
    return {};
}

std::expected<std::string, BackupError> S3Client::createMultipartUpload(const std::string& key,
                                                                        const ObjectMetadata& metadata) {
    Request request;
    request.method = "POST";
    request.url = std::format("{}?uploads=", objectUrl(key));
    request.headers.push_back("x-amz-server-side-encryption: AES256");
    addMetadataHeaders(request.headers, metadata);

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!isSuccess(response->status)) {
        return std::unexpected(s3Error("CreateMultipartUpload", response->status, response->body));
    }
    std::string uploadId = extractXmlElement(response->body, "UploadId");
    if (uploadId.empty()) {
        return std::unexpected(BackupError(ErrorKind::Upload, "CreateMultipartUpload returned no upload id"));
    }
    return uploadId;
}

std::expected<std::string, BackupError> S3Client::uploadPart(const std::string& key, const std::string& uploadId,
                                                             int partNumber, const char* data, std::size_t size) {
    Request request;
    request.method = "PUT";
    request.url = std::format("{}?partNumber={}&uploadId={}", objectUrl(key), partNumber, escape(uploadId));
    request.data = data;
    request.dataSize = size;

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!isSuccess(response->status)) {
        return std::unexpected(s3Error(std::format("UploadPart {}", partNumber), response->status, response->body));
    }
    auto etag = response->headers.find("etag");
    if (etag == response->headers.end() || etag->second.empty()) {
        return std::unexpected(BackupError(ErrorKind::Upload, "UploadPart returned no ETag"));
    }
    return etag->second;
}

std::expected<void, BackupError> S3Client::completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                                                   const std::vector<CompletedPart>& parts) {
    std::ostringstream xml;
    xml << "<CompleteMultipartUpload>";
    for (const auto& part : parts) {
        xml << "<Part><PartNumber>" << part.partNumber << "</PartNumber><ETag>" << xmlEscape(part.etag)
            << "</ETag></Part>";
    }
    xml << "</CompleteMultipartUpload>";

    Request request;
    request.method = "POST";
    request.url = std::format("{}?uploadId={}", objectUrl(key), escape(uploadId));
    request.headers.push_back("Content-Type: application/xml");
    request.body = xml.str();

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    // S3 may report a failed completion inside a 200 response
    if (!isSuccess(response->status) || response->body.find("<Error>") != std::string::npos) {
        return std::unexpected(s3Error("CompleteMultipartUpload", response->status, response->body));
    }
    return {};
}

std::expected<void, BackupError> S3Client::abortMultipartUpload(const std::string& key, const std::string& uploadId) {
    Request request;
    request.method = "DELETE";
    request.url = std::format("{}?uploadId={}", objectUrl(key), escape(uploadId));

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!isSuccess(response->status)) {
        return std::unexpected(s3Error("AbortMultipartUpload", response->status, response->body));
    }
    return {};
}

std::expected<std::vector<RemoteObject>, BackupError> S3Client::listObjects(const std::string& prefix) {
    std::vector<RemoteObject> objects;
    std::string token;
    do {
        Request request;
        request.url = std::format("{}/?", bucketUrl());
        if (!token.empty()) {
            request.url += std::format("continuation-token={}&", escape(token));
        }
        request.url += std::format("list-type=2&prefix={}", escape(prefix));

        auto response = perform(request);
        if (!response) {
            return std::unexpected(response.error());
        }
        if (!isSuccess(response->status)) {
            return std::unexpected(s3Error("ListObjectsV2", response->status, response->body));
        }
        token = parseListObjectsPage(response->body, objects);
    } while (!token.empty());
    return objects;
}

std::expected<ObjectMetadata, BackupError> S3Client::headObject(const std::string& key) {
    Request request;
    request.method = "HEAD";
    request.url = objectUrl(key);

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!isSuccess(response->status)) {
        return std::unexpected(s3Error("HeadObject", response->status, response->body));
    }

    ObjectMetadata metadata;
    const std::size_t prefixLength = std::strlen(kMetaPrefix);
    for (const auto& [name, value] : response->headers) {
        if (name.compare(0, prefixLength, kMetaPrefix) == 0) {
            metadata[name.substr(prefixLength)] = value;
        }
    }
    return metadata;
}

std::expected<void, BackupError> S3Client::deleteObject(const std::string& key) {
    Request request;
    request.method = "DELETE";
    request.url = objectUrl(key);

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!isSuccess(response->status)) {
        return std::unexpected(s3Error("DeleteObject", response->status, response->body));
    }
    return {};
}
