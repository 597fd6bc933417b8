/**
 * @file s3_client.hpp
 * @brief S3-compatible object store client built on libcurl.
 *
 * Requests are signed by libcurl's AWS SigV4 support with an unsigned payload.
 * AWS endpoints use virtual-host addressing, any other endpoint path-style.
 *
 * @note Requires libcurl 7.75 or later for CURLOPT_AWS_SIGV4.
 */

#ifndef S3_CLIENT_HPP
#define S3_CLIENT_HPP

#include "object_store.hpp"
#include <chrono>
#include <string>

/**
 * @brief Connection settings of the S3 client.
 */
struct S3Settings {
    std::string bucket;
    std::string endpoint = "s3.amazonaws.com";
    std::string region = "us-east-1";
    std::string accessKeyId;
    std::string secretAccessKey;
    long connectTimeoutSeconds = 30;
    long readTimeoutSeconds = 300;
    int maxRetries = 3;
};

/**
 * @brief Extracts the text of the first <tag> element at or after a position.
 *
 * @param xml Document text.
 * @param tag Element name.
 * @param from Start offset; advanced past the element when found.
 * @return std::string The unescaped element text, empty when absent.
 */
std::string extractXmlElement(const std::string& xml, const std::string& tag, std::size_t* from = nullptr);

/**
 * @brief Parses one ListObjectsV2 response page.
 *
 * @param xml Response body.
 * @param objects Receives the listed objects.
 * @return std::string The continuation token, empty on the last page.
 */
std::string parseListObjectsPage(const std::string& xml, std::vector<RemoteObject>& objects);

class S3Client : public ObjectStoreClient {
public:
    explicit S3Client(S3Settings settings);

    std::expected<void, BackupError> putObject(const std::string& key, const std::filesystem::path& file,
                                               const ObjectMetadata& metadata) override;
    std::expected<std::string, BackupError> createMultipartUpload(const std::string& key,
                                                                  const ObjectMetadata& metadata) override;
    std::expected<std::string, BackupError> uploadPart(const std::string& key, const std::string& uploadId,
                                                       int partNumber, const char* data, std::size_t size) override;
    std::expected<void, BackupError> completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                                             const std::vector<CompletedPart>& parts) override;
    std::expected<void, BackupError> abortMultipartUpload(const std::string& key, const std::string& uploadId) override;
    std::expected<std::vector<RemoteObject>, BackupError> listObjects(const std::string& prefix) override;
    std::expected<ObjectMetadata, BackupError> headObject(const std::string& key) override;
    std::expected<void, BackupError> deleteObject(const std::string& key) override;

    /**
     * @brief URL of the bucket root, without a trailing slash.
     */
    std::string bucketUrl() const;

    /**
     * @brief URL of an object, with each key segment percent-encoded.
     */
    std::string objectUrl(const std::string& key) const;

private:
    struct Request {
        std::string method = "GET";
        std::string url;
        std::vector<std::string> headers;
        std::string body;                         ///< Sent for POST requests.
        const char* data = nullptr;               ///< In-memory PUT payload.
        std::size_t dataSize = 0;
        const std::filesystem::path* file = nullptr; ///< File PUT payload.
    };

    struct Response {
        long status = 0;
        std::string body;
        std::map<std::string, std::string> headers; ///< Lower-case names.
    };

    std::expected<Response, BackupError> perform(const Request& request) const;
    std::expected<Response, BackupError> performOnce(const Request& request) const;

    S3Settings settings;
};

#endif // S3_CLIENT_HPP
