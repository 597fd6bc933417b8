#define BOOST_TEST_MODULE TestUploader
#include <boost/test/unit_test.hpp>
#include <fstream>
#include "fake_object_store.hpp"
#include "temp_dir.hpp"
#include "uploader.hpp"

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

BackupMetadata sampleMetadata() {
    BackupMetadata metadata;
    metadata.sourceName = "web";
    metadata.timestamp = "2026-10-19T03:00:00Z";
    metadata.filename = "web_20261019_030000.tar.gz.gpg";
    metadata.size = 2500;
    metadata.checksum = "abc123";
    metadata.encryptionMethod = EncryptionMethod::Gpg;
    metadata.sourceKind = SourceKind::Volume;
    return metadata;
}

struct UploadFixture {
    ScopedTempDir dir;

    UploadFixture() : dir(std::move(*ScopedTempDir::create(fs::temp_directory_path()))) {}

    fs::path writeFile(const std::string& name, std::size_t size) {
        fs::path path = dir.path() / name;
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'x');
        return path;
    }

    fs::path sparseFile(const std::string& name, std::uint64_t size) {
        fs::path path = dir.path() / name;
        { std::ofstream out(path, std::ios::binary); }
        fs::resize_file(path, size);
        return path;
    }
};

}

BOOST_AUTO_TEST_CASE(TestObjectKeyLayout)
{
    BackupMetadata metadata = sampleMetadata();
    BOOST_CHECK_EQUAL(Uploader::objectKey(metadata),
                      "backups/web/20261019_030000_web_20261019_030000.tar.gz.gpg");
    BOOST_CHECK_EQUAL(Uploader::sourcePrefix("web"), "backups/web/");
}

BOOST_AUTO_TEST_CASE(TestObjectKeySanitization)
{
    BackupMetadata metadata = sampleMetadata();
    metadata.sourceName = "../etc";
    metadata.filename = "a/b c.tar.gz";

    /* slashes never survive, dots only in the filename */
    BOOST_CHECK_EQUAL(Uploader::objectKey(metadata), "backups/___etc/20261019_030000_a_b_c.tar.gz");
    BOOST_CHECK_EQUAL(Uploader::sanitizeKeyComponent("db-01_x", false), "db-01_x");
    BOOST_CHECK_EQUAL(Uploader::sanitizeKeyComponent("x.y", false), "x_y");
    BOOST_CHECK_EQUAL(Uploader::sanitizeKeyComponent("x.y", true), "x.y");
}

BOOST_AUTO_TEST_CASE(TestObjectMetadataTags)
{
    ObjectMetadata tags = Uploader::objectMetadata(sampleMetadata());
    BOOST_CHECK_EQUAL(tags.at("source-name"), "web");
    BOOST_CHECK_EQUAL(tags.at("timestamp"), "2026-10-19T03:00:00Z");
    BOOST_CHECK_EQUAL(tags.at("size"), "2500");
    BOOST_CHECK_EQUAL(tags.at("checksum"), "abc123");
    BOOST_CHECK_EQUAL(tags.at("encryption-method"), "gpg");
    BOOST_CHECK_EQUAL(tags.at("source-kind"), "volume");
}

BOOST_FIXTURE_TEST_CASE(TestSmallFileUsesSingleRequest, UploadFixture)
{
    FakeObjectStore store;
    Uploader uploader(store);

    fs::path file = writeFile("small.gpg", 2500);
    UploadResult result = uploader.upload(file, sampleMetadata());

    BOOST_CHECK(result.success);
    BOOST_CHECK(result.error.empty());
    BOOST_CHECK_EQUAL(store.putCalls, 1);
    BOOST_CHECK_EQUAL(store.createCalls, 0);
    BOOST_REQUIRE_EQUAL(store.objects.count(result.key), 1u);
    BOOST_CHECK_EQUAL(store.objects[result.key].size, 2500u);
    BOOST_CHECK_EQUAL(store.objects[result.key].metadata.at("checksum"), "abc123");
}

BOOST_FIXTURE_TEST_CASE(TestSingleRequestFailure, UploadFixture)
{
    FakeObjectStore store;
    store.failPut = true;
    Uploader uploader(store);

    UploadResult result = uploader.upload(writeFile("small.gpg", 10), sampleMetadata());
    BOOST_CHECK(!result.success);
    BOOST_CHECK(!result.error.empty());
    BOOST_CHECK(store.objects.empty());
}

BOOST_FIXTURE_TEST_CASE(TestMultipartSplitsIntoOrderedParts, UploadFixture)
{
    FakeObjectStore store;
    Uploader uploader(store, UploadOptions{1024, 1024});

    UploadResult result = uploader.upload(writeFile("medium.gpg", 2500), sampleMetadata());

    BOOST_REQUIRE(result.success);
    BOOST_CHECK_EQUAL(store.putCalls, 0);
    BOOST_CHECK_EQUAL(store.createCalls, 1);
    BOOST_REQUIRE_EQUAL(store.partSizes.size(), 3u);
    BOOST_CHECK_EQUAL(store.partSizes[0], 1024u);
    BOOST_CHECK_EQUAL(store.partSizes[1], 1024u);
    BOOST_CHECK_EQUAL(store.partSizes[2], 452u);

    BOOST_REQUIRE_EQUAL(store.completedUploads.size(), 1u);
    const auto& parts = store.completedUploads[0];
    BOOST_REQUIRE_EQUAL(parts.size(), 3u);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        BOOST_CHECK_EQUAL(parts[i].partNumber, static_cast<int>(i + 1));
        BOOST_CHECK_EQUAL(parts[i].etag, "\"etag-" + std::to_string(i + 1) + "\"");
    }
    BOOST_CHECK_EQUAL(store.abortCalls, 0);
    BOOST_CHECK_EQUAL(store.objects[result.key].size, 2500u);
}

BOOST_FIXTURE_TEST_CASE(TestThresholdIsExclusive, UploadFixture)
{
    FakeObjectStore store;
    Uploader uploader(store, UploadOptions{1024, 1024});

    BOOST_CHECK(uploader.upload(writeFile("exact.gpg", 1024), sampleMetadata()).success);
    BOOST_CHECK_EQUAL(store.putCalls, 1);
    BOOST_CHECK_EQUAL(store.createCalls, 0);
}

BOOST_FIXTURE_TEST_CASE(TestLargeFileDefaultParts, UploadFixture)
{
    FakeObjectStore store;
    Uploader uploader(store);

    fs::path file = sparseFile("large.gpg", 250 * kMiB);
    UploadResult result = uploader.upload(file, sampleMetadata());

    BOOST_REQUIRE(result.success);
    BOOST_REQUIRE_EQUAL(store.partSizes.size(), 3u);
    BOOST_CHECK_EQUAL(store.partSizes[0], 100 * kMiB);
    BOOST_CHECK_EQUAL(store.partSizes[1], 100 * kMiB);
    BOOST_CHECK_EQUAL(store.partSizes[2], 50 * kMiB);
    BOOST_REQUIRE_EQUAL(store.completedUploads.size(), 1u);
    BOOST_CHECK_EQUAL(store.completedUploads[0].size(), 3u);
}

BOOST_FIXTURE_TEST_CASE(TestPartFailureAbortsUpload, UploadFixture)
{
    FakeObjectStore store;
    store.failPartNumber = 2;
    Uploader uploader(store, UploadOptions{1024, 1024});

    UploadResult result = uploader.upload(writeFile("medium.gpg", 2500), sampleMetadata());

    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.error.find("part 2") != std::string::npos);
    BOOST_CHECK_EQUAL(store.abortCalls, 1);
    BOOST_CHECK(store.completedUploads.empty());
    BOOST_CHECK(store.objects.empty());
}

BOOST_FIXTURE_TEST_CASE(TestAbortFailureKeepsOriginalError, UploadFixture)
{
    FakeObjectStore store;
    store.failPartNumber = 1;
    store.failAbort = true;
    Uploader uploader(store, UploadOptions{1024, 1024});

    UploadResult result = uploader.upload(writeFile("medium.gpg", 2500), sampleMetadata());

    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.error.find("part 1") != std::string::npos);
    BOOST_CHECK(result.error.find("abort") == std::string::npos);
    BOOST_CHECK_EQUAL(store.abortCalls, 1);
}

BOOST_AUTO_TEST_CASE(TestListBackupsNewestFirst)
{
    FakeObjectStore store;
    const auto base = Clock::now() - std::chrono::hours(48);
    store.addObject("backups/web/a", 1, base + std::chrono::hours(1));
    store.addObject("backups/web/b", 2, base + std::chrono::hours(30));
    store.addObject("backups/web/c", 3, base + std::chrono::hours(12));
    store.addObject("backups/webshop/d", 4, base + std::chrono::hours(40));
    store.objects["backups/web/b"].metadata["source-name"] = "web";

    Uploader uploader(store);
    auto listed = uploader.listBackups("web");

    BOOST_REQUIRE(listed.has_value());
    BOOST_REQUIRE_EQUAL(listed->size(), 3u);
    BOOST_CHECK_EQUAL((*listed)[0].key, "backups/web/b");
    BOOST_CHECK_EQUAL((*listed)[1].key, "backups/web/c");
    BOOST_CHECK_EQUAL((*listed)[2].key, "backups/web/a");
    BOOST_CHECK_EQUAL((*listed)[0].tags.at("source-name"), "web");
}

BOOST_AUTO_TEST_CASE(TestListBackupsFailure)
{
    FakeObjectStore store;
    store.failList = true;
    Uploader uploader(store);
    BOOST_CHECK(!uploader.listBackups("web").has_value());
}

BOOST_AUTO_TEST_CASE(TestDeleteBackup)
{
    FakeObjectStore store;
    store.addObject("backups/web/a", 1, Clock::now());
    store.addObject("backups/web/b", 1, Clock::now());
    store.failDeletes.insert("backups/web/b");

    Uploader uploader(store);
    BOOST_CHECK(uploader.deleteBackup("backups/web/a").has_value());

    auto failed = uploader.deleteBackup("backups/web/b");
    BOOST_REQUIRE(!failed.has_value());
    BOOST_CHECK(failed.error().kind == ErrorKind::Retention);
    BOOST_CHECK_EQUAL(store.objects.size(), 1u);
}
