#define BOOST_TEST_MODULE TestArchiveBuilder
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <map>
#include "archive_builder.hpp"

namespace {

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::size_t countEntries(const fs::path& dir) {
    std::size_t count = 0;
    for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

/* Copies the input verbatim and records the call */
class CopyEncryption : public EncryptionStrategy {
public:
    explicit CopyEncryption(std::vector<std::string>& calls) : calls(calls) {}

    std::expected<void, BackupError> encrypt(const std::string& inputPath, const std::string& outputPath) override {
        calls.push_back("encrypt");
        if (fail) {
            return std::unexpected(BackupError(ErrorKind::Encryption, "no usable key"));
        }
        std::ifstream in(inputPath, std::ios::binary);
        std::ofstream out(outputPath, std::ios::binary);
        out << in.rdbuf();
        out << padding;
        return {};
    }

    EncryptionMethod method() const override { return EncryptionMethod::Aes256; }
    std::string fileExtension() const override { return "bin"; }

    std::vector<std::string>& calls;
    bool fail = false;
    std::string padding;
};

struct BuilderFixture {
    ScopedTempDir root;
    fs::path sourceDir;
    fs::path workDir;
    std::vector<std::string> calls;
    CopyEncryption encryptor;
    std::map<std::string, bool> hookOutcome;

    BuilderFixture() : root(std::move(*ScopedTempDir::create(fs::temp_directory_path()))), encryptor(calls) {
        sourceDir = root.path() / "appdata";
        workDir = root.path() / "work";
        fs::create_directories(sourceDir / "sub");
        fs::create_directories(workDir);
        writeFile(sourceDir / "a.txt", "alpha");
        writeFile(sourceDir / "sub" / "b.txt", std::string(200000, 'b'));
        fs::create_symlink("a.txt", sourceDir / "link");
    }

    Source source() const {
        Source s;
        s.name = "app";
        s.kind = SourceKind::Volume;
        s.path = sourceDir.string();
        s.schedule = "0 3 * * *";
        return s;
    }

    HookRunner recordingHooks() {
        return [this](const std::string& command) -> std::expected<void, BackupError> {
            calls.push_back(command);
            auto it = hookOutcome.find(command);
            if (it != hookOutcome.end() && !it->second) {
                return std::unexpected(BackupError(ErrorKind::Hook, "Hook command failed with exit code 1: " + command));
            }
            return {};
        };
    }
};

}

BOOST_FIXTURE_TEST_CASE(TestWriteAndVerifyArchive, BuilderFixture)
{
    fs::path tarFile = root.path() / "out.tar.gz";
    auto written = writeTarGz(sourceDir, tarFile);
    BOOST_REQUIRE(written.has_value());

    /* appdata, a.txt, sub, sub/b.txt, link */
    BOOST_CHECK_EQUAL(*written, 5u);
    auto verified = verifyArchive(tarFile);
    BOOST_REQUIRE(verified.has_value());
    BOOST_CHECK_EQUAL(*verified, 5u);
}

BOOST_FIXTURE_TEST_CASE(TestVerifyRejectsCorruptArchive, BuilderFixture)
{
    fs::path tarFile = root.path() / "out.tar.gz";
    BOOST_REQUIRE(writeTarGz(sourceDir, tarFile).has_value());
    fs::resize_file(tarFile, fs::file_size(tarFile) / 2);

    auto verified = verifyArchive(tarFile);
    BOOST_REQUIRE(!verified.has_value());
    BOOST_CHECK(verified.error().kind == ErrorKind::Archive);

    writeFile(tarFile, "definitely not gzip");
    BOOST_CHECK(!verifyArchive(tarFile).has_value());
}

BOOST_FIXTURE_TEST_CASE(TestComputeChecksum, BuilderFixture)
{
    fs::path file = root.path() / "abc";
    writeFile(file, "abc");
    auto checksum = computeChecksum(file);
    BOOST_REQUIRE(checksum.has_value());
    BOOST_CHECK_EQUAL(*checksum, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    BOOST_CHECK(!computeChecksum(root.path() / "missing").has_value());
}

BOOST_FIXTURE_TEST_CASE(TestBuildProducesArtifact, BuilderFixture)
{
    ArchiveBuilder builder(encryptor, workDir, BuildLimits{}, recordingHooks());

    {
        auto artifact = builder.build(source());
        BOOST_REQUIRE(artifact.has_value());

        const BackupMetadata& metadata = artifact->metadata;
        BOOST_CHECK(fs::exists(artifact->filePath));
        BOOST_CHECK_EQUAL(artifact->filePath.parent_path(), artifact->scratch.path());
        BOOST_CHECK_EQUAL(metadata.sourceName, "app");
        BOOST_CHECK_EQUAL(metadata.filename, artifact->filePath.filename().string());
        BOOST_CHECK_EQUAL(metadata.filename.rfind("app_", 0), 0u);
        BOOST_CHECK(metadata.filename.ends_with(".tar.gz.bin"));
        BOOST_CHECK_EQUAL(metadata.size, fs::file_size(artifact->filePath));
        BOOST_CHECK_EQUAL(metadata.archiveSize, metadata.size);
        BOOST_CHECK_EQUAL(metadata.checksum, *computeChecksum(artifact->filePath));
        BOOST_CHECK_EQUAL(metadata.checksum.size(), 64u);
        BOOST_CHECK(metadata.timestamp.ends_with("Z"));
        BOOST_CHECK(metadata.durationSeconds >= 0.0);
        BOOST_CHECK(metadata.encryptionMethod == EncryptionMethod::Aes256);
        BOOST_CHECK(metadata.sourceKind == SourceKind::Volume);

        /* only the encrypted file remains in the scratch directory */
        BOOST_CHECK_EQUAL(countEntries(artifact->scratch.path()), 1u);
        BOOST_CHECK(verifyArchive(artifact->filePath).has_value());
    }

    /* dropping the artifact removes every trace */
    BOOST_CHECK_EQUAL(countEntries(workDir), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestMissingSource, BuilderFixture)
{
    ArchiveBuilder builder(encryptor, workDir, BuildLimits{}, recordingHooks());
    Source missing = source();
    missing.path = (root.path() / "gone").string();

    auto artifact = builder.build(missing);
    BOOST_REQUIRE(!artifact.has_value());
    BOOST_CHECK(artifact.error().kind == ErrorKind::SourceAccess);
    BOOST_CHECK(calls.empty());
    BOOST_CHECK_EQUAL(countEntries(workDir), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestArchiveSizeCeiling, BuilderFixture)
{
    ArchiveBuilder builder(encryptor, workDir, BuildLimits{64, 1024 * 1024}, recordingHooks());

    auto artifact = builder.build(source());
    BOOST_REQUIRE(!artifact.has_value());
    BOOST_CHECK(artifact.error().kind == ErrorKind::SizeLimitExceeded);
    BOOST_CHECK(calls.empty());
    BOOST_CHECK_EQUAL(countEntries(workDir), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestEncryptedSizeCeiling, BuilderFixture)
{
    fs::path sample = root.path() / "sample.tar.gz";
    BOOST_REQUIRE(writeTarGz(sourceDir, sample).has_value());
    const std::uint64_t archiveBytes = fs::file_size(sample) + 1024;

    encryptor.padding = std::string(4096, 'p');
    ArchiveBuilder builder(encryptor, workDir, BuildLimits{archiveBytes, archiveBytes}, recordingHooks());

    auto artifact = builder.build(source());
    BOOST_REQUIRE(!artifact.has_value());
    BOOST_CHECK(artifact.error().kind == ErrorKind::SizeLimitExceeded);
    BOOST_CHECK_EQUAL(calls.size(), 1u);
    BOOST_CHECK_EQUAL(countEntries(workDir), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestHookOrdering, BuilderFixture)
{
    ArchiveBuilder builder(encryptor, workDir, BuildLimits{}, recordingHooks());
    Source s = source();
    s.hooks.preBackup = "pre";
    s.hooks.postBackup = "post";

    auto artifact = builder.build(s);
    BOOST_REQUIRE(artifact.has_value());
    BOOST_REQUIRE_EQUAL(calls.size(), 3u);
    BOOST_CHECK_EQUAL(calls[0], "pre");
    BOOST_CHECK_EQUAL(calls[1], "encrypt");
    BOOST_CHECK_EQUAL(calls[2], "post");
}

BOOST_FIXTURE_TEST_CASE(TestPreHookFailureAbortsBuild, BuilderFixture)
{
    ArchiveBuilder builder(encryptor, workDir, BuildLimits{}, recordingHooks());
    Source s = source();
    s.hooks.preBackup = "pre";
    s.hooks.postBackup = "post";
    hookOutcome["pre"] = false;

    auto artifact = builder.build(s);
    BOOST_REQUIRE(!artifact.has_value());
    BOOST_CHECK(artifact.error().kind == ErrorKind::Hook);
    BOOST_REQUIRE_EQUAL(calls.size(), 1u);
    BOOST_CHECK_EQUAL(calls[0], "pre");
    BOOST_CHECK_EQUAL(countEntries(workDir), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestPostHookRunsAfterFailedBuild, BuilderFixture)
{
    encryptor.fail = true;
    ArchiveBuilder builder(encryptor, workDir, BuildLimits{}, recordingHooks());
    Source s = source();
    s.hooks.postBackup = "post";
    hookOutcome["post"] = false;

    /* the build error wins over the post-hook error */
    auto artifact = builder.build(s);
    BOOST_REQUIRE(!artifact.has_value());
    BOOST_CHECK(artifact.error().kind == ErrorKind::Encryption);
    BOOST_REQUIRE_EQUAL(calls.size(), 2u);
    BOOST_CHECK_EQUAL(calls[1], "post");
    BOOST_CHECK_EQUAL(countEntries(workDir), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestPostHookFailureFailsBuild, BuilderFixture)
{
    ArchiveBuilder builder(encryptor, workDir, BuildLimits{}, recordingHooks());
    Source s = source();
    s.hooks.postBackup = "post";
    hookOutcome["post"] = false;

    auto artifact = builder.build(s);
    BOOST_REQUIRE(!artifact.has_value());
    BOOST_CHECK(artifact.error().kind == ErrorKind::Hook);
    BOOST_CHECK_EQUAL(countEntries(workDir), 0u);
}

BOOST_FIXTURE_TEST_CASE(TestBuildWithAes, BuilderFixture)
{
    Aes256EncryptionStrategy aes("archive passphrase");
    ArchiveBuilder builder(aes, workDir);

    auto artifact = builder.build(source());
    BOOST_REQUIRE(artifact.has_value());
    BOOST_CHECK(artifact->metadata.filename.ends_with(".tar.gz.enc"));

    fs::path restored = root.path() / "restored.tar.gz";
    BOOST_REQUIRE(aes.decrypt(artifact->filePath.string(), restored.string()).has_value());
    auto verified = verifyArchive(restored);
    BOOST_REQUIRE(verified.has_value());
    BOOST_CHECK_EQUAL(*verified, 5u);
}
