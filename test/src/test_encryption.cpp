#define BOOST_TEST_MODULE TestEncryption
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <iterator>
#include <gpgme.h>
#include "encryption.hpp"
#include "temp_dir.hpp"

namespace {

const std::string kFingerprintA = "AAAA1111BBBB2222CCCC3333DDDD4444EEEE5555";
const std::string kFingerprintB = "0123456789ABCDEF0123456789ABCDEF01234567";

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::uint32_t bigEndianAt(const std::string& bytes, std::size_t offset) {
    return (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset])) << 24) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset + 1])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset + 2])) << 8) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset + 3]));
}

struct CryptoFixture {
    ScopedTempDir dir;
    fs::path plain;
    fs::path sealed;
    fs::path opened;
    std::string content;

    CryptoFixture() : dir(std::move(*ScopedTempDir::create(fs::temp_directory_path()))) {
        plain = dir.path() / "data.tar.gz";
        sealed = dir.path() / "data.tar.gz.enc";
        opened = dir.path() / "data.out";
        /* spans several 4 KiB chunks and ends mid-block */
        for (int i = 0; i < 3000; ++i) {
            content += "line " + std::to_string(i) + "\n";
        }
        writeFile(plain, content);
    }
};

GpgKeyInfo keyInfo(const std::string& fingerprint, const std::string& keyId) {
    GpgKeyInfo key;
    key.fingerprint = fingerprint;
    key.keyId = keyId;
    return key;
}

std::string takeData(gpgme_data_t data) {
    std::size_t length = 0;
    char* buffer = gpgme_data_release_and_get_mem(data, &length);
    std::string bytes(buffer ? buffer : "", buffer ? length : 0);
    gpgme_free(buffer);
    return bytes;
}

/*
 * Generates a fresh key pair in its own GNUPGHOME and exports the armored
 * public key; a second, empty GNUPGHOME plays the backup host.
 */
struct GpgFixture : CryptoFixture {
    ScopedTempDir ownerHome;
    ScopedTempDir hostHome;
    std::string fingerprint;
    std::string armoredKey;
    gpgme_ctx_t ctx = nullptr;

    GpgFixture()
        : ownerHome(std::move(*ScopedTempDir::create(fs::temp_directory_path()))),
          hostHome(std::move(*ScopedTempDir::create(fs::temp_directory_path()))) {
        gpgme_check_version(nullptr);
        BOOST_REQUIRE(!gpgme_new(&ctx));
        BOOST_REQUIRE(!gpgme_ctx_set_engine_info(ctx, GPGME_PROTOCOL_OpenPGP, nullptr, ownerHome.path().c_str()));

        BOOST_REQUIRE(!gpgme_op_createkey(ctx, "SnapVault Test <backup@snapvault.invalid>", "default", 0, 0, nullptr,
                                          GPGME_CREATE_NOPASSWD | GPGME_CREATE_NOEXPIRE));
        gpgme_genkey_result_t generated = gpgme_op_genkey_result(ctx);
        BOOST_REQUIRE(generated && generated->fpr);
        fingerprint = generated->fpr;

        gpgme_data_t exported = nullptr;
        BOOST_REQUIRE(!gpgme_data_new(&exported));
        gpgme_set_armor(ctx, 1);
        BOOST_REQUIRE(!gpgme_op_export(ctx, fingerprint.c_str(), 0, exported));
        armoredKey = takeData(exported);
        BOOST_REQUIRE(armoredKey.find("BEGIN PGP PUBLIC KEY BLOCK") != std::string::npos);
    }

    ~GpgFixture() { gpgme_release(ctx); }

    std::string decryptWithOwnerKey(const fs::path& file) {
        gpgme_data_t in = nullptr;
        gpgme_data_t out = nullptr;
        BOOST_REQUIRE(!gpgme_data_new_from_file(&in, file.c_str(), 1));
        BOOST_REQUIRE(!gpgme_data_new(&out));
        gpgme_error_t err = gpgme_op_decrypt(ctx, in, out);
        gpgme_data_release(in);
        std::string bytes = takeData(out);
        BOOST_REQUIRE(!err);
        return bytes;
    }

    GpgEncryptionStrategy::Options hostOptions() const {
        GpgEncryptionStrategy::Options options;
        options.publicKey = armoredKey;
        options.homeDir = hostHome.path().string();
        return options;
    }
};

}

BOOST_FIXTURE_TEST_CASE(TestAesRoundTrip, CryptoFixture)
{
    Aes256EncryptionStrategy aes("correct horse battery staple");
    BOOST_CHECK(aes.method() == EncryptionMethod::Aes256);
    BOOST_CHECK_EQUAL(aes.fileExtension(), "enc");

    BOOST_REQUIRE(aes.encrypt(plain.string(), sealed.string()).has_value());
    BOOST_CHECK(readFile(sealed) != content);

    BOOST_REQUIRE(aes.decrypt(sealed.string(), opened.string()).has_value());
    BOOST_CHECK(readFile(opened) == content);
}

BOOST_FIXTURE_TEST_CASE(TestAesHeaderLayout, CryptoFixture)
{
    Aes256EncryptionStrategy aes("secret");
    BOOST_REQUIRE(aes.encrypt(plain.string(), sealed.string()).has_value());

    std::string bytes = readFile(sealed);
    BOOST_REQUIRE(bytes.size() > 4 + 16 + 4 + 16);
    BOOST_CHECK_EQUAL(bigEndianAt(bytes, 0), Aes256EncryptionStrategy::kSaltLength);
    BOOST_CHECK_EQUAL(bigEndianAt(bytes, 4 + 16), 16u);

    /* CBC output is padded to whole blocks */
    const std::size_t payload = bytes.size() - (4 + 16 + 4 + 16);
    BOOST_CHECK_EQUAL(payload % 16, 0u);
    BOOST_CHECK(payload > content.size());
}

BOOST_FIXTURE_TEST_CASE(TestAesFreshSaltPerFile, CryptoFixture)
{
    Aes256EncryptionStrategy aes("secret");
    fs::path second = dir.path() / "second.enc";
    BOOST_REQUIRE(aes.encrypt(plain.string(), sealed.string()).has_value());
    BOOST_REQUIRE(aes.encrypt(plain.string(), second.string()).has_value());
    BOOST_CHECK(readFile(sealed).substr(0, 24) != readFile(second).substr(0, 24));
}

BOOST_FIXTURE_TEST_CASE(TestAesWrongPassphrase, CryptoFixture)
{
    Aes256EncryptionStrategy aes("secret");
    Aes256EncryptionStrategy other("not the secret");
    BOOST_REQUIRE(aes.encrypt(plain.string(), sealed.string()).has_value());

    /* padding check catches nearly every wrong key, never plaintext */
    auto result = other.decrypt(sealed.string(), opened.string());
    if (result) {
        BOOST_CHECK(readFile(opened) != content);
    } else {
        BOOST_CHECK(result.error().kind == ErrorKind::Encryption);
        BOOST_CHECK(!fs::exists(opened));
    }
}

BOOST_FIXTURE_TEST_CASE(TestAesRejectsCorruptHeader, CryptoFixture)
{
    Aes256EncryptionStrategy aes("secret");
    writeFile(sealed, std::string("\xff\xff\xff\xff", 4) + "garbage");
    auto result = aes.decrypt(sealed.string(), opened.string());
    BOOST_REQUIRE(!result.has_value());
    BOOST_CHECK(result.error().kind == ErrorKind::Encryption);

    writeFile(sealed, std::string("\x00\x00\x00\x10", 4) + "short");
    BOOST_CHECK(!aes.decrypt(sealed.string(), opened.string()).has_value());
}

BOOST_FIXTURE_TEST_CASE(TestAesEmptyPassphrase, CryptoFixture)
{
    Aes256EncryptionStrategy aes("");
    auto result = aes.encrypt(plain.string(), sealed.string());
    BOOST_REQUIRE(!result.has_value());
    BOOST_CHECK(result.error().kind == ErrorKind::Encryption);
}

BOOST_FIXTURE_TEST_CASE(TestAesMissingInput, CryptoFixture)
{
    Aes256EncryptionStrategy aes("secret");
    auto result = aes.encrypt((dir.path() / "missing").string(), sealed.string());
    BOOST_REQUIRE(!result.has_value());
    BOOST_CHECK(result.error().kind == ErrorKind::Encryption);
}

BOOST_AUTO_TEST_CASE(TestGpgKeyUsability)
{
    GpgKeyInfo key = keyInfo(kFingerprintA, "CCCC3333DDDD4444");
    BOOST_CHECK(key.usable());

    for (bool GpgKeyInfo::*flag : {&GpgKeyInfo::revoked, &GpgKeyInfo::expired,
                                   &GpgKeyInfo::disabled, &GpgKeyInfo::invalid}) {
        GpgKeyInfo flagged = key;
        flagged.*flag = true;
        BOOST_CHECK(!flagged.usable());
    }

    GpgKeyInfo signOnly = key;
    signOnly.canEncrypt = false;
    BOOST_CHECK(!signOnly.usable());
    BOOST_CHECK(!keyInfo("", "CCCC3333DDDD4444").usable());
}

BOOST_AUTO_TEST_CASE(TestSelectRecipientByKeyId)
{
    std::vector<GpgKeyInfo> keys = {
        keyInfo(kFingerprintA, "CCCC3333DDDD4444"),
        keyInfo(kFingerprintB, "89ABCDEF01234567")
    };

    auto byFingerprint = selectGpgRecipient(keys, kFingerprintB);
    BOOST_REQUIRE(byFingerprint.has_value());
    BOOST_CHECK_EQUAL(byFingerprint->fingerprint, kFingerprintB);

    auto byLongId = selectGpgRecipient(keys, std::string("0xcccc3333dddd4444"));
    BOOST_REQUIRE(byLongId.has_value());
    BOOST_CHECK_EQUAL(byLongId->fingerprint, kFingerprintA);

    auto byShortId = selectGpgRecipient(keys, std::string("EEEE5555"));
    BOOST_REQUIRE(byShortId.has_value());
    BOOST_CHECK_EQUAL(byShortId->fingerprint, kFingerprintA);

    auto missing = selectGpgRecipient(keys, std::string("DEADBEEF"));
    BOOST_REQUIRE(!missing.has_value());
    BOOST_CHECK(missing.error().kind == ErrorKind::Encryption);
}

BOOST_AUTO_TEST_CASE(TestSelectRecipientWithoutKeyId)
{
    std::vector<GpgKeyInfo> keys = {
        keyInfo(kFingerprintA, "CCCC3333DDDD4444"),
        keyInfo(kFingerprintB, "89ABCDEF01234567"),
        keyInfo("0000000000000000000000000000000000000000", "0000000000000000")
    };
    keys[2].revoked = true;

    /* revoked keys are skipped, the smallest fingerprint wins */
    auto chosen = selectGpgRecipient(keys, std::nullopt);
    BOOST_REQUIRE(chosen.has_value());
    BOOST_CHECK_EQUAL(chosen->fingerprint, kFingerprintB);

    /* same answer whatever the listing order */
    std::swap(keys[0], keys[1]);
    BOOST_CHECK_EQUAL(selectGpgRecipient(keys, std::nullopt)->fingerprint, kFingerprintB);
}

BOOST_AUTO_TEST_CASE(TestSelectRecipientNoUsableKeys)
{
    std::vector<GpgKeyInfo> keys = {
        keyInfo(kFingerprintA, "CCCC3333DDDD4444"),
        keyInfo("", "89ABCDEF01234567")
    };
    keys[0].expired = true;
    BOOST_CHECK(!selectGpgRecipient(keys, std::nullopt).has_value());
    BOOST_CHECK(!selectGpgRecipient({}, std::nullopt).has_value());
}

BOOST_AUTO_TEST_CASE(TestMakeEncryptionStrategy)
{
    EncryptionSettings settings;
    settings.method = EncryptionMethod::Aes256;
    settings.password = "secret";
    auto aes = makeEncryptionStrategy(settings);
    BOOST_REQUIRE(aes != nullptr);
    BOOST_CHECK(aes->method() == EncryptionMethod::Aes256);

    settings.method = EncryptionMethod::Gpg;
    settings.publicKey = "-----BEGIN PGP PUBLIC KEY BLOCK-----";
    auto gpg = makeEncryptionStrategy(settings);
    BOOST_REQUIRE(gpg != nullptr);
    BOOST_CHECK(gpg->method() == EncryptionMethod::Gpg);
    BOOST_CHECK_EQUAL(gpg->fileExtension(), "gpg");
}

BOOST_FIXTURE_TEST_CASE(TestGpgImportsKeyAndEncrypts, GpgFixture)
{
    GpgEncryptionStrategy::Options options = hostOptions();
    options.trustModel = "always";
    options.keyId = "0x" + fingerprint.substr(fingerprint.size() - 16);
    GpgEncryptionStrategy gpg(options);

    auto before = gpg.listKeys();
    BOOST_REQUIRE(before.has_value());
    BOOST_CHECK(before->empty());

    fs::path sealedGpg = dir.path() / "data.tar.gz.gpg";
    auto result = gpg.encrypt(plain.string(), sealedGpg.string());
    BOOST_REQUIRE_MESSAGE(result.has_value(), result ? "" : result.error().message);

    /* the configured key now lives in the host keyring */
    auto after = gpg.listKeys();
    BOOST_REQUIRE(after.has_value());
    BOOST_REQUIRE_EQUAL(after->size(), 1u);
    BOOST_CHECK_EQUAL(after->front().fingerprint, fingerprint);

    BOOST_CHECK(readFile(sealedGpg) != content);
    BOOST_CHECK_EQUAL(decryptWithOwnerKey(sealedGpg), content);

    /* a second run finds the key and does not import again */
    BOOST_REQUIRE(gpg.encrypt(plain.string(), sealedGpg.string()).has_value());
    BOOST_CHECK_EQUAL(decryptWithOwnerKey(sealedGpg), content);
}

BOOST_FIXTURE_TEST_CASE(TestGpgDoesNotForceTrust, GpgFixture)
{
    /* an imported key carries no validity under the pgp trust model */
    GpgEncryptionStrategy gpg(hostOptions());
    fs::path sealedGpg = dir.path() / "data.tar.gz.gpg";

    auto result = gpg.encrypt(plain.string(), sealedGpg.string());
    BOOST_REQUIRE(!result.has_value());
    BOOST_CHECK(result.error().kind == ErrorKind::Encryption);
    BOOST_CHECK(!fs::exists(sealedGpg));
}

BOOST_FIXTURE_TEST_CASE(TestGpgRejectsUnknownKeyId, GpgFixture)
{
    GpgEncryptionStrategy::Options options = hostOptions();
    options.trustModel = "always";
    options.keyId = "DEADBEEFDEADBEEF";
    GpgEncryptionStrategy gpg(options);

    auto result = gpg.encrypt(plain.string(), (dir.path() / "out.gpg").string());
    BOOST_REQUIRE(!result.has_value());
    BOOST_CHECK(result.error().message.find("not found in keyring") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(TestGpgRejectsInvalidArmor, CryptoFixture)
{
    auto home = ScopedTempDir::create(fs::temp_directory_path());
    BOOST_REQUIRE(home.has_value());

    GpgEncryptionStrategy::Options options;
    options.publicKey = "-----BEGIN PGP PUBLIC KEY BLOCK-----\nnot a key\n-----END PGP PUBLIC KEY BLOCK-----\n";
    options.homeDir = home->path().string();
    GpgEncryptionStrategy gpg(options);

    auto result = gpg.encrypt(plain.string(), (dir.path() / "out.gpg").string());
    BOOST_REQUIRE(!result.has_value());
    BOOST_CHECK(result.error().kind == ErrorKind::Encryption);

    options.publicKey.clear();
    GpgEncryptionStrategy noKey(options);
    BOOST_CHECK(!noKey.encrypt(plain.string(), (dir.path() / "out.gpg").string()).has_value());
}
