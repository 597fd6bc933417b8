#include "encryption.hpp"
#include "logger.hpp"
#include <gpgme.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <mutex>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

constexpr std::uint32_t kMaxSaltLength = 1024;

std::string opensslError(const std::string& context) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return context;
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::format("{}: {}", context, buf);
}

void writeLength(std::ofstream& out, std::uint32_t length) {
    const unsigned char bytes[4] = {
        static_cast<unsigned char>((length >> 24) & 0xff),
        static_cast<unsigned char>((length >> 16) & 0xff),
        static_cast<unsigned char>((length >> 8) & 0xff),
        static_cast<unsigned char>(length & 0xff)
    };
    out.write(reinterpret_cast<const char*>(bytes), sizeof(bytes));
}

bool readLength(std::ifstream& in, std::uint32_t& length) {
    unsigned char bytes[4];
    if (!in.read(reinterpret_cast<char*>(bytes), sizeof(bytes))) {
        return false;
    }
    length = (static_cast<std::uint32_t>(bytes[0]) << 24) | (static_cast<std::uint32_t>(bytes[1]) << 16) |
             (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
    return true;
}

void removePartial(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

std::expected<std::vector<unsigned char>, BackupError> deriveKey(const std::string& passphrase,
                                                                  const std::vector<unsigned char>& salt) {
    std::vector<unsigned char> key(EVP_CIPHER_key_length(EVP_aes_256_cbc()));
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          Aes256EncryptionStrategy::kPbkdf2Iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        return std::unexpected(BackupError(ErrorKind::Encryption, opensslError("Key derivation failed")));
    }
    return key;
}

/**
 * Streams in -> out through an initialised cipher context, finishing with
 * the final block.
 */
bool streamCipher(EVP_CIPHER_CTX* ctx, std::ifstream& in, std::ofstream& out) {
    std::array<char, Aes256EncryptionStrategy::kChunkSize> inBuf;
    std::vector<unsigned char> outBuf(Aes256EncryptionStrategy::kChunkSize + EVP_MAX_BLOCK_LENGTH);
    int outLen = 0;

    while (in) {
        in.read(inBuf.data(), inBuf.size());
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (EVP_CipherUpdate(ctx, outBuf.data(), &outLen,
                             reinterpret_cast<const unsigned char*>(inBuf.data()), static_cast<int>(got)) != 1) {
            return false;
        }
        out.write(reinterpret_cast<const char*>(outBuf.data()), outLen);
    }
    if (in.bad()) {
        return false;
    }
    if (EVP_CipherFinal_ex(ctx, outBuf.data(), &outLen) != 1) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(outBuf.data()), outLen);
    return static_cast<bool>(out);
}

std::string normalizeKeyId(const std::string& keyId) {
    std::string id = keyId;
    if (id.size() > 2 && id[0] == '0' && (id[1] == 'x' || id[1] == 'X')) {
        id = id.substr(2);
    }
    std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) { return std::toupper(c); });
    return id;
}

bool keyMatches(const GpgKeyInfo& key, const std::string& normalizedId) {
    const std::string& fpr = key.fingerprint;
    if (normalizedId == fpr || normalizedId == key.keyId) {
        return true;
    }
    if (fpr.size() >= normalizedId.size() && (normalizedId.size() == 16 || normalizedId.size() == 8)) {
        return fpr.compare(fpr.size() - normalizedId.size(), normalizedId.size(), normalizedId) == 0;
    }
    return false;
}

using GpgContext = std::unique_ptr<gpgme_context, decltype(&gpgme_release)>;
using GpgData = std::unique_ptr<gpgme_data, decltype(&gpgme_data_release)>;
using GpgKey = std::unique_ptr<_gpgme_key, decltype(&gpgme_key_unref)>;

/* Owns a file descriptor handed to GPGME data objects */
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd(fd) {}
    ~ScopedFd() {
        if (fd >= 0) {
            close(fd);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd; }

private:
    int fd;
};

BackupError gpgError(const std::string& context, gpgme_error_t err) {
    return BackupError(ErrorKind::Encryption, std::format("{}: {}", context, gpgme_strerror(err)));
}

std::expected<void, BackupError> initGpgme() {
    static std::once_flag once;
    static gpgme_error_t engineError = 0;
    std::call_once(once, [] {
        gpgme_check_version(nullptr);
        engineError = gpgme_engine_check_version(GPGME_PROTOCOL_OpenPGP);
    });
    if (engineError) {
        return std::unexpected(gpgError("GnuPG engine unavailable", engineError));
    }
    return {};
}

std::expected<GpgContext, BackupError> openContext(const std::optional<std::string>& homeDir,
                                                   const std::string& trustModel) {
    auto ready = initGpgme();
    if (!ready) {
        return std::unexpected(ready.error());
    }

    gpgme_ctx_t raw = nullptr;
    gpgme_error_t err = gpgme_new(&raw);
    if (err) {
        return std::unexpected(gpgError("Failed to create GPGME context", err));
    }
    GpgContext ctx(raw, &gpgme_release);

    err = gpgme_set_protocol(ctx.get(), GPGME_PROTOCOL_OpenPGP);
    if (!err && homeDir && !homeDir->empty()) {
        err = gpgme_ctx_set_engine_info(ctx.get(), GPGME_PROTOCOL_OpenPGP, nullptr, homeDir->c_str());
    }
    if (err) {
        return std::unexpected(gpgError("Failed to configure GnuPG engine", err));
    }
    gpgme_set_armor(ctx.get(), 0);

    err = gpgme_set_ctx_flag(ctx.get(), "trust-model", trustModel.c_str());
    if (err) {
        return std::unexpected(gpgError(std::format("Unsupported GPG trust model '{}'", trustModel), err));
    }
    return ctx;
}

GpgKeyInfo describeKey(gpgme_key_t key) {
    GpgKeyInfo info;
    const char* fpr = key->fpr ? key->fpr : (key->subkeys ? key->subkeys->fpr : nullptr);
    if (fpr) {
        info.fingerprint = normalizeKeyId(fpr);
    }
    if (key->subkeys && key->subkeys->keyid) {
        info.keyId = normalizeKeyId(key->subkeys->keyid);
    }
    info.revoked = key->revoked;
    info.expired = key->expired;
    info.disabled = key->disabled;
    info.invalid = key->invalid;
    info.canEncrypt = key->can_encrypt;
    return info;
}

bool anyUsable(const std::vector<GpgKeyInfo>& keys) {
    return std::any_of(keys.begin(), keys.end(), [](const GpgKeyInfo& k) { return k.usable(); });
}

}

Aes256EncryptionStrategy::Aes256EncryptionStrategy(std::string passphrase) : passphrase(std::move(passphrase)) {}

Aes256EncryptionStrategy::~Aes256EncryptionStrategy() {
    if (!passphrase.empty()) {
        OPENSSL_cleanse(passphrase.data(), passphrase.size());
    }
}

std::expected<void, BackupError> Aes256EncryptionStrategy::encrypt(const std::string& inputPath, const std::string& outputPath) {
    if (passphrase.empty()) {
        return std::unexpected(BackupError(ErrorKind::Encryption, "Encryption passphrase is empty"));
    }

    std::ifstream input(inputPath, std::ios::binary);
    if (!input) {
        return std::unexpected(BackupError(ErrorKind::Encryption, std::format("Failed to open input file: {}", inputPath)));
    }

    const EVP_CIPHER* cipher = EVP_aes_256_cbc();
    std::vector<unsigned char> salt(kSaltLength);
    std::vector<unsigned char> iv(EVP_CIPHER_iv_length(cipher));
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1 ||
        RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        return std::unexpected(BackupError(ErrorKind::Encryption, opensslError("Random generator failure")));
    }

    auto key = deriveKey(passphrase, salt);
    if (!key) {
        return std::unexpected(key.error());
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, key->data(), iv.data()) != 1) {
        OPENSSL_cleanse(key->data(), key->size());
        return std::unexpected(BackupError(ErrorKind::Encryption, opensslError("Cipher initialisation failed")));
    }
    OPENSSL_cleanse(key->data(), key->size());

    std::ofstream output(outputPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(BackupError(ErrorKind::Encryption, std::format("Failed to open output file: {}", outputPath)));
    }

    writeLength(output, static_cast<std::uint32_t>(salt.size()));
    output.write(reinterpret_cast<const char*>(salt.data()), static_cast<std::streamsize>(salt.size()));
    writeLength(output, static_cast<std::uint32_t>(iv.size()));
    output.write(reinterpret_cast<const char*>(iv.data()), static_cast<std::streamsize>(iv.size()));

    bool ok = output && streamCipher(ctx.get(), input, output);
    output.close();
    if (!ok || output.fail()) {
        removePartial(outputPath);
        return std::unexpected(BackupError(ErrorKind::Encryption, opensslError("AES-256 encryption failed")));
    }
    return {};
}

std::expected<void, BackupError> Aes256EncryptionStrategy::decrypt(const std::string& inputPath, const std::string& outputPath) {
    std::ifstream input(inputPath, std::ios::binary);
    if (!input) {
        return std::unexpected(BackupError(ErrorKind::Encryption, std::format("Failed to open encrypted file: {}", inputPath)));
    }

    const EVP_CIPHER* cipher = EVP_aes_256_cbc();
    std::uint32_t saltLength = 0;
    if (!readLength(input, saltLength) || saltLength == 0 || saltLength > kMaxSaltLength) {
        return std::unexpected(BackupError(ErrorKind::Encryption, "Invalid encrypted file header: salt length"));
    }
    std::vector<unsigned char> salt(saltLength);
    if (!input.read(reinterpret_cast<char*>(salt.data()), saltLength)) {
        return std::unexpected(BackupError(ErrorKind::Encryption, "Truncated encrypted file header: salt"));
    }

    std::uint32_t ivLength = 0;
    if (!readLength(input, ivLength) || ivLength != static_cast<std::uint32_t>(EVP_CIPHER_iv_length(cipher))) {
        return std::unexpected(BackupError(ErrorKind::Encryption, "Invalid encrypted file header: IV length"));
    }
    std::vector<unsigned char> iv(ivLength);
    if (!input.read(reinterpret_cast<char*>(iv.data()), ivLength)) {
        return std::unexpected(BackupError(ErrorKind::Encryption, "Truncated encrypted file header: IV"));
    }

    auto key = deriveKey(passphrase, salt);
    if (!key) {
        return std::unexpected(key.error());
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, key->data(), iv.data()) != 1) {
        OPENSSL_cleanse(key->data(), key->size());
        return std::unexpected(BackupError(ErrorKind::Encryption, opensslError("Cipher initialisation failed")));
    }
    OPENSSL_cleanse(key->data(), key->size());

    std::ofstream output(outputPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(BackupError(ErrorKind::Encryption, std::format("Failed to open output file: {}", outputPath)));
    }

    bool ok = streamCipher(ctx.get(), input, output);
    output.close();
    if (!ok || output.fail()) {
        removePartial(outputPath);
        return std::unexpected(BackupError(ErrorKind::Encryption,
            opensslError("AES-256 decryption failed (wrong passphrase or corrupt data)")));
    }
    return {};
}

bool GpgKeyInfo::usable() const {
    return !revoked && !expired && !disabled && !invalid && canEncrypt && !fingerprint.empty();
}

std::expected<GpgKeyInfo, BackupError> selectGpgRecipient(const std::vector<GpgKeyInfo>& keys,
                                                           const std::optional<std::string>& keyId) {
    std::vector<GpgKeyInfo> usable;
    std::copy_if(keys.begin(), keys.end(), std::back_inserter(usable), [](const GpgKeyInfo& k) { return k.usable(); });
    if (usable.empty()) {
        return std::unexpected(BackupError(ErrorKind::Encryption, "No usable GPG public keys found"));
    }

    if (keyId && !keyId->empty()) {
        const std::string wanted = normalizeKeyId(*keyId);
        auto it = std::find_if(usable.begin(), usable.end(), [&](const GpgKeyInfo& k) { return keyMatches(k, wanted); });
        if (it == usable.end()) {
            return std::unexpected(BackupError(ErrorKind::Encryption,
                std::format("Configured GPG key id not found in keyring: {}", *keyId)));
        }
        return *it;
    }

    std::sort(usable.begin(), usable.end(),
              [](const GpgKeyInfo& a, const GpgKeyInfo& b) { return a.fingerprint < b.fingerprint; });
    if (usable.size() > 1) {
        Logger::logWarning(std::format("Multiple GPG keys available ({}), using {}; set key_id to choose explicitly",
                                       usable.size(), usable.front().fingerprint));
    }
    return usable.front();
}

GpgEncryptionStrategy::GpgEncryptionStrategy(Options options) : options(std::move(options)) {}

std::expected<std::vector<GpgKeyInfo>, BackupError> GpgEncryptionStrategy::listKeys() const {
    auto ctx = openContext(options.homeDir, options.trustModel);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    gpgme_error_t err = gpgme_op_keylist_start(ctx->get(), nullptr, 0);
    if (err) {
        return std::unexpected(gpgError("GPG key listing failed", err));
    }

    std::vector<GpgKeyInfo> keys;
    while (true) {
        gpgme_key_t raw = nullptr;
        err = gpgme_op_keylist_next(ctx->get(), &raw);
        if (err) {
            break;
        }
        GpgKey key(raw, &gpgme_key_unref);
        keys.push_back(describeKey(key.get()));
    }
    gpgme_op_keylist_end(ctx->get());

    if (gpgme_err_code(err) != GPG_ERR_EOF) {
        return std::unexpected(gpgError("GPG key listing failed", err));
    }
    return keys;
}

std::expected<void, BackupError> GpgEncryptionStrategy::importPublicKey() const {
    if (options.publicKey.empty()) {
        return std::unexpected(BackupError(ErrorKind::Encryption, "No GPG public keys found. Please provide a public key."));
    }

    auto ctx = openContext(options.homeDir, options.trustModel);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    gpgme_data_t raw = nullptr;
    gpgme_error_t err = gpgme_data_new_from_mem(&raw, options.publicKey.data(), options.publicKey.size(), 1);
    if (err) {
        return std::unexpected(gpgError("GPG key import failed", err));
    }
    GpgData keyData(raw, &gpgme_data_release);

    err = gpgme_op_import(ctx->get(), keyData.get());
    if (err) {
        return std::unexpected(gpgError("GPG key import failed", err));
    }

    gpgme_import_result_t result = gpgme_op_import_result(ctx->get());
    if (!result || (result->imported == 0 && result->unchanged == 0)) {
        return std::unexpected(BackupError(ErrorKind::Encryption, "Failed to import GPG public key. Invalid key format."));
    }
    Logger::logMessage(std::format("Imported GPG public key ({} new, {} unchanged)", result->imported, result->unchanged));
    return {};
}

std::expected<void, BackupError> GpgEncryptionStrategy::encrypt(const std::string& inputPath, const std::string& outputPath) {
    auto keys = listKeys();
    if (!keys) {
        return std::unexpected(keys.error());
    }

    bool needImport = !anyUsable(*keys);
    if (!needImport && options.keyId && !options.keyId->empty()) {
        const std::string wanted = normalizeKeyId(*options.keyId);
        needImport = std::none_of(keys->begin(), keys->end(),
                                  [&](const GpgKeyInfo& k) { return k.usable() && keyMatches(k, wanted); });
    }

    if (needImport) {
        auto imported = importPublicKey();
        if (!imported) {
            return imported;
        }
        keys = listKeys();
        if (!keys) {
            return std::unexpected(keys.error());
        }
        if (!anyUsable(*keys)) {
            return std::unexpected(BackupError(ErrorKind::Encryption, "GPG key import yielded no usable key"));
        }
    }

    auto recipient = selectGpgRecipient(*keys, options.keyId);
    if (!recipient) {
        return std::unexpected(recipient.error());
    }

    auto ctx = openContext(options.homeDir, options.trustModel);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    gpgme_key_t rawKey = nullptr;
    gpgme_error_t err = gpgme_get_key(ctx->get(), recipient->fingerprint.c_str(), &rawKey, 0);
    if (err) {
        return std::unexpected(gpgError(std::format("GPG key {} unavailable", recipient->fingerprint), err));
    }
    GpgKey key(rawKey, &gpgme_key_unref);

    ScopedFd input(open(inputPath.c_str(), O_RDONLY | O_CLOEXEC));
    if (input.get() < 0) {
        return std::unexpected(BackupError(ErrorKind::Encryption, std::format("Failed to open input file: {}", inputPath)));
    }
    ScopedFd output(open(outputPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
    if (output.get() < 0) {
        return std::unexpected(BackupError(ErrorKind::Encryption, std::format("Failed to open output file: {}", outputPath)));
    }

    auto fail = [&](BackupError error) -> std::expected<void, BackupError> {
        removePartial(outputPath);
        return std::unexpected(std::move(error));
    };

    gpgme_data_t rawPlain = nullptr;
    gpgme_data_t rawCipher = nullptr;
    err = gpgme_data_new_from_fd(&rawPlain, input.get());
    GpgData plain(rawPlain, &gpgme_data_release);
    if (!err) {
        err = gpgme_data_new_from_fd(&rawCipher, output.get());
    }
    GpgData cipher(rawCipher, &gpgme_data_release);
    if (err) {
        return fail(gpgError("GPG encryption failed", err));
    }

    gpgme_key_t recipients[] = {key.get(), nullptr};
    err = gpgme_op_encrypt(ctx->get(), recipients, static_cast<gpgme_encrypt_flags_t>(0), plain.get(), cipher.get());

    gpgme_encrypt_result_t result = gpgme_op_encrypt_result(ctx->get());
    if (result && result->invalid_recipients) {
        return fail(gpgError(std::format("GPG encryption failed: recipient {} not usable", recipient->fingerprint),
                             result->invalid_recipients->reason));
    }
    if (err) {
        return fail(gpgError("GPG encryption failed", err));
    }
    Logger::logDebug(std::format("Encrypted {} for {}", fs::path(inputPath).filename().string(), recipient->fingerprint));
    return {};
}

std::unique_ptr<EncryptionStrategy> makeEncryptionStrategy(const EncryptionSettings& settings) {
    if (settings.method == EncryptionMethod::Aes256) {
        return std::make_unique<Aes256EncryptionStrategy>(settings.password);
    }
    GpgEncryptionStrategy::Options options;
    options.publicKey = settings.publicKey;
    options.keyId = settings.keyId;
    options.homeDir = settings.gnupgHome;
    options.trustModel = settings.trustModel;
    return std::make_unique<GpgEncryptionStrategy>(options);
}
