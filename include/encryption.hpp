/**
 * @file encryption.hpp
 * @brief Encryption strategies applied to backup archives.
 *
 * Two schemes are supported: GnuPG public-key encryption to a single
 * recipient, and passphrase-based AES-256-CBC with a self-describing header.
 * The strategy is chosen once at startup from the configuration.
 *
 * @note AES output layout: [4-byte BE salt length][salt][4-byte BE IV length][IV][ciphertext].
 */

#ifndef ENCRYPTION_HPP
#define ENCRYPTION_HPP

#include "backup_error.hpp"
#include "backup_types.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Interface for encryption strategies.
 */
class EncryptionStrategy {
public:
    virtual ~EncryptionStrategy() = default;

    /**
     * @brief Encrypts a file into a new file.
     *
     * No partial output is left behind on failure.
     *
     * @param inputPath Plaintext file.
     * @param outputPath Destination of the encrypted file.
     * @return std::expected<void, BackupError> Success or an EncryptionError.
     */
    virtual std::expected<void, BackupError> encrypt(const std::string& inputPath, const std::string& outputPath) = 0;

    /**
     * @brief Returns the scheme implemented by this strategy.
     */
    virtual EncryptionMethod method() const = 0;

    /**
     * @brief File extension appended to encrypted archives ("gpg" or "enc").
     */
    virtual std::string fileExtension() const = 0;
};

/**
 * @brief Passphrase-based AES-256-CBC encryption.
 *
 * The key is derived with PBKDF2-HMAC-SHA256 (100,000 iterations) from a fresh
 * 16-byte salt; the IV is random per file.
 */
class Aes256EncryptionStrategy : public EncryptionStrategy {
public:
    static constexpr int kPbkdf2Iterations = 100000;
    static constexpr std::size_t kSaltLength = 16;
    static constexpr std::size_t kChunkSize = 4096;

    explicit Aes256EncryptionStrategy(std::string passphrase);
    ~Aes256EncryptionStrategy() override;

    std::expected<void, BackupError> encrypt(const std::string& inputPath, const std::string& outputPath) override;

    /**
     * @brief Restores the plaintext of a file produced by encrypt().
     *
     * @param inputPath Encrypted file.
     * @param outputPath Destination of the plaintext.
     * @return std::expected<void, BackupError> Success or an EncryptionError
     *         (corrupt header, wrong passphrase, I/O failure).
     */
    std::expected<void, BackupError> decrypt(const std::string& inputPath, const std::string& outputPath);

    EncryptionMethod method() const override { return EncryptionMethod::Aes256; }
    std::string fileExtension() const override { return "enc"; }

private:
    std::string passphrase;
};

/**
 * @brief One primary key of the GnuPG keyring.
 */
struct GpgKeyInfo {
    std::string fingerprint; ///< 40 hex characters, upper case.
    std::string keyId;       ///< 16 hex characters long key id.
    bool revoked = false;
    bool expired = false;
    bool disabled = false;
    bool invalid = false;
    bool canEncrypt = true;

    /**
     * @brief True for a key that may receive an encrypted archive.
     */
    bool usable() const;
};

/**
 * @brief Chooses the recipient among the usable keys.
 *
 * With an explicit identifier the key whose fingerprint, long id or short id
 * matches it (case-insensitive, optional "0x") is chosen. Without one, the
 * lexicographically smallest fingerprint wins.
 *
 * @param keys Keyring listing.
 * @param keyId Optional explicit key identifier.
 * @return std::expected<GpgKeyInfo, BackupError> The key or an EncryptionError.
 */
std::expected<GpgKeyInfo, BackupError> selectGpgRecipient(const std::vector<GpgKeyInfo>& keys,
                                                           const std::optional<std::string>& keyId);

/**
 * @brief GnuPG public-key encryption through GPGME.
 *
 * The configured armored key is imported into the keyring when no usable key
 * is present, or when the explicit key id is missing from it. Validity is
 * judged by the configured trust model; trust is never forced.
 */
class GpgEncryptionStrategy : public EncryptionStrategy {
public:
    /**
     * @brief Settings of the GnuPG strategy.
     */
    struct Options {
        std::string publicKey;              ///< ASCII-armored public key to import.
        std::optional<std::string> keyId;   ///< Explicit recipient.
        std::optional<std::string> homeDir; ///< GNUPGHOME override.
        std::string trustModel = "pgp";     ///< Passed to gpg as its trust model.
    };

    explicit GpgEncryptionStrategy(Options options);

    std::expected<void, BackupError> encrypt(const std::string& inputPath, const std::string& outputPath) override;

    /**
     * @brief Lists the primary public keys of the keyring.
     */
    std::expected<std::vector<GpgKeyInfo>, BackupError> listKeys() const;

    EncryptionMethod method() const override { return EncryptionMethod::Gpg; }
    std::string fileExtension() const override { return "gpg"; }

private:
    std::expected<void, BackupError> importPublicKey() const;

    Options options;
};

/**
 * @brief Settings used to build the configured encryption strategy.
 */
struct EncryptionSettings {
    EncryptionMethod method = EncryptionMethod::Gpg;
    std::string publicKey;
    std::optional<std::string> keyId;
    std::optional<std::string> gnupgHome;
    std::string trustModel = "pgp";
    std::string password;
};

/**
 * @brief Creates the strategy selected by the configuration.
 *
 * @param settings Encryption settings.
 * @return std::unique_ptr<EncryptionStrategy> The strategy.
 */
std::unique_ptr<EncryptionStrategy> makeEncryptionStrategy(const EncryptionSettings& settings);

#endif // ENCRYPTION_HPP
