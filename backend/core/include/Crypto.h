#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Crypto {

// === Random Number Generation ===
bool RandBytes(void *buf, size_t len);

// === Hash Functions ===
bool SHA256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out);
bool DoubleSHA256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out);
bool RIPEMD160(const uint8_t *data, size_t len, std::array<uint8_t, 20> &out);
bool Hash160(const uint8_t *data, size_t len, std::array<uint8_t, 20> &out);
bool Keccak256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out);
bool HMAC_SHA256(const std::vector<uint8_t> &key, const uint8_t *data, size_t data_len,
                 std::vector<uint8_t> &out);

// === Key Derivation ===

/**
 * @brief HKDF-SHA256 (RFC 5869) extract-and-expand
 * @param ikm Input keying material
 * @param salt Extraction salt
 * @param info Context string for expansion
 * @param out Derived key (resized to out_len)
 * @param out_len Number of bytes to derive
 * @return true on success
 */
bool HKDF_SHA256(const std::vector<uint8_t> &ikm, const std::string &salt, const std::string &info,
                 std::vector<uint8_t> &out, size_t out_len = 32);

// === Utility Functions ===
bool ConstantTimeEquals(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b);

// === Memory Security Functions ===
void SecureClear(void *ptr, size_t size);
void SecureWipeVector(std::vector<uint8_t> &vec);
void SecureWipeString(std::string &str);

/**
 * @brief Owning byte buffer for key material that is wiped when it leaves scope
 *
 * Not copyable. Moving transfers ownership and leaves the source empty.
 */
class SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(size_t size) : m_data(size, 0) {}
    explicit SecureBytes(std::vector<uint8_t> &&data) : m_data(std::move(data)) {}
    ~SecureBytes() { SecureWipeVector(m_data); }

    SecureBytes(const SecureBytes &) = delete;
    SecureBytes &operator=(const SecureBytes &) = delete;

    SecureBytes(SecureBytes &&other) noexcept : m_data(std::move(other.m_data)) {
        other.m_data.clear();
    }

    SecureBytes &operator=(SecureBytes &&other) noexcept {
        if (this != &other) {
            SecureWipeVector(m_data);
            m_data = std::move(other.m_data);
            other.m_data.clear();
        }
        return *this;
    }

    uint8_t *data() { return m_data.data(); }
    const uint8_t *data() const { return m_data.data(); }
    size_t size() const { return m_data.size(); }
    bool empty() const { return m_data.empty(); }

    const std::vector<uint8_t> &bytes() const { return m_data; }
    std::vector<uint8_t> &bytes() { return m_data; }

    void wipe() { SecureWipeVector(m_data); }

private:
    std::vector<uint8_t> m_data;
};

// === AES-GCM Encryption/Decryption ===
bool AES_GCM_Encrypt(const std::vector<uint8_t> &key, const std::vector<uint8_t> &plaintext,
                     const std::vector<uint8_t> &aad, std::vector<uint8_t> &ciphertext,
                     std::vector<uint8_t> &iv, std::vector<uint8_t> &tag);
bool AES_GCM_Decrypt(const std::vector<uint8_t> &key, const std::vector<uint8_t> &ciphertext,
                     const std::vector<uint8_t> &aad, const std::vector<uint8_t> &iv,
                     const std::vector<uint8_t> &tag, std::vector<uint8_t> &plaintext);

// === secp256k1 ECDSA ===

// ECDSA signature structure (DER encoded)
struct ECDSASignature {
  std::vector<uint8_t> r;  // R component (32 bytes)
  std::vector<uint8_t> s;  // S component (32 bytes)
  std::vector<uint8_t> der_encoded;  // strict DER, low-S
};

// Compact signature with the recovery id used by EVM and TRON
struct RecoverableSignature {
  std::vector<uint8_t> r;
  std::vector<uint8_t> s;
  int recovery_id = 0;
};

// Sign a 32-byte hash with a private key (low-S, DER encoded)
bool SignHash(const std::vector<uint8_t> &private_key, const std::array<uint8_t, 32> &hash,
              ECDSASignature &signature);

// Sign a 32-byte hash producing r, s and the recovery id (low-S)
bool SignHashRecoverable(const std::vector<uint8_t> &private_key,
                         const std::array<uint8_t, 32> &hash, RecoverableSignature &signature);

// Verify a DER signature against a public key and hash
bool VerifySignature(const std::vector<uint8_t> &public_key, const std::array<uint8_t, 32> &hash,
                     const ECDSASignature &signature);

// Recover the uncompressed public key (65 bytes) from a recoverable signature
bool RecoverPublicKey(const std::array<uint8_t, 32> &hash, const RecoverableSignature &signature,
                      std::vector<uint8_t> &public_key);

// Derive public key from private key (compressed format, 33 bytes)
bool DerivePublicKey(const std::vector<uint8_t> &private_key, std::vector<uint8_t> &public_key);

// Derive public key from private key (uncompressed format, 65 bytes with 0x04 prefix)
bool DeriveUncompressedPublicKey(const std::vector<uint8_t> &private_key,
                                 std::vector<uint8_t> &public_key);

// === Ed25519 ===

/**
 * @brief Extract the 32-byte seed from a Solana/TON secret key
 * @param secret 32-byte seed or 64-byte seed || public key
 * @param seed Output seed
 * @return false if the secret has any other length
 */
bool Ed25519SeedFromSecret(const std::vector<uint8_t> &secret, SecureBytes &seed);

bool Ed25519PublicKeyFromSeed(const std::vector<uint8_t> &seed, std::vector<uint8_t> &public_key);

bool Ed25519Sign(const std::vector<uint8_t> &seed, const uint8_t *message, size_t message_len,
                 std::vector<uint8_t> &signature);

bool Ed25519Verify(const std::vector<uint8_t> &public_key, const uint8_t *message,
                   size_t message_len, const std::vector<uint8_t> &signature);

} // namespace Crypto
