#pragma once

#include "Crypto.h"
#include "Vault/VaultTypes.h"

#include <string>
#include <vector>

namespace KeyVault {

// HKDF parameters shared by every wallet ever encrypted; changing them orphans existing records
constexpr const char* HKDF_SALT = "canton-wallet-aes-key";
constexpr const char* HKDF_INFO = "encryption";

constexpr size_t GCM_IV_SIZE = 12;
constexpr size_t GCM_TAG_SIZE = 16;
constexpr size_t PRIVATE_KEY_SIZE = 32;

/**
 * @brief Derive the AES-256 wrapping key from a device secret (WebAuthn PRF output)
 * @param secret Device secret, any non-empty length
 * @return 32-byte key or DerivationFailure
 */
Vault::Result<Crypto::SecureBytes> DeriveEncryptionKey(const std::vector<uint8_t>& secret);

/**
 * @brief Encrypt text with AES-256-GCM under a fresh random IV
 * @param key 32-byte wrapping key
 * @param plaintext Text to protect (a private key in hex)
 * @return hex(IV || ciphertext || tag)
 */
Vault::Result<std::string> Encrypt(const Crypto::SecureBytes& key, const std::string& plaintext);

/**
 * @brief Decrypt an IV-prefixed AES-256-GCM hex blob
 *
 * Malformed hex, a blob shorter than IV plus tag, or a tag mismatch are all
 * reported as AuthenticationFailure.
 *
 * @return Plaintext bytes in a self-wiping buffer
 */
Vault::Result<Crypto::SecureBytes> Decrypt(const Crypto::SecureBytes& key, const std::string& ivCiphertextHex);

/**
 * @brief Create a random private key for a chain and return its address and ciphertext
 */
Vault::Result<Vault::WalletData> GenerateWallet(Vault::ChainType chain, const Crypto::SecureBytes& key);

/**
 * @brief Generate one wallet per requested chain, all wrapped under the same derived key
 */
Vault::Result<std::vector<Vault::WalletData>> GenerateWalletsForChains(const std::vector<uint8_t>& secret,
                                                                       const std::vector<Vault::ChainType>& chains);

Vault::Result<std::vector<Vault::WalletData>> GenerateAllWallets(const std::vector<uint8_t>& secret);

/**
 * @brief Recover the private key hex of an encrypted record
 *
 * The caller owns the returned text and must wipe it with Crypto::SecureWipeString.
 */
Vault::Result<std::string> DecryptPrivateKey(const std::vector<uint8_t>& secret, const std::string& encryptedHex);

/**
 * @brief Recover the raw private key bytes of an encrypted record
 *
 * The key lives only as long as the returned buffer.
 */
Vault::Result<Crypto::SecureBytes> UnlockPrivateKey(const std::vector<uint8_t>& secret,
                                                    const std::string& encryptedHex);

} // namespace KeyVault
