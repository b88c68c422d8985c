#include "include/KeyVault.h"
#include "include/AddressDerivation.h"
#include "ByteCodec.h"
#include "Vault/Logger.h"

using Vault::ErrorCode;
using Vault::Result;

namespace KeyVault {

Result<Crypto::SecureBytes> DeriveEncryptionKey(const std::vector<uint8_t>& secret) {
    if (secret.empty()) {
        return Result<Crypto::SecureBytes>(ErrorCode::DerivationFailure, "Device secret is empty");
    }

    std::vector<uint8_t> derived;
    if (!Crypto::HKDF_SHA256(secret, HKDF_SALT, HKDF_INFO, derived, 32)) {
        Crypto::SecureWipeVector(derived);
        return Result<Crypto::SecureBytes>(ErrorCode::DerivationFailure, "HKDF key derivation failed");
    }
    return Result<Crypto::SecureBytes>(Crypto::SecureBytes(std::move(derived)));
}

Result<std::string> Encrypt(const Crypto::SecureBytes& key, const std::string& plaintext) {
    std::vector<uint8_t> data(plaintext.begin(), plaintext.end());
    std::vector<uint8_t> aad;
    std::vector<uint8_t> ciphertext, iv, tag;

    const bool ok = Crypto::AES_GCM_Encrypt(key.bytes(), data, aad, ciphertext, iv, tag);
    Crypto::SecureWipeVector(data);
    if (!ok) {
        return Result<std::string>(ErrorCode::EncryptionFailure, "AES-GCM encryption failed");
    }

    // Format: [IV(12)] + [CIPHERTEXT] + [TAG(16)]
    std::vector<uint8_t> blob;
    blob.reserve(iv.size() + ciphertext.size() + tag.size());
    blob.insert(blob.end(), iv.begin(), iv.end());
    blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());
    blob.insert(blob.end(), tag.begin(), tag.end());

    return Result<std::string>(Codec::BytesToHex(blob));
}

Result<Crypto::SecureBytes> Decrypt(const Crypto::SecureBytes& key, const std::string& ivCiphertextHex) {
    std::vector<uint8_t> blob;
    if (!Codec::HexToBytes(ivCiphertextHex, blob) || blob.size() < GCM_IV_SIZE + GCM_TAG_SIZE) {
        return Result<Crypto::SecureBytes>(ErrorCode::AuthenticationFailure, "Malformed encrypted key");
    }

    const auto ivEnd = blob.begin() + GCM_IV_SIZE;
    const auto tagBegin = blob.end() - GCM_TAG_SIZE;
    std::vector<uint8_t> iv(blob.begin(), ivEnd);
    std::vector<uint8_t> ciphertext(ivEnd, tagBegin);
    std::vector<uint8_t> tag(tagBegin, blob.end());
    std::vector<uint8_t> aad;

    std::vector<uint8_t> plaintext;
    if (!Crypto::AES_GCM_Decrypt(key.bytes(), ciphertext, aad, iv, tag, plaintext)) {
        Crypto::SecureWipeVector(plaintext);
        return Result<Crypto::SecureBytes>(ErrorCode::AuthenticationFailure,
                                           "Authentication tag mismatch");
    }
    return Result<Crypto::SecureBytes>(Crypto::SecureBytes(std::move(plaintext)));
}

Result<Vault::WalletData> GenerateWallet(Vault::ChainType chain, const Crypto::SecureBytes& key) {
    Crypto::SecureBytes privateKey(PRIVATE_KEY_SIZE);
    if (!Crypto::RandBytes(privateKey.data(), privateKey.size())) {
        return Result<Vault::WalletData>(ErrorCode::DerivationFailure, "Random key generation failed");
    }

    auto address = AddressDerivation::DeriveAddress(chain, privateKey.bytes());
    if (!address) {
        return Vault::Forward<Vault::WalletData>(address);
    }

    std::string privateKeyHex = Codec::BytesToHex(privateKey.bytes());
    auto encrypted = Encrypt(key, privateKeyHex);
    Crypto::SecureWipeString(privateKeyHex);
    if (!encrypted) {
        return Vault::Forward<Vault::WalletData>(encrypted);
    }

    return Result<Vault::WalletData>(Vault::WalletData(chain, *address, *encrypted));
}

Result<std::vector<Vault::WalletData>> GenerateWalletsForChains(const std::vector<uint8_t>& secret,
                                                                const std::vector<Vault::ChainType>& chains) {
    VAULT_SCOPED_LOG("KeyVault", "GenerateWalletsForChains");

    auto key = DeriveEncryptionKey(secret);
    if (!key) {
        _scopedLogger.failure(key.errorMessage);
        return Vault::Forward<std::vector<Vault::WalletData>>(key);
    }

    std::vector<Vault::WalletData> wallets;
    wallets.reserve(chains.size());
    for (Vault::ChainType chain : chains) {
        auto wallet = GenerateWallet(chain, *key);
        if (!wallet) {
            _scopedLogger.failure(wallet.errorMessage, Vault::ChainTypeToString(chain));
            return Vault::Forward<std::vector<Vault::WalletData>>(wallet);
        }
        wallets.push_back(std::move(*wallet));
    }

    _scopedLogger.success(std::to_string(wallets.size()) + " wallets");
    return Result<std::vector<Vault::WalletData>>(std::move(wallets));
}

Result<std::vector<Vault::WalletData>> GenerateAllWallets(const std::vector<uint8_t>& secret) {
    return GenerateWalletsForChains(secret, Vault::AllChainTypes());
}

Result<std::string> DecryptPrivateKey(const std::vector<uint8_t>& secret, const std::string& encryptedHex) {
    auto key = DeriveEncryptionKey(secret);
    if (!key) {
        return Vault::Forward<std::string>(key);
    }

    auto plaintext = Decrypt(*key, encryptedHex);
    if (!plaintext) {
        VAULT_LOG_WARNING("KeyVault", "Private key decryption failed", plaintext.errorMessage);
        return Vault::Forward<std::string>(plaintext);
    }
    return Result<std::string>(std::string(plaintext->bytes().begin(), plaintext->bytes().end()));
}

Result<Crypto::SecureBytes> UnlockPrivateKey(const std::vector<uint8_t>& secret, const std::string& encryptedHex) {
    auto keyHex = DecryptPrivateKey(secret, encryptedHex);
    if (!keyHex) {
        return Vault::Forward<Crypto::SecureBytes>(keyHex);
    }

    std::vector<uint8_t> raw;
    const bool decoded = Codec::HexToBytes(keyHex.data, raw);
    Crypto::SecureWipeString(keyHex.data);
    if (!decoded) {
        Crypto::SecureWipeVector(raw);
        return Result<Crypto::SecureBytes>(ErrorCode::AuthenticationFailure,
                                           "Decrypted key is not valid hex");
    }
    return Result<Crypto::SecureBytes>(Crypto::SecureBytes(std::move(raw)));
}

} // namespace KeyVault
