#include "include/AddressDerivation.h"
#include "include/Crypto.h"
#include "ByteCodec.h"

#include <algorithm>
#include <cstdlib>

using Vault::ErrorCode;
using Vault::Result;

namespace AddressDerivation {

namespace {

constexpr uint8_t TRON_ADDRESS_PREFIX = 0x41;
constexpr uint8_t TON_TAG_BOUNCEABLE = 0x11;
constexpr uint8_t TON_TAG_NON_BOUNCEABLE = 0x51;

// Last 20 bytes of Keccak-256 over the 64-byte public point
bool KeccakAccountId(const std::vector<uint8_t>& publicKey, std::array<uint8_t, 20>& accountId) {
    const uint8_t* point = publicKey.data();
    size_t pointLen = publicKey.size();
    if (pointLen == 65 && publicKey[0] == 0x04) {
        ++point;
        --pointLen;
    }
    if (pointLen != 64) {
        return false;
    }

    std::array<uint8_t, 32> hash;
    if (!Crypto::Keccak256(point, pointLen, hash)) {
        return false;
    }
    std::copy(hash.begin() + 12, hash.end(), accountId.begin());
    return true;
}

Result<std::string> InvalidSecp256k1Key() {
    return Result<std::string>(ErrorCode::InvalidPrivateKeyLength,
                               "secp256k1 private key must be 32 bytes");
}

} // namespace

// === Address derivation from public keys ===

bool EvmAddressFromPublicKey(const std::vector<uint8_t>& publicKey, std::string& address) {
    std::array<uint8_t, 20> accountId;
    if (!KeccakAccountId(publicKey, accountId)) {
        return false;
    }
    address = "0x" + Codec::BytesToHex(accountId.data(), accountId.size());
    return true;
}

bool TronAddressFromPublicKey(const std::vector<uint8_t>& publicKey, std::string& address) {
    std::array<uint8_t, 20> accountId;
    if (!KeccakAccountId(publicKey, accountId)) {
        return false;
    }
    std::vector<uint8_t> payload;
    payload.reserve(21);
    payload.push_back(TRON_ADDRESS_PREFIX);
    payload.insert(payload.end(), accountId.begin(), accountId.end());
    address = Codec::EncodeBase58Check(payload);
    return true;
}

uint8_t BitcoinVersionByte(BitcoinNetwork network) {
    return network == BitcoinNetwork::Testnet ? 0x6f : 0x00;
}

bool BitcoinAddressFromPublicKey(const std::vector<uint8_t>& publicKey, BitcoinNetwork network,
                                 std::string& address) {
    if (publicKey.size() != 33 && publicKey.size() != 65) {
        return false;
    }
    std::array<uint8_t, 20> hash160;
    if (!Crypto::Hash160(publicKey.data(), publicKey.size(), hash160)) {
        return false;
    }
    std::vector<uint8_t> payload;
    payload.reserve(21);
    payload.push_back(BitcoinVersionByte(network));
    payload.insert(payload.end(), hash160.begin(), hash160.end());
    address = Codec::EncodeBase58Check(payload);
    return true;
}

bool Ed25519PublicKeyFromSecret(const std::vector<uint8_t>& secret, std::vector<uint8_t>& publicKey) {
    if (secret.size() == 64) {
        publicKey.assign(secret.begin() + 32, secret.end());
        return true;
    }
    Crypto::SecureBytes seed;
    if (!Crypto::Ed25519SeedFromSecret(secret, seed)) {
        return false;
    }
    return Crypto::Ed25519PublicKeyFromSeed(seed.bytes(), publicKey);
}

// === Address derivation from private keys ===

Result<std::string> DeriveEvmAddress(const std::vector<uint8_t>& privateKey) {
    if (privateKey.size() != 32) {
        return InvalidSecp256k1Key();
    }
    std::vector<uint8_t> publicKey;
    std::string address;
    if (!Crypto::DeriveUncompressedPublicKey(privateKey, publicKey) ||
        !EvmAddressFromPublicKey(publicKey, address)) {
        return Result<std::string>(ErrorCode::DerivationFailure, "Failed to derive EVM address");
    }
    return Result<std::string>(address);
}

Result<std::string> DeriveTronAddress(const std::vector<uint8_t>& privateKey) {
    if (privateKey.size() != 32) {
        return InvalidSecp256k1Key();
    }
    std::vector<uint8_t> publicKey;
    std::string address;
    if (!Crypto::DeriveUncompressedPublicKey(privateKey, publicKey) ||
        !TronAddressFromPublicKey(publicKey, address)) {
        return Result<std::string>(ErrorCode::DerivationFailure, "Failed to derive TRON address");
    }
    return Result<std::string>(address);
}

Result<std::string> DeriveBitcoinAddress(const std::vector<uint8_t>& privateKey, BitcoinNetwork network) {
    if (privateKey.size() != 32) {
        return InvalidSecp256k1Key();
    }
    std::vector<uint8_t> publicKey;
    std::string address;
    if (!Crypto::DerivePublicKey(privateKey, publicKey) ||
        !BitcoinAddressFromPublicKey(publicKey, network, address)) {
        return Result<std::string>(ErrorCode::DerivationFailure, "Failed to derive Bitcoin address");
    }
    return Result<std::string>(address);
}

Result<std::string> DeriveSolanaAddress(const std::vector<uint8_t>& privateKey) {
    if (privateKey.size() != 32 && privateKey.size() != 64) {
        return Result<std::string>(ErrorCode::InvalidPrivateKeyLength,
                                   "Solana secret key must be 32 or 64 bytes");
    }
    std::vector<uint8_t> publicKey;
    if (!Ed25519PublicKeyFromSecret(privateKey, publicKey)) {
        return Result<std::string>(ErrorCode::DerivationFailure, "Failed to derive Solana public key");
    }
    return Result<std::string>(Codec::EncodeBase58(publicKey));
}

Result<std::string> DeriveTonAddress(const std::vector<uint8_t>& privateKey, bool bounceable, int8_t workchain) {
    if (privateKey.size() != 32 && privateKey.size() != 64) {
        return Result<std::string>(ErrorCode::InvalidPrivateKeyLength,
                                   "TON secret key must be 32 or 64 bytes");
    }
    std::vector<uint8_t> publicKey;
    if (!Ed25519PublicKeyFromSecret(privateKey, publicKey)) {
        return Result<std::string>(ErrorCode::DerivationFailure, "Failed to derive TON public key");
    }

    // Account id is SHA-256 of the public key, not of a wallet StateInit
    Ton::Address address;
    address.workchain = workchain;
    address.bounceable = bounceable;
    if (!Crypto::SHA256(publicKey.data(), publicKey.size(), address.hash)) {
        return Result<std::string>(ErrorCode::DerivationFailure, "Failed to hash TON public key");
    }
    return Result<std::string>(ToFriendlyTonAddress(address));
}

Result<std::string> DeriveAddress(Vault::ChainType chain, const std::vector<uint8_t>& privateKey) {
    switch (chain) {
        case Vault::ChainType::EVM:
            return DeriveEvmAddress(privateKey);
        case Vault::ChainType::SVM:
            return DeriveSolanaAddress(privateKey);
        case Vault::ChainType::BTC:
            return DeriveBitcoinAddress(privateKey, BitcoinNetwork::Mainnet);
        case Vault::ChainType::TRON:
            return DeriveTronAddress(privateKey);
        case Vault::ChainType::TON:
            return DeriveTonAddress(privateKey, true, 0);
    }
    return Result<std::string>(ErrorCode::UnsupportedChain, "Unsupported chain type");
}

// === Address decoding ===

Result<BitcoinAddress> DecodeBitcoinAddress(const std::string& address) {
    std::vector<uint8_t> raw;
    if (!Codec::DecodeBase58(address, raw) || raw.size() != 25) {
        return Result<BitcoinAddress>(ErrorCode::InvalidAddressChecksum, "Invalid address length");
    }

    std::vector<uint8_t> payload;
    if (!Codec::DecodeBase58Check(address, payload)) {
        return Result<BitcoinAddress>(ErrorCode::InvalidAddressChecksum, "Invalid address checksum");
    }

    BitcoinAddress decoded;
    decoded.version = payload[0];
    std::copy(payload.begin() + 1, payload.begin() + 21, decoded.pubKeyHash.begin());
    return Result<BitcoinAddress>(decoded);
}

Result<std::string> TronAddressToHex(const std::string& address) {
    if (!address.empty() && address[0] == 'T') {
        std::vector<uint8_t> payload;
        if (!Codec::DecodeBase58Check(address, payload) || payload.size() != 21) {
            return Result<std::string>(ErrorCode::InvalidAddressChecksum, "Invalid TRON address checksum");
        }
        return Result<std::string>(Codec::BytesToHex(payload));
    }

    std::string hex;
    if (address.compare(0, 2, "41") == 0) {
        hex = address;
    } else if (Codec::HasHexPrefix(address)) {
        hex = address.size() == 42 ? "41" + address.substr(2) : address.substr(2);
    } else {
        return Result<std::string>(ErrorCode::InvalidArgument, "Invalid TRON address format");
    }

    std::vector<uint8_t> payload;
    if (hex.size() != 42 || !Codec::HexToBytes(hex, payload) || payload[0] != TRON_ADDRESS_PREFIX) {
        return Result<std::string>(ErrorCode::InvalidArgument, "TRON hex address must be 21 bytes starting with 41");
    }
    return Result<std::string>(Codec::BytesToHex(payload));
}

Result<std::string> TronHexToAddress(const std::string& hex) {
    const std::string clean = Codec::StripHexPrefix(hex);
    std::vector<uint8_t> payload;
    if (!Codec::HexToBytes(clean.size() == 40 ? "41" + clean : clean, payload) ||
        payload.size() != 21 || payload[0] != TRON_ADDRESS_PREFIX) {
        return Result<std::string>(ErrorCode::InvalidArgument, "Invalid TRON hex address");
    }
    return Result<std::string>(Codec::EncodeBase58Check(payload));
}

Result<Ton::Address> ParseTonAddress(const std::string& address) {
    Ton::Address parsed;

    const size_t colon = address.find(':');
    if (colon != std::string::npos) {
        const std::string wcText = address.substr(0, colon);
        char* end = nullptr;
        const long workchain = std::strtol(wcText.c_str(), &end, 10);
        std::vector<uint8_t> hash;
        if (wcText.empty() || *end != '\0' || workchain < -128 || workchain > 127 ||
            !Codec::HexToBytes(address.substr(colon + 1), hash) || hash.size() != 32) {
            return Result<Ton::Address>(ErrorCode::InvalidArgument, "Invalid raw TON address");
        }
        parsed.workchain = static_cast<int8_t>(workchain);
        std::copy(hash.begin(), hash.end(), parsed.hash.begin());
        parsed.bounceable = true;
        return Result<Ton::Address>(parsed);
    }

    std::vector<uint8_t> bytes;
    if (!Codec::Base64UrlDecode(address, bytes) || bytes.size() != 36) {
        return Result<Ton::Address>(ErrorCode::InvalidArgument, "Invalid address length");
    }

    const uint16_t checksum = static_cast<uint16_t>((bytes[34] << 8) | bytes[35]);
    if (checksum != Codec::CRC16(bytes.data(), 34)) {
        return Result<Ton::Address>(ErrorCode::InvalidAddressChecksum, "Invalid address checksum");
    }

    parsed.workchain = bytes[1] == 0xff ? -1 : static_cast<int8_t>(bytes[1]);
    std::copy(bytes.begin() + 2, bytes.begin() + 34, parsed.hash.begin());
    parsed.bounceable = (bytes[0] & TON_TAG_BOUNCEABLE) == TON_TAG_BOUNCEABLE;
    return Result<Ton::Address>(parsed);
}

std::string ToRawTonAddress(const Ton::Address& address) {
    return std::to_string(static_cast<int>(address.workchain)) + ":" +
           Codec::BytesToHex(address.hash.data(), address.hash.size());
}

std::string ToFriendlyTonAddress(const Ton::Address& address) {
    std::vector<uint8_t> data;
    data.reserve(36);
    data.push_back(address.bounceable ? TON_TAG_BOUNCEABLE : TON_TAG_NON_BOUNCEABLE);
    data.push_back(static_cast<uint8_t>(address.workchain));
    data.insert(data.end(), address.hash.begin(), address.hash.end());

    const uint16_t crc = Codec::CRC16(data.data(), data.size());
    data.push_back(static_cast<uint8_t>((crc >> 8) & 0xff));
    data.push_back(static_cast<uint8_t>(crc & 0xff));
    return Codec::Base64UrlEncode(data);
}

} // namespace AddressDerivation
