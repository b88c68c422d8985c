#pragma once

#include "TonCell.h"
#include "Vault/VaultTypes.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace AddressDerivation {

enum class BitcoinNetwork {
    Mainnet,
    Testnet
};

/**
 * @brief Decoded P2PKH address
 */
struct BitcoinAddress {
    uint8_t version;
    std::array<uint8_t, 20> pubKeyHash;

    BitcoinAddress() : version(0), pubKeyHash{} {}
};

// === Address derivation from private keys ===

/**
 * @brief Derive the canonical address of a chain family from a raw private key
 *
 * BTC addresses are mainnet P2PKH, TON addresses are bounceable on workchain 0.
 * Solana and TON accept a 32-byte seed or a 64-byte seed || public key.
 *
 * @param chain Chain family
 * @param privateKey Raw key bytes
 * @return Address text or InvalidPrivateKeyLength / DerivationFailure
 */
Vault::Result<std::string> DeriveAddress(Vault::ChainType chain, const std::vector<uint8_t>& privateKey);

Vault::Result<std::string> DeriveEvmAddress(const std::vector<uint8_t>& privateKey);
Vault::Result<std::string> DeriveTronAddress(const std::vector<uint8_t>& privateKey);
Vault::Result<std::string> DeriveBitcoinAddress(const std::vector<uint8_t>& privateKey,
                                                BitcoinNetwork network = BitcoinNetwork::Mainnet);
Vault::Result<std::string> DeriveSolanaAddress(const std::vector<uint8_t>& privateKey);
Vault::Result<std::string> DeriveTonAddress(const std::vector<uint8_t>& privateKey,
                                            bool bounceable = true, int8_t workchain = 0);

// === Address derivation from public keys ===

/**
 * @brief "0x" + hex of the last 20 bytes of Keccak-256 over the 64-byte point
 * @param publicKey 65-byte uncompressed key (0x04 prefix) or the bare 64 bytes
 */
bool EvmAddressFromPublicKey(const std::vector<uint8_t>& publicKey, std::string& address);

bool TronAddressFromPublicKey(const std::vector<uint8_t>& publicKey, std::string& address);

/**
 * @brief Base58Check(version || HASH160(compressed public key))
 */
bool BitcoinAddressFromPublicKey(const std::vector<uint8_t>& publicKey, BitcoinNetwork network,
                                 std::string& address);

/**
 * @brief Ed25519 public key of a Solana/TON secret
 *
 * A 64-byte secret already carries its public key in the trailing 32 bytes;
 * a 32-byte seed is expanded.
 */
bool Ed25519PublicKeyFromSecret(const std::vector<uint8_t>& secret, std::vector<uint8_t>& publicKey);

// === Address decoding ===

/**
 * @brief Decode a P2PKH address and verify its Base58Check checksum
 * @return InvalidAddressChecksum on a bad length, alphabet or checksum
 */
Vault::Result<BitcoinAddress> DecodeBitcoinAddress(const std::string& address);

/**
 * @brief Version byte for a network (0x00 mainnet, 0x6f testnet)
 */
uint8_t BitcoinVersionByte(BitcoinNetwork network);

/**
 * @brief Convert a TRON address to its 21-byte hex form ("41...")
 *
 * Accepts Base58 "T..." (checksum verified), "41..." hex, and "0x..." hex of
 * 20 bytes (given the 41 prefix) or 21 bytes. Hex input must decode to exactly
 * 21 bytes led by 0x41; the result is lowercase.
 */
Vault::Result<std::string> TronAddressToHex(const std::string& address);

/**
 * @brief Convert 20- or 21-byte hex to the Base58Check "T..." form
 */
Vault::Result<std::string> TronHexToAddress(const std::string& hex);

/**
 * @brief Parse a TON address in raw ("wc:hex") or user-friendly (base64url) form
 *
 * Friendly addresses carry a CRC16 that must match. Workchain byte 0xff maps
 * to -1 and the bounceable flag is (tag & 0x11) == 0x11. Raw addresses are
 * treated as bounceable.
 */
Vault::Result<Ton::Address> ParseTonAddress(const std::string& address);

/**
 * @brief "wc:hex" form of a TON address
 */
std::string ToRawTonAddress(const Ton::Address& address);

/**
 * @brief User-friendly form: base64url(tag || workchain || hash || crc16)
 */
std::string ToFriendlyTonAddress(const Ton::Address& address);

} // namespace AddressDerivation
