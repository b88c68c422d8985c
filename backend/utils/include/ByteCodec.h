#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Codec {

// === Hex ===

/**
 * @brief Lower-case hex without prefix
 */
std::string BytesToHex(const uint8_t *data, size_t len);
std::string BytesToHex(const std::vector<uint8_t> &data);

/**
 * @brief Decode hex text
 * @param hex Optional "0x" prefix; odd length is read as if left-padded with '0'
 * @param out Decoded bytes
 * @return false on any non-hex character
 *
 * The input is never copied, and a partial result is wiped on failure.
 */
bool HexToBytes(const std::string &hex, std::vector<uint8_t> &out);

bool HasHexPrefix(const std::string &hex);
std::string StripHexPrefix(const std::string &hex);
bool IsHexString(const std::string &text);

// === Base58 (Bitcoin alphabet) ===
std::string EncodeBase58(const std::vector<uint8_t> &data);

/**
 * @return false on characters outside the alphabet or an empty string
 */
bool DecodeBase58(const std::string &str, std::vector<uint8_t> &out);

// payload || first 4 bytes of double SHA-256
std::string EncodeBase58Check(const std::vector<uint8_t> &payload);

/**
 * @brief Decode and verify a Base58Check string
 * @return false when decoding fails or the checksum does not match
 */
bool DecodeBase58Check(const std::string &str, std::vector<uint8_t> &payload);

// === Base64 ===
std::string Base64Encode(const std::vector<uint8_t> &data);
bool Base64Decode(const std::string &str, std::vector<uint8_t> &out);

// URL-safe alphabet without padding
std::string Base64UrlEncode(const std::vector<uint8_t> &data);
bool Base64UrlDecode(const std::string &str, std::vector<uint8_t> &out);

// === Checksums ===

// CRC-16/XMODEM: poly 0x1021, init 0x0000, no reflection, no final xor
uint16_t CRC16(const uint8_t *data, size_t len);

// === Integer encodings ===

// Bitcoin CompactSize
void WriteVarInt(std::vector<uint8_t> &out, uint64_t value);
void WriteUInt32LE(std::vector<uint8_t> &out, uint32_t value);
void WriteUInt64LE(std::vector<uint8_t> &out, uint64_t value);
void WriteUInt16BE(std::vector<uint8_t> &out, uint16_t value);

// Solana shortvec: 7 bits per byte, high bit marks continuation
void EncodeCompactU16(std::vector<uint8_t> &out, uint16_t value);

// === Arbitrary-precision unsigned integers as text ===

/**
 * @brief Base-10 string to minimal big-endian bytes ("0" gives an empty vector)
 * @return false on empty input or non-digit characters
 */
bool DecimalToBytes(const std::string &decimal, std::vector<uint8_t> &out);

/**
 * @brief Big-endian bytes to a base-10 string ("0" for empty input)
 */
std::string BytesToDecimal(const std::vector<uint8_t> &bytes);

/**
 * @brief "0x"-prefixed hex quantity to base-10 string
 * @return false on malformed hex
 */
bool HexQuantityToDecimal(const std::string &hex, std::string &decimal);

/**
 * @brief Base-10 string to a "0x"-prefixed minimal hex quantity ("0x0" for zero)
 */
bool DecimalToHexQuantity(const std::string &decimal, std::string &hex);

/**
 * @brief Unsigned integer to a "0x"-prefixed minimal hex quantity
 */
std::string UIntToHexQuantity(uint64_t value);

/**
 * @brief Parse a "0x" hex quantity that fits in 64 bits
 */
bool HexQuantityToUInt(const std::string &hex, uint64_t &value);

/**
 * @brief Compare two base-10 strings numerically
 * @return negative, zero or positive like strcmp
 */
int CompareDecimal(const std::string &a, const std::string &b);

/**
 * @brief Left-pad hex text with '0' to the given width (no prefix in the result)
 */
std::string PadLeftHex(const std::string &hex, size_t width);

} // namespace Codec
