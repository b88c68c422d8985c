#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace RLP {

/**
 * @brief Recursive Length Prefix serialization used by EVM transactions
 *
 * A single byte below 0x80 is its own encoding. Other byte strings get the
 * 0x80 header, lists the 0xc0 header; payloads of 56 bytes or more carry
 * their big-endian length after the header byte.
 */
class Encoder {
public:
    static std::vector<uint8_t> EncodeBytes(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> EncodeString(const std::string& str);

    /** @brief Minimal big-endian integer; zero is the empty string (0x80) */
    static std::vector<uint8_t> EncodeUInt(uint64_t value);

    /** @brief Integer given in base 10, of any size; false if not all digits */
    static bool EncodeDecimal(const std::string& decimal, std::vector<uint8_t>& out);

    /** @brief Hex integer such as "0x01f4"; leading zero bytes are dropped */
    static bool EncodeQuantity(const std::string& hex, std::vector<uint8_t>& out);

    /** @brief Hex byte string kept byte for byte (addresses, calldata) */
    static bool EncodeHex(const std::string& hex, std::vector<uint8_t>& out);

    /** @brief Concatenate already encoded items under a list header */
    static std::vector<uint8_t> EncodeList(const std::vector<std::vector<uint8_t>>& items);

    static std::vector<uint8_t> TrimLeadingZeros(const std::vector<uint8_t>& data);
};

} // namespace RLP
