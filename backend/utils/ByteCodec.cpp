#include "include/ByteCodec.h"
#include "Crypto.h"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace Codec {

namespace {

const char *BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
const char *HEX_DIGITS = "0123456789abcdef";

int HexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

int Base58Value(char c) {
    const char *pos = std::strchr(BASE58_ALPHABET, c);
    if (c == '\0' || pos == nullptr)
        return -1;
    return static_cast<int>(pos - BASE58_ALPHABET);
}

bool IsDecimal(const std::string &text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string TrimLeadingZeros(const std::string &decimal) {
    size_t first = decimal.find_first_not_of('0');
    return first == std::string::npos ? "0" : decimal.substr(first);
}

} // namespace

// === Hex ===

std::string BytesToHex(const uint8_t *data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t> &data) {
    return BytesToHex(data.data(), data.size());
}

bool HasHexPrefix(const std::string &hex) {
    return hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
}

std::string StripHexPrefix(const std::string &hex) {
    return HasHexPrefix(hex) ? hex.substr(2) : hex;
}

bool IsHexString(const std::string &text) {
    return std::all_of(text.begin(), text.end(), [](char c) { return HexValue(c) >= 0; });
}

// Reads the digits where they lie; the text may be private-key hex
bool HexToBytes(const std::string &hex, std::vector<uint8_t> &out) {
    size_t pos = HasHexPrefix(hex) ? 2 : 0;
    const size_t digits = hex.size() - pos;

    std::vector<uint8_t> bytes;
    bytes.reserve((digits + 1) / 2);
    if (digits % 2 != 0) {
        const int lo = HexValue(hex[pos++]);
        if (lo < 0) {
            return false;
        }
        bytes.push_back(static_cast<uint8_t>(lo));
    }

    for (; pos < hex.size(); pos += 2) {
        const int hi = HexValue(hex[pos]);
        const int lo = HexValue(hex[pos + 1]);
        if (hi < 0 || lo < 0) {
            Crypto::SecureWipeVector(bytes);
            return false;
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

// === Base58 ===

std::string EncodeBase58(const std::vector<uint8_t> &data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Little-endian base58 digits; log(256)/log(58) is about 1.38
    std::vector<uint8_t> digits;
    digits.reserve((data.size() - leading_zeros) * 138 / 100 + 1);
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        int carry = data[i];
        for (auto &digit : digits) {
            carry += 256 * digit;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

bool DecodeBase58(const std::string &str, std::vector<uint8_t> &out) {
    if (str.empty()) {
        return false;
    }

    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }

    // Little-endian base256 bytes
    std::vector<uint8_t> bytes;
    bytes.reserve((str.size() - zeroes) * 733 / 1000 + 1);
    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = Base58Value(str[i]);
        if (carry < 0) {
            return false;
        }
        for (auto &byte : bytes) {
            carry += 58 * byte;
            byte = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    std::vector<uint8_t> result(zeroes, 0x00);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    out = std::move(result);
    return true;
}

std::string EncodeBase58Check(const std::vector<uint8_t> &payload) {
    std::array<uint8_t, 32> checksum;
    if (!Crypto::DoubleSHA256(payload.data(), payload.size(), checksum)) {
        return "";
    }

    std::vector<uint8_t> data = payload;
    data.insert(data.end(), checksum.begin(), checksum.begin() + 4);
    return EncodeBase58(data);
}

bool DecodeBase58Check(const std::string &str, std::vector<uint8_t> &payload) {
    std::vector<uint8_t> decoded;
    if (!DecodeBase58(str, decoded) || decoded.size() < 4) {
        return false;
    }

    std::vector<uint8_t> data(decoded.begin(), decoded.end() - 4);
    std::vector<uint8_t> checksum(decoded.end() - 4, decoded.end());

    std::array<uint8_t, 32> expected;
    if (!Crypto::DoubleSHA256(data.data(), data.size(), expected)) {
        return false;
    }
    if (!Crypto::ConstantTimeEquals(checksum, std::vector<uint8_t>(expected.begin(), expected.begin() + 4))) {
        return false;
    }

    payload = std::move(data);
    return true;
}

// === Base64 ===

std::string Base64Encode(const std::vector<uint8_t> &data) {
    if (data.empty())
        return {};

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int ret = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data.data(),
                              static_cast<int>(data.size()));
    if (ret < 0)
        return {};
    out.resize(static_cast<size_t>(ret));
    return out;
}

bool Base64Decode(const std::string &str, std::vector<uint8_t> &out) {
    if (str.empty()) {
        out.clear();
        return true;
    }
    if (str.size() % 4 != 0) {
        return false;
    }

    std::vector<uint8_t> decoded(3 * (str.size() / 4));
    int ret = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(str.data()),
                              static_cast<int>(str.size()));
    if (ret < 0)
        return false;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (str[str.size() - 1] == '=')
        padding++;
    if (str[str.size() - 2] == '=')
        padding++;
    decoded.resize(static_cast<size_t>(ret) - padding);
    out = std::move(decoded);
    return true;
}

std::string Base64UrlEncode(const std::vector<uint8_t> &data) {
    std::string out = Base64Encode(data);
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

bool Base64UrlDecode(const std::string &str, std::vector<uint8_t> &out) {
    std::string standard = str;
    std::replace(standard.begin(), standard.end(), '-', '+');
    std::replace(standard.begin(), standard.end(), '_', '/');
    if (standard.size() % 4 == 1) {
        return false;
    }
    while (standard.size() % 4 != 0) {
        standard.push_back('=');
    }
    return Base64Decode(standard, out);
}

// === Checksums ===

uint16_t CRC16(const uint8_t *data, size_t len) {
    uint16_t crc = 0;
    for (size_t i = 0; i < len; ++i) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ 0x1021)
                                 : static_cast<uint16_t>(crc << 1);
        }
    }
    return crc;
}

// === Integer encodings ===

void WriteVarInt(std::vector<uint8_t> &out, uint64_t value) {
    if (value < 0xFD) {
        out.push_back(static_cast<uint8_t>(value));
    } else if (value <= 0xFFFF) {
        out.push_back(0xFD);
        out.push_back(static_cast<uint8_t>(value & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    } else if (value <= 0xFFFFFFFF) {
        out.push_back(0xFE);
        WriteUInt32LE(out, static_cast<uint32_t>(value));
    } else {
        out.push_back(0xFF);
        WriteUInt64LE(out, value);
    }
}

void WriteUInt32LE(std::vector<uint8_t> &out, uint32_t value) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void WriteUInt64LE(std::vector<uint8_t> &out, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void WriteUInt16BE(std::vector<uint8_t> &out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void EncodeCompactU16(std::vector<uint8_t> &out, uint16_t value) {
    uint32_t remaining = value;
    while (true) {
        uint8_t byte = remaining & 0x7F;
        remaining >>= 7;
        if (remaining == 0) {
            out.push_back(byte);
            return;
        }
        out.push_back(byte | 0x80);
    }
}

// === Arbitrary-precision unsigned integers as text ===

bool DecimalToBytes(const std::string &decimal, std::vector<uint8_t> &out) {
    if (!IsDecimal(decimal)) {
        return false;
    }

    // Little-endian accumulator: value = value * 10 + digit
    std::vector<uint8_t> acc;
    for (char c : decimal) {
        int carry = c - '0';
        for (auto &byte : acc) {
            int v = byte * 10 + carry;
            byte = static_cast<uint8_t>(v & 0xFF);
            carry = v >> 8;
        }
        while (carry > 0) {
            acc.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }
    while (!acc.empty() && acc.back() == 0) {
        acc.pop_back();
    }
    out.assign(acc.rbegin(), acc.rend());
    return true;
}

std::string BytesToDecimal(const std::vector<uint8_t> &bytes) {
    // Little-endian decimal digits: value = value * 256 + byte
    std::vector<uint8_t> digits;
    for (uint8_t byte : bytes) {
        int carry = byte;
        for (auto &digit : digits) {
            int v = digit * 256 + carry;
            digit = static_cast<uint8_t>(v % 10);
            carry = v / 10;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 10));
            carry /= 10;
        }
    }
    if (digits.empty()) {
        return "0";
    }

    std::string result;
    result.reserve(digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(static_cast<char>('0' + *it));
    }
    return TrimLeadingZeros(result);
}

bool HexQuantityToDecimal(const std::string &hex, std::string &decimal) {
    std::string clean = StripHexPrefix(hex);
    if (clean.empty()) {
        decimal = "0";
        return true;
    }
    std::vector<uint8_t> bytes;
    if (!HexToBytes(clean, bytes)) {
        return false;
    }
    decimal = BytesToDecimal(bytes);
    return true;
}

bool DecimalToHexQuantity(const std::string &decimal, std::string &hex) {
    std::vector<uint8_t> bytes;
    if (!DecimalToBytes(decimal, bytes)) {
        return false;
    }
    if (bytes.empty()) {
        hex = "0x0";
        return true;
    }
    std::string digits = BytesToHex(bytes);
    size_t first = digits.find_first_not_of('0');
    hex = "0x" + digits.substr(first);
    return true;
}

std::string UIntToHexQuantity(uint64_t value) {
    if (value == 0) {
        return "0x0";
    }
    std::string digits;
    while (value > 0) {
        digits.insert(digits.begin(), HEX_DIGITS[value & 0x0F]);
        value >>= 4;
    }
    return "0x" + digits;
}

bool HexQuantityToUInt(const std::string &hex, uint64_t &value) {
    std::string clean = StripHexPrefix(hex);
    if (clean.empty() || !IsHexString(clean)) {
        return false;
    }
    size_t first = clean.find_first_not_of('0');
    if (first == std::string::npos) {
        value = 0;
        return true;
    }
    if (clean.size() - first > 16) {
        return false;
    }
    uint64_t result = 0;
    for (size_t i = first; i < clean.size(); ++i) {
        result = (result << 4) | static_cast<uint64_t>(HexValue(clean[i]));
    }
    value = result;
    return true;
}

int CompareDecimal(const std::string &a, const std::string &b) {
    std::string left = TrimLeadingZeros(a);
    std::string right = TrimLeadingZeros(b);
    if (left.size() != right.size()) {
        return left.size() < right.size() ? -1 : 1;
    }
    return left.compare(right);
}

std::string PadLeftHex(const std::string &hex, size_t width) {
    std::string clean = StripHexPrefix(hex);
    if (clean.size() >= width) {
        return clean;
    }
    return std::string(width - clean.size(), '0') + clean;
}

} // namespace Codec
