#include "include/RLPEncoder.h"
#include "include/ByteCodec.h"

#include <algorithm>

namespace RLP {

namespace {

constexpr uint8_t STRING_BASE = 0x80;
constexpr uint8_t LIST_BASE = 0xc0;
constexpr size_t SHORT_LIMIT = 56;

// Big-endian bytes of value without leading zeros
void appendBigEndian(std::vector<uint8_t>& out, uint64_t value) {
    uint8_t buffer[8];
    size_t count = 0;
    for (; value != 0; value >>= 8) {
        buffer[count++] = static_cast<uint8_t>(value);
    }
    while (count > 0) {
        out.push_back(buffer[--count]);
    }
}

void appendHeader(std::vector<uint8_t>& out, size_t payloadLength, uint8_t base) {
    if (payloadLength < SHORT_LIMIT) {
        out.push_back(static_cast<uint8_t>(base + payloadLength));
        return;
    }
    std::vector<uint8_t> length;
    appendBigEndian(length, payloadLength);
    out.push_back(static_cast<uint8_t>(base + SHORT_LIMIT - 1 + length.size()));
    out.insert(out.end(), length.begin(), length.end());
}

std::vector<uint8_t> encodeItem(const uint8_t* data, size_t size) {
    if (size == 1 && data[0] < STRING_BASE) {
        return {data[0]};
    }
    std::vector<uint8_t> out;
    out.reserve(size + 9);
    appendHeader(out, size, STRING_BASE);
    out.insert(out.end(), data, data + size);
    return out;
}

std::vector<uint8_t> encodeItem(const std::vector<uint8_t>& data) {
    return encodeItem(data.data(), data.size());
}

} // namespace

std::vector<uint8_t> Encoder::EncodeBytes(const std::vector<uint8_t>& data) {
    return encodeItem(data);
}

std::vector<uint8_t> Encoder::EncodeString(const std::string& str) {
    return encodeItem(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

std::vector<uint8_t> Encoder::EncodeUInt(uint64_t value) {
    std::vector<uint8_t> bytes;
    appendBigEndian(bytes, value);
    return encodeItem(bytes);
}

bool Encoder::EncodeDecimal(const std::string& decimal, std::vector<uint8_t>& out) {
    std::vector<uint8_t> magnitude;
    if (!Codec::DecimalToBytes(decimal, magnitude)) {
        return false;
    }
    out = encodeItem(TrimLeadingZeros(magnitude));
    return true;
}

bool Encoder::EncodeQuantity(const std::string& hex, std::vector<uint8_t>& out) {
    std::vector<uint8_t> magnitude;
    if (!Codec::HexToBytes(hex, magnitude)) {
        return false;
    }
    out = encodeItem(TrimLeadingZeros(magnitude));
    return true;
}

bool Encoder::EncodeHex(const std::string& hex, std::vector<uint8_t>& out) {
    std::vector<uint8_t> raw;
    if (!Codec::HexToBytes(hex, raw)) {
        return false;
    }
    out = encodeItem(raw);
    return true;
}

std::vector<uint8_t> Encoder::EncodeList(const std::vector<std::vector<uint8_t>>& items) {
    size_t payload = 0;
    for (const auto& item : items) {
        payload += item.size();
    }

    std::vector<uint8_t> out;
    out.reserve(payload + 9);
    appendHeader(out, payload, LIST_BASE);
    for (const auto& item : items) {
        out.insert(out.end(), item.begin(), item.end());
    }
    return out;
}

std::vector<uint8_t> Encoder::TrimLeadingZeros(const std::vector<uint8_t>& data) {
    auto first = std::find_if(data.begin(), data.end(), [](uint8_t b) { return b != 0; });
    return std::vector<uint8_t>(first, data.end());
}

} // namespace RLP
