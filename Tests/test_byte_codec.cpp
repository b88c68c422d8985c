#include "ByteCodec.h"
#include "RLPEncoder.h"
#include "TestUtils.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using TestUtils::hexBytes;

static std::vector<uint8_t> asBytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

bool testHexRoundTrip() {
    TEST_START("Hex Encoding");

    std::vector<uint8_t> bytes;
    TEST_ASSERT(Codec::HexToBytes("0xDEADbeef", bytes), "Mixed-case prefixed hex should decode");
    TEST_ASSERT(Codec::BytesToHex(bytes) == "deadbeef", "Hex output should be lower case without prefix");

    TEST_ASSERT(Codec::HexToBytes("abc", bytes), "Odd-length hex should decode");
    TEST_ASSERT(bytes.size() == 2 && bytes[0] == 0x0a && bytes[1] == 0xbc, "Odd-length hex is left padded");

    TEST_ASSERT(!Codec::HexToBytes("0xzz", bytes), "Non-hex characters should be rejected");
    TEST_ASSERT(Codec::StripHexPrefix("0X12") == "12", "Upper-case prefix should be stripped");
    TEST_ASSERT(Codec::IsHexString("00ffAA"), "Plain hex is hex");
    TEST_ASSERT(!Codec::IsHexString("0x12"), "Prefix is not part of the hex alphabet");

    TEST_PASS();
}

bool testBase58Vectors() {
    TEST_START("Base58 Known Vectors");

    TEST_ASSERT(Codec::EncodeBase58(asBytes("Hello World!")) == "2NEpo7TZRRrLZSi2U",
                "\"Hello World!\" should encode to 2NEpo7TZRRrLZSi2U");

    std::vector<uint8_t> withZeros = hexBytes("0000287fb4cd");
    TEST_STEP("Leading zero bytes map to '1'");
    TEST_ASSERT(Codec::EncodeBase58(withZeros) == "11233QC4", "0x0000287fb4cd should encode to 11233QC4");

    std::vector<uint8_t> decoded;
    TEST_ASSERT(Codec::DecodeBase58("11233QC4", decoded), "Known vector should decode");
    TEST_ASSERT(decoded == withZeros, "Decoding should restore the leading zeros");

    TEST_ASSERT(!Codec::DecodeBase58("0OIl", decoded), "Characters outside the alphabet are rejected");
    TEST_ASSERT(!Codec::DecodeBase58("", decoded), "Empty string is rejected");

    TEST_PASS();
}

bool testBase58Check() {
    TEST_START("Base58Check Checksum");

    // Hash160 of the compressed public key of private key 1
    std::vector<uint8_t> payload = hexBytes("00751e76e8199196d454941c45d1b3a323f1433bd6");
    std::string encoded = Codec::EncodeBase58Check(payload);
    TEST_ASSERT(encoded == "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", "P2PKH address of key 1 mismatch");

    std::vector<uint8_t> decoded;
    TEST_ASSERT(Codec::DecodeBase58Check(encoded, decoded), "Valid checksum should verify");
    TEST_ASSERT(decoded == payload, "Payload should round-trip");

    std::string corrupted = encoded;
    corrupted[5] = corrupted[5] == 'A' ? 'B' : 'A';
    TEST_ASSERT(!Codec::DecodeBase58Check(corrupted, decoded), "Corrupted string must fail the checksum");

    TEST_PASS();
}

bool testBase64() {
    TEST_START("Base64 Standard and URL-safe");

    TEST_ASSERT(Codec::Base64Encode(asBytes("foobar")) == "Zm9vYmFy", "foobar should encode to Zm9vYmFy");
    TEST_ASSERT(Codec::Base64Encode(asBytes("fo")) == "Zm8=", "Padding should be emitted");

    std::vector<uint8_t> decoded;
    TEST_ASSERT(Codec::Base64Decode("Zm8=", decoded), "Padded input should decode");
    TEST_ASSERT(decoded == asBytes("fo"), "Padding bytes should be dropped");
    TEST_ASSERT(!Codec::Base64Decode("Zm8", decoded), "Truncated standard base64 is rejected");

    std::vector<uint8_t> high = {0xfb, 0xff};
    TEST_ASSERT(Codec::Base64Encode(high) == "+/8=", "Standard alphabet uses + and /");
    TEST_ASSERT(Codec::Base64UrlEncode(high) == "-_8", "URL alphabet uses - and _ without padding");
    TEST_ASSERT(Codec::Base64UrlDecode("-_8", decoded), "Unpadded URL-safe input should decode");
    TEST_ASSERT(decoded == high, "URL-safe decode mismatch");

    TEST_PASS();
}

bool testCrc16() {
    TEST_START("CRC16 XMODEM");

    std::vector<uint8_t> check = asBytes("123456789");
    TEST_ASSERT(Codec::CRC16(check.data(), check.size()) == 0x31C3, "Check value should be 0x31C3");
    TEST_ASSERT(Codec::CRC16(nullptr, 0) == 0x0000, "Empty input keeps the zero init value");

    TEST_PASS();
}

bool testIntegerEncodings() {
    TEST_START("VarInt, Little-Endian and CompactU16");

    std::vector<uint8_t> out;
    Codec::WriteVarInt(out, 0xfc);
    TEST_ASSERT(out == std::vector<uint8_t>({0xfc}), "Values below 0xfd use one byte");

    out.clear();
    Codec::WriteVarInt(out, 0xfd);
    TEST_ASSERT(out == std::vector<uint8_t>({0xfd, 0xfd, 0x00}), "0xfd uses the 16-bit form");

    out.clear();
    Codec::WriteVarInt(out, 0x10000);
    TEST_ASSERT(out == std::vector<uint8_t>({0xfe, 0x00, 0x00, 0x01, 0x00}), "0x10000 uses the 32-bit form");

    out.clear();
    Codec::WriteUInt32LE(out, 0x01020304);
    TEST_ASSERT(out == std::vector<uint8_t>({0x04, 0x03, 0x02, 0x01}), "UInt32 should be little endian");

    out.clear();
    Codec::WriteUInt16BE(out, 0x1234);
    TEST_ASSERT(out == std::vector<uint8_t>({0x12, 0x34}), "UInt16 should be big endian");

    out.clear();
    Codec::EncodeCompactU16(out, 0x7f);
    TEST_ASSERT(out == std::vector<uint8_t>({0x7f}), "0x7f fits in one byte");

    out.clear();
    Codec::EncodeCompactU16(out, 0x80);
    TEST_ASSERT(out == std::vector<uint8_t>({0x80, 0x01}), "0x80 should encode to 80 01");

    out.clear();
    Codec::EncodeCompactU16(out, 0x4000);
    TEST_ASSERT(out == std::vector<uint8_t>({0x80, 0x80, 0x01}), "0x4000 should encode to 80 80 01");

    TEST_PASS();
}

bool testDecimalConversions() {
    TEST_START("Arbitrary-Precision Decimal Conversions");

    std::string hex;
    TEST_ASSERT(Codec::DecimalToHexQuantity("1000000000000000000", hex), "1 ETH in wei should convert");
    TEST_ASSERT(hex == "0xde0b6b3a7640000", "1e18 should be 0xde0b6b3a7640000");

    TEST_ASSERT(Codec::DecimalToHexQuantity("0", hex) && hex == "0x0", "Zero should be 0x0");

    std::string decimal;
    // 2^256 - 1
    const std::string maxUint256 =
        "115792089237316195423570985008687907853269984665640564039457584007913129639935";
    TEST_ASSERT(Codec::HexQuantityToDecimal("0x" + std::string(64, 'f'), decimal), "uint256 max should convert");
    TEST_ASSERT(decimal == maxUint256, "uint256 max decimal mismatch");

    std::vector<uint8_t> bytes;
    TEST_ASSERT(Codec::DecimalToBytes("0", bytes) && bytes.empty(), "Zero has no magnitude bytes");
    TEST_ASSERT(!Codec::DecimalToBytes("12a", bytes), "Non-digits are rejected");
    TEST_ASSERT(!Codec::DecimalToBytes("", bytes), "Empty input is rejected");
    TEST_ASSERT(Codec::BytesToDecimal({}) == "0", "Empty bytes read as zero");

    uint64_t value = 0;
    TEST_ASSERT(Codec::HexQuantityToUInt("0x5208", value) && value == 21000, "0x5208 is 21000");
    TEST_ASSERT(!Codec::HexQuantityToUInt("0x1" + std::string(16, '0'), value), "Values above 64 bits are rejected");
    TEST_ASSERT(Codec::UIntToHexQuantity(0) == "0x0", "Zero quantity is 0x0");

    TEST_ASSERT(Codec::CompareDecimal("100", "99") > 0, "100 > 99");
    TEST_ASSERT(Codec::CompareDecimal("0042", "42") == 0, "Leading zeros are ignored");
    TEST_ASSERT(Codec::PadLeftHex("0xabc", 8) == "00000abc", "Hex should be left padded");

    TEST_PASS();
}

bool testRlpVectors() {
    TEST_START("RLP Known Vectors");

    TEST_ASSERT(Codec::BytesToHex(RLP::Encoder::EncodeString("dog")) == "83646f67", "\"dog\" mismatch");
    TEST_ASSERT(Codec::BytesToHex(RLP::Encoder::EncodeString("")) == "80", "Empty string is 0x80");
    TEST_ASSERT(Codec::BytesToHex(RLP::Encoder::EncodeList({})) == "c0", "Empty list is 0xc0");
    TEST_ASSERT(Codec::BytesToHex(RLP::Encoder::EncodeUInt(0)) == "80", "Zero is 0x80");
    TEST_ASSERT(Codec::BytesToHex(RLP::Encoder::EncodeUInt(15)) == "0f", "Single small byte encodes as itself");
    TEST_ASSERT(Codec::BytesToHex(RLP::Encoder::EncodeUInt(1024)) == "820400", "1024 mismatch");

    auto catDog = RLP::Encoder::EncodeList({RLP::Encoder::EncodeString("cat"), RLP::Encoder::EncodeString("dog")});
    TEST_ASSERT(Codec::BytesToHex(catDog) == "c88363617483646f67", "[\"cat\",\"dog\"] mismatch");

    std::string longText = "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
    auto longEncoded = RLP::Encoder::EncodeString(longText);
    TEST_STEP("56-byte payload switches to the long form");
    TEST_ASSERT(longEncoded.size() == 58 && longEncoded[0] == 0xb8 && longEncoded[1] == 0x38,
                "Long string prefix should be b8 38");

    std::vector<uint8_t> encoded;
    TEST_ASSERT(RLP::Encoder::EncodeDecimal("1000000000000000000", encoded), "Decimal wei should encode");
    TEST_ASSERT(Codec::BytesToHex(encoded) == "880de0b6b3a7640000", "1e18 RLP mismatch");
    TEST_ASSERT(RLP::Encoder::EncodeQuantity("0x0000ff", encoded), "Quantity should encode");
    TEST_ASSERT(Codec::BytesToHex(encoded) == "81ff", "Leading zero bytes are trimmed from quantities");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Byte Codec Tests");

    testHexRoundTrip();
    testBase58Vectors();
    testBase58Check();
    testBase64();
    testCrc16();
    testIntegerEncodings();
    testDecimalConversions();
    testRlpVectors();

    TestUtils::printTestSummary("Byte Codec");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
