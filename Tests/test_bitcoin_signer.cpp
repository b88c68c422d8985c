#include "AddressDerivation.h"
#include "BitcoinSigner.h"
#include "ByteCodec.h"
#include "Crypto.h"
#include "FakeTransport.h"
#include "TestUtils.h"
#include <algorithm>
#include <array>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
using TestUtils::FakeTransport;
using TestUtils::hexBytes;
using Vault::ErrorCode;

namespace {

const char* const SENDER_KEY = "1111111111111111111111111111111111111111111111111111111111111111";
const char* const RECIPIENT = "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH";
const char* const ESPLORA = "https://blockstream.info/api";

// secp256k1 order / 2
const char* const HALF_ORDER = "7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0";

struct ParsedInput {
    std::vector<uint8_t> outpoint;  // txid || vout
    std::vector<uint8_t> scriptSig;
};

struct ParsedOutput {
    uint64_t value = 0;
    std::vector<uint8_t> script;
};

struct ParsedTx {
    std::vector<ParsedInput> inputs;
    std::vector<ParsedOutput> outputs;
    uint32_t version = 0;
    uint32_t locktime = 0;
};

uint64_t readLE(const std::vector<uint8_t>& data, size_t& pos, size_t width) {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(data[pos + i]) << (8 * i);
    }
    pos += width;
    return value;
}

// Only handles the single-byte counts and script lengths these tests produce
bool parseTransaction(const std::string& hex, ParsedTx& tx) {
    std::vector<uint8_t> raw = hexBytes(hex);
    if (raw.size() < 10) {
        return false;
    }
    size_t pos = 0;
    tx.version = static_cast<uint32_t>(readLE(raw, pos, 4));

    const size_t inputCount = raw[pos++];
    for (size_t i = 0; i < inputCount; ++i) {
        ParsedInput input;
        input.outpoint.assign(raw.begin() + pos, raw.begin() + pos + 36);
        pos += 36;
        const size_t scriptLen = raw[pos++];
        input.scriptSig.assign(raw.begin() + pos, raw.begin() + pos + scriptLen);
        pos += scriptLen;
        if (readLE(raw, pos, 4) != 0xffffffff) {
            return false;
        }
        tx.inputs.push_back(std::move(input));
    }

    const size_t outputCount = raw[pos++];
    for (size_t i = 0; i < outputCount; ++i) {
        ParsedOutput output;
        output.value = readLE(raw, pos, 8);
        const size_t scriptLen = raw[pos++];
        output.script.assign(raw.begin() + pos, raw.begin() + pos + scriptLen);
        pos += scriptLen;
        tx.outputs.push_back(std::move(output));
    }

    tx.locktime = static_cast<uint32_t>(readLE(raw, pos, 4));
    return pos == raw.size();
}

std::vector<uint8_t> p2pkhScriptFor(const std::string& address) {
    auto decoded = AddressDerivation::DecodeBitcoinAddress(address);
    std::vector<uint8_t> script = {0x76, 0xa9, 0x14};
    if (decoded) {
        script.insert(script.end(), decoded->pubKeyHash.begin(), decoded->pubKeyHash.end());
    }
    script.push_back(0x88);
    script.push_back(0xac);
    return script;
}

// Legacy SIGHASH_ALL digest of one input
std::array<uint8_t, 32> sighashFor(const ParsedTx& tx, size_t index, const std::vector<uint8_t>& senderScript) {
    std::vector<uint8_t> preimage;
    Codec::WriteUInt32LE(preimage, tx.version);
    Codec::WriteVarInt(preimage, tx.inputs.size());
    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        preimage.insert(preimage.end(), tx.inputs[i].outpoint.begin(), tx.inputs[i].outpoint.end());
        if (i == index) {
            Codec::WriteVarInt(preimage, senderScript.size());
            preimage.insert(preimage.end(), senderScript.begin(), senderScript.end());
        } else {
            Codec::WriteVarInt(preimage, 0);
        }
        Codec::WriteUInt32LE(preimage, 0xffffffff);
    }
    Codec::WriteVarInt(preimage, tx.outputs.size());
    for (const auto& output : tx.outputs) {
        Codec::WriteUInt64LE(preimage, output.value);
        Codec::WriteVarInt(preimage, output.script.size());
        preimage.insert(preimage.end(), output.script.begin(), output.script.end());
    }
    Codec::WriteUInt32LE(preimage, tx.locktime);
    Codec::WriteUInt32LE(preimage, Bitcoin::SIGHASH_ALL);

    std::array<uint8_t, 32> digest{};
    Crypto::DoubleSHA256(preimage.data(), preimage.size(), digest);
    return digest;
}

bool isLowS(const std::vector<uint8_t>& der) {
    if (der.size() < 8 || der[0] != 0x30 || der[2] != 0x02) {
        return false;
    }
    const size_t rLen = der[3];
    const size_t sPos = 4 + rLen;
    if (der[sPos] != 0x02) {
        return false;
    }
    const size_t sLen = der[sPos + 1];
    std::vector<uint8_t> s(der.begin() + sPos + 2, der.begin() + sPos + 2 + sLen);
    while (!s.empty() && s[0] == 0) {
        s.erase(s.begin());
    }
    if (s.size() < 32) {
        return true;
    }
    return s.size() == 32 && s <= hexBytes(HALF_ORDER);
}

// Every scriptSig must carry a low-S DER signature that verifies over its sighash
bool verifyInputs(const ParsedTx& tx, const std::string& senderAddress) {
    const std::vector<uint8_t> senderScript = p2pkhScriptFor(senderAddress);
    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        const std::vector<uint8_t>& scriptSig = tx.inputs[i].scriptSig;
        if (scriptSig.empty()) {
            return false;
        }
        const size_t sigLen = scriptSig[0];
        if (scriptSig.size() < 1 + sigLen + 1 || scriptSig[sigLen] != Bitcoin::SIGHASH_ALL) {
            return false;
        }
        Crypto::ECDSASignature signature;
        signature.der_encoded.assign(scriptSig.begin() + 1, scriptSig.begin() + sigLen);

        const size_t keyLen = scriptSig[1 + sigLen];
        std::vector<uint8_t> publicKey(scriptSig.begin() + 2 + sigLen, scriptSig.begin() + 2 + sigLen + keyLen);
        if (publicKey.size() != 33 || !isLowS(signature.der_encoded)) {
            return false;
        }
        if (!Crypto::VerifySignature(publicKey, sighashFor(tx, i, senderScript), signature)) {
            return false;
        }
    }
    return true;
}

Bitcoin::UTXO makeUtxo(char fill, uint32_t vout, uint64_t value) {
    Bitcoin::UTXO utxo;
    utxo.txid = std::string(64, fill);
    utxo.vout = vout;
    utxo.value = value;
    return utxo;
}

std::string senderAddress() {
    auto address = AddressDerivation::DeriveBitcoinAddress(hexBytes(SENDER_KEY));
    return address ? *address : "";
}

} // namespace

bool testChangeOutput() {
    TEST_START("Transfer with Change Output");

    FakeTransport transport;
    Bitcoin::BitcoinSigner signer(Chains::BitcoinConfig(), transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_KEY);

    Bitcoin::TransferRequest request;
    request.utxos = {makeUtxo('a', 0, 100000)};
    request.to = RECIPIENT;
    request.amount = 50000;
    request.fee = 1000;

    auto signedTx = signer.SignTransaction(request, key);
    TEST_ASSERT(signedTx, "Signing should succeed: " + signedTx.errorMessage);
    TEST_ASSERT(signedTx->fee == 1000 && signedTx->change == 49000, "Change should be 49000");

    ParsedTx tx;
    TEST_ASSERT(parseTransaction(signedTx->rawTransaction, tx), "Raw transaction should parse");
    TEST_ASSERT(tx.version == 1 && tx.locktime == 0, "Version 1, locktime 0");
    TEST_ASSERT(tx.inputs.size() == 1 && tx.outputs.size() == 2, "One input, two outputs");
    TEST_ASSERT(tx.outputs[0].value == 50000 && tx.outputs[0].script == p2pkhScriptFor(RECIPIENT),
                "First output pays the recipient");
    TEST_ASSERT(tx.outputs[1].value == 49000 && tx.outputs[1].script == p2pkhScriptFor(senderAddress()),
                "Change returns to the sender by default");

    TEST_STEP("Outpoint txid is serialized little-endian");
    std::vector<uint8_t> expectedOutpoint(32, 0xaa);
    expectedOutpoint.insert(expectedOutpoint.end(), {0, 0, 0, 0});
    TEST_ASSERT(tx.inputs[0].outpoint == expectedOutpoint, "Outpoint mismatch");

    TEST_STEP("Signature verifies against the sighash");
    TEST_ASSERT(verifyInputs(tx, senderAddress()), "scriptSig verification failed");

    std::vector<uint8_t> raw = hexBytes(signedTx->rawTransaction);
    std::array<uint8_t, 32> txHash;
    Crypto::DoubleSHA256(raw.data(), raw.size(), txHash);
    std::reverse(txHash.begin(), txHash.end());
    TEST_ASSERT(signedTx->txid == Codec::BytesToHex(txHash.data(), txHash.size()), "txid is reversed double SHA-256");

    TEST_PASS();
}

bool testInsufficientFunds() {
    TEST_START("Insufficient Funds");

    FakeTransport transport;
    Bitcoin::BitcoinSigner signer(Chains::BitcoinConfig(), transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_KEY);

    Bitcoin::TransferRequest request;
    request.utxos = {makeUtxo('a', 0, 100000)};
    request.to = RECIPIENT;
    request.amount = 99500;
    request.fee = 1000;

    auto result = signer.SignTransaction(request, key);
    TEST_ASSERT(!result && result.errorCode == ErrorCode::InsufficientFunds, "99500 + 1000 exceeds 100000");

    request.amount = UINT64_MAX;
    auto overflow = signer.SignTransaction(request, key);
    TEST_ASSERT(!overflow && overflow.errorCode == ErrorCode::InsufficientFunds, "Overflowing totals are rejected");

    TEST_STEP("Input values that wrap around are refused");
    request.utxos = {makeUtxo('a', 0, UINT64_MAX), makeUtxo('b', 1, 2000)};
    request.amount = 500;
    auto wrapped = signer.SignTransaction(request, key);
    TEST_ASSERT(!wrapped && wrapped.errorCode == ErrorCode::InvalidArgument, "Wrapped input sum must be rejected");

    TEST_PASS();
}

bool testDustChangeDropped() {
    TEST_START("Dust Change Dropped");

    FakeTransport transport;
    Bitcoin::BitcoinSigner signer(Chains::BitcoinConfig(), transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_KEY);

    Bitcoin::TransferRequest request;
    request.utxos = {makeUtxo('b', 3, 100000)};
    request.to = RECIPIENT;
    request.amount = 98500;
    request.fee = 1000;

    auto signedTx = signer.SignTransaction(request, key);
    TEST_ASSERT(signedTx, "Signing should succeed");
    TEST_ASSERT(signedTx->change == 0, "500 sat change is below the dust threshold");

    ParsedTx tx;
    TEST_ASSERT(parseTransaction(signedTx->rawTransaction, tx), "Raw transaction should parse");
    TEST_ASSERT(tx.outputs.size() == 1 && tx.outputs[0].value == 98500, "Only the payment output remains");

    TEST_STEP("Change of exactly 547 is kept");
    request.amount = 98453;
    auto kept = signer.SignTransaction(request, key);
    TEST_ASSERT(kept && kept->change == 547, "547 sat change is above the dust threshold");

    TEST_PASS();
}

bool testMultipleInputs() {
    TEST_START("Multiple Inputs and Default Fee");

    FakeTransport transport;
    Chains::BitcoinConfig config;
    config.defaultFee = 2000;
    Bitcoin::BitcoinSigner signer(config, transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_KEY);

    Bitcoin::TransferRequest request;
    request.utxos = {makeUtxo('c', 1, 30000), makeUtxo('d', 0, 40000)};
    request.to = RECIPIENT;
    request.amount = 60000;
    request.changeAddress = RECIPIENT;

    auto signedTx = signer.SignTransaction(request, key);
    TEST_ASSERT(signedTx, "Signing should succeed: " + signedTx.errorMessage);
    TEST_ASSERT(signedTx->fee == 2000 && signedTx->change == 8000, "Configured default fee applies");

    ParsedTx tx;
    TEST_ASSERT(parseTransaction(signedTx->rawTransaction, tx), "Raw transaction should parse");
    TEST_ASSERT(tx.inputs.size() == 2, "Every UTXO is spent");
    TEST_ASSERT(tx.outputs[1].script == p2pkhScriptFor(RECIPIENT), "Explicit change address is honored");
    TEST_ASSERT(verifyInputs(tx, senderAddress()), "Each input carries its own valid signature");

    TEST_PASS();
}

bool testInvalidAddresses() {
    TEST_START("Invalid Addresses and Keys");

    FakeTransport transport;
    Bitcoin::BitcoinSigner signer(Chains::BitcoinConfig(), transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_KEY);

    Bitcoin::TransferRequest request;
    request.utxos = {makeUtxo('a', 0, 100000)};
    request.to = "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMJ";
    request.amount = 1000;

    auto badRecipient = signer.SignTransaction(request, key);
    TEST_ASSERT(!badRecipient && badRecipient.errorCode == ErrorCode::InvalidAddressChecksum,
                "Corrupted recipient must be rejected");

    request.to = RECIPIENT;
    request.changeAddress = "1111111111";
    auto badChange = signer.SignTransaction(request, key);
    TEST_ASSERT(!badChange && badChange.errorCode == ErrorCode::InvalidAddressChecksum,
                "Corrupted change address must be rejected");

    request.changeAddress.reset();
    request.utxos[0].txid = "abcd";
    auto badTxid = signer.SignTransaction(request, key);
    TEST_ASSERT(!badTxid && badTxid.errorCode == ErrorCode::InvalidArgument, "Short txid must be rejected");

    Crypto::SecureBytes shortKey(std::vector<uint8_t>(20, 0x01));
    auto badKey = signer.SignTransaction(request, shortKey);
    TEST_ASSERT(!badKey && badKey.errorCode == ErrorCode::InvalidPrivateKeyLength, "Short key must be rejected");

    TEST_PASS();
}

bool testFetchUtxosFromChain() {
    TEST_START("UTXO Lookup with Esplora Fallback");

    const std::string sender = senderAddress();
    FakeTransport transport;
    transport.onGet(std::string(ESPLORA) + "/address/" + sender + "/utxo",
                    json::array({{{"txid", std::string(64, 'e')}, {"vout", 2}, {"value", 75000}}}));

    Chains::BitcoinConfig config;
    config.mainnet.rpcUrl = "http://127.0.0.1:8332";
    Bitcoin::BitcoinSigner signer(config, transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_KEY);

    Bitcoin::TransferRequest request;
    request.to = RECIPIENT;
    request.amount = 25000;
    request.fee = 1000;

    auto signedTx = signer.SignTransferFromChain(request, key);
    TEST_ASSERT(signedTx, "Signing should succeed: " + signedTx.errorMessage);
    TEST_ASSERT(signedTx->change == 49000, "Fetched UTXO funds the transfer");
    TEST_ASSERT(transport.callCount("rpc:scantxoutset") == 1, "Node is asked first");

    FakeTransport empty;
    empty.onGet(std::string(ESPLORA) + "/address/" + sender + "/utxo", json::array());
    Bitcoin::BitcoinSigner emptySigner(Chains::BitcoinConfig(), empty);
    auto none = emptySigner.SignTransferFromChain(request, key);
    TEST_ASSERT(!none && none.errorCode == ErrorCode::NoUTXOsAvailable, "Empty UTXO set must fail");

    FakeTransport offline;
    Bitcoin::BitcoinSigner offlineSigner(Chains::BitcoinConfig(), offline);
    auto unreachable = offlineSigner.SignTransferFromChain(request, key);
    TEST_ASSERT(!unreachable && unreachable.errorCode == ErrorCode::RPCError, "No provider answered");

    TEST_PASS();
}

bool testBroadcastAndBalance() {
    TEST_START("Broadcast and Balance");

    const std::string sender = senderAddress();
    FakeTransport transport;
    transport.onRpc("sendrawtransaction", "f00dbabe");
    transport.onGet(std::string(ESPLORA) + "/address/" + sender,
                    {{"chain_stats", {{"funded_txo_sum", 150000}, {"spent_txo_sum", 50000}}},
                     {"mempool_stats", {{"funded_txo_sum", 1000}, {"spent_txo_sum", 0}}}});

    Chains::BitcoinConfig config;
    config.mainnet.rpcUrl = "http://127.0.0.1:8332";
    config.rpcUsername = "vault";
    config.rpcPassword = "secret";
    Bitcoin::BitcoinSigner signer(config, transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_KEY);

    Bitcoin::TransferRequest request;
    request.utxos = {makeUtxo('a', 0, 100000)};
    request.to = RECIPIENT;
    request.amount = 50000;

    auto result = signer.SignAndSendTransaction(request, key);
    TEST_ASSERT(result, "Broadcast should succeed: " + result.errorMessage);
    TEST_ASSERT(result->transactionHash == "f00dbabe" && result->status == Vault::TransactionStatus::Pending,
                "Node txid is reported as pending");

    TEST_ASSERT(signer.GetBalance(sender) == 101000, "Confirmed plus mempool balance");

    FakeTransport noNode;
    Bitcoin::BitcoinSigner noNodeSigner(Chains::BitcoinConfig(), noNode);
    auto unsent = noNodeSigner.SendRawTransaction("00", AddressDerivation::BitcoinNetwork::Mainnet);
    TEST_ASSERT(!unsent && unsent.errorCode == ErrorCode::RPCError, "Broadcast needs a node endpoint");
    TEST_ASSERT(noNodeSigner.GetBalance(sender) == 0, "Failed balance lookups degrade to zero");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Bitcoin Signer Tests");
    TestUtils::initializeTestLogger("test_bitcoin_signer.log");

    testChangeOutput();
    testInsufficientFunds();
    testDustChangeDropped();
    testMultipleInputs();
    testInvalidAddresses();
    testFetchUtxosFromChain();
    testBroadcastAndBalance();

    Vault::Logger::getInstance().shutdown();
    TestUtils::printTestSummary("Bitcoin Signer");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
