#include "AddressDerivation.h"
#include "ByteCodec.h"
#include "Crypto.h"
#include "FakeTransport.h"
#include "TestUtils.h"
#include "TonSigner.h"
#include <array>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;
using TestUtils::FakeTransport;
using TestUtils::hexBytes;
using Vault::ErrorCode;

namespace {

const char* const SENDER_SEED = "1111111111111111111111111111111111111111111111111111111111111111";
const char* const RECIPIENT_SEED = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
const char* const API = "https://toncenter.com/api/v2";
const int64_t NOW = 1700000000;

std::string url(const std::string& path) {
    return std::string(API) + path;
}

Ton::TonSigner makeSigner(FakeTransport& transport) {
    return Ton::TonSigner(Chains::TonConfig(), transport, []() { return NOW; });
}

std::string recipient() {
    auto address = AddressDerivation::DeriveTonAddress(hexBytes(RECIPIENT_SEED));
    return address ? *address : std::string();
}

json seqnoResponse(const std::string& hexValue) {
    json result;
    result["gas_used"] = 100u;
    result["exit_code"] = 0u;
    result["stack"] = json::array({json::array({"num", hexValue})});
    return {{"ok", true}, {"result", result}};
}

} // namespace

bool testSigningMessageLayout() {
    TEST_START("Wallet Signing Message Layout");

    FakeTransport transport;
    Ton::TonSigner signer = makeSigner(transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_SEED);

    Ton::TransferRequest request;
    request.to = recipient();
    request.amount = "1000000000";

    auto signedTx = signer.SignTransferWithSeqno(request, 7, key);
    TEST_ASSERT(signedTx, "Signing should succeed: " + signedTx.errorMessage);
    TEST_ASSERT(signedTx->seqno == 7, "Seqno is reported back");
    TEST_ASSERT(transport.totalCalls() == 0, "Signing with a known seqno is offline");

    std::vector<uint8_t> boc;
    TEST_ASSERT(Codec::Base64Decode(signedTx->boc, boc), "BOC is base64");
    TEST_ASSERT(boc.size() == 64 + 14, "Signature followed by the 112-bit signing message");

    TEST_STEP("wallet_id || valid_until || seqno || op || mode");
    std::vector<uint8_t> signingBytes(boc.begin() + 64, boc.end());
    TEST_ASSERT(Codec::BytesToHex(signingBytes) == "29a9a3176553f13c000000070003",
                "Signing message fields mismatch");

    TEST_STEP("Signature covers sha256 of the signing message");
    std::array<uint8_t, 32> digest;
    TEST_ASSERT(Crypto::SHA256(signingBytes.data(), signingBytes.size(), digest), "Reference hash failed");
    std::vector<uint8_t> publicKey;
    TEST_ASSERT(Crypto::Ed25519PublicKeyFromSeed(hexBytes(SENDER_SEED), publicKey), "Public key derivation failed");
    std::vector<uint8_t> signature(boc.begin(), boc.begin() + 64);
    TEST_ASSERT(Crypto::Ed25519Verify(publicKey, digest.data(), digest.size(), signature),
                "Signature must verify against the sender key");

    std::array<uint8_t, 32> hash;
    TEST_ASSERT(Crypto::SHA256(boc.data(), boc.size(), hash), "Reference hash failed");
    TEST_ASSERT(signedTx->hash == Codec::BytesToHex(hash.data(), hash.size()), "Hash is sha256 of the BOC bytes");

    TEST_STEP("64-byte secret keys sign like their seed");
    std::vector<uint8_t> secret = hexBytes(SENDER_SEED);
    secret.insert(secret.end(), publicKey.begin(), publicKey.end());
    Crypto::SecureBytes fullSecret(std::move(secret));
    auto fromSecret = signer.SignTransferWithSeqno(request, 7, fullSecret);
    TEST_ASSERT(fromSecret && fromSecret->boc == signedTx->boc, "Seed || public key must give the same BOC");

    TEST_PASS();
}

bool testSigningErrors() {
    TEST_START("Signing Errors");

    FakeTransport transport;
    Ton::TonSigner signer = makeSigner(transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_SEED);

    Ton::TransferRequest request;
    request.to = recipient();
    request.amount = "12.5";
    auto badAmount = signer.SignTransferWithSeqno(request, 0, key);
    TEST_ASSERT(!badAmount && badAmount.errorCode == ErrorCode::InvalidArgument, "Fractional nanotons rejected");

    request.amount = "1";
    request.to = "EQnot-an-address";
    auto badAddress = signer.SignTransferWithSeqno(request, 0, key);
    TEST_ASSERT(!badAddress, "Unparseable destination must be rejected");

    request.to = recipient();
    Crypto::SecureBytes shortKey(hexBytes("0102030405"));
    auto badKey = signer.SignTransferWithSeqno(request, 0, shortKey);
    TEST_ASSERT(!badKey && badKey.errorCode == ErrorCode::InvalidPrivateKeyLength, "Short keys must be rejected");

    TEST_PASS();
}

bool testSeqnoLookup() {
    TEST_START("Seqno Get-Method");

    FakeTransport transport;
    Ton::TonSigner signer = makeSigner(transport);
    const std::string wallet = recipient();

    transport.onGet(url("/runGetMethod"), seqnoResponse("0x2a"));
    auto seqno = signer.GetSeqno(wallet);
    TEST_ASSERT(seqno && *seqno == 42, "Hex stack entry is the seqno");

    json query = transport.lastPayload("get:" + url("/runGetMethod"));
    TEST_ASSERT(query["address"] == wallet && query["method"] == "seqno", "Query names the wallet and method");

    TEST_STEP("Undeployed wallet");
    FakeTransport empty;
    Ton::TonSigner emptySigner = makeSigner(empty);
    json emptyStack = {{"ok", true}, {"result", {{"exit_code", -13}, {"stack", json::array()}}}};
    empty.onGet(url("/runGetMethod"), emptyStack);
    auto zero = emptySigner.GetSeqno(wallet);
    TEST_ASSERT(zero && *zero == 0, "Empty stack reads as seqno 0");

    TEST_STEP("API failures");
    FakeTransport failing;
    Ton::TonSigner failingSigner = makeSigner(failing);
    failing.onGet(url("/runGetMethod"), {{"ok", false}, {"error", "rate limit exceeded"}});
    auto failed = failingSigner.GetSeqno(wallet);
    TEST_ASSERT(!failed && failed.errorCode == ErrorCode::RPCError, "ok:false is an RPC error");
    TEST_ASSERT(failed.errorMessage == "rate limit exceeded", "API error text should be kept");

    FakeTransport malformed;
    Ton::TonSigner malformedSigner = makeSigner(malformed);
    malformed.onGet(url("/runGetMethod"), seqnoResponse("seven"));
    auto garbage = malformedSigner.GetSeqno(wallet);
    TEST_ASSERT(!garbage && garbage.errorCode == ErrorCode::RPCError, "Malformed stack entries are rejected");

    auto unknown = signer.GetSeqno(wallet, "sandbox");
    TEST_ASSERT(!unknown && unknown.errorCode == ErrorCode::InvalidArgument, "Unknown network has no endpoint");

    TEST_PASS();
}

bool testSignAndSend() {
    TEST_START("Sign and Send");

    FakeTransport transport;
    Ton::TonSigner signer = makeSigner(transport);
    Crypto::SecureBytes key = TestUtils::secureKey(SENDER_SEED);

    transport.onGet(url("/runGetMethod"), seqnoResponse("0x3"));
    transport.onPost(url("/sendBoc"), {{"ok", true}, {"result", {{"@type", "ok"}}}});

    Ton::TransferRequest request;
    request.to = recipient();
    request.amount = "250000000";
    request.comment = std::string("invoice 17");

    auto sent = signer.SignAndSendTransaction(request, key);
    TEST_ASSERT(sent, "Send should succeed: " + sent.errorMessage);
    TEST_ASSERT(sent->status == Vault::TransactionStatus::Pending, "Accepted BOCs are pending");

    auto expected = signer.SignTransferWithSeqno(request, 3, key);
    TEST_ASSERT(expected && sent->transactionHash == expected->hash, "Hash must match the fetched seqno");

    json body = transport.lastPayload("post:" + url("/sendBoc"));
    TEST_ASSERT(body["boc"] == expected->boc, "The signed BOC is posted");

    auto owner = signer.GetAddressFromPrivateKey(key);
    json seqnoQuery = transport.lastPayload("get:" + url("/runGetMethod"));
    TEST_ASSERT(owner && seqnoQuery["address"] == *owner, "Seqno is read for the sender");

    TEST_STEP("Rejected BOC");
    FakeTransport rejecting;
    Ton::TonSigner rejectingSigner = makeSigner(rejecting);
    rejecting.onGet(url("/runGetMethod"), seqnoResponse("0x3"));
    rejecting.onPost(url("/sendBoc"), {{"ok", false}, {"error", "cannot apply external message"}});
    auto rejected = rejectingSigner.SignAndSendTransaction(request, key);
    TEST_ASSERT(rejected, "A refused BOC is still a reported result");
    TEST_ASSERT(rejected->status == Vault::TransactionStatus::Failed, "Refused BOCs are failed");
    TEST_ASSERT(rejected->message == "cannot apply external message", "API error text should be kept");

    TEST_STEP("Seqno failure stops the send");
    FakeTransport offline;
    Ton::TonSigner offlineSigner = makeSigner(offline);
    auto noSeqno = offlineSigner.SignAndSendTransaction(request, key);
    TEST_ASSERT(!noSeqno && noSeqno.errorCode == ErrorCode::RPCError, "Transport errors propagate");
    TEST_ASSERT(offline.callCount("post:" + url("/sendBoc")) == 0, "Nothing is posted without a seqno");

    TEST_PASS();
}

bool testSignMessage() {
    TEST_START("TON Message Signing");

    FakeTransport transport;
    Ton::TonSigner signer = makeSigner(transport);
    Crypto::SecureBytes key = TestUtils::secureKey(RECIPIENT_SEED);

    auto signature = signer.SignMessage("", key);
    TEST_ASSERT(signature, "Signing should succeed");
    TEST_ASSERT(*signature ==
                    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
                    "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b",
                "RFC 8032 test 1 signature expected");

    TEST_PASS();
}

bool testBalanceAndHistory() {
    TEST_START("Balance and History");

    FakeTransport transport;
    Ton::TonSigner signer = makeSigner(transport);
    const std::string wallet = recipient();

    TEST_ASSERT(signer.GetBalance(wallet) == "0", "Failed lookups read as zero");
    transport.onGet(url("/getAddressInformation"),
                    {{"ok", true}, {"result", {{"balance", "123456789"}, {"state", "active"}}}});
    TEST_ASSERT(signer.GetBalance(wallet) == "123456789", "Balance in nanotons");

    json sent;
    sent["transaction_id"]["hash"] = "hash-out";
    sent["utime"] = 1700000200u;
    sent["fee"] = "5000";
    sent["in_msg"] = {{"source", ""}, {"value", "0"}};
    sent["out_msgs"] = json::array({{{"destination", "EQdest"}, {"value", "1000"}, {"message", "rent"}}});

    json received;
    received["transaction_id"]["hash"] = "hash-in";
    received["utime"] = 1700000100u;
    received["fee"] = "0";
    received["in_msg"] = {{"source", {{"account_address", "EQsource"}}}, {"value", "2000"}, {"message", ""}};
    received["out_msgs"] = json::array();

    json external;
    external["transaction_id"]["hash"] = "hash-ext";
    external["in_msg"] = {{"source", ""}, {"value", "0"}};
    external["out_msgs"] = json::array();

    transport.onGet(url("/getTransactions"), {{"ok", true}, {"result", json::array({sent, received, external})}});

    auto history = signer.GetTransactionHistory(wallet, "mainnet", Vault::HistoryOptions(10));
    TEST_ASSERT(history.size() == 2, "External messages carry no transfer");

    TEST_ASSERT(history[0].hash == "hash-out", "API order is kept");
    TEST_ASSERT(history[0].direction == Vault::TransferDirection::Send, "Out message means send");
    TEST_ASSERT(history[0].from == wallet && history[0].to == "EQdest", "Send endpoints");
    TEST_ASSERT(history[0].amount == "1000", "Amount from the out message");
    TEST_ASSERT(history[0].message && *history[0].message == "rent", "Comment kept");
    TEST_ASSERT(history[0].fee && *history[0].fee == "5000", "Fee kept");
    TEST_ASSERT(history[0].timestamp && *history[0].timestamp == 1700000200, "utime is the timestamp");

    TEST_ASSERT(history[1].direction == Vault::TransferDirection::Receive, "Sourced in message means receive");
    TEST_ASSERT(history[1].from == "EQsource" && history[1].to == wallet, "Nested source address is read");
    TEST_ASSERT(history[1].amount == "2000", "Amount from the in message");
    TEST_ASSERT(!history[1].message, "Empty comments are omitted");

    json query = transport.lastPayload("get:" + url("/getTransactions"));
    TEST_ASSERT(query["limit"] == "10", "Limit is forwarded");

    auto limited = signer.GetTransactionHistory(wallet, "mainnet", Vault::HistoryOptions(1));
    TEST_ASSERT(limited.size() == 1 && limited[0].hash == "hash-out", "Results are truncated to the limit");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("TON Signer Tests");
    TestUtils::initializeTestLogger("test_ton_signer.log");

    testSigningMessageLayout();
    testSigningErrors();
    testSeqnoLookup();
    testSignAndSend();
    testSignMessage();
    testBalanceAndHistory();

    Vault::Logger::getInstance().shutdown();
    TestUtils::printTestSummary("TON Signer");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
