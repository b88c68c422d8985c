#include "include/TonSigner.h"
#include "AddressDerivation.h"
#include "ByteCodec.h"
#include "Vault/Logger.h"

#include <chrono>

using json = nlohmann::json;
using Vault::ErrorCode;
using Vault::Result;

namespace Ton {

namespace {

const char* const COMPONENT = "TonSigner";

int64_t systemClock() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// toncenter returns amounts as strings, older nodes as numbers
std::string amountField(const json& object, const char* key) {
    if (!object.is_object() || !object.contains(key)) {
        return "0";
    }
    const json& value = object[key];
    if (value.is_string()) {
        return value.get<std::string>().empty() ? "0" : value.get<std::string>();
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<uint64_t>());
    }
    return "0";
}

// Message endpoints are either a plain address string or {account_address: ...}
std::string messageAddress(const json& message, const char* key) {
    if (!message.contains(key)) {
        return std::string();
    }
    const json& value = message[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_object() && value.contains("account_address") && value["account_address"].is_string()) {
        return value["account_address"].get<std::string>();
    }
    return std::string();
}

std::optional<std::string> messageText(const json& message) {
    if (message.contains("message") && message["message"].is_string() &&
        !message["message"].get<std::string>().empty()) {
        return message["message"].get<std::string>();
    }
    return std::nullopt;
}

bool parseTransaction(const json& tx, const std::string& wallet, Vault::TransactionHistoryEntry& entry) {
    const json outMsgs = tx.contains("out_msgs") && tx["out_msgs"].is_array() ? tx["out_msgs"] : json::array();
    const json inMsg = tx.contains("in_msg") && tx["in_msg"].is_object() ? tx["in_msg"] : json::object();

    if (!outMsgs.empty() && outMsgs[0].is_object()) {
        const json& outMsg = outMsgs[0];
        entry.direction = Vault::TransferDirection::Send;
        entry.amount = amountField(outMsg, "value");
        entry.from = wallet;
        entry.to = messageAddress(outMsg, "destination");
        entry.message = messageText(outMsg);
    } else if (!messageAddress(inMsg, "source").empty()) {
        entry.direction = Vault::TransferDirection::Receive;
        entry.amount = amountField(inMsg, "value");
        entry.from = messageAddress(inMsg, "source");
        entry.to = wallet;
        entry.message = messageText(inMsg);
    } else {
        // External messages without a source carry no transfer
        return false;
    }

    if (entry.to.empty()) {
        entry.to = "unknown";
    }

    const json::json_pointer hashPath("/transaction_id/hash");
    if (tx.contains(hashPath) && tx[hashPath].is_string()) {
        entry.hash = tx[hashPath].get<std::string>();
    }
    if (tx.contains("utime") && tx["utime"].is_number()) {
        entry.timestamp = tx["utime"].get<int64_t>();
    }
    entry.fee = amountField(tx, "fee");
    entry.status = Vault::TransactionStatus::Confirmed;
    return true;
}

} // namespace

TonSigner::TonSigner(Chains::TonConfig config, Transport::ChainTransport& transport, Clock clock)
    : m_config(std::move(config)), m_transport(transport), m_clock(clock ? std::move(clock) : Clock(systemClock)) {}

Result<json> TonSigner::apiCall(const std::string& network, const std::string& endpoint,
                                const Transport::QueryParams& query) {
    auto baseUrl = Chains::EndpointFor(m_config.apiUrls, network);
    if (!baseUrl) {
        return Vault::Forward<json>(baseUrl);
    }

    auto response = m_transport.Get(*baseUrl + endpoint, query);
    if (!response) {
        return response;
    }
    if (!response->is_object() || !response->contains("ok") || !(*response)["ok"].is_boolean() ||
        !(*response)["ok"].get<bool>()) {
        std::string error = "API call failed";
        if (response->is_object() && response->contains("error") && (*response)["error"].is_string()) {
            error = (*response)["error"].get<std::string>();
        }
        return Result<json>(ErrorCode::RPCError, error);
    }
    return Result<json>((*response)["result"]);
}

Result<std::string> TonSigner::GetAddressFromPrivateKey(const Crypto::SecureBytes& privateKey) const {
    return AddressDerivation::DeriveTonAddress(privateKey.bytes());
}

Result<json> TonSigner::GetAccountInfo(const std::string& address, const std::string& network) {
    return apiCall(network, "/getAddressInformation", {{"address", address}});
}

std::string TonSigner::GetBalance(const std::string& address, const std::string& network) {
    auto info = GetAccountInfo(address, network);
    if (!info) {
        VAULT_LOG_WARNING(COMPONENT, "Balance lookup failed", address);
        return "0";
    }
    return amountField(*info, "balance");
}

Result<uint32_t> TonSigner::GetSeqno(const std::string& address, const std::string& network) {
    auto result = apiCall(network, "/runGetMethod", {{"address", address}, {"method", "seqno"}, {"stack", ""}});
    if (!result) {
        return Vault::Forward<uint32_t>(result);
    }

    const json::json_pointer seqnoPath("/stack/0/1");
    if (!result->is_object() || !result->contains(seqnoPath)) {
        return Result<uint32_t>(0u);
    }

    const json& value = (*result)[seqnoPath];
    uint64_t seqno = 0;
    if (!value.is_string() || !Codec::HexQuantityToUInt(value.get<std::string>(), seqno) || seqno > UINT32_MAX) {
        return Result<uint32_t>(ErrorCode::RPCError, "Malformed seqno stack entry");
    }
    return Result<uint32_t>(static_cast<uint32_t>(seqno));
}

Result<SignedTransaction> TonSigner::SignTransferWithSeqno(const TransferRequest& request, uint32_t seqno,
                                                           const Crypto::SecureBytes& privateKey) const {
    Crypto::SecureBytes seed;
    if (!Crypto::Ed25519SeedFromSecret(privateKey.bytes(), seed)) {
        return Result<SignedTransaction>(ErrorCode::InvalidPrivateKeyLength, "TON secret key must be 32 or 64 bytes");
    }

    auto destination = AddressDerivation::ParseTonAddress(request.to);
    if (!destination) {
        return Vault::Forward<SignedTransaction>(destination);
    }

    CellBuilder internal;
    internal.WriteBit(false)  // ihr_disabled
        .WriteBit(true)       // bounce
        .WriteBit(false)      // bounced
        .WriteAddressNone()   // src, filled in by the wallet contract
        .WriteAddress(*destination);
    if (!internal.WriteCoins(request.amount)) {
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Invalid nanoton amount: " + request.amount);
    }
    internal.WriteBit(false)            // ihr_fee
        .WriteCoins(std::vector<uint8_t>())  // fwd_fee
        .WriteUint(0, 64)               // created_lt
        .WriteUint(0, 32)               // created_at
        .WriteBit(false)                // state_init
        .WriteBit(request.comment.has_value());

    if (request.comment) {
        internal.WriteUint(0, 32);  // text comment opcode
        const std::string& comment = *request.comment;
        internal.WriteBytes(reinterpret_cast<const uint8_t*>(comment.data()), comment.size());
    }

    const int64_t validUntil = m_clock() + MESSAGE_TTL;

    CellBuilder signing;
    signing.WriteUint(WALLET_ID, 32)
        .WriteUint(static_cast<uint64_t>(validUntil), 32)
        .WriteUint(seqno, 32)
        .WriteUint(0, 8)  // op: simple send
        .WriteUint(SEND_MODE, 8)
        .WriteRef(internal);

    const std::vector<uint8_t> signingBytes = signing.Build();
    std::array<uint8_t, 32> digest;
    if (!Crypto::SHA256(signingBytes.data(), signingBytes.size(), digest)) {
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Failed to hash signing message");
    }

    std::vector<uint8_t> signature;
    if (!Crypto::Ed25519Sign(seed.bytes(), digest.data(), digest.size(), signature)) {
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "ed25519 signing failed");
    }

    CellBuilder external;
    external.WriteBytes(signature).WriteBytes(signingBytes);
    const std::vector<uint8_t> externalBytes = external.Build();

    std::array<uint8_t, 32> hash;
    if (!Crypto::SHA256(externalBytes.data(), externalBytes.size(), hash)) {
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Failed to hash external message");
    }

    SignedTransaction signedTx;
    signedTx.boc = Codec::Base64Encode(externalBytes);
    signedTx.hash = Codec::BytesToHex(hash.data(), hash.size());
    signedTx.seqno = seqno;
    return Result<SignedTransaction>(std::move(signedTx));
}

Result<SignedTransaction> TonSigner::SignTransaction(const TransferRequest& request,
                                                     const Crypto::SecureBytes& privateKey) {
    VAULT_SCOPED_LOG(COMPONENT, "SignTransaction");
    _scopedLogger.addContext("network", request.network);

    auto from = GetAddressFromPrivateKey(privateKey);
    if (!from) {
        _scopedLogger.failure(from.errorMessage);
        return Vault::Forward<SignedTransaction>(from);
    }

    auto seqno = GetSeqno(*from, request.network);
    if (!seqno) {
        _scopedLogger.failure(seqno.errorMessage);
        return Vault::Forward<SignedTransaction>(seqno);
    }
    _scopedLogger.addContext("seqno", std::to_string(*seqno));

    auto signedTx = SignTransferWithSeqno(request, *seqno, privateKey);
    if (signedTx) {
        _scopedLogger.success(signedTx->hash);
    } else {
        _scopedLogger.failure(signedTx.errorMessage);
    }
    return signedTx;
}

Result<Vault::BroadcastResult> TonSigner::SignAndSendTransaction(const TransferRequest& request,
                                                                 const Crypto::SecureBytes& privateKey) {
    auto signedTx = SignTransaction(request, privateKey);
    if (!signedTx) {
        return Vault::Forward<Vault::BroadcastResult>(signedTx);
    }

    auto baseUrl = Chains::EndpointFor(m_config.apiUrls, request.network);
    if (!baseUrl) {
        return Vault::Forward<Vault::BroadcastResult>(baseUrl);
    }

    auto response = m_transport.Post(*baseUrl + "/sendBoc", {{"boc", signedTx->boc}});
    if (!response) {
        VAULT_LOG_ERROR(COMPONENT, "sendBoc failed", response.errorMessage);
        return Vault::Forward<Vault::BroadcastResult>(response);
    }

    const bool accepted = response->is_object() && response->contains("ok") && (*response)["ok"].is_boolean() &&
                          (*response)["ok"].get<bool>();
    if (!accepted) {
        std::string error;
        if (response->is_object() && response->contains("error") && (*response)["error"].is_string()) {
            error = (*response)["error"].get<std::string>();
        }
        VAULT_LOG_WARNING(COMPONENT, "sendBoc not accepted", error);
        return Result<Vault::BroadcastResult>(
            Vault::BroadcastResult(signedTx->hash, Vault::TransactionStatus::Failed, error));
    }

    VAULT_LOG_INFO(COMPONENT, "BOC submitted", signedTx->hash);
    return Result<Vault::BroadcastResult>(Vault::BroadcastResult(signedTx->hash, Vault::TransactionStatus::Pending));
}

Result<std::string> TonSigner::SignMessage(const std::string& message, const Crypto::SecureBytes& privateKey) const {
    Crypto::SecureBytes seed;
    if (!Crypto::Ed25519SeedFromSecret(privateKey.bytes(), seed)) {
        return Result<std::string>(ErrorCode::InvalidPrivateKeyLength, "TON secret key must be 32 or 64 bytes");
    }

    std::vector<uint8_t> signature;
    if (!Crypto::Ed25519Sign(seed.bytes(), reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                             signature)) {
        return Result<std::string>(ErrorCode::InvalidArgument, "ed25519 signing failed");
    }
    return Result<std::string>(Codec::BytesToHex(signature));
}

std::vector<Vault::TransactionHistoryEntry> TonSigner::GetTransactionHistory(const std::string& address,
                                                                             const std::string& network,
                                                                             const Vault::HistoryOptions& options) {
    auto result = apiCall(network, "/getTransactions", {{"address", address}, {"limit", std::to_string(options.limit)}});
    if (!result || !result->is_array()) {
        VAULT_LOG_WARNING(COMPONENT, "History lookup failed", address);
        return {};
    }

    std::vector<Vault::TransactionHistoryEntry> entries;
    for (const auto& tx : *result) {
        Vault::TransactionHistoryEntry entry;
        try {
            if (tx.is_object() && parseTransaction(tx, address, entry)) {
                entries.push_back(std::move(entry));
            }
        } catch (const json::exception& e) {
            VAULT_LOG_WARNING(COMPONENT, "Skipping malformed transaction", e.what());
        }
    }
    if (entries.size() > options.limit) {
        entries.resize(options.limit);
    }
    return entries;
}

} // namespace Ton
