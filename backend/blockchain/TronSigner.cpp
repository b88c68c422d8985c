#include "include/TronSigner.h"
#include "AddressDerivation.h"
#include "ByteCodec.h"
#include "Vault/Logger.h"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;
using Vault::ErrorCode;
using Vault::Result;

namespace Tron {

namespace {

const char* const COMPONENT = "TronSigner";

Result<std::string> invalidKeyLength() {
    return Result<std::string>(ErrorCode::InvalidPrivateKeyLength, "secp256k1 private key must be 32 bytes");
}

// r || s || v as hex, v = 27 + recovery id
bool signDigest(const std::array<uint8_t, 32>& digest, const Crypto::SecureBytes& privateKey,
                std::string& signatureHex) {
    Crypto::RecoverableSignature signature;
    if (!Crypto::SignHashRecoverable(privateKey.bytes(), digest, signature)) {
        return false;
    }
    std::vector<uint8_t> encoded;
    encoded.reserve(65);
    encoded.insert(encoded.end(), signature.r.begin(), signature.r.end());
    encoded.insert(encoded.end(), signature.s.begin(), signature.s.end());
    encoded.push_back(static_cast<uint8_t>(27 + signature.recovery_id));
    signatureHex = Codec::BytesToHex(encoded);
    return true;
}

// 20-byte account id of an address, left-padded to one ABI word
Result<std::string> addressWord(const std::string& address) {
    auto hex = AddressDerivation::TronAddressToHex(address);
    if (!hex) {
        return hex;
    }
    if (hex->size() != 42 || !Codec::IsHexString(*hex)) {
        return Result<std::string>(ErrorCode::InvalidAddressChecksum, "Invalid TRON address: " + address);
    }
    return Result<std::string>(Codec::PadLeftHex(hex->substr(2), 64));
}

// Node messages arrive hex-encoded; fall back to the raw text if they are not
std::string decodeNodeMessage(const std::string& message) {
    std::vector<uint8_t> bytes;
    if (message.empty() || message.size() % 2 != 0 || !Codec::IsHexString(message) ||
        !Codec::HexToBytes(message, bytes)) {
        return message;
    }
    for (uint8_t b : bytes) {
        if (!std::isprint(b) && !std::isspace(b)) {
            return message;
        }
    }
    return std::string(bytes.begin(), bytes.end());
}

std::string toDisplayAddress(const std::string& hexAddress) {
    if (hexAddress.empty() || hexAddress[0] == 'T') {
        return hexAddress;
    }
    auto address = AddressDerivation::TronHexToAddress(hexAddress);
    return address ? *address : hexAddress;
}

std::string stringField(const json& object, const char* key) {
    if (!object.is_object() || !object.contains(key) || !object[key].is_string()) {
        return std::string();
    }
    return object[key].get<std::string>();
}

// Base58 is case-sensitive, so addresses are compared as decoded bytes
bool sameAddress(const std::string& a, const std::string& b) {
    auto hexA = AddressDerivation::TronAddressToHex(a);
    auto hexB = AddressDerivation::TronAddressToHex(b);
    if (hexA && hexB) {
        return *hexA == *hexB;
    }
    return a == b;
}

bool parseTransfer(const json& tx, const std::string& wallet, Vault::TransactionHistoryEntry& entry) {
    const json::json_pointer contractPath("/raw_data/contract/0");
    if (!tx.contains(contractPath) || tx[contractPath].value("type", "") != "TransferContract") {
        return false;
    }

    const json& contract = tx[contractPath];
    const json value = contract.contains("parameter") ? contract["parameter"].value("value", json::object())
                                                      : json::object();

    entry.hash = tx.value("txID", "");
    entry.from = toDisplayAddress(value.value("owner_address", ""));
    entry.to = toDisplayAddress(value.value("to_address", ""));
    entry.amount = std::to_string(value.value("amount", static_cast<uint64_t>(0)));
    if (tx.contains("blockNumber") && tx["blockNumber"].is_number_unsigned()) {
        entry.blockNumber = tx["blockNumber"].get<uint64_t>();
    }
    if (tx.contains("block_timestamp") && tx["block_timestamp"].is_number()) {
        entry.timestamp = tx["block_timestamp"].get<int64_t>() / 1000;
    }
    entry.direction = sameAddress(entry.from, wallet) ? Vault::TransferDirection::Send
                                                      : Vault::TransferDirection::Receive;

    const json::json_pointer retPath("/ret/0/contractRet");
    const bool succeeded = tx.contains(retPath) && tx[retPath] == "SUCCESS";
    entry.status = succeeded ? Vault::TransactionStatus::Confirmed : Vault::TransactionStatus::Failed;
    return !entry.hash.empty();
}

bool parseTrc20Transfer(const json& tx, const std::string& wallet, Vault::TransactionHistoryEntry& entry) {
    entry.hash = tx.value("transaction_id", "");
    entry.from = tx.value("from", "");
    entry.to = tx.value("to", "");
    entry.amount = tx.value("value", "0");
    if (tx.contains("block_timestamp") && tx["block_timestamp"].is_number()) {
        entry.timestamp = tx["block_timestamp"].get<int64_t>() / 1000;
    }
    const json::json_pointer tokenPath("/token_info/address");
    if (tx.contains(tokenPath) && tx[tokenPath].is_string()) {
        entry.tokenAddress = tx[tokenPath].get<std::string>();
    }
    entry.direction = sameAddress(entry.from, wallet) ? Vault::TransferDirection::Send
                                                      : Vault::TransferDirection::Receive;
    entry.status = Vault::TransactionStatus::Confirmed;
    return !entry.hash.empty();
}

} // namespace

TronSigner::TronSigner(Chains::TronConfig config, Transport::ChainTransport& transport)
    : m_config(std::move(config)), m_transport(transport) {}

Result<json> TronSigner::apiCall(const std::string& network, const std::string& endpoint, const json& body) {
    auto baseUrl = Chains::EndpointFor(m_config.apiUrls, network);
    if (!baseUrl) {
        return Vault::Forward<json>(baseUrl);
    }

    auto result = m_transport.Post(*baseUrl + endpoint, body);
    if (!result) {
        return result;
    }
    if (result->is_object() && result->contains("Error")) {
        const json& error = (*result)["Error"];
        return Result<json>(ErrorCode::RPCError, error.is_string() ? error.get<std::string>() : error.dump());
    }
    return result;
}

Result<std::string> TronSigner::GetAddressFromPrivateKey(const Crypto::SecureBytes& privateKey) const {
    return AddressDerivation::DeriveTronAddress(privateKey.bytes());
}

Result<SignedTransaction> TronSigner::signNodeTransaction(const json& transaction,
                                                          const Crypto::SecureBytes& privateKey) const {
    const std::string txID = stringField(transaction, "txID");
    std::vector<uint8_t> txIdBytes;
    if (!Codec::HexToBytes(txID, txIdBytes) || txIdBytes.size() != 32) {
        return Result<SignedTransaction>(ErrorCode::TransactionCreationFailed, "Node returned an invalid txID");
    }

    std::array<uint8_t, 32> digest;
    std::copy(txIdBytes.begin(), txIdBytes.end(), digest.begin());

    // txID is sha256(raw_data); refuse to sign an id that does not match the payload
    if (transaction.contains("raw_data_hex") && transaction["raw_data_hex"].is_string()) {
        std::vector<uint8_t> rawData;
        std::array<uint8_t, 32> expected;
        if (!Codec::HexToBytes(transaction["raw_data_hex"].get<std::string>(), rawData) ||
            !Crypto::SHA256(rawData.data(), rawData.size(), expected) || expected != digest) {
            return Result<SignedTransaction>(ErrorCode::TransactionCreationFailed,
                                             "txID does not match raw_data_hex");
        }
    }

    std::string signature;
    if (!signDigest(digest, privateKey, signature)) {
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "ECDSA signing failed");
    }

    json signedTx = transaction;
    signedTx["signature"] = json::array({signature});

    SignedTransaction result;
    result.rawTransaction = signedTx.dump();
    result.txID = txID;
    result.signature = signature;
    return Result<SignedTransaction>(std::move(result));
}

Result<SignedTransaction> TronSigner::SignTransaction(const TransferRequest& request,
                                                      const Crypto::SecureBytes& privateKey) {
    VAULT_SCOPED_LOG(COMPONENT, "SignTransaction");
    _scopedLogger.addContext("network", request.network);

    auto from = GetAddressFromPrivateKey(privateKey);
    if (!from) {
        _scopedLogger.failure(from.errorMessage);
        return Vault::Forward<SignedTransaction>(from);
    }

    auto ownerHex = AddressDerivation::TronAddressToHex(*from);
    auto toHex = AddressDerivation::TronAddressToHex(request.to);
    if (!ownerHex || !toHex) {
        _scopedLogger.failure("Invalid address");
        return Result<SignedTransaction>(ErrorCode::InvalidAddressChecksum, "Invalid TRON address: " + request.to);
    }

    json body = {{"owner_address", *ownerHex}, {"to_address", *toHex}, {"amount", request.amount}, {"visible", false}};
    auto unsignedTx = apiCall(request.network, "/wallet/createtransaction", body);
    if (!unsignedTx) {
        _scopedLogger.failure(unsignedTx.errorMessage);
        return Vault::Forward<SignedTransaction>(unsignedTx);
    }
    if (!unsignedTx->is_object() || !unsignedTx->contains("txID")) {
        _scopedLogger.failure("No txID in node response");
        return Result<SignedTransaction>(ErrorCode::TransactionCreationFailed, "Failed to create transaction");
    }

    auto signedTx = signNodeTransaction(*unsignedTx, privateKey);
    if (signedTx) {
        _scopedLogger.success(signedTx->txID);
    } else {
        _scopedLogger.failure(signedTx.errorMessage);
    }
    return signedTx;
}

Result<Vault::BroadcastResult> TronSigner::BroadcastTransaction(const json& signedTransaction,
                                                                const std::string& network) {
    auto result = apiCall(network, "/wallet/broadcasttransaction", signedTransaction);
    if (!result) {
        return Vault::Forward<Vault::BroadcastResult>(result);
    }

    const std::string txID = stringField(signedTransaction, "txID");
    if (result->is_object() && result->contains("result") && (*result)["result"].is_boolean() &&
        (*result)["result"].get<bool>()) {
        VAULT_LOG_INFO(COMPONENT, "Transaction broadcast", txID);
        return Result<Vault::BroadcastResult>(Vault::BroadcastResult(txID, Vault::TransactionStatus::Pending));
    }

    std::string message = "Broadcast rejected";
    if (result->is_object()) {
        const std::string code = stringField(*result, "code");
        const std::string detail = decodeNodeMessage(stringField(*result, "message"));
        if (!code.empty() || !detail.empty()) {
            message = code + (code.empty() || detail.empty() ? "" : ": ") + detail;
        }
    }
    VAULT_LOG_ERROR(COMPONENT, "Broadcast rejected", message);
    return Result<Vault::BroadcastResult>(ErrorCode::BroadcastRejected, message);
}

Result<Vault::BroadcastResult> TronSigner::SignAndSendTransaction(const TransferRequest& request,
                                                                  const Crypto::SecureBytes& privateKey) {
    auto signedTx = SignTransaction(request, privateKey);
    if (!signedTx) {
        return Vault::Forward<Vault::BroadcastResult>(signedTx);
    }
    return BroadcastTransaction(json::parse(signedTx->rawTransaction), request.network);
}

Result<SignedTransaction> TronSigner::SignTrc20Transfer(const Trc20TransferRequest& request,
                                                        const Crypto::SecureBytes& privateKey) {
    VAULT_SCOPED_LOG(COMPONENT, "SignTrc20Transfer");
    _scopedLogger.addContext("contract", request.contractAddress);

    auto from = GetAddressFromPrivateKey(privateKey);
    if (!from) {
        _scopedLogger.failure(from.errorMessage);
        return Vault::Forward<SignedTransaction>(from);
    }

    auto toWord = addressWord(request.to);
    auto ownerHex = AddressDerivation::TronAddressToHex(*from);
    auto contractHex = AddressDerivation::TronAddressToHex(request.contractAddress);
    if (!toWord || !ownerHex || !contractHex) {
        _scopedLogger.failure("Invalid address");
        return Result<SignedTransaction>(ErrorCode::InvalidAddressChecksum, "Invalid TRC20 recipient or contract");
    }

    std::vector<uint8_t> amount;
    if (!Codec::DecimalToBytes(request.amount, amount) || amount.size() > 32) {
        _scopedLogger.failure("Invalid amount");
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Invalid token amount: " + request.amount);
    }

    json body = {{"owner_address", *ownerHex},
                 {"contract_address", *contractHex},
                 {"function_selector", "transfer(address,uint256)"},
                 {"parameter", *toWord + Codec::PadLeftHex(Codec::BytesToHex(amount), 64)},
                 {"fee_limit", m_config.trc20FeeLimit},
                 {"call_value", 0},
                 {"visible", false}};

    auto response = apiCall(request.network, "/wallet/triggersmartcontract", body);
    if (!response) {
        _scopedLogger.failure(response.errorMessage);
        return Vault::Forward<SignedTransaction>(response);
    }

    const json::json_pointer txIdPath("/transaction/txID");
    if (!response->is_object() || !response->contains(txIdPath)) {
        const json::json_pointer messagePath("/result/message");
        std::string message = "Failed to create TRC20 transfer";
        if (response->is_object() && response->contains(messagePath) && (*response)[messagePath].is_string()) {
            message = decodeNodeMessage((*response)[messagePath].get<std::string>());
        }
        _scopedLogger.failure(message);
        return Result<SignedTransaction>(ErrorCode::TransactionCreationFailed, message);
    }

    auto signedTx = signNodeTransaction((*response)["transaction"], privateKey);
    if (signedTx) {
        _scopedLogger.success(signedTx->txID);
    } else {
        _scopedLogger.failure(signedTx.errorMessage);
    }
    return signedTx;
}

Result<Vault::BroadcastResult> TronSigner::TransferTrc20(const Trc20TransferRequest& request,
                                                         const Crypto::SecureBytes& privateKey) {
    auto signedTx = SignTrc20Transfer(request, privateKey);
    if (!signedTx) {
        return Vault::Forward<Vault::BroadcastResult>(signedTx);
    }
    return BroadcastTransaction(json::parse(signedTx->rawTransaction), request.network);
}

Result<std::string> TronSigner::SignMessage(const std::string& message,
                                            const Crypto::SecureBytes& privateKey) const {
    if (privateKey.size() != 32) {
        return invalidKeyLength();
    }

    const std::string prefixed = "\x19" "TRON Signed Message:\n" + std::to_string(message.size()) + message;
    std::array<uint8_t, 32> digest;
    if (!Crypto::Keccak256(reinterpret_cast<const uint8_t*>(prefixed.data()), prefixed.size(), digest)) {
        return Result<std::string>(ErrorCode::InvalidArgument, "Failed to hash message");
    }

    std::string signature;
    if (!signDigest(digest, privateKey, signature)) {
        return Result<std::string>(ErrorCode::InvalidArgument, "ECDSA signing failed");
    }
    return Result<std::string>("0x" + signature);
}

Result<json> TronSigner::GetAccount(const std::string& address, const std::string& network) {
    auto hex = AddressDerivation::TronAddressToHex(address);
    if (!hex) {
        return Vault::Forward<json>(hex);
    }
    return apiCall(network, "/wallet/getaccount", {{"address", *hex}, {"visible", false}});
}

std::string TronSigner::GetBalance(const std::string& address, const std::string& network) {
    auto account = GetAccount(address, network);
    if (!account || !account->is_object()) {
        VAULT_LOG_WARNING(COMPONENT, "Balance lookup failed", address);
        return "0";
    }
    // Unactivated accounts come back as an empty object
    if (!account->contains("balance") || !(*account)["balance"].is_number_unsigned()) {
        return "0";
    }
    return std::to_string((*account)["balance"].get<uint64_t>());
}

std::string TronSigner::GetTokenBalance(const std::string& contractAddress, const std::string& walletAddress,
                                        const std::string& network) {
    auto walletHex = AddressDerivation::TronAddressToHex(walletAddress);
    auto contractHex = AddressDerivation::TronAddressToHex(contractAddress);
    auto word = addressWord(walletAddress);
    if (!walletHex || !contractHex || !word) {
        VAULT_LOG_WARNING(COMPONENT, "Invalid address for token balance", walletAddress);
        return "0";
    }

    json body = {{"owner_address", *walletHex},
                 {"contract_address", *contractHex},
                 {"function_selector", "balanceOf(address)"},
                 {"parameter", *word},
                 {"visible", false}};

    auto result = apiCall(network, "/wallet/triggersmartcontract", body);
    std::string balance;
    const json::json_pointer constantPath("/constant_result/0");
    if (!result || !result->is_object() || !result->contains(constantPath) ||
        !(*result)[constantPath].is_string() ||
        !Codec::HexQuantityToDecimal("0x" + (*result)[constantPath].get<std::string>(), balance)) {
        VAULT_LOG_WARNING(COMPONENT, "Token balance lookup failed", contractAddress);
        return "0";
    }
    return balance;
}

std::vector<Vault::TransactionHistoryEntry> TronSigner::GetTransactionHistory(const std::string& address,
                                                                              const std::string& network,
                                                                              const Vault::HistoryOptions& options) {
    auto baseUrl = Chains::EndpointFor(m_config.apiUrls, network);
    if (!baseUrl) {
        VAULT_LOG_WARNING(COMPONENT, "No endpoint for network", network);
        return {};
    }

    const Transport::QueryParams query = {{"limit", std::to_string(options.limit)}, {"only_confirmed", "true"}};
    const std::string accountUrl = *baseUrl + "/v1/accounts/" + address + "/transactions";

    std::vector<Vault::TransactionHistoryEntry> entries;

    // Either listing may fail independently; keep whatever arrived
    auto trx = m_transport.Get(accountUrl, query);
    if (trx && trx->is_object() && trx->contains("data") && (*trx)["data"].is_array()) {
        for (const auto& tx : (*trx)["data"]) {
            Vault::TransactionHistoryEntry entry;
            try {
                if (tx.is_object() && parseTransfer(tx, address, entry)) {
                    entries.push_back(std::move(entry));
                }
            } catch (const json::exception& e) {
                VAULT_LOG_WARNING(COMPONENT, "Skipping malformed TRX transfer", e.what());
            }
        }
    } else {
        VAULT_LOG_WARNING(COMPONENT, "TRX history lookup failed", address);
    }

    auto trc20 = m_transport.Get(accountUrl + "/trc20", query);
    if (trc20 && trc20->is_object() && trc20->contains("data") && (*trc20)["data"].is_array()) {
        for (const auto& tx : (*trc20)["data"]) {
            Vault::TransactionHistoryEntry entry;
            try {
                if (tx.is_object() && parseTrc20Transfer(tx, address, entry)) {
                    entries.push_back(std::move(entry));
                }
            } catch (const json::exception& e) {
                VAULT_LOG_WARNING(COMPONENT, "Skipping malformed TRC20 transfer", e.what());
            }
        }
    } else {
        VAULT_LOG_WARNING(COMPONENT, "TRC20 history lookup failed", address);
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const Vault::TransactionHistoryEntry& a, const Vault::TransactionHistoryEntry& b) {
                         return a.timestamp.value_or(0) > b.timestamp.value_or(0);
                     });
    if (entries.size() > options.limit) {
        entries.resize(options.limit);
    }
    return entries;
}

} // namespace Tron
