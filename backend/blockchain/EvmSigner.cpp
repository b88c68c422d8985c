#include "include/EvmSigner.h"
#include "AddressDerivation.h"
#include "ByteCodec.h"
#include "RLPEncoder.h"
#include "Vault/Logger.h"

#include <algorithm>
#include <cctype>
#include <future>
#include <map>

using json = nlohmann::json;
using Vault::ErrorCode;
using Vault::Result;

namespace EVM {

namespace {

const char* const COMPONENT = "EvmSigner";

// "0x" hex passes through, base-10 text is converted, empty means zero
bool toQuantity(const std::string& text, std::string& hex) {
    if (text.empty()) {
        hex = "0x0";
        return true;
    }
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        if (!Codec::IsHexString(text.substr(2))) {
            return false;
        }
        hex = text.size() == 2 ? "0x0" : text;
        return true;
    }
    return Codec::DecimalToHexQuantity(text, hex);
}

bool encodeQuantityField(const std::string& text, std::vector<uint8_t>& out) {
    std::string hex;
    return toQuantity(text, hex) && RLP::Encoder::EncodeQuantity(hex, out);
}

std::vector<uint8_t> encodeSignatureInt(const std::vector<uint8_t>& component) {
    return RLP::Encoder::EncodeBytes(RLP::Encoder::TrimLeadingZeros(component));
}

// 0x || r || s || v, v = 27 + recovery id
Result<std::string> signDigestForMessage(const std::array<uint8_t, 32>& digest,
                                         const Crypto::SecureBytes& privateKey) {
    Crypto::RecoverableSignature signature;
    if (!Crypto::SignHashRecoverable(privateKey.bytes(), digest, signature)) {
        return Result<std::string>(ErrorCode::InvalidArgument, "ECDSA signing failed");
    }
    std::vector<uint8_t> encoded;
    encoded.reserve(65);
    encoded.insert(encoded.end(), signature.r.begin(), signature.r.end());
    encoded.insert(encoded.end(), signature.s.begin(), signature.s.end());
    encoded.push_back(static_cast<uint8_t>(27 + signature.recovery_id));
    return Result<std::string>("0x" + Codec::BytesToHex(encoded));
}

std::string topicToAddress(const std::string& topic) {
    std::string clean = Codec::StripHexPrefix(topic);
    if (clean.size() > 40) {
        clean = clean.substr(clean.size() - 40);
    }
    std::transform(clean.begin(), clean.end(), clean.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "0x" + clean;
}

bool parseTransferLog(const json& log, Vault::TransferDirection direction,
                      Vault::TransactionHistoryEntry& entry) {
    if (!log.is_object() || !log.contains("topics") || !log["topics"].is_array() ||
        log["topics"].size() < 3) {
        return false;
    }

    entry.hash = log.value("transactionHash", "");
    entry.direction = direction;
    entry.from = topicToAddress(log["topics"][1].get<std::string>());
    entry.to = topicToAddress(log["topics"][2].get<std::string>());
    entry.tokenAddress = log.value("address", "");
    entry.status = Vault::TransactionStatus::Confirmed;

    if (!Codec::HexQuantityToDecimal(log.value("data", "0x0"), entry.amount)) {
        return false;
    }

    uint64_t blockNumber = 0;
    if (Codec::HexQuantityToUInt(log.value("blockNumber", "0x0"), blockNumber)) {
        entry.blockNumber = blockNumber;
    }
    return true;
}

} // namespace

EvmSigner::EvmSigner(Chains::EvmConfig config, Transport::ChainTransport& transport)
    : m_config(std::move(config)), m_transport(transport) {}

bool EvmSigner::IsLegacyChain(uint64_t chainId) const {
    return m_config.legacyChainIds.count(chainId) != 0;
}

Result<json> EvmSigner::rpcCall(uint64_t chainId, const std::string& method, const json& params) {
    auto it = m_config.rpcUrls.find(chainId);
    if (it == m_config.rpcUrls.end() || it->second.empty()) {
        return Result<json>(ErrorCode::UnsupportedChainId,
                            "Unsupported chain ID: " + std::to_string(chainId));
    }

    Transport::RpcRequest request;
    request.url = it->second;
    request.method = method;
    request.params = params;
    return m_transport.Call(request);
}

// === Node queries ===

Result<uint64_t> EvmSigner::GetNonce(uint64_t chainId, const std::string& address) {
    auto result = rpcCall(chainId, "eth_getTransactionCount", json::array({address, "pending"}));
    if (!result) {
        return Vault::Forward<uint64_t>(result);
    }

    uint64_t nonce = 0;
    if (!result->is_string() || !Codec::HexQuantityToUInt(result->get<std::string>(), nonce)) {
        return Result<uint64_t>(ErrorCode::RPCError, "Malformed eth_getTransactionCount result");
    }
    return Result<uint64_t>(nonce);
}

Result<std::string> EvmSigner::GetGasPrice(uint64_t chainId) {
    auto result = rpcCall(chainId, "eth_gasPrice", json::array());
    if (!result) {
        return Vault::Forward<std::string>(result);
    }
    if (!result->is_string()) {
        return Result<std::string>(ErrorCode::RPCError, "Malformed eth_gasPrice result");
    }
    return Result<std::string>(result->get<std::string>());
}

FeeData EvmSigner::GetFeeData(uint64_t chainId) {
    auto gasPriceFuture = std::async(std::launch::async, [this, chainId] { return GetGasPrice(chainId); });
    auto priorityFuture = std::async(std::launch::async, [this, chainId] {
        return rpcCall(chainId, "eth_maxPriorityFeePerGas", json::array());
    });

    auto gasPrice = gasPriceFuture.get();
    auto priority = priorityFuture.get();

    FeeData fees;
    fees.maxFeePerGas = DEFAULT_PRIORITY_FEE;
    fees.maxPriorityFeePerGas = DEFAULT_PRIORITY_FEE;

    std::string priorityHex = DEFAULT_PRIORITY_FEE;
    if (priority && priority->is_string()) {
        priorityHex = priority->get<std::string>();
    }

    uint64_t base = 0;
    uint64_t tip = 0;
    if (!gasPrice || !Codec::HexQuantityToUInt(*gasPrice, base) ||
        !Codec::HexQuantityToUInt(priorityHex, tip)) {
        VAULT_LOG_WARNING(COMPONENT, "Fee data unavailable, using 1 gwei",
                          "chain " + std::to_string(chainId));
        return fees;
    }

    fees.maxFeePerGas = Codec::UIntToHexQuantity(base * 2 + tip);
    fees.maxPriorityFeePerGas = priorityHex;
    return fees;
}

std::string EvmSigner::EstimateGas(uint64_t chainId, const std::string& from, const std::string& to,
                                   const std::string& value, const std::string& data) {
    json call = {{"from", from},
                 {"to", to},
                 {"value", value.empty() ? "0x0" : value},
                 {"data", data.empty() ? "0x" : data}};

    auto result = rpcCall(chainId, "eth_estimateGas", json::array({call}));
    uint64_t gas = 0;
    if (!result || !result->is_string() || !Codec::HexQuantityToUInt(result->get<std::string>(), gas)) {
        return DEFAULT_GAS_LIMIT;
    }

    // 20% margin, rounded up
    return Codec::UIntToHexQuantity((gas * 6 + 4) / 5);
}

Result<std::string> EvmSigner::SendRawTransaction(uint64_t chainId, const std::string& rawTransaction) {
    auto result = rpcCall(chainId, "eth_sendRawTransaction", json::array({rawTransaction}));
    if (!result) {
        return Vault::Forward<std::string>(result);
    }
    if (!result->is_string()) {
        return Result<std::string>(ErrorCode::RPCError, "Malformed eth_sendRawTransaction result");
    }
    return Result<std::string>(result->get<std::string>());
}

Result<json> EvmSigner::GetTransactionReceipt(uint64_t chainId, const std::string& txHash) {
    auto result = rpcCall(chainId, "eth_getTransactionReceipt", json::array({txHash}));
    if (!result) {
        return result;
    }
    if (!result->is_null() && !result->is_object()) {
        return Result<json>(ErrorCode::RPCError, "Malformed eth_getTransactionReceipt result");
    }
    return result;
}

std::string EvmSigner::GetBalance(const std::string& address, uint64_t chainId) {
    auto result = rpcCall(chainId, "eth_getBalance", json::array({address, "latest"}));
    std::string balance;
    if (!result || !result->is_string() || !Codec::HexQuantityToDecimal(result->get<std::string>(), balance)) {
        VAULT_LOG_WARNING(COMPONENT, "Balance lookup failed", address);
        return "0";
    }
    return balance;
}

std::string EvmSigner::GetTokenBalance(const std::string& tokenAddress, const std::string& walletAddress,
                                       uint64_t chainId) {
    // balanceOf(address)
    const std::string data = "0x70a08231" + Codec::PadLeftHex(walletAddress, 64);
    json call = {{"to", tokenAddress}, {"data", data}};

    auto result = rpcCall(chainId, "eth_call", json::array({call, "latest"}));
    std::string balance;
    if (!result || !result->is_string() || !Codec::HexQuantityToDecimal(result->get<std::string>(), balance)) {
        VAULT_LOG_WARNING(COMPONENT, "Token balance lookup failed", tokenAddress);
        return "0";
    }
    return balance;
}

std::vector<Vault::TransactionHistoryEntry> EvmSigner::GetTransactionHistory(const std::string& address,
                                                                             uint64_t chainId,
                                                                             const Vault::HistoryOptions& options) {
    std::string padded = Codec::PadLeftHex(address, 64);
    std::transform(padded.begin(), padded.end(), padded.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    padded = "0x" + padded;

    std::vector<Vault::TransactionHistoryEntry> entries;

    auto fetch = [&](const json& topics, Vault::TransferDirection direction) {
        json filter = {{"fromBlock", "earliest"}, {"toBlock", "latest"}, {"topics", topics}};
        if (options.tokenAddress) {
            filter["address"] = *options.tokenAddress;
        }

        auto logs = rpcCall(chainId, "eth_getLogs", json::array({filter}));
        if (!logs || !logs->is_array()) {
            return false;
        }
        for (const auto& log : *logs) {
            Vault::TransactionHistoryEntry entry;
            if (parseTransferLog(log, direction, entry)) {
                entries.push_back(std::move(entry));
            }
        }
        return true;
    };

    try {
        const bool received = fetch(json::array({TRANSFER_EVENT_TOPIC, nullptr, padded}),
                                    Vault::TransferDirection::Receive);
        const bool sent = received && fetch(json::array({TRANSFER_EVENT_TOPIC, padded, nullptr}),
                                            Vault::TransferDirection::Send);
        if (!sent) {
            VAULT_LOG_WARNING(COMPONENT, "Transfer log query failed", address);
            return {};
        }
    } catch (const json::exception& e) {
        VAULT_LOG_WARNING(COMPONENT, "Malformed transfer log", e.what());
        return {};
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const Vault::TransactionHistoryEntry& a, const Vault::TransactionHistoryEntry& b) {
                         return a.blockNumber.value_or(0) > b.blockNumber.value_or(0);
                     });
    if (entries.size() > options.limit) {
        entries.resize(options.limit);
    }

    // One block lookup per distinct block; a failed lookup leaves the timestamp unset
    std::map<uint64_t, std::optional<int64_t>> blockTimes;
    for (auto& entry : entries) {
        if (!entry.blockNumber) {
            continue;
        }
        auto cached = blockTimes.find(*entry.blockNumber);
        if (cached == blockTimes.end()) {
            cached = blockTimes.emplace(*entry.blockNumber, GetBlockTimestamp(chainId, *entry.blockNumber)).first;
        }
        entry.timestamp = cached->second;
    }
    return entries;
}

std::optional<int64_t> EvmSigner::GetBlockTimestamp(uint64_t chainId, uint64_t blockNumber) {
    auto block = rpcCall(chainId, "eth_getBlockByNumber",
                         json::array({Codec::UIntToHexQuantity(blockNumber), false}));
    if (!block || !block->is_object() || !block->contains("timestamp") || !(*block)["timestamp"].is_string()) {
        return std::nullopt;
    }

    uint64_t timestamp = 0;
    if (!Codec::HexQuantityToUInt((*block)["timestamp"].get<std::string>(), timestamp)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(timestamp);
}

// === Signing ===

Result<std::string> EvmSigner::GetAddressFromPrivateKey(const Crypto::SecureBytes& privateKey) const {
    return AddressDerivation::DeriveEvmAddress(privateKey.bytes());
}

Result<SignedTransaction> EvmSigner::SignTransaction(const TransactionRequest& tx,
                                                     const Crypto::SecureBytes& privateKey) {
    VAULT_SCOPED_LOG(COMPONENT, "SignTransaction");
    _scopedLogger.addContext("chainId", std::to_string(tx.chainId));

    auto from = GetAddressFromPrivateKey(privateKey);
    if (!from) {
        _scopedLogger.failure(from.errorMessage);
        return Vault::Forward<SignedTransaction>(from);
    }

    uint64_t nonce = 0;
    if (tx.nonce) {
        nonce = *tx.nonce;
    } else {
        auto fetched = GetNonce(tx.chainId, *from);
        if (!fetched) {
            _scopedLogger.failure(fetched.errorMessage);
            return Vault::Forward<SignedTransaction>(fetched);
        }
        nonce = *fetched;
    }

    const bool eip1559 = tx.maxFeePerGas.has_value() || (!tx.gasPrice && !IsLegacyChain(tx.chainId));

    std::string gasPrice = tx.gasPrice.value_or("");
    std::string maxFeePerGas = tx.maxFeePerGas.value_or("");
    std::string maxPriorityFeePerGas = tx.maxPriorityFeePerGas.value_or("");

    if (eip1559 && !tx.maxFeePerGas) {
        FeeData fees = GetFeeData(tx.chainId);
        maxFeePerGas = fees.maxFeePerGas;
        maxPriorityFeePerGas = fees.maxPriorityFeePerGas;
    } else if (!eip1559 && !tx.gasPrice) {
        auto fetched = GetGasPrice(tx.chainId);
        if (!fetched) {
            _scopedLogger.failure(fetched.errorMessage);
            return Vault::Forward<SignedTransaction>(fetched);
        }
        gasPrice = *fetched;
    }

    std::string value;
    if (!toQuantity(tx.value, value)) {
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Invalid transaction value");
    }

    std::string gasLimit = tx.gasLimit.value_or("");
    if (gasLimit.empty()) {
        gasLimit = EstimateGas(tx.chainId, *from, tx.to, value, tx.data);
    }

    // Shared fields
    std::vector<uint8_t> gasLimitField, toField, valueField, dataField;
    if (!encodeQuantityField(gasLimit, gasLimitField) || !RLP::Encoder::EncodeHex(tx.to, toField) ||
        !encodeQuantityField(value, valueField) || !RLP::Encoder::EncodeHex(tx.data, dataField)) {
        _scopedLogger.failure("Malformed transaction field");
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Malformed transaction field");
    }

    std::vector<std::vector<uint8_t>> fields;
    std::vector<uint8_t> preimage;

    if (eip1559) {
        std::vector<uint8_t> priorityField, maxFeeField;
        if (!encodeQuantityField(maxPriorityFeePerGas, priorityField) ||
            !encodeQuantityField(maxFeePerGas, maxFeeField)) {
            return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Malformed fee field");
        }
        fields = {RLP::Encoder::EncodeUInt(tx.chainId),
                  RLP::Encoder::EncodeUInt(nonce),
                  priorityField,
                  maxFeeField,
                  gasLimitField,
                  toField,
                  valueField,
                  dataField,
                  RLP::Encoder::EncodeList({})};
        preimage.push_back(0x02);
    } else {
        std::vector<uint8_t> gasPriceField;
        if (!encodeQuantityField(gasPrice, gasPriceField)) {
            return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Malformed gas price");
        }
        // EIP-155 replay protection: chainId, 0, 0
        fields = {RLP::Encoder::EncodeUInt(nonce),
                  gasPriceField,
                  gasLimitField,
                  toField,
                  valueField,
                  dataField,
                  RLP::Encoder::EncodeUInt(tx.chainId),
                  RLP::Encoder::EncodeUInt(0),
                  RLP::Encoder::EncodeUInt(0)};
    }

    const std::vector<uint8_t> unsignedList = RLP::Encoder::EncodeList(fields);
    preimage.insert(preimage.end(), unsignedList.begin(), unsignedList.end());

    std::array<uint8_t, 32> digest;
    Crypto::RecoverableSignature signature;
    if (!Crypto::Keccak256(preimage.data(), preimage.size(), digest) ||
        !Crypto::SignHashRecoverable(privateKey.bytes(), digest, signature)) {
        _scopedLogger.failure("ECDSA signing failed");
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "ECDSA signing failed");
    }

    SignedTransaction signedTx;
    signedTx.eip1559 = eip1559;

    std::vector<uint8_t> raw;
    if (eip1559) {
        fields.push_back(RLP::Encoder::EncodeUInt(static_cast<uint64_t>(signature.recovery_id)));
        raw.push_back(0x02);
    } else {
        // legacy chain ids stay far below 2^63
        fields.resize(6);
        fields.push_back(RLP::Encoder::EncodeUInt(tx.chainId * 2 + 35 + static_cast<uint64_t>(signature.recovery_id)));
    }
    fields.push_back(encodeSignatureInt(signature.r));
    fields.push_back(encodeSignatureInt(signature.s));

    const std::vector<uint8_t> signedList = RLP::Encoder::EncodeList(fields);
    raw.insert(raw.end(), signedList.begin(), signedList.end());

    std::array<uint8_t, 32> txHash;
    if (!Crypto::Keccak256(raw.data(), raw.size(), txHash)) {
        return Result<SignedTransaction>(ErrorCode::TransactionCreationFailed, "Failed to hash transaction");
    }

    signedTx.rawTransaction = "0x" + Codec::BytesToHex(raw);
    signedTx.transactionHash = "0x" + Codec::BytesToHex(txHash.data(), txHash.size());

    _scopedLogger.success(signedTx.transactionHash);
    return Result<SignedTransaction>(std::move(signedTx));
}

Result<Vault::BroadcastResult> EvmSigner::SignAndSendTransaction(const TransactionRequest& tx,
                                                                 const Crypto::SecureBytes& privateKey) {
    auto signedTx = SignTransaction(tx, privateKey);
    if (!signedTx) {
        return Vault::Forward<Vault::BroadcastResult>(signedTx);
    }

    auto txHash = SendRawTransaction(tx.chainId, signedTx->rawTransaction);
    if (!txHash) {
        VAULT_LOG_ERROR(COMPONENT, "eth_sendRawTransaction failed", txHash.errorMessage);
        return Vault::Forward<Vault::BroadcastResult>(txHash);
    }

    VAULT_LOG_INFO(COMPONENT, "Transaction submitted", *txHash);
    return Result<Vault::BroadcastResult>(
        Vault::BroadcastResult(*txHash, Vault::TransactionStatus::Pending));
}

Result<std::string> EvmSigner::SignMessage(const std::string& message,
                                           const Crypto::SecureBytes& privateKey) const {
    if (privateKey.size() != 32) {
        return Result<std::string>(ErrorCode::InvalidPrivateKeyLength, "secp256k1 private key must be 32 bytes");
    }

    const std::string prefixed = "\x19" "Ethereum Signed Message:\n" + std::to_string(message.size()) + message;
    std::array<uint8_t, 32> digest;
    if (!Crypto::Keccak256(reinterpret_cast<const uint8_t*>(prefixed.data()), prefixed.size(), digest)) {
        return Result<std::string>(ErrorCode::InvalidArgument, "Failed to hash message");
    }
    return signDigestForMessage(digest, privateKey);
}

Result<std::string> EvmSigner::SignTypedData(const std::string& typedDataJson,
                                             const Crypto::SecureBytes& privateKey) const {
    if (privateKey.size() != 32) {
        return Result<std::string>(ErrorCode::InvalidPrivateKeyLength, "secp256k1 private key must be 32 bytes");
    }

    // ordered_json keeps keys in document order so dump() matches the input layout
    nlohmann::ordered_json typedData = nlohmann::ordered_json::parse(typedDataJson, nullptr, false);
    if (typedData.is_discarded() || !typedData.is_object() || !typedData.contains("domain") ||
        !typedData.contains("message")) {
        return Result<std::string>(ErrorCode::InvalidArgument, "Typed data needs domain and message objects");
    }

    const std::string domain = typedData["domain"].dump();
    const std::string message = typedData["message"].dump();

    std::array<uint8_t, 32> domainSeparator;
    std::array<uint8_t, 32> structHash;
    if (!Crypto::Keccak256(reinterpret_cast<const uint8_t*>(domain.data()), domain.size(), domainSeparator) ||
        !Crypto::Keccak256(reinterpret_cast<const uint8_t*>(message.data()), message.size(), structHash)) {
        return Result<std::string>(ErrorCode::InvalidArgument, "Failed to hash typed data");
    }

    std::vector<uint8_t> combined = {0x19, 0x01};
    combined.insert(combined.end(), domainSeparator.begin(), domainSeparator.end());
    combined.insert(combined.end(), structHash.begin(), structHash.end());

    std::array<uint8_t, 32> digest;
    if (!Crypto::Keccak256(combined.data(), combined.size(), digest)) {
        return Result<std::string>(ErrorCode::InvalidArgument, "Failed to hash typed data");
    }
    return signDigestForMessage(digest, privateKey);
}

} // namespace EVM
