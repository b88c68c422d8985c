#include "include/SolanaSigner.h"
#include "AddressDerivation.h"
#include "ByteCodec.h"
#include "Vault/Logger.h"

#include <algorithm>

using json = nlohmann::json;
using Vault::ErrorCode;
using Vault::Result;

namespace Solana {

namespace {

const char* const COMPONENT = "SolanaSigner";
constexpr uint8_t kTransferInstruction = 2;

// System Program id is 32 zero bytes (base58 "1111...1")
const std::vector<uint8_t> SYSTEM_PROGRAM_ID(32, 0);

bool decodePublicKey(const std::string& text, std::vector<uint8_t>& out) {
    return Codec::DecodeBase58(text, out) && out.size() == 32;
}

Result<std::string> invalidKeyLength() {
    return Result<std::string>(ErrorCode::InvalidPrivateKeyLength, "Solana secret key must be 32 or 64 bytes");
}

} // namespace

SolanaSigner::SolanaSigner(Chains::SolanaConfig config, Transport::ChainTransport& transport)
    : m_config(std::move(config)), m_transport(transport) {}

Result<json> SolanaSigner::rpcCall(const std::string& network, const std::string& method, const json& params) {
    auto url = Chains::EndpointFor(m_config.rpcUrls, network);
    if (!url) {
        return Vault::Forward<json>(url);
    }

    Transport::RpcRequest request;
    request.url = *url;
    request.method = method;
    request.params = params;
    return m_transport.Call(request);
}

Result<std::string> SolanaSigner::GetAddressFromPrivateKey(const Crypto::SecureBytes& privateKey) const {
    return AddressDerivation::DeriveSolanaAddress(privateKey.bytes());
}

Result<std::string> SolanaSigner::GetRecentBlockhash(const std::string& network) {
    auto result = rpcCall(network, "getLatestBlockhash", json::array({{{"commitment", "finalized"}}}));
    if (!result) {
        return Vault::Forward<std::string>(result);
    }

    const json& body = *result;
    if (!body.is_object() || !body.contains("value") || !body["value"].is_object() ||
        !body["value"].contains("blockhash") || !body["value"]["blockhash"].is_string()) {
        return Result<std::string>(ErrorCode::RPCError, "Malformed getLatestBlockhash result");
    }
    return Result<std::string>(body["value"]["blockhash"].get<std::string>());
}

Result<std::string> SolanaSigner::SendTransaction(const std::string& rawTransaction, const std::string& network) {
    auto result = rpcCall(network, "sendTransaction", json::array({rawTransaction, {{"encoding", "base64"}}}));
    if (!result) {
        return Vault::Forward<std::string>(result);
    }
    if (!result->is_string()) {
        return Result<std::string>(ErrorCode::RPCError, "Malformed sendTransaction result");
    }
    return Result<std::string>(result->get<std::string>());
}

Result<SignedTransaction> SolanaSigner::SignTransferWithBlockhash(const TransferRequest& request,
                                                                  const std::string& recentBlockhash,
                                                                  const Crypto::SecureBytes& privateKey) const {
    Crypto::SecureBytes seed;
    if (!Crypto::Ed25519SeedFromSecret(privateKey.bytes(), seed)) {
        return Vault::Forward<SignedTransaction>(invalidKeyLength());
    }

    std::vector<uint8_t> fromKey;
    if (!AddressDerivation::Ed25519PublicKeyFromSecret(privateKey.bytes(), fromKey)) {
        return Result<SignedTransaction>(ErrorCode::DerivationFailure, "Failed to derive Solana public key");
    }

    std::vector<uint8_t> toKey;
    if (!decodePublicKey(request.to, toKey)) {
        return Result<SignedTransaction>(ErrorCode::InvalidAddressChecksum, "Invalid recipient address: " + request.to);
    }

    std::vector<uint8_t> blockhash;
    if (!decodePublicKey(recentBlockhash, blockhash)) {
        return Result<SignedTransaction>(ErrorCode::InvalidAddressChecksum, "Invalid recent blockhash");
    }

    // Header: 1 required signature, 0 read-only signed, 1 read-only unsigned (the program)
    std::vector<uint8_t> message = {1, 0, 1};

    Codec::EncodeCompactU16(message, 3);
    message.insert(message.end(), fromKey.begin(), fromKey.end());
    message.insert(message.end(), toKey.begin(), toKey.end());
    message.insert(message.end(), SYSTEM_PROGRAM_ID.begin(), SYSTEM_PROGRAM_ID.end());

    message.insert(message.end(), blockhash.begin(), blockhash.end());

    // Transfer instruction data: u32 LE index || u64 LE lamports
    std::vector<uint8_t> data;
    Codec::WriteUInt32LE(data, kTransferInstruction);
    Codec::WriteUInt64LE(data, request.lamports);

    Codec::EncodeCompactU16(message, 1);
    message.push_back(2);  // program id index
    Codec::EncodeCompactU16(message, 2);
    message.push_back(0);
    message.push_back(1);
    Codec::EncodeCompactU16(message, static_cast<uint16_t>(data.size()));
    message.insert(message.end(), data.begin(), data.end());

    std::vector<uint8_t> signature;
    if (!Crypto::Ed25519Sign(seed.bytes(), message.data(), message.size(), signature)) {
        return Result<SignedTransaction>(ErrorCode::InvalidArgument, "ed25519 signing failed");
    }

    std::vector<uint8_t> transaction;
    transaction.reserve(1 + signature.size() + message.size());
    Codec::EncodeCompactU16(transaction, 1);
    transaction.insert(transaction.end(), signature.begin(), signature.end());
    transaction.insert(transaction.end(), message.begin(), message.end());

    SignedTransaction signedTx;
    signedTx.rawTransaction = Codec::Base64Encode(transaction);
    signedTx.signature = Codec::EncodeBase58(signature);
    return Result<SignedTransaction>(std::move(signedTx));
}

Result<SignedTransaction> SolanaSigner::SignTransaction(const TransferRequest& request,
                                                        const Crypto::SecureBytes& privateKey) {
    VAULT_SCOPED_LOG(COMPONENT, "SignTransaction");
    _scopedLogger.addContext("network", request.network);

    if (privateKey.size() != 32 && privateKey.size() != 64) {
        _scopedLogger.failure("Invalid private key length");
        return Vault::Forward<SignedTransaction>(invalidKeyLength());
    }

    auto blockhash = GetRecentBlockhash(request.network);
    if (!blockhash) {
        _scopedLogger.failure(blockhash.errorMessage);
        return Vault::Forward<SignedTransaction>(blockhash);
    }

    auto signedTx = SignTransferWithBlockhash(request, *blockhash, privateKey);
    if (signedTx) {
        _scopedLogger.success(signedTx->signature);
    } else {
        _scopedLogger.failure(signedTx.errorMessage);
    }
    return signedTx;
}

Result<Vault::BroadcastResult> SolanaSigner::SignAndSendTransaction(const TransferRequest& request,
                                                                    const Crypto::SecureBytes& privateKey) {
    auto signedTx = SignTransaction(request, privateKey);
    if (!signedTx) {
        return Vault::Forward<Vault::BroadcastResult>(signedTx);
    }

    auto signature = SendTransaction(signedTx->rawTransaction, request.network);
    if (!signature) {
        VAULT_LOG_ERROR(COMPONENT, "sendTransaction failed", signature.errorMessage);
        return Vault::Forward<Vault::BroadcastResult>(signature);
    }

    VAULT_LOG_INFO(COMPONENT, "Transaction submitted", *signature);
    return Result<Vault::BroadcastResult>(Vault::BroadcastResult(*signature, Vault::TransactionStatus::Pending));
}

Result<std::string> SolanaSigner::SignMessage(const std::string& message,
                                              const Crypto::SecureBytes& privateKey) const {
    Crypto::SecureBytes seed;
    if (!Crypto::Ed25519SeedFromSecret(privateKey.bytes(), seed)) {
        return invalidKeyLength();
    }

    std::vector<uint8_t> signature;
    if (!Crypto::Ed25519Sign(seed.bytes(), reinterpret_cast<const uint8_t*>(message.data()), message.size(),
                             signature)) {
        return Result<std::string>(ErrorCode::InvalidArgument, "ed25519 signing failed");
    }
    return Result<std::string>(Codec::EncodeBase58(signature));
}

std::string SolanaSigner::GetBalance(const std::string& address, const std::string& network) {
    auto result = rpcCall(network, "getBalance", json::array({address}));
    if (!result || !result->is_object() || !result->contains("value") || !(*result)["value"].is_number_unsigned()) {
        VAULT_LOG_WARNING(COMPONENT, "Balance lookup failed", address);
        return "0";
    }
    return std::to_string((*result)["value"].get<uint64_t>());
}

std::string SolanaSigner::GetTokenBalance(const std::string& mintAddress, const std::string& walletAddress,
                                          const std::string& network) {
    json params = json::array({walletAddress, {{"mint", mintAddress}}, {{"encoding", "jsonParsed"}}});
    auto result = rpcCall(network, "getTokenAccountsByOwner", params);
    if (!result || !result->is_object() || !result->contains("value") || !(*result)["value"].is_array()) {
        VAULT_LOG_WARNING(COMPONENT, "Token balance lookup failed", mintAddress);
        return "0";
    }

    // Amounts are decimal strings that may exceed 64 bits; add them as big integers
    std::vector<uint8_t> total;
    for (const auto& account : (*result)["value"]) {
        const json::json_pointer amountPath("/account/data/parsed/info/tokenAmount/amount");
        if (!account.contains(amountPath) || !account[amountPath].is_string()) {
            continue;
        }

        std::vector<uint8_t> amount;
        if (!Codec::DecimalToBytes(account[amountPath].get<std::string>(), amount)) {
            continue;
        }

        const size_t width = std::max(total.size(), amount.size()) + 1;
        std::vector<uint8_t> sum(width, 0);
        unsigned carry = 0;
        for (size_t i = 0; i < width; ++i) {
            unsigned a = i < total.size() ? total[total.size() - 1 - i] : 0;
            unsigned b = i < amount.size() ? amount[amount.size() - 1 - i] : 0;
            unsigned digit = a + b + carry;
            sum[width - 1 - i] = static_cast<uint8_t>(digit & 0xff);
            carry = digit >> 8;
        }
        total = std::move(sum);
    }
    return Codec::BytesToDecimal(total);
}

Result<uint64_t> SolanaSigner::GetMinimumBalanceForRentExemption(uint64_t dataLength, const std::string& network) {
    auto result = rpcCall(network, "getMinimumBalanceForRentExemption", json::array({dataLength}));
    if (!result) {
        return Vault::Forward<uint64_t>(result);
    }
    if (!result->is_number_unsigned()) {
        return Result<uint64_t>(ErrorCode::RPCError, "Malformed getMinimumBalanceForRentExemption result");
    }
    return Result<uint64_t>(result->get<uint64_t>());
}

} // namespace Solana
