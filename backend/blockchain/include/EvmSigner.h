#pragma once

#include "ChainTransport.h"
#include "Crypto.h"
#include "SignerConfig.h"
#include "Vault/VaultTypes.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace EVM {

/// Default priority fee when the node does not implement eth_maxPriorityFeePerGas (1 gwei)
constexpr const char* DEFAULT_PRIORITY_FEE = "0x3b9aca00";

/// Gas for a plain value transfer
constexpr const char* DEFAULT_GAS_LIMIT = "0x5208";

/// keccak256("Transfer(address,address,uint256)")
constexpr const char* TRANSFER_EVENT_TOPIC =
    "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

/**
 * @brief Unsigned EVM transaction
 *
 * Quantities accept "0x" hex or base-10 text. Absent fields are resolved
 * from the node before signing.
 */
struct TransactionRequest {
    std::string to;
    std::string value;  // empty means zero
    std::string data;   // hex calldata, empty means none
    std::optional<std::string> gasLimit;
    std::optional<std::string> gasPrice;
    std::optional<std::string> maxFeePerGas;
    std::optional<std::string> maxPriorityFeePerGas;
    std::optional<uint64_t> nonce;
    uint64_t chainId;

    TransactionRequest() : chainId(1) {}
};

struct SignedTransaction {
    std::string rawTransaction;   // "0x" hex, type-2 envelopes start with 0x02
    std::string transactionHash;  // "0x" keccak256 of the raw bytes
    bool eip1559;

    SignedTransaction() : eip1559(false) {}
};

struct FeeData {
    std::string maxFeePerGas;
    std::string maxPriorityFeePerGas;
};

/**
 * @brief EVM transaction builder and signer (legacy EIP-155 and EIP-1559)
 */
class EvmSigner {
public:
    EvmSigner(Chains::EvmConfig config, Transport::ChainTransport& transport);

    /**
     * @brief Resolve nonce, fees and gas, then RLP-encode and sign
     * @param tx Transaction parameters
     * @param privateKey 32-byte secp256k1 key
     * @return Signed raw transaction and its hash
     */
    Vault::Result<SignedTransaction> SignTransaction(const TransactionRequest& tx,
                                                     const Crypto::SecureBytes& privateKey);

    /**
     * @brief Sign and submit through eth_sendRawTransaction
     * @return Node-reported hash with status pending
     */
    Vault::Result<Vault::BroadcastResult> SignAndSendTransaction(const TransactionRequest& tx,
                                                                 const Crypto::SecureBytes& privateKey);

    /**
     * @brief personal_sign: keccak256("\x19Ethereum Signed Message:\n" + len + message)
     * @return "0x" r || s || v with v = 27 + recovery id
     */
    Vault::Result<std::string> SignMessage(const std::string& message,
                                           const Crypto::SecureBytes& privateKey) const;

    /**
     * @brief Sign typed data as keccak256(0x19 0x01 || keccak(domain JSON) || keccak(message JSON))
     *
     * Domain and message are hashed as compact JSON in document order; this
     * is not the EIP-712 struct encoding.
     */
    Vault::Result<std::string> SignTypedData(const std::string& typedDataJson,
                                             const Crypto::SecureBytes& privateKey) const;

    Vault::Result<std::string> GetAddressFromPrivateKey(const Crypto::SecureBytes& privateKey) const;

    // Node queries
    Vault::Result<uint64_t> GetNonce(uint64_t chainId, const std::string& address);
    Vault::Result<std::string> GetGasPrice(uint64_t chainId);

    /**
     * @brief eth_gasPrice and eth_maxPriorityFeePerGas fetched concurrently
     *
     * maxFeePerGas = 2 * gasPrice + priority. Both fall back to 1 gwei when
     * the gas price is unavailable.
     */
    FeeData GetFeeData(uint64_t chainId);

    /**
     * @brief eth_estimateGas plus a 20% margin, 21000 when estimation fails
     */
    std::string EstimateGas(uint64_t chainId, const std::string& from, const std::string& to,
                            const std::string& value, const std::string& data);

    Vault::Result<std::string> SendRawTransaction(uint64_t chainId, const std::string& rawTransaction);

    /**
     * @brief eth_getTransactionReceipt
     * @return The receipt object, or JSON null while the transaction is pending
     */
    Vault::Result<nlohmann::json> GetTransactionReceipt(uint64_t chainId, const std::string& txHash);

    /**
     * @brief Native balance in wei, "0" on failure
     */
    std::string GetBalance(const std::string& address, uint64_t chainId = 1);

    /**
     * @brief ERC20 balanceOf in token base units, "0" on failure
     */
    std::string GetTokenBalance(const std::string& tokenAddress, const std::string& walletAddress,
                                uint64_t chainId = 1);

    /**
     * @brief ERC20 transfers to and from an address, newest block first
     *
     * Native transfers do not emit logs and are not listed. Timestamps come
     * from the entries' blocks and stay unset when a block lookup fails.
     */
    std::vector<Vault::TransactionHistoryEntry> GetTransactionHistory(const std::string& address,
                                                                      uint64_t chainId,
                                                                      const Vault::HistoryOptions& options = {});

    /**
     * @brief Unix time of a block, nullopt when it cannot be fetched
     */
    std::optional<int64_t> GetBlockTimestamp(uint64_t chainId, uint64_t blockNumber);

    bool IsLegacyChain(uint64_t chainId) const;

private:
    Vault::Result<nlohmann::json> rpcCall(uint64_t chainId, const std::string& method,
                                          const nlohmann::json& params);

    Chains::EvmConfig m_config;
    Transport::ChainTransport& m_transport;
};

} // namespace EVM
