#pragma once

#include "ChainTransport.h"
#include "Crypto.h"
#include "SignerConfig.h"
#include "Vault/VaultTypes.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace Tron {

/**
 * @brief TRX transfer in SUN (1 TRX = 1e6 SUN)
 */
struct TransferRequest {
    std::string to;  // base58 "T..." or hex
    uint64_t amount;
    std::string network;  // "mainnet" or "shasta"

    TransferRequest() : amount(0), network("mainnet") {}
};

/**
 * @brief TRC20 transfer(address,uint256) call
 */
struct Trc20TransferRequest {
    std::string contractAddress;
    std::string to;
    std::string amount;  // base-10 token base units
    std::string network;

    Trc20TransferRequest() : amount("0"), network("mainnet") {}
};

struct SignedTransaction {
    std::string rawTransaction;  // node transaction JSON with the signature array attached
    std::string txID;
    std::string signature;  // hex r || s || v, v = 27 + recovery id
};

/**
 * @brief Signs transactions built by a TRON full node HTTP API
 *
 * The node assembles the protobuf transaction; the signer checks its id and
 * signs it with secp256k1.
 */
class TronSigner {
public:
    TronSigner(Chains::TronConfig config, Transport::ChainTransport& transport);

    /**
     * @brief Create a TRX transfer through /wallet/createtransaction and sign its txID
     */
    Vault::Result<SignedTransaction> SignTransaction(const TransferRequest& request,
                                                     const Crypto::SecureBytes& privateKey);

    Vault::Result<Vault::BroadcastResult> SignAndSendTransaction(const TransferRequest& request,
                                                                 const Crypto::SecureBytes& privateKey);

    /**
     * @brief Build a TRC20 transfer through /wallet/triggersmartcontract and sign it
     */
    Vault::Result<SignedTransaction> SignTrc20Transfer(const Trc20TransferRequest& request,
                                                       const Crypto::SecureBytes& privateKey);

    /**
     * @brief Sign a TRC20 transfer and broadcast it
     */
    Vault::Result<Vault::BroadcastResult> TransferTrc20(const Trc20TransferRequest& request,
                                                        const Crypto::SecureBytes& privateKey);

    /**
     * @brief keccak256("\x19TRON Signed Message:\n" + len + message), "0x" r || s || v
     */
    Vault::Result<std::string> SignMessage(const std::string& message,
                                           const Crypto::SecureBytes& privateKey) const;

    Vault::Result<std::string> GetAddressFromPrivateKey(const Crypto::SecureBytes& privateKey) const;

    /**
     * @brief POST a signed transaction to /wallet/broadcasttransaction
     * @return Pending on result:true, BroadcastRejected with the node message otherwise
     */
    Vault::Result<Vault::BroadcastResult> BroadcastTransaction(const nlohmann::json& signedTransaction,
                                                               const std::string& network = "mainnet");

    Vault::Result<nlohmann::json> GetAccount(const std::string& address, const std::string& network = "mainnet");

    /**
     * @brief Balance in SUN, "0" on failure
     */
    std::string GetBalance(const std::string& address, const std::string& network = "mainnet");

    /**
     * @brief TRC20 balanceOf in token base units, "0" on failure
     */
    std::string GetTokenBalance(const std::string& contractAddress, const std::string& walletAddress,
                                const std::string& network = "mainnet");

    /**
     * @brief Confirmed TRX and TRC20 transfers from TronGrid, newest first
     */
    std::vector<Vault::TransactionHistoryEntry> GetTransactionHistory(const std::string& address,
                                                                      const std::string& network = "mainnet",
                                                                      const Vault::HistoryOptions& options = {});

private:
    Vault::Result<nlohmann::json> apiCall(const std::string& network, const std::string& endpoint,
                                          const nlohmann::json& body);

    Vault::Result<SignedTransaction> signNodeTransaction(const nlohmann::json& transaction,
                                                         const Crypto::SecureBytes& privateKey) const;

    Chains::TronConfig m_config;
    Transport::ChainTransport& m_transport;
};

} // namespace Tron
