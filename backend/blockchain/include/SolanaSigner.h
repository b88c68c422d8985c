#pragma once

#include "ChainTransport.h"
#include "Crypto.h"
#include "SignerConfig.h"
#include "Vault/VaultTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace Solana {

/**
 * @brief Native SOL transfer
 */
struct TransferRequest {
    std::string to;       // base58 public key
    uint64_t lamports;
    std::string network;  // "mainnet" or "devnet"

    TransferRequest() : lamports(0), network("mainnet") {}
};

struct SignedTransaction {
    std::string rawTransaction;  // base64 wire transaction
    std::string signature;       // base58, doubles as the transaction id
};

/**
 * @brief Builds legacy-format System Program transfers and signs them with ed25519
 *
 * Keys are 32-byte seeds or 64-byte seed || public key secrets.
 */
class SolanaSigner {
public:
    SolanaSigner(Chains::SolanaConfig config, Transport::ChainTransport& transport);

    /**
     * @brief Fetch a finalized blockhash and sign a one-instruction transfer
     */
    Vault::Result<SignedTransaction> SignTransaction(const TransferRequest& request,
                                                     const Crypto::SecureBytes& privateKey);

    /**
     * @brief Serialize and sign a transfer against a known blockhash (no network access)
     */
    Vault::Result<SignedTransaction> SignTransferWithBlockhash(const TransferRequest& request,
                                                               const std::string& recentBlockhash,
                                                               const Crypto::SecureBytes& privateKey) const;

    Vault::Result<Vault::BroadcastResult> SignAndSendTransaction(const TransferRequest& request,
                                                                 const Crypto::SecureBytes& privateKey);

    /**
     * @brief base58 ed25519 signature over the UTF-8 message
     */
    Vault::Result<std::string> SignMessage(const std::string& message,
                                           const Crypto::SecureBytes& privateKey) const;

    Vault::Result<std::string> GetAddressFromPrivateKey(const Crypto::SecureBytes& privateKey) const;

    Vault::Result<std::string> GetRecentBlockhash(const std::string& network = "mainnet");
    Vault::Result<std::string> SendTransaction(const std::string& rawTransaction,
                                               const std::string& network = "mainnet");

    /**
     * @brief Balance in lamports, "0" on failure
     */
    std::string GetBalance(const std::string& address, const std::string& network = "mainnet");

    /**
     * @brief Sum of the owner's SPL token accounts for a mint, "0" on failure
     */
    std::string GetTokenBalance(const std::string& mintAddress, const std::string& walletAddress,
                                const std::string& network = "mainnet");

    /**
     * @brief Lamports an account of the given size needs to be rent exempt
     */
    Vault::Result<uint64_t> GetMinimumBalanceForRentExemption(uint64_t dataLength,
                                                              const std::string& network = "mainnet");

private:
    Vault::Result<nlohmann::json> rpcCall(const std::string& network, const std::string& method,
                                          const nlohmann::json& params);

    Chains::SolanaConfig m_config;
    Transport::ChainTransport& m_transport;
};

} // namespace Solana
