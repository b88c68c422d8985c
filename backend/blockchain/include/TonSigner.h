#pragma once

#include "ChainTransport.h"
#include "Crypto.h"
#include "SignerConfig.h"
#include "TonCell.h"
#include "Vault/VaultTypes.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Ton {

/// Wallet subwallet id prefixed to every signing message
constexpr uint32_t WALLET_ID = 698983191;

/// Seconds a signed message stays valid
constexpr int64_t MESSAGE_TTL = 60;

/// Pay fees separately and ignore action-phase errors
constexpr uint8_t SEND_MODE = 3;

/**
 * @brief Native transfer in nanotons (1 TON = 1e9 nanotons)
 */
struct TransferRequest {
    std::string to;
    std::string amount;  // base-10 nanotons
    std::optional<std::string> comment;
    std::string network;  // "mainnet" or "testnet"

    TransferRequest() : amount("0"), network("mainnet") {}
};

struct SignedTransaction {
    std::string boc;   // base64(signature || signing message)
    std::string hash;  // hex SHA-256 of the same bytes
    uint32_t seqno;

    SignedTransaction() : seqno(0) {}
};

/**
 * @brief Builds and signs wallet external messages against toncenter's HTTP API
 */
class TonSigner {
public:
    using Clock = std::function<int64_t()>;

    /**
     * @param clock Unix time source, the system clock when empty
     */
    TonSigner(Chains::TonConfig config, Transport::ChainTransport& transport, Clock clock = Clock());

    /**
     * @brief Fetch the wallet seqno and sign a transfer
     */
    Vault::Result<SignedTransaction> SignTransaction(const TransferRequest& request,
                                                     const Crypto::SecureBytes& privateKey);

    /**
     * @brief Build and sign a transfer for a known seqno (no network access)
     */
    Vault::Result<SignedTransaction> SignTransferWithSeqno(const TransferRequest& request, uint32_t seqno,
                                                           const Crypto::SecureBytes& privateKey) const;

    /**
     * @brief Sign, then POST the BOC to /sendBoc
     * @return Pending when the API answers ok, Failed with its error otherwise
     */
    Vault::Result<Vault::BroadcastResult> SignAndSendTransaction(const TransferRequest& request,
                                                                 const Crypto::SecureBytes& privateKey);

    /**
     * @brief hex ed25519 signature over the UTF-8 message
     */
    Vault::Result<std::string> SignMessage(const std::string& message,
                                           const Crypto::SecureBytes& privateKey) const;

    Vault::Result<std::string> GetAddressFromPrivateKey(const Crypto::SecureBytes& privateKey) const;

    /**
     * @brief Current wallet seqno via the seqno get-method
     *
     * An empty stack (undeployed wallet) reads as 0.
     */
    Vault::Result<uint32_t> GetSeqno(const std::string& address, const std::string& network = "mainnet");

    Vault::Result<nlohmann::json> GetAccountInfo(const std::string& address, const std::string& network = "mainnet");

    /**
     * @brief Balance in nanotons, "0" on failure
     */
    std::string GetBalance(const std::string& address, const std::string& network = "mainnet");

    std::vector<Vault::TransactionHistoryEntry> GetTransactionHistory(const std::string& address,
                                                                      const std::string& network = "mainnet",
                                                                      const Vault::HistoryOptions& options = {});

private:
    Vault::Result<nlohmann::json> apiCall(const std::string& network, const std::string& endpoint,
                                          const Transport::QueryParams& query);

    Chains::TonConfig m_config;
    Transport::ChainTransport& m_transport;
    Clock m_clock;
};

} // namespace Ton
