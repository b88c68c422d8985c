#pragma once

#include "AddressDerivation.h"
#include "ChainTransport.h"
#include "Crypto.h"
#include "SignerConfig.h"
#include "Vault/VaultTypes.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Bitcoin {

using AddressDerivation::BitcoinNetwork;

constexpr uint64_t DUST_THRESHOLD = 546;  // satoshis
constexpr uint32_t SIGHASH_ALL = 1;

struct UTXO {
  std::string txid;  // big-endian hex as shown by explorers
  uint32_t vout = 0;
  uint64_t value = 0;  // satoshis
  std::string scriptPubKey;
};

/**
 * @brief P2PKH transfer parameters
 *
 * When utxos is empty the signer fetches the sender's outputs from the
 * configured providers.
 */
struct TransferRequest {
  std::vector<UTXO> utxos;
  std::string to;
  uint64_t amount = 0;  // satoshis
  std::optional<std::string> changeAddress;
  std::optional<uint64_t> fee;
  BitcoinNetwork network = BitcoinNetwork::Mainnet;
};

struct SignedTransaction {
  std::string rawTransaction;  // hex
  std::string txid;            // reversed double SHA-256 of the raw bytes
  uint64_t fee = 0;
  uint64_t change = 0;  // zero when the change output was dropped as dust
};

/**
 * @brief Source of spendable outputs and balances for an address
 */
class UtxoProvider {
public:
  virtual ~UtxoProvider() = default;
  virtual std::optional<std::vector<UTXO>> getUtxos(const std::string &address,
                                                    BitcoinNetwork network) = 0;
  virtual std::optional<uint64_t> getBalance(const std::string &address,
                                             BitcoinNetwork network) = 0;
  virtual std::string name() const = 0;
};

/**
 * @brief Node RPC (scantxoutset) first, then the Esplora REST API when fallback is enabled
 */
std::unique_ptr<UtxoProvider> CreateUtxoProvider(const Chains::BitcoinConfig &config,
                                                 Transport::ChainTransport &transport);

/**
 * @brief Legacy P2PKH transaction builder and signer
 */
class BitcoinSigner {
public:
  BitcoinSigner(Chains::BitcoinConfig config, Transport::ChainTransport &transport,
                std::unique_ptr<UtxoProvider> provider = nullptr);

  /**
   * @brief Spend every given UTXO to the recipient with change back to the sender
   *
   * change = sum(inputs) - amount - fee. A change at or below the dust
   * threshold is left to the miner.
   *
   * @return InsufficientFunds, InvalidAddressChecksum or the signed transaction
   */
  Vault::Result<SignedTransaction> SignTransaction(const TransferRequest &request,
                                                   const Crypto::SecureBytes &privateKey) const;

  /**
   * @brief Fetch the sender's UTXOs, then sign
   * @return NoUTXOsAvailable when the sender has nothing to spend
   */
  Vault::Result<SignedTransaction> SignTransferFromChain(const TransferRequest &request,
                                                         const Crypto::SecureBytes &privateKey);

  /**
   * @brief Sign (fetching UTXOs when none are given) and submit via sendrawtransaction
   */
  Vault::Result<Vault::BroadcastResult> SignAndSendTransaction(const TransferRequest &request,
                                                               const Crypto::SecureBytes &privateKey);

  Vault::Result<std::string> SendRawTransaction(const std::string &rawTransaction,
                                                BitcoinNetwork network);

  Vault::Result<std::string> GetAddressFromPrivateKey(const Crypto::SecureBytes &privateKey,
                                                      BitcoinNetwork network = BitcoinNetwork::Mainnet) const;

  Vault::Result<std::vector<UTXO>> GetUTXOs(const std::string &address, BitcoinNetwork network);

  /**
   * @brief Confirmed plus mempool balance in satoshis, 0 when every source fails
   */
  uint64_t GetBalance(const std::string &address, BitcoinNetwork network = BitcoinNetwork::Mainnet);

private:
  Chains::BitcoinConfig m_config;
  Transport::ChainTransport &m_transport;
  std::unique_ptr<UtxoProvider> m_provider;
};

} // namespace Bitcoin
