#pragma once

#include "BitcoinSigner.h"
#include "ChainTransport.h"
#include "Crypto.h"
#include "EvmSigner.h"
#include "SignerConfig.h"
#include "SolanaSigner.h"
#include "TonSigner.h"
#include "TronSigner.h"
#include "Vault/VaultTypes.h"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace WalletAPI {

/**
 * @brief A transfer for any supported chain family
 */
using TransferRequest =
    std::variant<EVM::TransactionRequest, Bitcoin::TransferRequest, Solana::TransferRequest,
                 Tron::TransferRequest, Tron::Trc20TransferRequest, Ton::TransferRequest>;

using SignedTransaction =
    std::variant<EVM::SignedTransaction, Bitcoin::SignedTransaction, Solana::SignedTransaction,
                 Tron::SignedTransaction, Ton::SignedTransaction>;

/**
 * @brief Chain family a request belongs to
 */
Vault::ChainType ChainTypeOf(const TransferRequest &request);

/**
 * @brief Transaction id or hash of any signed transaction
 */
std::string TransactionIdOf(const SignedTransaction &signedTx);

/**
 * @brief Entry point tying the key vault to the chain signers
 *
 * Signing calls take the device secret and the stored ciphertext; the private
 * key is decrypted into a self-wiping buffer that lives only for the call.
 *
 * Network names are per chain: EVM takes a decimal chain id ("1" when empty),
 * BTC "mainnet"/"testnet", Solana "mainnet"/"devnet", TRON "mainnet"/"shasta"
 * and TON "mainnet"/"testnet".
 */
class MultiChainWallet {
public:
  /**
   * @brief Use a caller-owned transport (tests, shared connection pools)
   */
  MultiChainWallet(const Chains::SignerConfig &config, Transport::ChainTransport &transport);

  /**
   * @brief Own an HTTPS transport built from config.transport
   */
  explicit MultiChainWallet(const Chains::SignerConfig &config);

  MultiChainWallet(const MultiChainWallet &) = delete;
  MultiChainWallet &operator=(const MultiChainWallet &) = delete;

  // Vault
  Vault::Result<std::vector<Vault::WalletData>>
  GenerateWalletsForChains(const std::vector<uint8_t> &secret,
                           const std::vector<Vault::ChainType> &chains);
  Vault::Result<std::string> DecryptPrivateKey(const std::vector<uint8_t> &secret,
                                               const std::string &encryptedKeyHex);

  // Signing
  Vault::Result<SignedTransaction> SignTransaction(const std::vector<uint8_t> &secret,
                                                   const std::string &encryptedKeyHex,
                                                   const TransferRequest &request);
  Vault::Result<Vault::BroadcastResult>
  SignAndSendTransaction(const std::vector<uint8_t> &secret, const std::string &encryptedKeyHex,
                         const TransferRequest &request);

  /**
   * @brief Chain-specific message signature
   * @return UnsupportedChain for BTC
   */
  Vault::Result<std::string> SignMessage(Vault::ChainType chain, const std::vector<uint8_t> &secret,
                                         const std::string &encryptedKeyHex,
                                         const std::string &message);

  Vault::Result<std::string> GetAddressFromPrivateKey(Vault::ChainType chain,
                                                      const std::vector<uint8_t> &secret,
                                                      const std::string &encryptedKeyHex);

  // Queries
  std::string GetBalance(Vault::ChainType chain, const std::string &address,
                         const std::string &network = "");

  /**
   * @brief Token balance for EVM (ERC20), Solana (SPL) and TRON (TRC20), "0" elsewhere
   */
  std::string GetTokenBalance(Vault::ChainType chain, const std::string &tokenAddress,
                              const std::string &walletAddress, const std::string &network = "");

  /**
   * @brief History for EVM, TRON and TON; other chains have no history source
   */
  std::vector<Vault::TransactionHistoryEntry>
  GetTransactionHistory(Vault::ChainType chain, const std::string &address,
                        const std::string &network = "", const Vault::HistoryOptions &options = {});

  EVM::EvmSigner &evm() { return m_evm; }
  Bitcoin::BitcoinSigner &bitcoin() { return m_bitcoin; }
  Solana::SolanaSigner &solana() { return m_solana; }
  Tron::TronSigner &tron() { return m_tron; }
  Ton::TonSigner &ton() { return m_ton; }

private:
  std::unique_ptr<Transport::ChainTransport> m_ownedTransport;
  Transport::ChainTransport &m_transport;
  EVM::EvmSigner m_evm;
  Bitcoin::BitcoinSigner m_bitcoin;
  Solana::SolanaSigner m_solana;
  Tron::TronSigner m_tron;
  Ton::TonSigner m_ton;
};

} // namespace WalletAPI
