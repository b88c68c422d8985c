#include "include/WalletAPI.h"
#include "AddressDerivation.h"
#include "KeyVault.h"
#include "Vault/Logger.h"

#include <cstdlib>

namespace WalletAPI {

using Vault::ChainType;
using Vault::ErrorCode;
using Vault::Result;

namespace {

const char* const COMPONENT = "WalletAPI";

// Overload set for std::visit
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string networkOr(const std::string& network, const char* fallback) {
    return network.empty() ? std::string(fallback) : network;
}

bool parseChainId(const std::string& network, uint64_t& chainId) {
    if (network.empty()) {
        chainId = 1;
        return true;
    }
    char* end = nullptr;
    const unsigned long long value = std::strtoull(network.c_str(), &end, 10);
    if (end == network.c_str() || *end != '\0' || value == 0) {
        return false;
    }
    chainId = value;
    return true;
}

bool parseBitcoinNetwork(const std::string& network, Bitcoin::BitcoinNetwork& out) {
    if (network.empty() || network == "mainnet") {
        out = Bitcoin::BitcoinNetwork::Mainnet;
        return true;
    }
    if (network == "testnet") {
        out = Bitcoin::BitcoinNetwork::Testnet;
        return true;
    }
    return false;
}

template <typename T>
Result<SignedTransaction> wrapSigned(Result<T>&& signedTx) {
    if (!signedTx) {
        return Vault::Forward<SignedTransaction>(signedTx);
    }
    return Result<SignedTransaction>(SignedTransaction(std::move(*signedTx)));
}

} // namespace

ChainType ChainTypeOf(const TransferRequest& request) {
    return std::visit(Overloaded{
                          [](const EVM::TransactionRequest&) { return ChainType::EVM; },
                          [](const Bitcoin::TransferRequest&) { return ChainType::BTC; },
                          [](const Solana::TransferRequest&) { return ChainType::SVM; },
                          [](const Tron::TransferRequest&) { return ChainType::TRON; },
                          [](const Tron::Trc20TransferRequest&) { return ChainType::TRON; },
                          [](const Ton::TransferRequest&) { return ChainType::TON; },
                      },
                      request);
}

std::string TransactionIdOf(const SignedTransaction& signedTx) {
    return std::visit(Overloaded{
                          [](const EVM::SignedTransaction& tx) { return tx.transactionHash; },
                          [](const Bitcoin::SignedTransaction& tx) { return tx.txid; },
                          [](const Solana::SignedTransaction& tx) { return tx.signature; },
                          [](const Tron::SignedTransaction& tx) { return tx.txID; },
                          [](const Ton::SignedTransaction& tx) { return tx.hash; },
                      },
                      signedTx);
}

MultiChainWallet::MultiChainWallet(const Chains::SignerConfig& config, Transport::ChainTransport& transport)
    : m_transport(transport),
      m_evm(config.evm, m_transport),
      m_bitcoin(config.bitcoin, m_transport),
      m_solana(config.solana, m_transport),
      m_tron(config.tron, m_transport),
      m_ton(config.ton, m_transport) {}

MultiChainWallet::MultiChainWallet(const Chains::SignerConfig& config)
    : m_ownedTransport(Transport::CreateHttpTransport(config.transport)),
      m_transport(*m_ownedTransport),
      m_evm(config.evm, m_transport),
      m_bitcoin(config.bitcoin, m_transport),
      m_solana(config.solana, m_transport),
      m_tron(config.tron, m_transport),
      m_ton(config.ton, m_transport) {}

Result<std::vector<Vault::WalletData>> MultiChainWallet::GenerateWalletsForChains(
    const std::vector<uint8_t>& secret, const std::vector<ChainType>& chains) {
    return KeyVault::GenerateWalletsForChains(secret, chains);
}

Result<std::string> MultiChainWallet::DecryptPrivateKey(const std::vector<uint8_t>& secret,
                                                        const std::string& encryptedKeyHex) {
    return KeyVault::DecryptPrivateKey(secret, encryptedKeyHex);
}

Result<SignedTransaction> MultiChainWallet::SignTransaction(const std::vector<uint8_t>& secret,
                                                            const std::string& encryptedKeyHex,
                                                            const TransferRequest& request) {
    auto key = KeyVault::UnlockPrivateKey(secret, encryptedKeyHex);
    if (!key) {
        VAULT_LOG_WARNING(COMPONENT, "Key unlock failed", Vault::ChainTypeToString(ChainTypeOf(request)));
        return Vault::Forward<SignedTransaction>(key);
    }
    const Crypto::SecureBytes& privateKey = *key;

    return std::visit(Overloaded{
                          [&](const EVM::TransactionRequest& r) { return wrapSigned(m_evm.SignTransaction(r, privateKey)); },
                          [&](const Bitcoin::TransferRequest& r) {
                              // Without explicit inputs the sender's UTXOs are fetched
                              return wrapSigned(r.utxos.empty() ? m_bitcoin.SignTransferFromChain(r, privateKey)
                                                                : m_bitcoin.SignTransaction(r, privateKey));
                          },
                          [&](const Solana::TransferRequest& r) { return wrapSigned(m_solana.SignTransaction(r, privateKey)); },
                          [&](const Tron::TransferRequest& r) { return wrapSigned(m_tron.SignTransaction(r, privateKey)); },
                          [&](const Tron::Trc20TransferRequest& r) { return wrapSigned(m_tron.SignTrc20Transfer(r, privateKey)); },
                          [&](const Ton::TransferRequest& r) { return wrapSigned(m_ton.SignTransaction(r, privateKey)); },
                      },
                      request);
}

Result<Vault::BroadcastResult> MultiChainWallet::SignAndSendTransaction(const std::vector<uint8_t>& secret,
                                                                        const std::string& encryptedKeyHex,
                                                                        const TransferRequest& request) {
    auto key = KeyVault::UnlockPrivateKey(secret, encryptedKeyHex);
    if (!key) {
        VAULT_LOG_WARNING(COMPONENT, "Key unlock failed", Vault::ChainTypeToString(ChainTypeOf(request)));
        return Vault::Forward<Vault::BroadcastResult>(key);
    }
    const Crypto::SecureBytes& privateKey = *key;

    return std::visit(Overloaded{
                          [&](const EVM::TransactionRequest& r) { return m_evm.SignAndSendTransaction(r, privateKey); },
                          [&](const Bitcoin::TransferRequest& r) { return m_bitcoin.SignAndSendTransaction(r, privateKey); },
                          [&](const Solana::TransferRequest& r) { return m_solana.SignAndSendTransaction(r, privateKey); },
                          [&](const Tron::TransferRequest& r) { return m_tron.SignAndSendTransaction(r, privateKey); },
                          [&](const Tron::Trc20TransferRequest& r) { return m_tron.TransferTrc20(r, privateKey); },
                          [&](const Ton::TransferRequest& r) { return m_ton.SignAndSendTransaction(r, privateKey); },
                      },
                      request);
}

Result<std::string> MultiChainWallet::SignMessage(ChainType chain, const std::vector<uint8_t>& secret,
                                                  const std::string& encryptedKeyHex, const std::string& message) {
    if (chain == ChainType::BTC) {
        return Result<std::string>(ErrorCode::UnsupportedChain, "Message signing is not available for btc");
    }

    auto key = KeyVault::UnlockPrivateKey(secret, encryptedKeyHex);
    if (!key) {
        return Vault::Forward<std::string>(key);
    }

    switch (chain) {
    case ChainType::EVM:
        return m_evm.SignMessage(message, *key);
    case ChainType::SVM:
        return m_solana.SignMessage(message, *key);
    case ChainType::TRON:
        return m_tron.SignMessage(message, *key);
    case ChainType::TON:
        return m_ton.SignMessage(message, *key);
    default:
        return Result<std::string>(ErrorCode::UnsupportedChain, "Unsupported chain: " + Vault::ChainTypeToString(chain));
    }
}

Result<std::string> MultiChainWallet::GetAddressFromPrivateKey(ChainType chain, const std::vector<uint8_t>& secret,
                                                               const std::string& encryptedKeyHex) {
    auto key = KeyVault::UnlockPrivateKey(secret, encryptedKeyHex);
    if (!key) {
        return Vault::Forward<std::string>(key);
    }
    return AddressDerivation::DeriveAddress(chain, key->bytes());
}

std::string MultiChainWallet::GetBalance(ChainType chain, const std::string& address, const std::string& network) {
    switch (chain) {
    case ChainType::EVM: {
        uint64_t chainId = 1;
        if (!parseChainId(network, chainId)) {
            VAULT_LOG_WARNING(COMPONENT, "Invalid EVM chain id", network);
            return "0";
        }
        return m_evm.GetBalance(address, chainId);
    }
    case ChainType::BTC: {
        Bitcoin::BitcoinNetwork btcNetwork;
        if (!parseBitcoinNetwork(network, btcNetwork)) {
            VAULT_LOG_WARNING(COMPONENT, "Invalid Bitcoin network", network);
            return "0";
        }
        return std::to_string(m_bitcoin.GetBalance(address, btcNetwork));
    }
    case ChainType::SVM:
        return m_solana.GetBalance(address, networkOr(network, "mainnet"));
    case ChainType::TRON:
        return m_tron.GetBalance(address, networkOr(network, "mainnet"));
    case ChainType::TON:
        return m_ton.GetBalance(address, networkOr(network, "mainnet"));
    }
    return "0";
}

std::string MultiChainWallet::GetTokenBalance(ChainType chain, const std::string& tokenAddress,
                                              const std::string& walletAddress, const std::string& network) {
    switch (chain) {
    case ChainType::EVM: {
        uint64_t chainId = 1;
        if (!parseChainId(network, chainId)) {
            VAULT_LOG_WARNING(COMPONENT, "Invalid EVM chain id", network);
            return "0";
        }
        return m_evm.GetTokenBalance(tokenAddress, walletAddress, chainId);
    }
    case ChainType::SVM:
        return m_solana.GetTokenBalance(tokenAddress, walletAddress, networkOr(network, "mainnet"));
    case ChainType::TRON:
        return m_tron.GetTokenBalance(tokenAddress, walletAddress, networkOr(network, "mainnet"));
    default:
        VAULT_LOG_WARNING(COMPONENT, "Token balances are not available", Vault::ChainTypeToString(chain));
        return "0";
    }
}

std::vector<Vault::TransactionHistoryEntry> MultiChainWallet::GetTransactionHistory(
    ChainType chain, const std::string& address, const std::string& network, const Vault::HistoryOptions& options) {
    switch (chain) {
    case ChainType::EVM: {
        uint64_t chainId = 1;
        if (!parseChainId(network, chainId)) {
            VAULT_LOG_WARNING(COMPONENT, "Invalid EVM chain id", network);
            return {};
        }
        return m_evm.GetTransactionHistory(address, chainId, options);
    }
    case ChainType::TRON:
        return m_tron.GetTransactionHistory(address, networkOr(network, "mainnet"), options);
    case ChainType::TON:
        return m_ton.GetTransactionHistory(address, networkOr(network, "mainnet"), options);
    default:
        VAULT_LOG_DEBUG(COMPONENT, "No history source", Vault::ChainTypeToString(chain));
        return {};
    }
}

} // namespace WalletAPI
