#pragma once

#include "ChainTransport.h"
#include "Vault/VaultTypes.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace Chains {

/**
 * @brief EVM JSON-RPC endpoints keyed by chain id
 */
struct EvmConfig {
  std::map<uint64_t, std::string> rpcUrls;
  std::set<uint64_t> legacyChainIds = {56};  // chains without EIP-1559 fee markets
};

struct BitcoinEndpoints {
  std::string rpcUrl;       // JSON-RPC 1.0 node, may be empty
  std::string restBaseUrl;  // Esplora-compatible REST API
};

struct BitcoinConfig {
  BitcoinEndpoints mainnet{"", "https://blockstream.info/api"};
  BitcoinEndpoints testnet{"", "https://blockstream.info/testnet/api"};
  std::string rpcUsername;
  std::string rpcPassword;
  uint64_t defaultFee = 1000;  // satoshis
  bool enableFallback = true;
};

struct SolanaConfig {
  std::map<std::string, std::string> rpcUrls = {
      {"mainnet", "https://api.mainnet-beta.solana.com"},
      {"devnet", "https://api.devnet.solana.com"}};
};

struct TronConfig {
  std::map<std::string, std::string> apiUrls = {
      {"mainnet", "https://api.trongrid.io"},
      {"shasta", "https://api.shasta.trongrid.io"}};
  uint64_t trc20FeeLimit = 100000000;  // SUN
};

struct TonConfig {
  std::map<std::string, std::string> apiUrls = {
      {"mainnet", "https://toncenter.com/api/v2"},
      {"testnet", "https://testnet.toncenter.com/api/v2"}};
};

/**
 * @brief Endpoint and policy configuration for every signer
 */
struct SignerConfig {
  Transport::TransportConfig transport;
  EvmConfig evm;
  BitcoinConfig bitcoin;
  SolanaConfig solana;
  TronConfig tron;
  TonConfig ton;
};

/// Environment variable that overrides the configuration file path
constexpr const char *SIGNER_CONFIG_ENV = "VAULT_SIGNER_CONFIG";

/**
 * @brief Build a configuration from a JSON document
 *
 * Missing sections keep their defaults.
 *
 * @return InvalidArgument when a present field has the wrong type
 */
Vault::Result<SignerConfig> ParseSignerConfig(const nlohmann::json &document);

/**
 * @brief Load a JSON configuration file
 * @param path File path; VAULT_SIGNER_CONFIG takes precedence when set
 */
Vault::Result<SignerConfig> LoadSignerConfig(const std::string &path);

/**
 * @brief Path that LoadSignerConfig would read
 */
std::string ResolveSignerConfigPath(const std::string &path);

/**
 * @brief Look up a per-network endpoint
 * @return InvalidArgument when the network has no endpoint
 */
Vault::Result<std::string> EndpointFor(const std::map<std::string, std::string> &endpoints,
                                       const std::string &network);

} // namespace Chains
