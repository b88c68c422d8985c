#include "include/SignerConfig.h"
#include "Vault/Logger.h"

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;
using Vault::ErrorCode;
using Vault::Result;

namespace Chains {
namespace {

void readStringMap(const json &node, std::map<std::string, std::string> &target) {
  for (auto it = node.begin(); it != node.end(); ++it) {
    target[it.key()] = it.value().get<std::string>();
  }
}

void readBitcoinEndpoints(const json &node, BitcoinEndpoints &target) {
  target.rpcUrl = node.value("rpcUrl", target.rpcUrl);
  target.restBaseUrl = node.value("restBaseUrl", target.restBaseUrl);
}

} // namespace

Result<SignerConfig> ParseSignerConfig(const json &document) {
  if (!document.is_object()) {
    return Result<SignerConfig>(ErrorCode::InvalidArgument,
                                "Signer configuration must be a JSON object");
  }

  SignerConfig config;
  try {
    if (document.contains("transport")) {
      const json &node = document.at("transport");
      config.transport.timeoutMs = node.value("timeoutMs", config.transport.timeoutMs);
      config.transport.allowInsecureHttp =
          node.value("allowInsecureHttp", config.transport.allowInsecureHttp);
      config.transport.userAgent = node.value("userAgent", config.transport.userAgent);
    }

    if (document.contains("evm")) {
      const json &node = document.at("evm");
      if (node.contains("rpcUrls")) {
        // JSON object keys are strings; chain ids are decimal
        for (auto it = node.at("rpcUrls").begin(); it != node.at("rpcUrls").end(); ++it) {
          config.evm.rpcUrls[std::stoull(it.key())] = it.value().get<std::string>();
        }
      }
      if (node.contains("legacyChainIds")) {
        config.evm.legacyChainIds = node.at("legacyChainIds").get<std::set<uint64_t>>();
      }
    }

    if (document.contains("bitcoin")) {
      const json &node = document.at("bitcoin");
      if (node.contains("mainnet")) {
        readBitcoinEndpoints(node.at("mainnet"), config.bitcoin.mainnet);
      }
      if (node.contains("testnet")) {
        readBitcoinEndpoints(node.at("testnet"), config.bitcoin.testnet);
      }
      config.bitcoin.rpcUsername = node.value("rpcUsername", config.bitcoin.rpcUsername);
      config.bitcoin.rpcPassword = node.value("rpcPassword", config.bitcoin.rpcPassword);
      config.bitcoin.defaultFee = node.value("defaultFee", config.bitcoin.defaultFee);
      config.bitcoin.enableFallback = node.value("enableFallback", config.bitcoin.enableFallback);
    }

    if (document.contains("solana") && document.at("solana").contains("rpcUrls")) {
      readStringMap(document.at("solana").at("rpcUrls"), config.solana.rpcUrls);
    }

    if (document.contains("tron")) {
      const json &node = document.at("tron");
      if (node.contains("apiUrls")) {
        readStringMap(node.at("apiUrls"), config.tron.apiUrls);
      }
      config.tron.trc20FeeLimit = node.value("trc20FeeLimit", config.tron.trc20FeeLimit);
    }

    if (document.contains("ton") && document.at("ton").contains("apiUrls")) {
      readStringMap(document.at("ton").at("apiUrls"), config.ton.apiUrls);
    }
  } catch (const std::exception &e) {
    return Result<SignerConfig>(ErrorCode::InvalidArgument,
                                std::string("Invalid signer configuration: ") + e.what());
  }

  return Result<SignerConfig>(std::move(config));
}

std::string ResolveSignerConfigPath(const std::string &path) {
  const char *overridePath = std::getenv(SIGNER_CONFIG_ENV);
  if (overridePath != nullptr && overridePath[0] != '\0') {
    return overridePath;
  }
  return path;
}

Result<SignerConfig> LoadSignerConfig(const std::string &path) {
  const std::string resolved = ResolveSignerConfigPath(path);

  std::ifstream file(resolved);
  if (!file.is_open()) {
    return Result<SignerConfig>(ErrorCode::InvalidArgument,
                                "Cannot open signer configuration: " + resolved);
  }

  json document = json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    return Result<SignerConfig>(ErrorCode::InvalidArgument,
                                "Signer configuration is not valid JSON: " + resolved);
  }

  auto config = ParseSignerConfig(document);
  if (config) {
    VAULT_LOG_INFO("SignerConfig", "Loaded signer configuration", resolved);
  }
  return config;
}

Result<std::string> EndpointFor(const std::map<std::string, std::string> &endpoints,
                                const std::string &network) {
  auto it = endpoints.find(network);
  if (it == endpoints.end() || it->second.empty()) {
    return Result<std::string>(ErrorCode::InvalidArgument,
                               "No endpoint configured for network: " + network);
  }
  return Result<std::string>(it->second);
}

} // namespace Chains
