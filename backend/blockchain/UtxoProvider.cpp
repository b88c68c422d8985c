#include "include/BitcoinSigner.h"
#include "Vault/Logger.h"

#include <nlohmann/json.hpp>
#include <cmath>

using json = nlohmann::json;

namespace Bitcoin {
namespace {
constexpr double kSatoshisPerBtc = 100000000.0;

uint64_t btcToSatoshis(double btc) {
  return static_cast<uint64_t>(std::llround(btc * kSatoshisPerBtc));
}

double parseBtcValue(const json &value) {
  if (value.is_number_float()) {
    return value.get<double>();
  }
  if (value.is_number_integer()) {
    return static_cast<double>(value.get<int64_t>());
  }
  if (value.is_string()) {
    return std::stod(value.get<std::string>());
  }
  return 0.0;
}

const Chains::BitcoinEndpoints &endpointsFor(const Chains::BitcoinConfig &config,
                                             BitcoinNetwork network) {
  return network == BitcoinNetwork::Testnet ? config.testnet : config.mainnet;
}

class NodeRpcUtxoProvider : public UtxoProvider {
public:
  NodeRpcUtxoProvider(const Chains::BitcoinConfig &config, Transport::ChainTransport &transport)
      : m_config(config), m_transport(transport) {}

  std::optional<std::vector<UTXO>> getUtxos(const std::string &address,
                                            BitcoinNetwork network) override {
    json descriptors = json::array({"addr(" + address + ")"});
    auto result = call(network, "scantxoutset", json::array({"start", descriptors}));
    if (!result || !result->is_object() || !result->contains("unspents") ||
        !(*result)["unspents"].is_array()) {
      return std::nullopt;
    }

    std::vector<UTXO> utxos;
    try {
      for (const auto &unspent : (*result)["unspents"]) {
        UTXO utxo;
        utxo.txid = unspent.at("txid").get<std::string>();
        utxo.vout = unspent.at("vout").get<uint32_t>();
        utxo.value = btcToSatoshis(parseBtcValue(unspent.at("amount")));
        utxo.scriptPubKey = unspent.value("scriptPubKey", "");
        utxos.push_back(std::move(utxo));
      }
    } catch (const std::exception &e) {
      VAULT_LOG_WARNING("UtxoProvider", "Malformed scantxoutset result", e.what());
      return std::nullopt;
    }
    return utxos;
  }

  std::optional<uint64_t> getBalance(const std::string &, BitcoinNetwork) override {
    // scantxoutset is the only address index a plain node offers
    return std::nullopt;
  }

  std::string name() const override { return "Bitcoin RPC"; }

private:
  std::optional<json> call(BitcoinNetwork network, const std::string &method, json params) {
    const std::string &url = endpointsFor(m_config, network).rpcUrl;
    if (url.empty()) {
      return std::nullopt;
    }

    Transport::RpcRequest request;
    request.url = url;
    request.method = method;
    request.params = std::move(params);
    request.version = "1.0";
    request.id = "vaultsigner";
    request.username = m_config.rpcUsername;
    request.password = m_config.rpcPassword;

    auto result = m_transport.Call(request);
    if (!result) {
      VAULT_LOG_DEBUG("UtxoProvider", method + " failed", result.errorMessage);
      return std::nullopt;
    }
    return *result;
  }

  Chains::BitcoinConfig m_config;
  Transport::ChainTransport &m_transport;
};

class EsploraUtxoProvider : public UtxoProvider {
public:
  EsploraUtxoProvider(const Chains::BitcoinConfig &config, Transport::ChainTransport &transport)
      : m_config(config), m_transport(transport) {}

  std::optional<std::vector<UTXO>> getUtxos(const std::string &address,
                                            BitcoinNetwork network) override {
    auto result = m_transport.Get(baseUrl(network) + "/address/" + address + "/utxo");
    if (!result || !result->is_array()) {
      return std::nullopt;
    }

    std::vector<UTXO> utxos;
    try {
      for (const auto &entry : *result) {
        UTXO utxo;
        utxo.txid = entry.at("txid").get<std::string>();
        utxo.vout = entry.at("vout").get<uint32_t>();
        utxo.value = entry.at("value").get<uint64_t>();
        utxos.push_back(std::move(utxo));
      }
    } catch (const std::exception &e) {
      VAULT_LOG_WARNING("UtxoProvider", "Malformed Esplora UTXO list", e.what());
      return std::nullopt;
    }
    return utxos;
  }

  std::optional<uint64_t> getBalance(const std::string &address,
                                     BitcoinNetwork network) override {
    auto result = m_transport.Get(baseUrl(network) + "/address/" + address);
    if (!result || !result->is_object()) {
      return std::nullopt;
    }

    try {
      const json &chain = result->at("chain_stats");
      const json &mempool = result->at("mempool_stats");
      const int64_t confirmed = chain.at("funded_txo_sum").get<int64_t>() -
                                chain.at("spent_txo_sum").get<int64_t>();
      const int64_t pending = mempool.at("funded_txo_sum").get<int64_t>() -
                              mempool.at("spent_txo_sum").get<int64_t>();
      const int64_t total = confirmed + pending;
      return total > 0 ? static_cast<uint64_t>(total) : 0;
    } catch (const std::exception &e) {
      VAULT_LOG_WARNING("UtxoProvider", "Malformed Esplora address stats", e.what());
      return std::nullopt;
    }
  }

  std::string name() const override { return "Esplora"; }

private:
  std::string baseUrl(BitcoinNetwork network) const {
    return endpointsFor(m_config, network).restBaseUrl;
  }

  Chains::BitcoinConfig m_config;
  Transport::ChainTransport &m_transport;
};

class FallbackUtxoProvider : public UtxoProvider {
public:
  explicit FallbackUtxoProvider(std::vector<std::unique_ptr<UtxoProvider>> providers)
      : m_providers(std::move(providers)) {}

  std::optional<std::vector<UTXO>> getUtxos(const std::string &address,
                                            BitcoinNetwork network) override {
    for (auto &provider : m_providers) {
      auto utxos = provider->getUtxos(address, network);
      if (utxos) {
        return utxos;
      }
      VAULT_LOG_DEBUG("UtxoProvider", provider->name() + " UTXO lookup failed", address);
    }
    return std::nullopt;
  }

  std::optional<uint64_t> getBalance(const std::string &address,
                                     BitcoinNetwork network) override {
    for (auto &provider : m_providers) {
      auto balance = provider->getBalance(address, network);
      if (balance) {
        return balance;
      }
    }

    auto utxos = getUtxos(address, network);
    if (!utxos) {
      return std::nullopt;
    }
    uint64_t sum = 0;
    for (const auto &utxo : *utxos) {
      sum += utxo.value;
    }
    return sum;
  }

  std::string name() const override { return "Fallback"; }

private:
  std::vector<std::unique_ptr<UtxoProvider>> m_providers;
};

} // namespace

std::unique_ptr<UtxoProvider> CreateUtxoProvider(const Chains::BitcoinConfig &config,
                                                 Transport::ChainTransport &transport) {
  std::vector<std::unique_ptr<UtxoProvider>> providers;
  providers.push_back(std::make_unique<NodeRpcUtxoProvider>(config, transport));
  if (config.enableFallback) {
    providers.push_back(std::make_unique<EsploraUtxoProvider>(config, transport));
  }
  return std::make_unique<FallbackUtxoProvider>(std::move(providers));
}

} // namespace Bitcoin
