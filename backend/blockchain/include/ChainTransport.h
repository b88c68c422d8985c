#pragma once

#include "Vault/VaultTypes.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace Transport {

using QueryParams = std::map<std::string, std::string>;

struct TransportConfig {
  int32_t timeoutMs = 10000;
  bool allowInsecureHttp = false;
  std::string userAgent = "VaultSigner/1.0";
};

/**
 * @brief One JSON-RPC call against a node endpoint
 *
 * Bitcoin Core speaks "1.0" with basic auth, EVM and Solana nodes speak "2.0".
 */
struct RpcRequest {
  std::string url;
  std::string method;
  nlohmann::json params = nlohmann::json::array();
  std::string version = "2.0";
  std::string id = "1";
  std::string username;
  std::string password;
};

/**
 * @brief Network collaborator used by every chain signer
 *
 * Implementations never throw. Transport failures, non-2xx statuses,
 * unparseable bodies and JSON-RPC error objects all come back as RPCError.
 */
class ChainTransport {
public:
  virtual ~ChainTransport() = default;

  /**
   * @brief POST a JSON-RPC envelope and return its `result` member
   */
  virtual Vault::Result<nlohmann::json> Call(const RpcRequest &request) = 0;

  /**
   * @brief GET a REST resource and return the parsed body
   */
  virtual Vault::Result<nlohmann::json> Get(const std::string &url,
                                            const QueryParams &query = {}) = 0;

  /**
   * @brief POST a JSON body to a REST resource and return the parsed body
   */
  virtual Vault::Result<nlohmann::json> Post(const std::string &url,
                                             const nlohmann::json &body) = 0;
};

/**
 * @brief ChainTransport over HTTPS using cpr
 *
 * Plain-http URLs are refused unless allowInsecureHttp is set or the host is
 * the local machine.
 */
class HttpTransport : public ChainTransport {
public:
  explicit HttpTransport(TransportConfig config = TransportConfig());

  Vault::Result<nlohmann::json> Call(const RpcRequest &request) override;
  Vault::Result<nlohmann::json> Get(const std::string &url,
                                    const QueryParams &query) override;
  Vault::Result<nlohmann::json> Post(const std::string &url,
                                     const nlohmann::json &body) override;

  const TransportConfig &config() const { return m_config; }

private:
  bool isUrlAllowed(const std::string &url) const;

  TransportConfig m_config;
};

std::unique_ptr<ChainTransport> CreateHttpTransport(const TransportConfig &config);

} // namespace Transport
