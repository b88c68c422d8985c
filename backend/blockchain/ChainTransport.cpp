#include "include/ChainTransport.h"
#include "Vault/Logger.h"

#include <cpr/cpr.h>

using json = nlohmann::json;
using Vault::ErrorCode;
using Vault::Result;

namespace Transport {
namespace {

Result<json> rpcError(const std::string &message) {
  return Result<json>(ErrorCode::RPCError, message);
}

Result<json> parseBody(const cpr::Response &response) {
  if (response.error) {
    return rpcError("HTTP request failed: " + response.error.message);
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    return rpcError("HTTP status " + std::to_string(response.status_code));
  }
  if (response.text.empty()) {
    return rpcError("Empty response body");
  }

  try {
    return Result<json>(json::parse(response.text));
  } catch (const std::exception &e) {
    return rpcError(std::string("Invalid JSON response: ") + e.what());
  }
}

bool isLocalHost(const std::string &url) {
  static const char *const kLocalPrefixes[] = {"http://localhost", "http://127.0.0.1",
                                               "http://[::1]"};
  for (const char *prefix : kLocalPrefixes) {
    if (url.rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

} // namespace

HttpTransport::HttpTransport(TransportConfig config) : m_config(std::move(config)) {}

bool HttpTransport::isUrlAllowed(const std::string &url) const {
  if (url.rfind("https://", 0) == 0) {
    return true;
  }
  if (url.rfind("http://", 0) == 0) {
    return m_config.allowInsecureHttp || isLocalHost(url);
  }
  return false;
}

Result<json> HttpTransport::Call(const RpcRequest &request) {
  if (!isUrlAllowed(request.url)) {
    return rpcError("Refusing insecure or malformed RPC URL");
  }

  json payload = {{"jsonrpc", request.version},
                  {"id", request.id},
                  {"method", request.method},
                  {"params", request.params}};

  cpr::Header headers{{"Content-Type", "application/json"},
                      {"User-Agent", m_config.userAgent}};
  cpr::Response response;

  try {
    if (!request.username.empty()) {
      response = cpr::Post(cpr::Url{request.url}, cpr::Body{payload.dump()}, headers,
                           cpr::Authentication{request.username, request.password,
                                               cpr::AuthMode::BASIC},
                           cpr::Timeout{m_config.timeoutMs});
    } else {
      response = cpr::Post(cpr::Url{request.url}, cpr::Body{payload.dump()}, headers,
                           cpr::Timeout{m_config.timeoutMs});
    }
  } catch (const std::exception &e) {
    return rpcError(std::string("HTTP request failed: ") + e.what());
  }

  auto parsed = parseBody(response);
  if (!parsed) {
    // Bitcoin Core answers RPC errors with HTTP 500 and a JSON error body
    json body = json::parse(response.text, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error") &&
        body["error"].is_object()) {
      return rpcError(body["error"].value("message", parsed.errorMessage));
    }
    VAULT_LOG_DEBUG("Transport", "RPC call failed", request.method + ": " + parsed.errorMessage);
    return parsed;
  }

  const json &body = *parsed;
  if (!body.is_object()) {
    return rpcError("Malformed JSON-RPC response");
  }
  if (body.contains("error") && !body["error"].is_null()) {
    const json &error = body["error"];
    std::string message = error.is_object() ? error.value("message", error.dump()) : error.dump();
    return rpcError(message);
  }
  if (!body.contains("result")) {
    return rpcError("JSON-RPC response has no result");
  }
  return Result<json>(body["result"]);
}

Result<json> HttpTransport::Get(const std::string &url, const QueryParams &query) {
  if (!isUrlAllowed(url)) {
    return rpcError("Refusing insecure or malformed URL");
  }

  cpr::Parameters parameters;
  for (const auto &entry : query) {
    parameters.Add(cpr::Parameter{entry.first, entry.second});
  }

  cpr::Response response;
  try {
    response = cpr::Get(cpr::Url{url}, parameters, cpr::Timeout{m_config.timeoutMs},
                        cpr::Header{{"User-Agent", m_config.userAgent}},
                        cpr::VerifySsl{true});
  } catch (const std::exception &e) {
    return rpcError(std::string("HTTP request failed: ") + e.what());
  }
  return parseBody(response);
}

Result<json> HttpTransport::Post(const std::string &url, const json &body) {
  if (!isUrlAllowed(url)) {
    return rpcError("Refusing insecure or malformed URL");
  }

  cpr::Response response;
  try {
    response = cpr::Post(cpr::Url{url}, cpr::Body{body.dump()},
                         cpr::Header{{"Content-Type", "application/json"},
                                     {"User-Agent", m_config.userAgent}},
                         cpr::Timeout{m_config.timeoutMs}, cpr::VerifySsl{true});
  } catch (const std::exception &e) {
    return rpcError(std::string("HTTP request failed: ") + e.what());
  }
  return parseBody(response);
}

std::unique_ptr<ChainTransport> CreateHttpTransport(const TransportConfig &config) {
  return std::make_unique<HttpTransport>(config);
}

} // namespace Transport
