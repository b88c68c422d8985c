#include "include/BitcoinSigner.h"
#include "ByteCodec.h"
#include "Vault/Logger.h"

#include <algorithm>

using json = nlohmann::json;
using Vault::ErrorCode;
using Vault::Result;

namespace Bitcoin {
namespace {

const char *const COMPONENT = "BitcoinSigner";
constexpr uint32_t kVersion = 1;
constexpr uint32_t kSequence = 0xffffffff;
constexpr uint32_t kLocktime = 0;

// OP_DUP OP_HASH160 <20> OP_EQUALVERIFY OP_CHECKSIG
std::vector<uint8_t> p2pkhScript(const std::array<uint8_t, 20> &pubKeyHash) {
  std::vector<uint8_t> script;
  script.reserve(25);
  script.push_back(0x76);
  script.push_back(0xa9);
  script.push_back(0x14);
  script.insert(script.end(), pubKeyHash.begin(), pubKeyHash.end());
  script.push_back(0x88);
  script.push_back(0xac);
  return script;
}

struct Outpoint {
  std::vector<uint8_t> txid;  // little-endian
  uint32_t vout;
};

void writeInput(std::vector<uint8_t> &out, const Outpoint &outpoint,
                const std::vector<uint8_t> &script) {
  out.insert(out.end(), outpoint.txid.begin(), outpoint.txid.end());
  Codec::WriteUInt32LE(out, outpoint.vout);
  Codec::WriteVarInt(out, script.size());
  out.insert(out.end(), script.begin(), script.end());
  Codec::WriteUInt32LE(out, kSequence);
}

void writeOutput(std::vector<uint8_t> &out, uint64_t value, const std::vector<uint8_t> &script) {
  Codec::WriteUInt64LE(out, value);
  Codec::WriteVarInt(out, script.size());
  out.insert(out.end(), script.begin(), script.end());
}

std::vector<uint8_t> serialize(const std::vector<Outpoint> &outpoints,
                               const std::vector<std::vector<uint8_t>> &scriptSigs,
                               const std::vector<std::pair<uint64_t, std::vector<uint8_t>>> &outputs) {
  std::vector<uint8_t> tx;
  Codec::WriteUInt32LE(tx, kVersion);
  Codec::WriteVarInt(tx, outpoints.size());
  for (size_t i = 0; i < outpoints.size(); ++i) {
    writeInput(tx, outpoints[i], scriptSigs[i]);
  }
  Codec::WriteVarInt(tx, outputs.size());
  for (const auto &output : outputs) {
    writeOutput(tx, output.first, output.second);
  }
  Codec::WriteUInt32LE(tx, kLocktime);
  return tx;
}

} // namespace

BitcoinSigner::BitcoinSigner(Chains::BitcoinConfig config, Transport::ChainTransport &transport,
                             std::unique_ptr<UtxoProvider> provider)
    : m_config(std::move(config)), m_transport(transport), m_provider(std::move(provider)) {
  if (!m_provider) {
    m_provider = CreateUtxoProvider(m_config, m_transport);
  }
}

Result<std::string> BitcoinSigner::GetAddressFromPrivateKey(const Crypto::SecureBytes &privateKey,
                                                            BitcoinNetwork network) const {
  return AddressDerivation::DeriveBitcoinAddress(privateKey.bytes(), network);
}

Result<SignedTransaction> BitcoinSigner::SignTransaction(const TransferRequest &request,
                                                         const Crypto::SecureBytes &privateKey) const {
  VAULT_SCOPED_LOG(COMPONENT, "SignTransaction");

  if (privateKey.size() != 32) {
    _scopedLogger.failure("Invalid private key length");
    return Result<SignedTransaction>(ErrorCode::InvalidPrivateKeyLength,
                                     "secp256k1 private key must be 32 bytes");
  }

  std::vector<uint8_t> publicKey;
  std::string senderAddress;
  if (!Crypto::DerivePublicKey(privateKey.bytes(), publicKey) ||
      !AddressDerivation::BitcoinAddressFromPublicKey(publicKey, request.network, senderAddress)) {
    _scopedLogger.failure("Public key derivation failed");
    return Result<SignedTransaction>(ErrorCode::DerivationFailure, "Failed to derive public key");
  }

  const uint64_t fee = request.fee.value_or(m_config.defaultFee);

  uint64_t totalInput = 0;
  for (const auto &utxo : request.utxos) {
    if (utxo.value > UINT64_MAX - totalInput) {
      _scopedLogger.failure("UTXO values overflow");
      return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Sum of UTXO values overflows 64 bits");
    }
    totalInput += utxo.value;
  }
  if (request.amount > UINT64_MAX - fee || totalInput < request.amount + fee) {
    const std::string message = "Insufficient funds. Have " + std::to_string(totalInput) +
                                ", need " + std::to_string(request.amount) + " + fee " +
                                std::to_string(fee);
    _scopedLogger.failure(message);
    return Result<SignedTransaction>(ErrorCode::InsufficientFunds, message);
  }
  const uint64_t change = totalInput - request.amount - fee;

  auto recipient = AddressDerivation::DecodeBitcoinAddress(request.to);
  if (!recipient) {
    _scopedLogger.failure(recipient.errorMessage, "recipient");
    return Vault::Forward<SignedTransaction>(recipient);
  }
  auto changeTarget = AddressDerivation::DecodeBitcoinAddress(request.changeAddress.value_or(senderAddress));
  if (!changeTarget) {
    _scopedLogger.failure(changeTarget.errorMessage, "change");
    return Vault::Forward<SignedTransaction>(changeTarget);
  }
  auto sender = AddressDerivation::DecodeBitcoinAddress(senderAddress);
  if (!sender) {
    return Vault::Forward<SignedTransaction>(sender);
  }

  std::vector<Outpoint> outpoints;
  outpoints.reserve(request.utxos.size());
  for (const auto &utxo : request.utxos) {
    Outpoint outpoint;
    if (!Codec::HexToBytes(utxo.txid, outpoint.txid) || outpoint.txid.size() != 32) {
      return Result<SignedTransaction>(ErrorCode::InvalidArgument, "Invalid UTXO txid: " + utxo.txid);
    }
    std::reverse(outpoint.txid.begin(), outpoint.txid.end());
    outpoint.vout = utxo.vout;
    outpoints.push_back(std::move(outpoint));
  }

  std::vector<std::pair<uint64_t, std::vector<uint8_t>>> outputs;
  outputs.emplace_back(request.amount, p2pkhScript(recipient->pubKeyHash));
  if (change > DUST_THRESHOLD) {
    outputs.emplace_back(change, p2pkhScript(changeTarget->pubKeyHash));
  }

  // Legacy sighash: the signed input carries the sender's script, every other input an empty one
  const std::vector<uint8_t> senderScript = p2pkhScript(sender->pubKeyHash);
  std::vector<std::vector<uint8_t>> scriptSigs(outpoints.size());

  for (size_t i = 0; i < outpoints.size(); ++i) {
    std::vector<std::vector<uint8_t>> sighashScripts(outpoints.size());
    sighashScripts[i] = senderScript;

    std::vector<uint8_t> preimage = serialize(outpoints, sighashScripts, outputs);
    Codec::WriteUInt32LE(preimage, SIGHASH_ALL);

    std::array<uint8_t, 32> sighash;
    Crypto::ECDSASignature signature;
    if (!Crypto::DoubleSHA256(preimage.data(), preimage.size(), sighash) ||
        !Crypto::SignHash(privateKey.bytes(), sighash, signature)) {
      _scopedLogger.failure("ECDSA signing failed");
      return Result<SignedTransaction>(ErrorCode::InvalidArgument, "ECDSA signing failed");
    }

    // <sig || SIGHASH_ALL> <pubkey>
    std::vector<uint8_t> sigWithType = signature.der_encoded;
    sigWithType.push_back(static_cast<uint8_t>(SIGHASH_ALL));

    std::vector<uint8_t> &scriptSig = scriptSigs[i];
    scriptSig.push_back(static_cast<uint8_t>(sigWithType.size()));
    scriptSig.insert(scriptSig.end(), sigWithType.begin(), sigWithType.end());
    scriptSig.push_back(static_cast<uint8_t>(publicKey.size()));
    scriptSig.insert(scriptSig.end(), publicKey.begin(), publicKey.end());
  }

  const std::vector<uint8_t> raw = serialize(outpoints, scriptSigs, outputs);

  std::array<uint8_t, 32> txHash;
  if (!Crypto::DoubleSHA256(raw.data(), raw.size(), txHash)) {
    return Result<SignedTransaction>(ErrorCode::TransactionCreationFailed, "Failed to hash transaction");
  }
  std::reverse(txHash.begin(), txHash.end());

  SignedTransaction signedTx;
  signedTx.rawTransaction = Codec::BytesToHex(raw);
  signedTx.txid = Codec::BytesToHex(txHash.data(), txHash.size());
  signedTx.fee = fee;
  signedTx.change = change > DUST_THRESHOLD ? change : 0;

  _scopedLogger.success(signedTx.txid);
  return Result<SignedTransaction>(std::move(signedTx));
}

Result<std::vector<UTXO>> BitcoinSigner::GetUTXOs(const std::string &address, BitcoinNetwork network) {
  auto utxos = m_provider->getUtxos(address, network);
  if (!utxos) {
    return Result<std::vector<UTXO>>(ErrorCode::RPCError, "No UTXO provider answered for " + address);
  }
  return Result<std::vector<UTXO>>(std::move(*utxos));
}

uint64_t BitcoinSigner::GetBalance(const std::string &address, BitcoinNetwork network) {
  auto balance = m_provider->getBalance(address, network);
  if (!balance) {
    VAULT_LOG_WARNING(COMPONENT, "Balance lookup failed", address);
    return 0;
  }
  return *balance;
}

Result<SignedTransaction> BitcoinSigner::SignTransferFromChain(const TransferRequest &request,
                                                               const Crypto::SecureBytes &privateKey) {
  auto sender = GetAddressFromPrivateKey(privateKey, request.network);
  if (!sender) {
    return Vault::Forward<SignedTransaction>(sender);
  }

  auto utxos = GetUTXOs(*sender, request.network);
  if (!utxos) {
    return Vault::Forward<SignedTransaction>(utxos);
  }
  if (utxos->empty()) {
    return Result<SignedTransaction>(ErrorCode::NoUTXOsAvailable, "No UTXOs available for " + *sender);
  }

  TransferRequest funded = request;
  funded.utxos = std::move(*utxos);
  return SignTransaction(funded, privateKey);
}

Result<std::string> BitcoinSigner::SendRawTransaction(const std::string &rawTransaction,
                                                      BitcoinNetwork network) {
  const auto &endpoints = network == BitcoinNetwork::Testnet ? m_config.testnet : m_config.mainnet;
  if (endpoints.rpcUrl.empty()) {
    return Result<std::string>(ErrorCode::RPCError, "No Bitcoin RPC endpoint configured");
  }

  Transport::RpcRequest request;
  request.url = endpoints.rpcUrl;
  request.method = "sendrawtransaction";
  request.params = json::array({rawTransaction});
  request.version = "1.0";
  request.id = "vaultsigner";
  request.username = m_config.rpcUsername;
  request.password = m_config.rpcPassword;

  auto result = m_transport.Call(request);
  if (!result) {
    return Vault::Forward<std::string>(result);
  }
  if (!result->is_string()) {
    return Result<std::string>(ErrorCode::RPCError, "Malformed sendrawtransaction result");
  }
  return Result<std::string>(result->get<std::string>());
}

Result<Vault::BroadcastResult> BitcoinSigner::SignAndSendTransaction(const TransferRequest &request,
                                                                     const Crypto::SecureBytes &privateKey) {
  auto signedTx = request.utxos.empty() ? SignTransferFromChain(request, privateKey)
                                        : SignTransaction(request, privateKey);
  if (!signedTx) {
    return Vault::Forward<Vault::BroadcastResult>(signedTx);
  }

  auto txid = SendRawTransaction(signedTx->rawTransaction, request.network);
  if (!txid) {
    VAULT_LOG_ERROR(COMPONENT, "sendrawtransaction failed", txid.errorMessage);
    return Vault::Forward<Vault::BroadcastResult>(txid);
  }

  VAULT_LOG_INFO(COMPONENT, "Transaction submitted", *txid);
  return Result<Vault::BroadcastResult>(Vault::BroadcastResult(*txid, Vault::TransactionStatus::Pending));
}

} // namespace Bitcoin
