#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Vault {

/**
 * @brief Failure categories surfaced by vault, derivation and signing operations
 */
enum class ErrorCode {
    None = 0,
    DerivationFailure,
    EncryptionFailure,
    AuthenticationFailure,
    InvalidPrivateKeyLength,
    InvalidAddressChecksum,
    InsufficientFunds,
    UnsupportedChain,
    UnsupportedChainId,
    NoUTXOsAvailable,
    RPCError,
    TransactionCreationFailed,
    BroadcastRejected,
    InvalidArgument,
    StorageError
};

/**
 * @brief Convert an error code to its symbolic name
 */
std::string ErrorCodeToString(ErrorCode code);

/**
 * @brief Result wrapper for vault and signer operations
 */
template<typename T>
struct Result {
    bool success;
    std::string errorMessage;
    T data;
    ErrorCode errorCode;

    Result() : success(false), data(), errorCode(ErrorCode::None) {}
    Result(const T& value) : success(true), data(value), errorCode(ErrorCode::None) {}
    Result(T&& value) : success(true), data(std::move(value)), errorCode(ErrorCode::None) {}
    Result(ErrorCode code, const std::string& error)
        : success(false), errorMessage(error), data(), errorCode(code) {}

    explicit operator bool() const { return success; }
    const T& operator*() const { return data; }
    T& operator*() { return data; }
    const T* operator->() const { return &data; }
    T* operator->() { return &data; }

    bool hasValue() const { return success; }
    const std::string& error() const { return errorMessage; }
    ErrorCode code() const { return errorCode; }
};

/**
 * @brief Propagate the failure of one result into a result of another type
 */
template<typename T, typename U>
Result<T> Forward(const Result<U>& failed) {
    return Result<T>(failed.errorCode, failed.errorMessage);
}

/**
 * @brief Log levels for vault operations
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string details;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& det = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), details(det) {}
};

/**
 * @brief Chain families supported by the vault
 */
enum class ChainType {
    EVM,
    SVM,
    BTC,
    TRON,
    TON
};

/**
 * @brief Wire tag of a chain family ("evm", "svm", "btc", "tron", "ton")
 */
std::string ChainTypeToString(ChainType chain);

/**
 * @brief Parse a wire tag into a chain family
 * @return std::nullopt for unknown tags
 */
std::optional<ChainType> ChainTypeFromString(const std::string& tag);

/**
 * @brief All chain families in declaration order
 */
const std::vector<ChainType>& AllChainTypes();

/**
 * @brief Public wallet record: address plus the encrypted private key
 */
struct WalletData {
    ChainType chainType;
    std::string address;
    std::string privateKeyEncrypted;  // hex(IV || ciphertext || tag)

    WalletData() : chainType(ChainType::EVM) {}
    WalletData(ChainType chain, const std::string& addr, const std::string& encrypted)
        : chainType(chain), address(addr), privateKeyEncrypted(encrypted) {}
};

/**
 * @brief Persisted key record owned by one user for one chain
 */
struct EncryptedKeyRecord {
    int id;
    std::string userId;
    WalletData wallet;
    std::chrono::system_clock::time_point createdAt;

    EncryptedKeyRecord() : id(0) {}
};

/**
 * @brief Status reported for a signed or broadcast transaction
 */
enum class TransactionStatus {
    Signed,
    Pending,
    Confirmed,
    Failed
};

std::string TransactionStatusToString(TransactionStatus status);

/**
 * @brief Outcome of handing a signed transaction to a node
 */
struct BroadcastResult {
    std::string transactionHash;
    TransactionStatus status;
    std::string message;

    BroadcastResult() : status(TransactionStatus::Pending) {}
    BroadcastResult(const std::string& hash, TransactionStatus st, const std::string& msg = "")
        : transactionHash(hash), status(st), message(msg) {}
};

/**
 * @brief Direction of a history entry relative to the queried address
 */
enum class TransferDirection {
    Send,
    Receive
};

/**
 * @brief Normalized transfer history entry shared by all chain signers
 */
struct TransactionHistoryEntry {
    std::string hash;
    std::optional<uint64_t> blockNumber;
    std::optional<int64_t> timestamp;
    TransferDirection direction;
    std::string amount;  // base-10 smallest units
    std::string from;
    std::string to;
    std::optional<std::string> tokenAddress;
    std::optional<std::string> message;
    std::optional<std::string> fee;
    TransactionStatus status;

    TransactionHistoryEntry()
        : direction(TransferDirection::Receive), amount("0"), status(TransactionStatus::Confirmed) {}
};

/**
 * @brief Filters for history queries
 */
struct HistoryOptions {
    uint32_t limit;
    std::optional<std::string> tokenAddress;

    HistoryOptions(uint32_t lim = 50) : limit(lim) {}
};

} // namespace Vault
