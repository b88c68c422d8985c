#include "Vault/VaultTypes.h"

namespace Vault {

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::DerivationFailure:
            return "DerivationFailure";
        case ErrorCode::EncryptionFailure:
            return "EncryptionFailure";
        case ErrorCode::AuthenticationFailure:
            return "AuthenticationFailure";
        case ErrorCode::InvalidPrivateKeyLength:
            return "InvalidPrivateKeyLength";
        case ErrorCode::InvalidAddressChecksum:
            return "InvalidAddressChecksum";
        case ErrorCode::InsufficientFunds:
            return "InsufficientFunds";
        case ErrorCode::UnsupportedChain:
            return "UnsupportedChain";
        case ErrorCode::UnsupportedChainId:
            return "UnsupportedChainId";
        case ErrorCode::NoUTXOsAvailable:
            return "NoUTXOsAvailable";
        case ErrorCode::RPCError:
            return "RPCError";
        case ErrorCode::TransactionCreationFailed:
            return "TransactionCreationFailed";
        case ErrorCode::BroadcastRejected:
            return "BroadcastRejected";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::StorageError:
            return "StorageError";
    }
    return "Unknown";
}

std::string ChainTypeToString(ChainType chain) {
    switch (chain) {
        case ChainType::EVM:
            return "evm";
        case ChainType::SVM:
            return "svm";
        case ChainType::BTC:
            return "btc";
        case ChainType::TRON:
            return "tron";
        case ChainType::TON:
            return "ton";
    }
    return "unknown";
}

std::optional<ChainType> ChainTypeFromString(const std::string& tag) {
    for (ChainType chain : AllChainTypes()) {
        if (ChainTypeToString(chain) == tag) {
            return chain;
        }
    }
    return std::nullopt;
}

const std::vector<ChainType>& AllChainTypes() {
    static const std::vector<ChainType> chains = {
        ChainType::EVM, ChainType::SVM, ChainType::BTC, ChainType::TRON, ChainType::TON};
    return chains;
}

std::string TransactionStatusToString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::Signed:
            return "signed";
        case TransactionStatus::Pending:
            return "pending";
        case TransactionStatus::Confirmed:
            return "confirmed";
        case TransactionStatus::Failed:
            return "failed";
    }
    return "unknown";
}

} // namespace Vault
