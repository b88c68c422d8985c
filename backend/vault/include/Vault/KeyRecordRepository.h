#pragma once

#include "Vault/VaultTypes.h"
#include "Vault/Logger.h"
#include "Database/DatabaseManager.h"
#include <string>
#include <vector>

namespace Vault {

/**
 * @brief Persistence for encrypted wallet keys, one record per user and chain
 *
 * Only addresses and ciphertext are stored; decryption needs the user's
 * device secret, which never reaches this layer.
 */
class KeyRecordRepository {
public:
    explicit KeyRecordRepository(Database::DatabaseManager& dbManager);

    /**
     * @brief Create the encrypted_keys table if the schema predates it
     */
    Result<bool> initializeSchema();

    /**
     * @brief Store one wallet for a user
     * @return StorageError when the user already has a record for that chain
     */
    Result<EncryptedKeyRecord> storeRecord(const std::string& userId, const WalletData& wallet);

    /**
     * @brief Store a batch of wallets atomically (all or nothing)
     */
    Result<std::vector<EncryptedKeyRecord>> storeRecords(const std::string& userId,
                                                         const std::vector<WalletData>& wallets);

    Result<EncryptedKeyRecord> getRecord(const std::string& userId, ChainType chainType);

    /**
     * @brief All records of a user in insertion order
     */
    Result<std::vector<EncryptedKeyRecord>> getRecordsForUser(const std::string& userId);

    /**
     * @brief Remove every record of a user
     * @return Number of deleted records
     */
    Result<int> deleteRecordsForUser(const std::string& userId);

private:
    Result<bool> validateRecord(const std::string& userId, const WalletData& wallet) const;
    Result<EncryptedKeyRecord> insertRecord(const std::string& userId, const WalletData& wallet);
    bool mapRowToRecord(const Database::Statement& row, EncryptedKeyRecord& record) const;

    Database::DatabaseManager& m_dbManager;
    static constexpr const char* COMPONENT_NAME = "KeyRecordRepository";
};

} // namespace Vault
