#include "Vault/KeyRecordRepository.h"
#include "ByteCodec.h"

#include <ctime>

extern "C" {
#ifdef SQLCIPHER_AVAILABLE
#include <sqlcipher/sqlite3.h>
#else
#include <sqlite3.h>
#endif
}

namespace Vault {

namespace {

const std::vector<Database::Migration>& keyRecordMigrations() {
    static const std::vector<Database::Migration> migrations = {
        Database::Migration(1, "Create encrypted_keys table", R"(
            CREATE TABLE IF NOT EXISTS encrypted_keys (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                user_id TEXT NOT NULL,
                chain_type TEXT NOT NULL,
                address TEXT NOT NULL,
                private_key_encrypted TEXT NOT NULL,
                created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
                UNIQUE (user_id, chain_type)
            );
            CREATE INDEX IF NOT EXISTS idx_encrypted_keys_user ON encrypted_keys (user_id);
        )")};
    return migrations;
}

constexpr const char* SELECT_COLUMNS =
    "SELECT id, user_id, chain_type, address, private_key_encrypted, created_at FROM encrypted_keys";

} // namespace

KeyRecordRepository::KeyRecordRepository(Database::DatabaseManager& dbManager) : m_dbManager(dbManager) {
    VAULT_LOG_DEBUG(COMPONENT_NAME, "KeyRecordRepository initialized");
}

Result<bool> KeyRecordRepository::initializeSchema() {
    auto result = m_dbManager.runMigrations(keyRecordMigrations());
    if (!result) {
        VAULT_LOG_ERROR(COMPONENT_NAME, "Schema migration failed", result.message);
        return Result<bool>(ErrorCode::StorageError, result.message);
    }
    return Result<bool>(true);
}

Result<bool> KeyRecordRepository::validateRecord(const std::string& userId, const WalletData& wallet) const {
    if (userId.empty()) {
        return Result<bool>(ErrorCode::InvalidArgument, "User id must not be empty");
    }
    if (wallet.address.empty()) {
        return Result<bool>(ErrorCode::InvalidArgument, "Wallet address must not be empty");
    }
    // IV + tag alone are 28 bytes
    if (wallet.privateKeyEncrypted.size() < 56 || !Codec::IsHexString(wallet.privateKeyEncrypted)) {
        return Result<bool>(ErrorCode::InvalidArgument, "Encrypted key must be IV || ciphertext || tag hex");
    }
    return Result<bool>(true);
}

Result<EncryptedKeyRecord> KeyRecordRepository::insertRecord(const std::string& userId, const WalletData& wallet) {
    const std::string chainTag = ChainTypeToString(wallet.chainType);

    Database::Statement insert(m_dbManager.getHandle(), R"(
        INSERT INTO encrypted_keys (user_id, chain_type, address, private_key_encrypted)
        VALUES (?, ?, ?, ?)
    )");
    if (!insert.prepared()) {
        return Result<EncryptedKeyRecord>(ErrorCode::StorageError, "Failed to prepare key record insertion");
    }
    insert.bind(1, userId).bind(2, chainTag).bind(3, wallet.address).bind(4, wallet.privateKeyEncrypted);

    const int rc = insert.step();
    if (rc == SQLITE_CONSTRAINT) {
        return Result<EncryptedKeyRecord>(ErrorCode::StorageError,
                                          "A " + chainTag + " key is already stored for this user");
    }
    if (rc != SQLITE_DONE) {
        return Result<EncryptedKeyRecord>(ErrorCode::StorageError,
                                          "Failed to store key record: " + m_dbManager.lastError());
    }

    EncryptedKeyRecord record;
    record.id = static_cast<int>(m_dbManager.lastInsertId());
    record.userId = userId;
    record.wallet = wallet;
    record.createdAt = std::chrono::system_clock::now();
    return Result<EncryptedKeyRecord>(record);
}

Result<EncryptedKeyRecord> KeyRecordRepository::storeRecord(const std::string& userId, const WalletData& wallet) {
    VAULT_SCOPED_LOG(COMPONENT_NAME, "storeRecord");

    auto validation = validateRecord(userId, wallet);
    if (!validation) {
        _scopedLogger.failure(validation.errorMessage);
        return Forward<EncryptedKeyRecord>(validation);
    }

    std::lock_guard<std::recursive_mutex> lock(m_dbManager.mutex());
    auto record = insertRecord(userId, wallet);
    if (!record) {
        _scopedLogger.failure(record.errorMessage);
        return record;
    }

    _scopedLogger.success("Chain: " + ChainTypeToString(wallet.chainType) + ", ID: " + std::to_string(record->id));
    return record;
}

Result<std::vector<EncryptedKeyRecord>> KeyRecordRepository::storeRecords(const std::string& userId,
                                                                          const std::vector<WalletData>& wallets) {
    VAULT_SCOPED_LOG(COMPONENT_NAME, "storeRecords");

    for (const auto& wallet : wallets) {
        auto validation = validateRecord(userId, wallet);
        if (!validation) {
            _scopedLogger.failure(validation.errorMessage);
            return Forward<std::vector<EncryptedKeyRecord>>(validation);
        }
    }

    Database::TransactionGuard transaction(m_dbManager);
    if (!transaction.begun()) {
        VAULT_LOG_ERROR(COMPONENT_NAME, "Failed to begin transaction", transaction.begun().message);
        return Result<std::vector<EncryptedKeyRecord>>(ErrorCode::StorageError, "Database transaction error");
    }

    std::vector<EncryptedKeyRecord> records;
    for (const auto& wallet : wallets) {
        auto record = insertRecord(userId, wallet);
        if (!record) {
            _scopedLogger.failure(record.errorMessage);
            return Forward<std::vector<EncryptedKeyRecord>>(record);
        }
        records.push_back(*record);
    }

    auto commitResult = transaction.commit();
    if (!commitResult) {
        VAULT_LOG_ERROR(COMPONENT_NAME, "Failed to commit key records", commitResult.message);
        return Result<std::vector<EncryptedKeyRecord>>(ErrorCode::StorageError, "Failed to commit key records");
    }

    _scopedLogger.success(std::to_string(records.size()) + " records");
    return Result<std::vector<EncryptedKeyRecord>>(std::move(records));
}

Result<EncryptedKeyRecord> KeyRecordRepository::getRecord(const std::string& userId, ChainType chainType) {
    const std::string chainTag = ChainTypeToString(chainType);

    std::lock_guard<std::recursive_mutex> lock(m_dbManager.mutex());
    Database::Statement query(m_dbManager.getHandle(), std::string(SELECT_COLUMNS) +
                                                           " WHERE user_id = ? AND chain_type = ?");
    if (!query.prepared()) {
        return Result<EncryptedKeyRecord>(ErrorCode::StorageError, "Failed to prepare key record query");
    }
    query.bind(1, userId).bind(2, chainTag);

    const int rc = query.step();
    EncryptedKeyRecord record;
    if (rc == SQLITE_ROW && mapRowToRecord(query, record)) {
        return Result<EncryptedKeyRecord>(record);
    }
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return Result<EncryptedKeyRecord>(ErrorCode::StorageError, "No " + chainTag + " key stored for this user");
    }
    return Result<EncryptedKeyRecord>(ErrorCode::StorageError, "Database error while retrieving key record");
}

Result<std::vector<EncryptedKeyRecord>> KeyRecordRepository::getRecordsForUser(const std::string& userId) {
    std::lock_guard<std::recursive_mutex> lock(m_dbManager.mutex());
    Database::Statement query(m_dbManager.getHandle(),
                              std::string(SELECT_COLUMNS) + " WHERE user_id = ? ORDER BY id ASC");
    if (!query.prepared()) {
        return Result<std::vector<EncryptedKeyRecord>>(ErrorCode::StorageError, "Failed to prepare key records query");
    }
    query.bind(1, userId);

    std::vector<EncryptedKeyRecord> records;
    int rc;
    while ((rc = query.step()) == SQLITE_ROW) {
        EncryptedKeyRecord record;
        if (mapRowToRecord(query, record)) {
            records.push_back(std::move(record));
        }
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<EncryptedKeyRecord>>(ErrorCode::StorageError,
                                                       "Database error while retrieving key records");
    }
    return Result<std::vector<EncryptedKeyRecord>>(std::move(records));
}

Result<int> KeyRecordRepository::deleteRecordsForUser(const std::string& userId) {
    VAULT_SCOPED_LOG(COMPONENT_NAME, "deleteRecordsForUser");

    std::lock_guard<std::recursive_mutex> lock(m_dbManager.mutex());
    Database::Statement remove(m_dbManager.getHandle(), "DELETE FROM encrypted_keys WHERE user_id = ?");
    if (!remove.prepared()) {
        _scopedLogger.failure("prepare failed");
        return Result<int>(ErrorCode::StorageError, "Failed to prepare key record deletion");
    }
    remove.bind(1, userId);

    if (remove.step() != SQLITE_DONE) {
        _scopedLogger.failure(m_dbManager.lastError());
        return Result<int>(ErrorCode::StorageError, "Failed to delete key records");
    }

    const int deleted = m_dbManager.changes();
    _scopedLogger.success(std::to_string(deleted) + " records");
    return Result<int>(deleted);
}

bool KeyRecordRepository::mapRowToRecord(const Database::Statement& row, EncryptedKeyRecord& record) const {
    const std::string chainTag = row.columnText(2);
    auto chain = ChainTypeFromString(chainTag);
    if (!chain) {
        VAULT_LOG_WARNING(COMPONENT_NAME, "Skipping key record with unknown chain tag", chainTag);
        return false;
    }

    record.id = static_cast<int>(row.columnInt(0));
    record.userId = row.columnText(1);
    record.wallet.chainType = *chain;
    record.wallet.address = row.columnText(3);
    record.wallet.privateKeyEncrypted = row.columnText(4);
    record.createdAt = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(row.columnInt(5)));
    return true;
}

} // namespace Vault
