/**
 * @file test_key_record_repository.cpp
 * @brief Unit tests for KeyRecordRepository
 *
 * Tests storing, listing and deleting encrypted wallet keys per user.
 */

#include "TestUtils.h"
#include "KeyVault.h"
#include "Vault/KeyRecordRepository.h"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Vault::ChainType;
using Vault::ErrorCode;

namespace {

// A well-formed ciphertext: 12-byte IV, 32-byte body, 16-byte tag
std::string ciphertext(char fill) {
    return std::string(120, fill);
}

Vault::WalletData wallet(ChainType chain, const std::string& address, char fill = 'a') {
    return Vault::WalletData(chain, address, ciphertext(fill));
}

} // namespace

static bool testSchemaIsIdempotent(Vault::KeyRecordRepository& repo, Database::DatabaseManager& dbManager) {
    TEST_START("Schema Migration");

    TEST_ASSERT(dbManager.getSchemaVersion() >= 1, "Migration should have advanced the schema version");
    auto again = repo.initializeSchema();
    TEST_ASSERT(again && *again, "Re-running the migration should be a no-op");

    auto integrity = dbManager.verifyIntegrity();
    TEST_ASSERT(integrity, "Fresh database passes the integrity check: " + integrity.message);

    TEST_STEP("Failed migrations leave the version untouched");
    const int version = dbManager.getSchemaVersion();
    auto broken = dbManager.runMigrations({Database::Migration(version + 1, "Broken step", "CREATE TABLE;")});
    TEST_ASSERT(!broken, "Invalid SQL must fail the migration");
    TEST_ASSERT(dbManager.getSchemaVersion() == version, "Version must not advance");
    TEST_ASSERT(dbManager.beginTransaction(), "No transaction may be left open");
    TEST_ASSERT(dbManager.rollbackTransaction(), "Rollback of the probe transaction");

    TEST_PASS();
}

static bool testStoreAndGetRecord(Vault::KeyRecordRepository& repo) {
    TEST_START("Store and Retrieve Record");

    const auto before = std::chrono::system_clock::now() - std::chrono::seconds(5);
    auto stored = repo.storeRecord("alice", wallet(ChainType::EVM, "0x2c7536e3605d9c16a7a3d7b1898e529396a65c23"));
    TEST_ASSERT(stored, "Store should succeed: " + stored.errorMessage);
    TEST_ASSERT(stored->id > 0, "Row id should be assigned");

    auto fetched = repo.getRecord("alice", ChainType::EVM);
    TEST_ASSERT(fetched, "Record should be found");
    TEST_ASSERT(fetched->id == stored->id, "Same row expected");
    TEST_ASSERT(fetched->userId == "alice", "User id should match");
    TEST_ASSERT(fetched->wallet.chainType == ChainType::EVM, "Chain should match");
    TEST_ASSERT(fetched->wallet.address == "0x2c7536e3605d9c16a7a3d7b1898e529396a65c23", "Address should match");
    TEST_ASSERT(fetched->wallet.privateKeyEncrypted == ciphertext('a'), "Ciphertext stored verbatim");
    TEST_ASSERT(fetched->createdAt >= before, "Creation time is recorded in unix seconds");

    auto missing = repo.getRecord("alice", ChainType::TON);
    TEST_ASSERT(!missing && missing.errorCode == ErrorCode::StorageError, "Missing chain is a storage error");

    TEST_PASS();
}

static bool testDuplicateChainRejected(Vault::KeyRecordRepository& repo) {
    TEST_START("One Record per User and Chain");

    auto first = repo.storeRecord("bob", wallet(ChainType::BTC, "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH"));
    TEST_ASSERT(first, "First store should succeed");

    auto duplicate = repo.storeRecord("bob", wallet(ChainType::BTC, "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", 'b'));
    TEST_ASSERT(!duplicate && duplicate.errorCode == ErrorCode::StorageError, "Second BTC key must be refused");

    auto kept = repo.getRecord("bob", ChainType::BTC);
    TEST_ASSERT(kept && kept->wallet.privateKeyEncrypted == ciphertext('a'), "Original ciphertext is kept");

    auto otherUser = repo.storeRecord("carol", wallet(ChainType::BTC, "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH"));
    TEST_ASSERT(otherUser, "Another user may store the same chain");

    TEST_PASS();
}

static bool testInvalidRecordsRejected(Vault::KeyRecordRepository& repo) {
    TEST_START("Record Validation");

    auto noUser = repo.storeRecord("", wallet(ChainType::SVM, "11111111111111111111111111111111"));
    TEST_ASSERT(!noUser && noUser.errorCode == ErrorCode::InvalidArgument, "Empty user id rejected");

    auto noAddress = repo.storeRecord("dave", wallet(ChainType::SVM, ""));
    TEST_ASSERT(!noAddress && noAddress.errorCode == ErrorCode::InvalidArgument, "Empty address rejected");

    Vault::WalletData shortBlob(ChainType::SVM, "11111111111111111111111111111111", "abcd");
    auto tooShort = repo.storeRecord("dave", shortBlob);
    TEST_ASSERT(!tooShort && tooShort.errorCode == ErrorCode::InvalidArgument, "Blob shorter than IV plus tag");

    Vault::WalletData notHex(ChainType::SVM, "11111111111111111111111111111111", std::string(120, 'z'));
    auto badHex = repo.storeRecord("dave", notHex);
    TEST_ASSERT(!badHex && badHex.errorCode == ErrorCode::InvalidArgument, "Non-hex ciphertext rejected");

    auto records = repo.getRecordsForUser("dave");
    TEST_ASSERT(records && records->empty(), "Nothing should have been stored");

    TEST_PASS();
}

static bool testBatchStoreIsAtomic(Vault::KeyRecordRepository& repo) {
    TEST_START("Atomic Batch Store");

    std::vector<Vault::WalletData> batch = {
        wallet(ChainType::EVM, "0x0000000000000000000000000000000000000001"),
        wallet(ChainType::TRON, "TR7NHqjeKQxGTCi8q8ZY4pL8otSzgjLj6t"),
        wallet(ChainType::EVM, "0x0000000000000000000000000000000000000002"),
    };
    auto failed = repo.storeRecords("erin", batch);
    TEST_ASSERT(!failed && failed.errorCode == ErrorCode::StorageError, "Duplicate chain in batch must fail");

    auto afterFailure = repo.getRecordsForUser("erin");
    TEST_ASSERT(afterFailure && afterFailure->empty(), "A failed batch must leave no rows behind");

    batch.pop_back();
    auto stored = repo.storeRecords("erin", batch);
    TEST_ASSERT(stored && stored->size() == 2, "Valid batch should store every wallet");

    TEST_PASS();
}

static bool testVaultWalletsRoundTrip(Vault::KeyRecordRepository& repo) {
    TEST_START("Generated Wallets Persist in Order");

    auto wallets = KeyVault::GenerateAllWallets(TestUtils::deviceSecret());
    TEST_ASSERT(wallets, "Wallet generation should succeed");

    auto stored = repo.storeRecords("frank", *wallets);
    TEST_ASSERT(stored && stored->size() == wallets->size(), "Every generated wallet should store");

    auto records = repo.getRecordsForUser("frank");
    TEST_ASSERT(records && records->size() == wallets->size(), "All records listed");
    for (size_t i = 0; i < records->size(); ++i) {
        TEST_ASSERT((*records)[i].wallet.chainType == (*wallets)[i].chainType, "Insertion order is kept");
        TEST_ASSERT((*records)[i].wallet.address == (*wallets)[i].address, "Address round-trips");
        if (i > 0) {
            TEST_ASSERT((*records)[i].id > (*records)[i - 1].id, "Ids ascend");
        }
    }

    TEST_STEP("Stored ciphertext still unlocks with the device secret");
    auto tonRecord = repo.getRecord("frank", ChainType::TON);
    TEST_ASSERT(tonRecord, "TON record should be found");
    auto key = KeyVault::UnlockPrivateKey(TestUtils::deviceSecret(), tonRecord->wallet.privateKeyEncrypted);
    TEST_ASSERT(key && key->size() == KeyVault::PRIVATE_KEY_SIZE, "Key should decrypt");

    TEST_PASS();
}

static bool testDeleteRecords(Vault::KeyRecordRepository& repo) {
    TEST_START("Delete Records for User");

    TEST_ASSERT(repo.storeRecord("grace", wallet(ChainType::EVM, "0x0000000000000000000000000000000000000003")),
                "Store should succeed");
    TEST_ASSERT(repo.storeRecord("grace", wallet(ChainType::TON, "EQgrace")), "Store should succeed");
    TEST_ASSERT(repo.storeRecord("heidi", wallet(ChainType::TON, "EQheidi")), "Store should succeed");

    auto deleted = repo.deleteRecordsForUser("grace");
    TEST_ASSERT(deleted && *deleted == 2, "Both of grace's records should be deleted");

    auto remaining = repo.getRecordsForUser("grace");
    TEST_ASSERT(remaining && remaining->empty(), "No records left for grace");

    auto untouched = repo.getRecord("heidi", ChainType::TON);
    TEST_ASSERT(untouched, "Other users are unaffected");

    auto none = repo.deleteRecordsForUser("nobody");
    TEST_ASSERT(none && *none == 0, "Deleting an unknown user removes nothing");

    TEST_PASS();
}

static bool testInjectionInUserId(Vault::KeyRecordRepository& repo) {
    TEST_START("SQL Injection in User Id");

    const std::string hostile = "x'; DROP TABLE encrypted_keys; --";
    auto stored = repo.storeRecord(hostile, wallet(ChainType::SVM, "11111111111111111111111111111111"));
    TEST_ASSERT(stored, "Hostile ids are bound, not interpolated");

    auto fetched = repo.getRecord(hostile, ChainType::SVM);
    TEST_ASSERT(fetched && fetched->userId == hostile, "Hostile id round-trips");

    auto alice = repo.getRecord("alice", ChainType::EVM);
    TEST_ASSERT(alice, "Table must survive");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("KeyRecordRepository Unit Tests");

    Database::DatabaseManager& dbManager = Database::DatabaseManager::getInstance();
    TestUtils::initializeTestLogger("test_key_record_repository.log");

    const std::string dbPath = TestUtils::testDatabasePath("key_records");
    if (!TestUtils::initializeTestDatabase(dbManager, dbPath, STANDARD_TEST_ENCRYPTION_KEY)) {
        return 1;
    }

    Vault::KeyRecordRepository repo(dbManager);
    auto schema = repo.initializeSchema();
    if (!schema) {
        std::cerr << COLOR_RED << "Schema setup failed: " << schema.errorMessage << COLOR_RESET << std::endl;
        TestUtils::shutdownTestEnvironment(dbManager, dbPath);
        return 1;
    }

    testSchemaIsIdempotent(repo, dbManager);
    testStoreAndGetRecord(repo);
    testDuplicateChainRejected(repo);
    testInvalidRecordsRejected(repo);
    testBatchStoreIsAtomic(repo);
    testVaultWalletsRoundTrip(repo);
    testDeleteRecords(repo);

    std::cout << "\n" << COLOR_CYAN << "Running SQL Injection Protection Tests..." << COLOR_RESET << std::endl;
    testInjectionInUserId(repo);

    TestUtils::printTestSummary("KeyRecordRepository");
    TestUtils::shutdownTestEnvironment(dbManager, dbPath);

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
