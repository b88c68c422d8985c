#include "Database/DatabaseManager.h"
#include "Crypto.h"
#include "Vault/Logger.h"

#ifdef SQLCIPHER_AVAILABLE
#define SQLITE_HAS_CODEC 1
#include <sqlcipher/sqlite3.h>
#else
#include <sqlite3.h>
#endif

namespace Database {

namespace {

const char *const COMPONENT = "DatabaseManager";
constexpr size_t MIN_PASSPHRASE_LENGTH = 32;

DatabaseResult notOpen() { return DatabaseResult(false, "Database is not open", SQLITE_MISUSE); }

} // namespace

// Statement

Statement::Statement(sqlite3 *db, const std::string &sql)
    : m_prepareCode(db ? sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) : SQLITE_MISUSE) {
  if (m_prepareCode != SQLITE_OK && m_stmt) {
    sqlite3_finalize(m_stmt);
    m_stmt = nullptr;
  }
}

Statement::~Statement() {
  if (m_stmt) {
    sqlite3_finalize(m_stmt);
  }
}

Statement &Statement::bind(int index, const std::string &value) {
  if (m_stmt) {
    sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  }
  return *this;
}

Statement &Statement::bind(int index, std::int64_t value) {
  if (m_stmt) {
    sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value));
  }
  return *this;
}

int Statement::step() { return m_stmt ? sqlite3_step(m_stmt) : SQLITE_MISUSE; }

std::string Statement::columnText(int column) const {
  const unsigned char *text = m_stmt ? sqlite3_column_text(m_stmt, column) : nullptr;
  if (!text) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<size_t>(sqlite3_column_bytes(m_stmt, column)));
}

std::int64_t Statement::columnInt(int column) const {
  return m_stmt ? static_cast<std::int64_t>(sqlite3_column_int64(m_stmt, column)) : 0;
}

// DatabaseManager

DatabaseManager &DatabaseManager::getInstance() {
  static DatabaseManager instance;
  return instance;
}

DatabaseManager::~DatabaseManager() { close(); }

DatabaseResult DatabaseManager::exec(const std::string &sql, const std::string &context) {
  char *message = nullptr;
  const int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &message);
  if (rc == SQLITE_OK) {
    return DatabaseResult(true);
  }
  std::string error = context + ": " + (message ? message : sqlite3_errmsg(m_db));
  sqlite3_free(message);
  return DatabaseResult(false, error, rc);
}

DatabaseResult DatabaseManager::fail(const DatabaseResult &failure) {
  sqlite3_close(m_db);
  m_db = nullptr;
  Crypto::SecureWipeString(m_passphrase);
  VAULT_LOG_ERROR(COMPONENT, "Could not open key-record database", failure.message);
  return failure;
}

DatabaseResult DatabaseManager::initialize(const std::string &dbPath, const std::string &encryptionKey) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (m_db) {
    return DatabaseResult(true, "Already open: " + m_dbPath);
  }
  if (encryptionKey.size() < MIN_PASSPHRASE_LENGTH) {
    return DatabaseResult(false, "Database passphrase must be at least 32 characters", SQLITE_MISUSE);
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc = sqlite3_open_v2(dbPath.c_str(), &m_db, flags, nullptr);
  if (rc != SQLITE_OK) {
    // sqlite3_open_v2 may hand back a handle even on failure
    return fail(DatabaseResult(false, "Cannot open " + dbPath + ": " + sqlite3_errstr(rc), rc));
  }

  m_dbPath = dbPath;
  m_passphrase = encryptionKey;
  m_inTransaction = false;

  DatabaseResult step = applyKey();
  if (!step) {
    return fail(step);
  }
  step = probeReadable();
  if (!step) {
    return fail(step);
  }

  static const char *const kSessionPragmas[] = {
      "PRAGMA foreign_keys = ON;",
      "PRAGMA secure_delete = ON;",
      "PRAGMA journal_mode = WAL;",
      "PRAGMA synchronous = FULL;",
  };
  for (const char *pragma : kSessionPragmas) {
    step = exec(pragma, "Session setup");
    if (!step) {
      return fail(step);
    }
  }

  VAULT_LOG_INFO(COMPONENT, "Key-record database open", dbPath);
  return DatabaseResult(true, "Opened " + dbPath);
}

DatabaseResult DatabaseManager::applyKey() {
#ifdef SQLCIPHER_AVAILABLE
  const int rc = sqlite3_key(m_db, m_passphrase.data(), static_cast<int>(m_passphrase.size()));
  if (rc != SQLITE_OK) {
    return DatabaseResult(false, std::string("sqlite3_key: ") + sqlite3_errmsg(m_db), rc);
  }
  // SQLCipher 4 parameters, pinned so a library default change cannot orphan old files
  return exec("PRAGMA cipher_page_size = 4096;"
              "PRAGMA kdf_iter = 256000;"
              "PRAGMA cipher_hmac_algorithm = HMAC_SHA512;"
              "PRAGMA cipher_kdf_algorithm = PBKDF2_HMAC_SHA512;",
              "Cipher setup");
#else
  VAULT_LOG_WARNING(COMPONENT, "Built without SQLCipher, key records are not encrypted at rest", m_dbPath);
  return DatabaseResult(true);
#endif
}

DatabaseResult DatabaseManager::probeReadable() {
  // A wrong passphrase is only detected when the first page is decrypted
  Statement probe(m_db, "SELECT count(*) FROM sqlite_master;");
  if (!probe.prepared()) {
    return DatabaseResult(false, "Database unreadable (wrong passphrase?): " + lastError(),
                          probe.prepareCode());
  }
  const int rc = probe.step();
  if (rc != SQLITE_ROW) {
    return DatabaseResult(false, "Database unreadable (wrong passphrase?): " + lastError(), rc);
  }
  return DatabaseResult(true);
}

void DatabaseManager::close() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  if (m_db) {
    if (m_inTransaction) {
      DatabaseResult undone = exec("ROLLBACK;", "Rollback on close");
      if (!undone) {
        VAULT_LOG_WARNING(COMPONENT, "Open transaction could not be rolled back", undone.message);
      }
    }
    sqlite3_close(m_db);
    m_db = nullptr;
    VAULT_LOG_DEBUG(COMPONENT, "Key-record database closed", m_dbPath);
  }
  m_inTransaction = false;
  Crypto::SecureWipeString(m_passphrase);
}

bool DatabaseManager::isInitialized() const {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_db != nullptr;
}

sqlite3 *DatabaseManager::getHandle() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_db;
}

std::int64_t DatabaseManager::lastInsertId() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_db ? static_cast<std::int64_t>(sqlite3_last_insert_rowid(m_db)) : 0;
}

int DatabaseManager::changes() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_db ? sqlite3_changes(m_db) : 0;
}

std::string DatabaseManager::lastError() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_db ? sqlite3_errmsg(m_db) : "database not open";
}

DatabaseResult DatabaseManager::executeQuery(const std::string &sql) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  if (!m_db) {
    return notOpen();
  }
  DatabaseResult result = exec(sql, "Query failed");
  if (!result) {
    VAULT_LOG_ERROR(COMPONENT, "Statement failed", result.message);
  }
  return result;
}

DatabaseResult DatabaseManager::beginTransaction() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  if (!m_db) {
    return notOpen();
  }
  if (m_inTransaction) {
    return DatabaseResult(false, "Nested transactions are not supported", SQLITE_MISUSE);
  }
  DatabaseResult result = exec("BEGIN IMMEDIATE;", "BEGIN");
  m_inTransaction = result.success;
  return result;
}

DatabaseResult DatabaseManager::commitTransaction() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  if (!m_db) {
    return notOpen();
  }
  if (!m_inTransaction) {
    return DatabaseResult(false, "COMMIT without BEGIN", SQLITE_MISUSE);
  }
  DatabaseResult result = exec("COMMIT;", "COMMIT");
  if (result) {
    m_inTransaction = false;
  }
  return result;
}

DatabaseResult DatabaseManager::rollbackTransaction() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  if (!m_db) {
    return notOpen();
  }
  if (!m_inTransaction) {
    return DatabaseResult(false, "ROLLBACK without BEGIN", SQLITE_MISUSE);
  }
  DatabaseResult result = exec("ROLLBACK;", "ROLLBACK");
  // SQLite ends the transaction even when ROLLBACK reports an error
  m_inTransaction = false;
  return result;
}

int DatabaseManager::getSchemaVersion() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  if (!m_db) {
    return -1;
  }
  Statement query(m_db, "PRAGMA user_version;");
  if (query.step() != SQLITE_ROW) {
    return -1;
  }
  return static_cast<int>(query.columnInt(0));
}

DatabaseResult DatabaseManager::setSchemaVersion(int version) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  if (!m_db) {
    return notOpen();
  }
  if (version < 0) {
    return DatabaseResult(false, "Schema version must not be negative", SQLITE_MISUSE);
  }
  // PRAGMA arguments cannot be bound
  return exec("PRAGMA user_version = " + std::to_string(version) + ";", "Schema version update");
}

DatabaseResult DatabaseManager::runMigrations(const std::vector<Migration> &migrations) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);

  int current = getSchemaVersion();
  if (current < 0) {
    return notOpen();
  }

  for (const Migration &migration : migrations) {
    if (migration.version <= current) {
      continue;
    }
    VAULT_LOG_INFO(COMPONENT, "Migrating schema to v" + std::to_string(migration.version),
                   migration.description);

    TransactionGuard transaction(*this);
    if (!transaction.begun()) {
      return transaction.begun();
    }

    DatabaseResult applied = exec(migration.sql, "Migration v" + std::to_string(migration.version));
    if (!applied) {
      VAULT_LOG_ERROR(COMPONENT, "Migration rolled back", applied.message);
      return applied;
    }
    applied = setSchemaVersion(migration.version);
    if (!applied) {
      return applied;
    }
    applied = transaction.commit();
    if (!applied) {
      return applied;
    }
    current = migration.version;
  }

  return DatabaseResult(true, "Schema at v" + std::to_string(current));
}

DatabaseResult DatabaseManager::verifyIntegrity() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  if (!m_db) {
    return notOpen();
  }

  Statement check(m_db, "PRAGMA integrity_check(10);");
  if (!check.prepared()) {
    return DatabaseResult(false, "Integrity check unavailable: " + lastError(), check.prepareCode());
  }

  std::string firstProblem;
  int rc;
  while ((rc = check.step()) == SQLITE_ROW) {
    const std::string line = check.columnText(0);
    if (line != "ok" && firstProblem.empty()) {
      firstProblem = line;
    }
  }
  if (rc != SQLITE_DONE) {
    return DatabaseResult(false, "Integrity check aborted: " + lastError(), rc);
  }
  if (!firstProblem.empty()) {
    VAULT_LOG_CRITICAL(COMPONENT, "Key-record database is corrupt", firstProblem);
    return DatabaseResult(false, "Integrity check failed: " + firstProblem, SQLITE_CORRUPT);
  }
  return DatabaseResult(true, "ok");
}

// TransactionGuard

TransactionGuard::TransactionGuard(DatabaseManager &db)
    : m_db(db), m_lock(db.mutex()), m_begin(db.beginTransaction()), m_open(m_begin.success) {}

TransactionGuard::~TransactionGuard() {
  if (!m_open) {
    return;
  }
  DatabaseResult undone = m_db.rollbackTransaction();
  if (!undone) {
    VAULT_LOG_WARNING(COMPONENT, "Rollback failed", undone.message);
  }
}

DatabaseResult TransactionGuard::commit() {
  if (!m_open) {
    return DatabaseResult(false, "No transaction to commit", SQLITE_MISUSE);
  }
  DatabaseResult result = m_db.commitTransaction();
  if (result) {
    m_open = false;
  }
  return result;
}

} // namespace Database
