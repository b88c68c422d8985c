#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace Database {

/**
 * @brief Outcome of a storage call, carrying the SQLite result code on failure
 */
struct DatabaseResult {
  bool success;
  std::string message;
  int errorCode;

  DatabaseResult(bool ok = false, std::string msg = "", int code = 0)
      : success(ok), message(std::move(msg)), errorCode(code) {}

  explicit operator bool() const { return success; }
};

/**
 * @brief One schema step; applied when its version exceeds PRAGMA user_version
 */
struct Migration {
  int version;
  std::string description;
  std::string sql;

  Migration(int v, std::string desc, std::string statements)
      : version(v), description(std::move(desc)), sql(std::move(statements)) {}
};

/**
 * @brief Prepared statement that finalizes itself
 *
 * Text is bound with SQLITE_TRANSIENT, so arguments may be temporaries.
 */
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql);
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  bool prepared() const { return m_stmt != nullptr; }
  int prepareCode() const { return m_prepareCode; }

  Statement &bind(int index, const std::string &value);
  Statement &bind(int index, std::int64_t value);

  /** @brief sqlite3_step result code */
  int step();

  std::string columnText(int column) const;
  std::int64_t columnInt(int column) const;

private:
  sqlite3_stmt *m_stmt = nullptr;
  int m_prepareCode;
};

/**
 * @brief Single connection to the key-record database
 *
 * Opened through SQLCipher when it is available; against plain SQLite the
 * passphrase is checked for length but the file is not encrypted. Every call
 * locks one recursive mutex, which callers may also hold across several
 * statements through mutex().
 */
class DatabaseManager {
public:
  static DatabaseManager &getInstance();

  /**
   * @brief Open or create the database file and key it
   * @param dbPath File path or ":memory:"
   * @param encryptionKey SQLCipher passphrase of at least 32 characters
   */
  DatabaseResult initialize(const std::string &dbPath, const std::string &encryptionKey);

  /**
   * @brief Abandon any open transaction, close the handle and wipe the passphrase
   */
  void close();

  bool isInitialized() const;

  /** @brief Run SQL text that takes no parameters; may hold several statements */
  DatabaseResult executeQuery(const std::string &sql);

  DatabaseResult beginTransaction();
  DatabaseResult commitTransaction();
  DatabaseResult rollbackTransaction();

  /** @brief PRAGMA user_version, or -1 when no database is open */
  int getSchemaVersion();
  DatabaseResult setSchemaVersion(int version);

  /**
   * @brief Apply pending migrations in version order
   *
   * Each migration and its version bump commit together; the first failure
   * rolls back that migration and stops.
   */
  DatabaseResult runMigrations(const std::vector<Migration> &migrations);

  DatabaseResult verifyIntegrity();

  sqlite3 *getHandle();
  std::recursive_mutex &mutex() { return m_mutex; }

  std::int64_t lastInsertId();
  int changes();
  std::string lastError();

private:
  DatabaseManager() = default;
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  DatabaseResult applyKey();
  DatabaseResult probeReadable();
  DatabaseResult exec(const std::string &sql, const std::string &context);
  DatabaseResult fail(const DatabaseResult &failure);

  sqlite3 *m_db = nullptr;
  std::string m_dbPath;
  std::string m_passphrase;
  bool m_inTransaction = false;
  mutable std::recursive_mutex m_mutex;
};

/**
 * @brief Holds the database lock and a transaction for one scope
 *
 * The transaction rolls back on destruction unless commit() succeeded.
 */
class TransactionGuard {
public:
  explicit TransactionGuard(DatabaseManager &db);
  ~TransactionGuard();

  TransactionGuard(const TransactionGuard &) = delete;
  TransactionGuard &operator=(const TransactionGuard &) = delete;

  /** @brief Result of BEGIN; nothing else may run when this failed */
  const DatabaseResult &begun() const { return m_begin; }

  DatabaseResult commit();

private:
  DatabaseManager &m_db;
  std::lock_guard<std::recursive_mutex> m_lock;
  DatabaseResult m_begin;
  bool m_open;
};

} // namespace Database
