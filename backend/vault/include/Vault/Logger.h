#pragma once

#include "VaultTypes.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Vault {

/**
 * @brief Process-wide asynchronous logger for the vault, the signers and storage
 *
 * Callers enqueue entries; a single writer thread formats them and appends
 * them to the log file and, optionally, the console. Long hexadecimal runs
 * (ciphertext, raw signed transactions) are shortened before an entry is
 * queued, so key material handed to the logger by mistake never reaches disk.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Open the sink and start the writer thread
     * @param logFilePath File to append to, empty to write to the console only
     * @param minLevel Entries below this level are dropped
     * @param enableConsole Mirror entries to stdout/stderr
     * @return false when the log file cannot be opened
     */
    bool initialize(const std::string& logFilePath, LogLevel minLevel = LogLevel::INFO,
                    bool enableConsole = false);

    /**
     * @brief Drain the queue, stop the writer thread and close the file
     */
    void shutdown();

    /**
     * @brief Wait until the writer thread has emptied the queue
     */
    void flush();

    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& details = "");

    void debug(const std::string& component, const std::string& message, const std::string& details = "");
    void info(const std::string& component, const std::string& message, const std::string& details = "");
    void warning(const std::string& component, const std::string& message, const std::string& details = "");
    void error(const std::string& component, const std::string& message, const std::string& details = "");
    void critical(const std::string& component, const std::string& message, const std::string& details = "");

    void setMinLevel(LogLevel level) { m_minLevel = level; }
    LogLevel minLevel() const { return m_minLevel; }
    bool isInitialized() const { return m_running; }

    /**
     * @brief Copy of the newest entries kept in memory, oldest first
     */
    std::vector<LogEntry> recentEntries(size_t maxEntries = 100) const;

    /**
     * @brief Shorten every hex run longer than a 32-byte value
     *
     * A run of more than 64 hex digits becomes its first 8 digits followed
     * by "...(<n> hex)". Addresses, hashes and transaction ids are kept whole.
     */
    static std::string redact(const std::string& text);

    static const char* levelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writerLoop();
    void write(const std::deque<LogEntry>& batch);
    static std::string formatLine(const LogEntry& entry);

    std::atomic<bool> m_running{false};
    std::atomic<LogLevel> m_minLevel{LogLevel::INFO};
    bool m_console = false;
    bool m_stopRequested = false;

    std::string m_path;
    std::ofstream m_file;

    std::deque<LogEntry> m_pending;
    bool m_writing = false;
    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    std::thread m_writer;

    mutable std::mutex m_historyMutex;
    std::deque<LogEntry> m_history;
    static constexpr size_t HISTORY_LIMIT = 1000;
};

/**
 * @brief Logs how long one operation took and whether it succeeded
 *
 * If neither success() nor failure() is called, the destructor records a
 * debug-level completion entry.
 */
class ScopedLogger {
public:
    ScopedLogger(std::string component, std::string operation);
    ~ScopedLogger();

    ScopedLogger(const ScopedLogger&) = delete;
    ScopedLogger& operator=(const ScopedLogger&) = delete;

    void success(const std::string& details = "");
    void failure(const std::string& error, const std::string& details = "");
    void addContext(const std::string& key, const std::string& value);

private:
    void finish(LogLevel level, const std::string& verb, std::string details);

    std::string m_component;
    std::string m_operation;
    std::chrono::steady_clock::time_point m_started;
    std::vector<std::string> m_context;
    bool m_done = false;
};

} // namespace Vault

#define VAULT_LOG_DEBUG(component, message, ...) \
    Vault::Logger::getInstance().debug(component, message, ##__VA_ARGS__)

#define VAULT_LOG_INFO(component, message, ...) \
    Vault::Logger::getInstance().info(component, message, ##__VA_ARGS__)

#define VAULT_LOG_WARNING(component, message, ...) \
    Vault::Logger::getInstance().warning(component, message, ##__VA_ARGS__)

#define VAULT_LOG_ERROR(component, message, ...) \
    Vault::Logger::getInstance().error(component, message, ##__VA_ARGS__)

#define VAULT_LOG_CRITICAL(component, message, ...) \
    Vault::Logger::getInstance().critical(component, message, ##__VA_ARGS__)

#define VAULT_SCOPED_LOG(component, operation) \
    Vault::ScopedLogger _scopedLogger(component, operation)
