#include "Vault/Logger.h"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <utility>

namespace Vault {

namespace {

constexpr size_t REDACT_THRESHOLD = 64;
constexpr size_t REDACT_KEEP = 8;

std::string joinDetails(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += " | ";
        }
        out += part;
    }
    return out;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

bool Logger::initialize(const std::string& logFilePath, LogLevel minLevel, bool enableConsole) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_running) {
        return true;
    }

    if (!logFilePath.empty()) {
        m_file.open(logFilePath, std::ios::out | std::ios::app);
        if (!m_file) {
            std::cerr << "Vault logger: cannot open " << logFilePath << std::endl;
            return false;
        }
    }

    m_path = logFilePath;
    m_minLevel = minLevel;
    m_console = enableConsole;
    m_stopRequested = false;
    m_writer = std::thread(&Logger::writerLoop, this);
    m_running = true;
    lock.unlock();

    info("Logger", "Logging started", m_path.empty() ? "sink=console" : "sink=" + m_path);
    return true;
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_stopRequested = true;
    }
    m_wake.notify_one();
    if (m_writer.joinable()) {
        m_writer.join();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_file.close();
    m_running = false;
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_running) {
        return;
    }
    m_idle.wait(lock, [this] { return (m_pending.empty() && !m_writing) || m_stopRequested; });
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& details) {
    if (!m_running || level < m_minLevel) {
        return;
    }

    LogEntry entry(level, component, redact(message), redact(details));
    {
        std::lock_guard<std::mutex> lock(m_historyMutex);
        m_history.push_back(entry);
        if (m_history.size() > HISTORY_LIMIT) {
            m_history.pop_front();
        }
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.push_back(std::move(entry));
    }
    m_wake.notify_one();
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::DEBUG, component, message, details);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::INFO, component, message, details);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::WARNING, component, message, details);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::ERROR, component, message, details);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& details) {
    log(LogLevel::CRITICAL, component, message, details);
}

std::vector<LogEntry> Logger::recentEntries(size_t maxEntries) const {
    std::lock_guard<std::mutex> lock(m_historyMutex);
    const size_t skip = m_history.size() > maxEntries ? m_history.size() - maxEntries : 0;
    return std::vector<LogEntry>(m_history.begin() + static_cast<std::ptrdiff_t>(skip), m_history.end());
}

std::string Logger::redact(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        size_t end = i;
        while (end < text.size() && std::isxdigit(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        const size_t run = end - i;
        if (run > REDACT_THRESHOLD) {
            out.append(text, i, REDACT_KEEP);
            out += "...(" + std::to_string(run) + " hex)";
        } else if (run > 0) {
            out.append(text, i, run);
        } else {
            out += text[i];
            end = i + 1;
        }
        i = end;
    }
    return out;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "?";
}

void Logger::writerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    for (;;) {
        m_wake.wait(lock, [this] { return !m_pending.empty() || m_stopRequested; });

        // Take the whole backlog so producers are not blocked on file I/O
        std::deque<LogEntry> batch;
        batch.swap(m_pending);
        m_writing = true;
        lock.unlock();

        write(batch);

        lock.lock();
        m_writing = false;
        if (m_pending.empty()) {
            m_idle.notify_all();
            if (m_stopRequested) {
                return;
            }
        }
    }
}

void Logger::write(const std::deque<LogEntry>& batch) {
    for (const auto& entry : batch) {
        const std::string line = formatLine(entry);
        if (m_file.is_open()) {
            m_file << line << '\n';
        }
        if (m_console) {
            std::ostream& stream = entry.level >= LogLevel::ERROR ? std::cerr : std::cout;
            stream << line << '\n';
        }
    }
    if (m_file.is_open()) {
        m_file.flush();
    }
    if (m_console) {
        std::cout.flush();
    }
}

std::string Logger::formatLine(const LogEntry& entry) {
    using namespace std::chrono;

    const std::time_t seconds = system_clock::to_time_t(entry.timestamp);
    const auto millis = duration_cast<milliseconds>(entry.timestamp.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03dZ", static_cast<int>(millis));

    std::ostringstream line;
    line << stamp << fraction << ' ' << levelName(entry.level) << ' ' << entry.component << ": "
         << entry.message;
    if (!entry.details.empty()) {
        line << " (" << entry.details << ')';
    }
    return line.str();
}

ScopedLogger::ScopedLogger(std::string component, std::string operation)
    : m_component(std::move(component)),
      m_operation(std::move(operation)),
      m_started(std::chrono::steady_clock::now()) {
    Logger::getInstance().debug(m_component, m_operation + " started");
}

ScopedLogger::~ScopedLogger() {
    if (!m_done) {
        finish(LogLevel::DEBUG, "finished", "");
    }
}

void ScopedLogger::success(const std::string& details) {
    if (!m_done) {
        finish(LogLevel::INFO, "succeeded", details);
    }
}

void ScopedLogger::failure(const std::string& error, const std::string& details) {
    if (!m_done) {
        finish(LogLevel::ERROR, "failed", joinDetails({"error=" + error, details}));
    }
}

void ScopedLogger::addContext(const std::string& key, const std::string& value) {
    m_context.push_back(key + "=" + value);
}

void ScopedLogger::finish(LogLevel level, const std::string& verb, std::string details) {
    m_done = true;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - m_started)
                             .count();

    std::vector<std::string> parts{std::to_string(elapsed) + "ms", std::move(details)};
    parts.insert(parts.end(), m_context.begin(), m_context.end());
    Logger::getInstance().log(level, m_component, m_operation + " " + verb, joinDetails(parts));
}

} // namespace Vault
