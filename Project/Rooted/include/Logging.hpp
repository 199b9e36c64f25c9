#pragma once

#include <string>
#include <sstream>
#include <memory>
#include <functional>
#include <queue>
#include <mutex>
#include <chrono>

#include "RootedAPI.h"

namespace RootedLogging {

    // Log levels matching spdlog levels
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    // Structure for queued log messages
    struct LogMessage {
        std::string text;
        LogLevel level;
        double timestamp;

        LogMessage() : level(LogLevel::Info), timestamp(0.0) {}

        LogMessage(const std::string& message, LogLevel lvl)
            : text(message), level(lvl), timestamp(std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count()) {}
    };

    // Thread-safe bounded queue that hosts drain to show store diagnostics
    // in their own overlays. Oldest messages are dropped when full.
    class LogQueue {
    public:
        void Push(const LogMessage& message);
        bool ROOTED_API TryPop(LogMessage& message);
        void ROOTED_API Clear();
        size_t ROOTED_API Size() const;

    private:
        mutable std::mutex mutex;
        std::queue<LogMessage> queue;
        static constexpr size_t MAX_QUEUE_SIZE = 1000;
    };

    // Initialize the logging system. An empty path disables the file sink.
    bool ROOTED_API Initialize(const std::string& logFilePath = "");

    // Shutdown the logging system
    void ROOTED_API Shutdown();

    bool ROOTED_API IsInitialized();

    // Messages below this level are dropped before formatting
    void ROOTED_API SetLevel(LogLevel level);
    LogLevel ROOTED_API GetLevel();
    bool ROOTED_API ShouldLog(LogLevel level);

    // Parses "trace", "debug", "info", "warn", "error", "critical".
    // Returns false and leaves 'out' untouched for anything else.
    bool ROOTED_API ParseLevel(const std::string& name, LogLevel& out);
    const char* ROOTED_API LevelName(LogLevel level);

    // Get the in-memory log queue
    ROOTED_API LogQueue& GetLogQueue();

    // Logging functions
    void ROOTED_API LogTrace(const std::string& message);
    void ROOTED_API LogDebug(const std::string& message);
    void ROOTED_API LogInfo(const std::string& message);
    void ROOTED_API LogWarn(const std::string& message);
    void ROOTED_API LogError(const std::string& message);
    void ROOTED_API LogCritical(const std::string& message);

    // Flush every sink (used before aborting)
    void ROOTED_API Flush();

    void ROOTED_API LogInternal(LogLevel level, const std::string& message);

    template <typename... Args>
    void PrintOutput(LogLevel level, const Args&... args) {
        if (!ShouldLog(level)) return;
        std::ostringstream oss;
        (oss << ... << args);
        LogInternal(level, oss.str());
    }

    template <typename First, typename... Args>
    void PrintOutput(const First& first, const Args&... args) {
        PrintOutput(LogLevel::Info, first, args...);
    }

}

// Convenience macros for store logging
#define ROOTED_LOG_TRACE(msg)    RootedLogging::LogTrace(msg)
#define ROOTED_LOG_DEBUG(msg)    RootedLogging::LogDebug(msg)
#define ROOTED_LOG_INFO(msg)     RootedLogging::LogInfo(msg)
#define ROOTED_LOG_WARN(msg)     RootedLogging::LogWarn(msg)
#define ROOTED_LOG_ERROR(msg)    RootedLogging::LogError(msg)
#define ROOTED_LOG_CRITICAL(msg) RootedLogging::LogCritical(msg)

/**
 * @brief Streams all arguments into a single message and logs it.
 *
 * An optional leading LogLevel selects the level (Info is default):
 *   ROOTED_PRINT("[SlotStore] Cleared ", count, " slots");
 *   ROOTED_PRINT(RootedLogging::LogLevel::Warn, "[SlotStore] ", count, " live slots");
 */
#define ROOTED_PRINT(...) RootedLogging::PrintOutput(__VA_ARGS__)
