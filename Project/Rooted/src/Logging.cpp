#include "pch.h"
#include "Logging.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/base_sink.h"
#include "spdlog/pattern_formatter.h"

namespace RootedLogging {

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    // Sink that pushes to the thread-safe queue
    class QueueSink : public spdlog::sinks::base_sink<std::mutex> {
    public:
        explicit QueueSink(LogQueue& queue) : logQueue(queue) {}

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            LogLevel level;
            switch (msg.level) {
                case spdlog::level::trace:    level = LogLevel::Trace; break;
                case spdlog::level::debug:    level = LogLevel::Debug; break;
                case spdlog::level::info:     level = LogLevel::Info; break;
                case spdlog::level::warn:     level = LogLevel::Warn; break;
                case spdlog::level::err:      level = LogLevel::Error; break;
                case spdlog::level::critical: level = LogLevel::Critical; break;
                default:                      level = LogLevel::Info; break;
            }

            std::string message(msg.payload.data(), msg.payload.size());
            if (message.empty()) {
                return;
            }

            logQueue.Push(LogMessage(message, level));
        }

        void flush_() override {
            // Nothing to flush for the queue
        }

    private:
        LogQueue& logQueue;
    };

    // Static instances
    static std::shared_ptr<spdlog::logger> logger;

    static LogQueue logQueue;
    static std::atomic<bool> initialized{ false };
    static std::atomic<int> currentLevel{ static_cast<int>(LogLevel::Info) };

    // LogQueue implementation
    void LogQueue::Push(const LogMessage& message) {
        assert(!message.text.empty() && "Log message text cannot be empty");

        std::lock_guard<std::mutex> lock(mutex);

        // Remove old messages if queue is full
        while (queue.size() >= MAX_QUEUE_SIZE) {
            queue.pop();
        }

        queue.push(message);
    }

    bool LogQueue::TryPop(LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return false;
        }

        message = queue.front();
        queue.pop();
        return true;
    }

    void LogQueue::Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        std::queue<LogMessage> empty;
        queue.swap(empty);
    }

    size_t LogQueue::Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

    // Logging system functions
    bool Initialize(const std::string& logFilePath) {
        if (initialized) {
            return true;
        }

        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(console_sink);

            if (!logFilePath.empty()) {
                std::filesystem::path parent = std::filesystem::path(logFilePath).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }

                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFilePath, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            }

            auto queue_sink = std::make_shared<QueueSink>(logQueue);
            queue_sink->set_level(spdlog::level::trace);
            queue_sink->set_pattern("%v");
            sinks.push_back(queue_sink);

            logger = std::make_shared<spdlog::logger>("rooted", sinks.begin(), sinks.end());
            logger->set_level(spdlog::level::trace);
            logger->flush_on(spdlog::level::warn);

            initialized = true;

            LogInfo("Rooted logging system initialized");

            return true;
        }
        catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "[RootedLogging] Failed to initialize logging system: " << ex.what() << std::endl;
            logger.reset();
            return false;
        }
        catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "[RootedLogging] Failed to create log directory: " << ex.what() << std::endl;
            logger.reset();
            return false;
        }
    }

    void Shutdown() {
        if (!initialized) {
            return;
        }

        LogInfo("Shutting down logging system");

        if (logger) {
            logger->flush();
            logger.reset();
        }

        logQueue.Clear();
        initialized = false;
    }

    bool IsInitialized() {
        return initialized;
    }

    void SetLevel(LogLevel level) {
        currentLevel.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel GetLevel() {
        return static_cast<LogLevel>(currentLevel.load(std::memory_order_relaxed));
    }

    bool ShouldLog(LogLevel level) {
        return initialized && static_cast<int>(level) >= currentLevel.load(std::memory_order_relaxed);
    }

    bool ParseLevel(const std::string& name, LogLevel& out) {
        static const std::unordered_map<std::string, LogLevel> levels = {
            { "trace", LogLevel::Trace },
            { "debug", LogLevel::Debug },
            { "info", LogLevel::Info },
            { "warn", LogLevel::Warn },
            { "error", LogLevel::Error },
            { "critical", LogLevel::Critical },
        };

        auto it = levels.find(name);
        if (it == levels.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    const char* LevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return "trace";
            case LogLevel::Debug:    return "debug";
            case LogLevel::Info:     return "info";
            case LogLevel::Warn:     return "warn";
            case LogLevel::Error:    return "error";
            case LogLevel::Critical: return "critical";
        }
        return "info";
    }

    LogQueue& GetLogQueue() {
        return logQueue;
    }

    void Flush() {
        if (logger) {
            logger->flush();
        }
    }

    // Internal helper for logging
    void LogInternal(LogLevel level, const std::string& message) {
        if (message.empty() || !ShouldLog(level) || !logger) {
            // Logger not initialized or already destroyed - fail silently
            return;
        }

        logger->log(ToSpdlogLevel(level), message);
    }

    // Public logging functions
    void LogTrace(const std::string& message) {
        LogInternal(LogLevel::Trace, message);
    }

    void LogDebug(const std::string& message) {
        LogInternal(LogLevel::Debug, message);
    }

    void LogInfo(const std::string& message) {
        LogInternal(LogLevel::Info, message);
    }

    void LogWarn(const std::string& message) {
        LogInternal(LogLevel::Warn, message);
    }

    void LogError(const std::string& message) {
        LogInternal(LogLevel::Error, message);
    }

    void LogCritical(const std::string& message) {
        LogInternal(LogLevel::Critical, message);
    }

}
