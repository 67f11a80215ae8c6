#pragma once

#include "timekeeper/format.hpp"
#include "timekeeper/status.hpp"

#include <atomic>
#include <mutex>
#include <source_location>
#include <string_view>
#include <vector>

#include <stdio.h>

namespace tk {
    class Logger;
    class LogSink;
    class ILogAppender;

    static constexpr size_t kLogMessageSize = 256;

    enum class LogLevel : uint8_t {
        ePrint = 0,
        eDebug = 1,
        eInfo = 2,
        eWarning = 3,
        eError = 4,
        eFatal = 5,
    };

    struct LogMessageView {
        std::source_location location;
        std::string_view message;
        const Logger *logger;
        LogLevel level;
    };

    class ILogAppender {
    public:
        virtual ~ILogAppender() = default;

        virtual void write(const LogMessageView& message) = 0;
    };

    /// @brief Writes one line per message to a stdio stream.
    class StreamAppender final : public ILogAppender {
        FILE *mStream;

    public:
        constexpr StreamAppender(FILE *stream) noexcept
            : mStream(stream)
        { }

        void write(const LogMessageView& message) override;
    };

    struct LogConfig {
        /// @brief Messages below this level are discarded, @ref LogLevel::ePrint is never filtered.
        LogLevel level = LogLevel::eWarning;

        /// @brief Attach the process wide stderr appender.
        bool stderrAppender = true;
    };

    /// @brief Parse a level name as accepted by the TK_LOG_LEVEL environment variable.
    TkStatus ParseLogLevel(std::string_view name, LogLevel *level);

    std::string_view GetLogLevelName(LogLevel level);

    class LogSink {
        std::mutex mLock;
        std::vector<ILogAppender*> mAppenders;
        std::atomic<LogLevel> mLevel = LogLevel::eWarning;

        void write(const LogMessageView& message);

    public:
        LogSink() = default;

        LogSink(const LogConfig& config) {
            configure(config);
        }

        /// @brief Apply a configuration, replaces the current level and the stderr appender state.
        void configure(const LogConfig& config);

        LogLevel getLevel();
        void setLevel(LogLevel level);

        bool isEnabled(LogLevel level);

        TkStatus addAppender(ILogAppender *appender);
        TkStatus removeAppender(ILogAppender *appender);

        void submit(const LogMessageView& message);

        /// @brief The sink used by all category loggers.
        ///
        /// Created on first use from the default @ref LogConfig, the level can be
        /// overridden with the TK_LOG_LEVEL environment variable.
        static LogSink& getGlobalSink();
    };

    class Logger {
        LogSink *mSink;
        std::string_view mName;

    public:
        constexpr Logger(std::string_view name, LogSink *sink) noexcept
            : mSink(sink)
            , mName(name)
        { }

        /// @brief A logger that resolves the global sink when it first writes.
        constexpr Logger(std::string_view name) noexcept
            : Logger(name, nullptr)
        { }

        std::string_view getName() const noexcept;

        LogSink& getSink() const noexcept;

        void submit(LogLevel level, std::string_view message, std::source_location location) const;

        template<typename... Args>
        void print(Args&&... args) const {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            StaticString message = tk::concat<kLogMessageSize>(std::forward<Args>(args)...);
            submit(LogLevel::ePrint, message, std::source_location::current());
        }

        template<typename... Args>
        void println(Args&&... args) const {
            print(std::forward<Args>(args)..., "\n");
        }

        void dbg(std::string_view message, std::source_location location = std::source_location::current()) const;
        void info(std::string_view message, std::source_location location = std::source_location::current()) const;
        void warn(std::string_view message, std::source_location location = std::source_location::current()) const;
        void error(std::string_view message, std::source_location location = std::source_location::current()) const;
        void fatal(std::string_view message, std::source_location location = std::source_location::current()) const;

        template<typename... Args>
        void logfImpl(LogLevel level, std::source_location location, Args&&... args) const {
            static_assert(sizeof...(Args) > 0, "No arguments provided");

            // skip formatting for filtered messages
            if (!getSink().isEnabled(level)) {
                return;
            }

            StaticString message = tk::concat<kLogMessageSize>(std::forward<Args>(args)...);
            submit(level, message, location);
        }

        template<typename... Args>
        void dbgfImpl(std::source_location location, Args&&... args) const {
            logfImpl(LogLevel::eDebug, location, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void infofImpl(std::source_location location, Args&&... args) const {
            logfImpl(LogLevel::eInfo, location, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warnfImpl(std::source_location location, Args&&... args) const {
            logfImpl(LogLevel::eWarning, location, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void errorfImpl(std::source_location location, Args&&... args) const {
            logfImpl(LogLevel::eError, location, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void fatalfImpl(std::source_location location, Args&&... args) const {
            logfImpl(LogLevel::eFatal, location, std::forward<Args>(args)...);
        }
    };
}

#define dbgf(...) dbgfImpl(std::source_location::current(), __VA_ARGS__)
#define infof(...) infofImpl(std::source_location::current(), __VA_ARGS__)
#define warnf(...) warnfImpl(std::source_location::current(), __VA_ARGS__)
#define errorf(...) errorfImpl(std::source_location::current(), __VA_ARGS__)
#define fatalf(...) fatalfImpl(std::source_location::current(), __VA_ARGS__)
