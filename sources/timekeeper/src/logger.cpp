#include "timekeeper/logger.hpp"

#include <algorithm>
#include <utility>

#include <stdlib.h>

static tk::StreamAppender& GetStderrAppender() {
    static tk::StreamAppender sAppender{stderr};
    return sAppender;
}

static tk::LogConfig GetGlobalConfig() {
    tk::LogConfig config;

    const char *env = getenv("TK_LOG_LEVEL");
    if (env == nullptr) {
        return config;
    }

    tk::LogLevel level;
    if (TkStatus status = tk::ParseLogLevel(env, &level); TK_ERROR(status)) {
        fprintf(stderr, "[WARN] LOG: Unknown TK_LOG_LEVEL '%s', using default level\n", env);
        return config;
    }

    config.level = level;
    return config;
}

void tk::StreamAppender::write(const LogMessageView& message) {
    std::string_view text = message.message;

    if (message.level == LogLevel::ePrint) {
        fwrite(text.data(), 1, text.size(), mStream);
        return;
    }

    std::string_view level = GetLogLevelName(message.level);
    std::string_view name = message.logger->getName();

    fprintf(mStream, "[%.*s] %.*s: %.*s\n",
        int(level.size()), level.data(),
        int(name.size()), name.data(),
        int(text.size()), text.data());
}

std::string_view tk::GetLogLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::ePrint: return "PRINT";
    case LogLevel::eDebug: return "DEBUG";
    case LogLevel::eInfo: return "INFO";
    case LogLevel::eWarning: return "WARN";
    case LogLevel::eError: return "ERROR";
    case LogLevel::eFatal: return "FATAL";
    default: return "UNKNOWN";
    }
}

TkStatus tk::ParseLogLevel(std::string_view name, LogLevel *level) {
    static constexpr std::pair<std::string_view, LogLevel> kLevels[] = {
        { "debug", LogLevel::eDebug },
        { "info", LogLevel::eInfo },
        { "warning", LogLevel::eWarning },
        { "error", LogLevel::eError },
        { "fatal", LogLevel::eFatal },
    };

    for (const auto& [key, value] : kLevels) {
        if (key == name) {
            *level = value;
            return TkStatusSuccess;
        }
    }

    return TkStatusInvalidInput;
}

void tk::LogSink::write(const LogMessageView& message) {
    for (ILogAppender *appender : mAppenders) {
        appender->write(message);
    }
}

void tk::LogSink::configure(const LogConfig& config) {
    setLevel(config.level);

    std::lock_guard guard(mLock);
    ILogAppender *appender = &GetStderrAppender();
    auto it = std::ranges::find(mAppenders, appender);
    bool attached = it != mAppenders.end();

    if (config.stderrAppender && !attached) {
        mAppenders.push_back(appender);
    } else if (!config.stderrAppender && attached) {
        mAppenders.erase(it);
    }
}

tk::LogLevel tk::LogSink::getLevel() {
    return mLevel.load(std::memory_order_relaxed);
}

void tk::LogSink::setLevel(LogLevel level) {
    mLevel.store(level, std::memory_order_relaxed);
}

bool tk::LogSink::isEnabled(LogLevel level) {
    return level == LogLevel::ePrint || level >= getLevel();
}

TkStatus tk::LogSink::addAppender(ILogAppender *appender) {
    std::lock_guard guard(mLock);
    if (std::ranges::find(mAppenders, appender) != mAppenders.end()) {
        return TkStatusAlreadyExists;
    }

    mAppenders.push_back(appender);
    return TkStatusSuccess;
}

TkStatus tk::LogSink::removeAppender(ILogAppender *appender) {
    std::lock_guard guard(mLock);
    auto it = std::ranges::find(mAppenders, appender);
    if (it == mAppenders.end()) {
        return TkStatusNotFound;
    }

    mAppenders.erase(it);
    return TkStatusSuccess;
}

void tk::LogSink::submit(const LogMessageView& message) {
    if (!isEnabled(message.level)) {
        return;
    }

    std::lock_guard guard(mLock);
    write(message);
}

tk::LogSink& tk::LogSink::getGlobalSink() {
    static LogSink sSink{GetGlobalConfig()};

    return sSink;
}

std::string_view tk::Logger::getName() const noexcept {
    return mName;
}

tk::LogSink& tk::Logger::getSink() const noexcept {
    return (mSink != nullptr) ? *mSink : LogSink::getGlobalSink();
}

void tk::Logger::submit(LogLevel level, std::string_view message, std::source_location location) const {
    LogMessageView view {
        .location = location,
        .message = message,
        .logger = this,
        .level = level,
    };

    getSink().submit(view);
}

void tk::Logger::dbg(std::string_view message, std::source_location location) const {
    submit(LogLevel::eDebug, message, location);
}

void tk::Logger::info(std::string_view message, std::source_location location) const {
    submit(LogLevel::eInfo, message, location);
}

void tk::Logger::warn(std::string_view message, std::source_location location) const {
    submit(LogLevel::eWarning, message, location);
}

void tk::Logger::error(std::string_view message, std::source_location location) const {
    submit(LogLevel::eError, message, location);
}

void tk::Logger::fatal(std::string_view message, std::source_location location) const {
    submit(LogLevel::eFatal, message, location);
}
