#include "logger.hpp"
#include "console.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>

namespace calc {

namespace {
std::atomic<Logger::Level> currentLevel{ Logger::Level::Warn };
std::mutex writeMutex;

const auto startTime = std::chrono::steady_clock::now();

// Префикс записи: секунды и миллисекунды с момента запуска
int appendPrefix(char* buf, std::size_t len) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
    long long sec = elapsed / 1000;
    int msec = static_cast<int>(elapsed % 1000);
    return std::snprintf(buf, len, "[%5lld.%03d] ", sec, msec);
}

const char* levelColor(Logger::Level level) {
    switch (level) {
    case Logger::Level::Debug:
        return Color::GRAY;
    case Logger::Level::Info:
        return Color::CYAN;
    case Logger::Level::Warn:
        return Color::YELLOW;
    case Logger::Level::Error:
        return Color::RED;
    }
    return Color::RESET;
}
}

void Logger::setLevel(Level level) {
    currentLevel.store(level);
}

Logger::Level Logger::level() {
    return currentLevel.load();
}

bool Logger::enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(currentLevel.load());
}

std::optional<Logger::Level> Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "error") {
        return Level::Error;
    }
    return std::nullopt;
}

const char* Logger::levelName(Level level) {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "?";
}

void Logger::debug(const char* fmt, ...) {
    if (!enabled(Level::Debug)) {
        return;
    }
    va_list ap;
    va_start(ap, fmt);
    write(Level::Debug, fmt, ap);
    va_end(ap);
}

void Logger::info(const char* fmt, ...) {
    if (!enabled(Level::Info)) {
        return;
    }
    va_list ap;
    va_start(ap, fmt);
    write(Level::Info, fmt, ap);
    va_end(ap);
}

void Logger::warn(const char* fmt, ...) {
    if (!enabled(Level::Warn)) {
        return;
    }
    va_list ap;
    va_start(ap, fmt);
    write(Level::Warn, fmt, ap);
    va_end(ap);
}

void Logger::error(const char* fmt, ...) {
    if (!enabled(Level::Error)) {
        return;
    }
    va_list ap;
    va_start(ap, fmt);
    write(Level::Error, fmt, ap);
    va_end(ap);
}

void Logger::write(Level level, const char* fmt, va_list ap) {
    char buf[kMaxMsgBytes];
    int prefix = appendPrefix(buf, sizeof(buf));
    if (prefix < 0) {
        return;
    }
    int n = std::vsnprintf(buf + prefix, sizeof(buf) - prefix, fmt, ap);
    if (n < 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(writeMutex);
    std::cerr << Color::GRAY << std::string(buf, prefix) << Color::RESET
        << levelColor(level) << levelName(level) << Color::RESET << ' '
        << (buf + prefix) << "\n";
}

} // namespace calc
