#pragma once

#include <string>
#include <vector>

#include "logger.hpp"

namespace calc {

enum class RunMode {
    Interactive,
    Batch,
    Generate
};

// Настройки запуска: keycalc [interactive|batch|generate] [--verbose|-v] [--quiet|-q]
struct AppOptions {
    RunMode mode = RunMode::Interactive;
    Logger::Level logLevel = Logger::Level::Warn;
    bool showHelp = false;
};

// Переменная окружения с начальным уровнем журнала
constexpr const char* kLogLevelEnv = "KEYCALC_LOG_LEVEL";

// Разбор аргументов (без имени программы).
// envLevel — значение KEYCALC_LOG_LEVEL или пустая строка; флаги его перекрывают.
// Выбрасывает std::runtime_error на неизвестный аргумент.
AppOptions parseOptions(const std::vector<std::string>& args, const std::string& envLevel);

// Текст справки по аргументам
std::string usage(const std::string& program);

} // namespace calc
