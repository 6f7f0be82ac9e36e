#include "app_options.hpp"

#include <stdexcept>

namespace calc {

AppOptions parseOptions(const std::vector<std::string>& args, const std::string& envLevel) {
    AppOptions options;
    if (!envLevel.empty()) {
        auto level = Logger::parseLevel(envLevel);
        if (!level) {
            throw std::runtime_error(std::string("Неизвестный уровень журнала в ") + kLogLevelEnv
                + ": '" + envLevel + "'");
        }
        options.logLevel = *level;
    }

    bool modeSeen = false;
    for (const auto& arg : args) {
        if (arg == "--verbose" || arg == "-v") {
            options.logLevel = Logger::Level::Debug;
        } else if (arg == "--quiet" || arg == "-q") {
            options.logLevel = Logger::Level::Error;
        } else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (!modeSeen && (arg == "interactive" || arg == "batch" || arg == "generate")) {
            modeSeen = true;
            if (arg == "batch") {
                options.mode = RunMode::Batch;
            } else if (arg == "generate") {
                options.mode = RunMode::Generate;
            } else {
                options.mode = RunMode::Interactive;
            }
        } else {
            throw std::runtime_error("Неизвестный аргумент: '" + arg + "'");
        }
    }
    return options;
}

std::string usage(const std::string& program) {
    return "Использование: " + program + " [interactive|batch|generate] [--verbose|-v] [--quiet|-q]\n"
        "  interactive  ввод нажатий с клавиатуры (по умолчанию)\n"
        "  batch        обработка файла сессий с записью результатов в CSV\n"
        "  generate     генерация файла случайных сессий в папке sessions\n"
        "Уровень журнала: " + std::string(kLogLevelEnv) + "=debug|info|warn|error\n";
}

} // namespace calc
