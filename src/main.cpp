#include "app_options.hpp"
#include "console.hpp"
#include "logger.hpp"
#include "modes.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// Точка входа в программу
int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "keycalc";

    calc::AppOptions options;
    try {
        const char* envLevel = std::getenv(calc::kLogLevelEnv);
        options = calc::parseOptions(std::vector<std::string>(argv + 1, argv + argc),
            envLevel != nullptr ? envLevel : "");
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        std::cerr << calc::usage(program);
        return 2;
    }

    if (options.showHelp) {
        std::cout << calc::usage(program);
        return 0;
    }
    calc::Logger::setLevel(options.logLevel);

    try {
        switch (options.mode) {
        case calc::RunMode::Interactive:
            printHeader();
            calc::runInteractiveMode(std::cin, std::cout);
            break;
        case calc::RunMode::Batch:
            calc::runBatchMode();
            break;
        case calc::RunMode::Generate:
            calc::runGenerateMode();
            break;
        }
    }
    catch (const std::exception& ex) {
        calc::Logger::error("%s", ex.what());
        printError(ex.what());
        return 1;
    }
    return 0;
}
