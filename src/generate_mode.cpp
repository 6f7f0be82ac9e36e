#include "modes.hpp"

#include "console.hpp"
#include "file_utils.hpp"
#include "logger.hpp"
#include "sequence_generator.hpp"
#include "user_input.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace calc {

void runGenerateMode() {
    printHeader();

    std::cout << Color::BOLD << Color::CYAN << "Режим генерации сессий\n" << Color::RESET << "\n";

    // 1. Количество сессий и имя файла
    std::size_t sessionCount = askSessionCount();
    std::filesystem::path fileName = selectGeneratedFileName(sessionCount);

    // 2. Файл кладется в папку sessions в корне проекта
    std::filesystem::path sessionsDir = findProjectRoot() / kSessionsDirName;
    std::filesystem::create_directories(sessionsDir);
    std::filesystem::path outputPath = sessionsDir / fileName;

    std::cout << "\n" << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество сессий: " << Color::CYAN << sessionCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:     " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    // 3. Генерация
    std::cout << Color::BOLD << "Генерация сессий..." << Color::RESET << std::flush;
    auto startGen = std::chrono::steady_clock::now();

    std::vector<char> fileBuffer(1024 * 1024);
    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }
    output.rdbuf()->pubsetbuf(fileBuffer.data(), static_cast<std::streamsize>(fileBuffer.size()));

    SequenceGenerator generator;
    for (std::size_t i = 0; i < sessionCount; ++i) {
        // От 1 до 6 операций в сессии
        int steps = 1 + static_cast<int>(i % 6);
        output << generator.generate(steps) << "\n";

        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << sessionCount
                << " сессий сгенерировано..." << Color::RESET << std::flush;
        }
    }

    output.close();
    if (output.fail()) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }

    auto genDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startGen);
    Logger::info("generated %zu sessions into %s", sessionCount, outputPath.string().c_str());

    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << sessionCount << " сессий, " << genDuration.count() << " мс)\n\n";
    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}

} // namespace calc
