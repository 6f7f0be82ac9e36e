#include "modes.hpp"

#include "console.hpp"
#include "csv_writer.hpp"
#include "file_utils.hpp"
#include "logger.hpp"
#include "progress_bar.hpp"
#include "session_processor.hpp"
#include "thread_pool.hpp"
#include "user_input.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>

namespace calc {

namespace {
// Один проход: выбор файлов, обработка, статистика
void processOneFile() {
    std::filesystem::path inputPath = selectInputFile();
    std::filesystem::path outputPath = selectOutputFile(inputPath);
    std::size_t threadCount = selectThreadCount();

    std::cout << "\n" << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
    std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n";
    std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
    auto startCount = std::chrono::steady_clock::now();
    std::size_t totalLines = countLinesInFile(inputPath);
    auto countDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startCount);
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " ("
        << totalLines << " строк, " << countDuration.count() << " мс)\n\n";

    std::cout << Color::BOLD << "Воспроизведение сессий:\n" << Color::RESET;
    auto startProcess = std::chrono::steady_clock::now();

    CsvWriter writer(outputPath);
    std::atomic<std::size_t> completed{ 0 };
    std::size_t successCount = 0;
    std::size_t errorCount = 0;

    // Пакеты приходят по порядку строк, их можно писать сразу
    auto processBatch = [&](const std::vector<SessionRecord>& batch) {
        for (const auto& record : batch) {
            if (record.status == "success") {
                ++successCount;
            } else {
                ++errorCount;
            }
        }
        writer.write(batch);
    };

    std::thread progressThread(displayProgress, std::cref(completed), totalLines);
    try {
        ThreadPool pool(threadCount);
        processSessionsStreaming(inputPath, pool, completed, processBatch);
    }
    catch (...) {
        // Поток прогресса ждет completed == totalLines
        completed.store(totalLines);
        progressThread.join();
        throw;
    }
    // Число прочитанных строк может отличаться от подсчитанного, если файл менялся
    completed.store(totalLines);
    progressThread.join();

    auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startProcess);
    Logger::info("batch %s: %zu ok, %zu errors", inputPath.string().c_str(), successCount, errorCount);

    std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего сессий:     " << Color::CYAN << (successCount + errorCount) << Color::RESET << "\n";
    std::cout << "  Успешно:          " << Color::GREEN << successCount << Color::RESET << "\n";
    if (errorCount > 0) {
        std::cout << "  Ошибок:           " << Color::RED << errorCount << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << Color::MAGENTA << processDuration.count()
        << " мс" << Color::RESET << "\n";
    if (processDuration.count() > 0) {
        std::cout << "  Производительность: " << Color::YELLOW
            << static_cast<long long>((successCount + errorCount) * 1000.0 / processDuration.count())
            << " сессий/сек" << Color::RESET << "\n";
    }
    std::cout << "\n" << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n\n";
}
}

void runBatchMode() {
    printHeader();

    bool continueProcessing = true;
    while (continueProcessing) {
        try {
            processOneFile();
        }
        catch (const std::exception& ex) {
            Logger::error("batch failed: %s", ex.what());
            printError(ex.what());
        }

        continueProcessing = askContinue();
        if (continueProcessing) {
            std::cout << "\n";
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
}

} // namespace calc
