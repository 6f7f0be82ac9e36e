#pragma once

#include "csv_writer.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace calc {

// Строка файла сессий с ее номером
struct SessionLine {
    std::size_t number;
    std::string text;
};

// Воспроизводит одну строку нажатий на новом калькуляторе.
// Пустая строка дает статус error, иначе success и итоговый дисплей.
SessionRecord runSession(std::size_t lineNumber, const std::string& keys);

// Потоковая обработка файла сессий.
// Строки читаются порциями по chunkSize и сразу уходят в пул потоков,
// результаты собираются пакетами по batchSize и передаются в processBatch.
// Пакеты приходят в порядке строк файла.
template<typename ProcessCallback>
void processSessionsStreaming(
    const std::filesystem::path& path,
    ThreadPool& pool,
    std::atomic<std::size_t>& completed,
    ProcessCallback&& processBatch,
    std::size_t chunkSize = 10000,
    std::size_t batchSize = 1000) {

    // Буфер объявлен раньше потока и переживает его
    std::vector<char> fileBuffer(1024 * 1024);
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }

    // pubsetbuf должен быть вызван до первого чтения
    input.rdbuf()->pubsetbuf(fileBuffer.data(), static_cast<std::streamsize>(fileBuffer.size()));

    std::vector<std::future<SessionRecord>> futures;
    futures.reserve(batchSize);

    auto flushFutures = [&]() {
        if (futures.empty()) {
            return;
        }
        std::vector<SessionRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
        }
        processBatch(batch);
        futures.clear();
    };

    auto submitChunk = [&](std::vector<SessionLine>& chunk) {
        for (auto& line : chunk) {
            futures.emplace_back(pool.enqueue(
                [line = std::move(line), &completed]() -> SessionRecord {
                    SessionRecord record = runSession(line.number, line.text);
                    completed.fetch_add(1);
                    return record;
                }));
            if (futures.size() >= batchSize) {
                flushFutures();
            }
        }
        chunk.clear();
    };

    std::vector<SessionLine> chunk;
    chunk.reserve(chunkSize);
    std::string buffer;
    std::size_t lineNumber = 1;

    while (std::getline(input, buffer)) {
        chunk.push_back({ lineNumber++, std::move(buffer) });
        if (chunk.size() >= chunkSize) {
            submitChunk(chunk);
        }
    }
    submitChunk(chunk);
    flushFutures();
}

} // namespace calc
