#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace calc {

// Разбор положительного целого из строки
std::size_t parseCount(const std::string& value);

// <каталог входного файла>/<имя>_results_<время>.csv
std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath, const std::string& timeStr);

// Подставляет расширение ext, если у пути другое или его нет
std::filesystem::path ensureExtension(std::filesystem::path path, const std::string& ext);

// Интерактивный выбор файла сессий (номер из списка sessions/ или путь)
std::filesystem::path selectInputFile();

// Интерактивный выбор выходного CSV
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Запрос продолжения работы с другим файлом
bool askContinue();

// Интерактивный ввод количества сессий для генерации
std::size_t askSessionCount();

// Интерактивный выбор имени генерируемого файла
std::filesystem::path selectGeneratedFileName(std::size_t sessionCount);

} // namespace calc
