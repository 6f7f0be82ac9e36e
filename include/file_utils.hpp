#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace calc {

// Папка с файлами сессий относительно корня проекта
constexpr const char* kSessionsDirName = "sessions";

// Подсчет строк файла; последняя строка без '\n' тоже считается
std::size_t countLinesInFile(const std::filesystem::path& path);

// Корень проекта: ближайший предок текущей директории с папкой sessions
// или файлом CMakeLists.txt. Если не найден — текущая директория.
std::filesystem::path findProjectRoot();

// Файлы *.txt (расширение без учета регистра) в директории, по алфавиту
std::vector<std::filesystem::path> findSessionFiles(const std::filesystem::path& directory);

// Текущее время для имени файла: YYYYmmdd_HHMMSS
std::string getCurrentTimeString();

} // namespace calc
