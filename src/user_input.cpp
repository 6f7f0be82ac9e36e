#include "user_input.hpp"
#include "console.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace calc {

namespace {
// Приглашение и чтение одной строки без пробелов по краям
std::string prompt(const std::string& text) {
    std::cout << Color::BOLD << text << Color::RESET;
    std::string line;
    if (!std::getline(std::cin, line)) {
        throw std::runtime_error("Ввод завершен");
    }
    return trim(line);
}

// Выбор "1" (по умолчанию) или "2" (своё название)
bool askCustomName(const std::string& defaultDescription) {
    std::cout << Color::BOLD << "Выберите способ задания имени файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". " << defaultDescription << "\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = prompt("Ваш выбор (1 или 2): ");
    if (choice == "1") {
        return false;
    }
    if (choice == "2") {
        return true;
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}
}

std::size_t parseCount(const std::string& value) {
    std::size_t result = 0;
    try {
        std::size_t pos = 0;
        result = std::stoul(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath, const std::string& timeStr) {
    return inputPath.parent_path() / (inputPath.stem().string() + "_results_" + timeStr + ".csv");
}

std::filesystem::path ensureExtension(std::filesystem::path path, const std::string& ext) {
    if (path.extension() != ext) {
        path.replace_extension(ext);
    }
    return path;
}

std::filesystem::path selectInputFile() {
    std::filesystem::path sessionsDir = findProjectRoot() / kSessionsDirName;
    auto files = findSessionFiles(sessionsDir);

    if (files.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt файлов в папке " << kSessionsDirName << ".\n";
        std::cout << "Директория: " << Color::CYAN << sessionsDir << Color::RESET << "\n\n";
    } else {
        std::cout << Color::BOLD << "Найденные файлы сессий:\n" << Color::RESET;
        for (std::size_t i = 0; i < files.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << files[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::string input = prompt("Введите номер файла или путь до входного файла: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    bool isNumber = std::all_of(input.begin(), input.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    if (isNumber && !files.empty()) {
        std::size_t index = parseCount(input);
        if (index > files.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return files[index - 1];
    }

    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

// Относительное имя отсчитывается от каталога входного файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    if (!askCustomName("Название по умолчанию (имя входного файла + _results_ + время)")) {
        return defaultOutputPath(inputPath, getCurrentTimeString());
    }

    std::string customName = prompt("Введите название выходного файла (расширение .csv добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }

    std::filesystem::path customPath(customName);
    if (customPath.is_relative()) {
        customPath = inputPath.parent_path() / customPath;
    }
    return ensureExtension(customPath, ".csv");
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = std::thread::hardware_concurrency();
    if (defaultThreads == 0) {
        defaultThreads = 2;
    }

    std::string input = prompt("Введите количество потоков (по умолчанию: "
        + std::to_string(defaultThreads) + "): ");
    if (input.empty()) {
        return defaultThreads;
    }
    return parseCount(input);
}

bool askContinue() {
    std::string input;
    try {
        input = prompt("Обработать еще один файл? (y/n): ");
    }
    catch (const std::runtime_error&) {
        return false; // EOF
    }
    std::transform(input.begin(), input.end(), input.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return input == "y" || input == "yes" || input == "д" || input == "да";
}

std::size_t askSessionCount() {
    std::string input = prompt("Введите количество сессий для генерации: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parseCount(input);
}

std::filesystem::path selectGeneratedFileName(std::size_t sessionCount) {
    std::string automatic = "generate_" + std::to_string(sessionCount) + ".txt";
    if (!askCustomName("Автоматическое название (" + automatic + ")")) {
        return automatic;
    }

    std::string customName = prompt("Введите название файла (расширение .txt добавится автоматически): ");
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }
    return ensureExtension(customName, ".txt");
}

} // namespace calc
