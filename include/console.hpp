#pragma once

#include <iostream>
#include <string>

// ANSI цвета для вывода в терминал и в журнал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Вывод сообщения об ошибке в едином формате
void printError(const std::string& message);

// Удаление пробелов и табуляций по краям строки
std::string trim(const std::string& text);
