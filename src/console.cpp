#include "console.hpp"

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Клавишный калькулятор v1.0                             ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::string& message) {
    std::cerr << "\n" << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n\n";
}

std::string trim(const std::string& text) {
    std::size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}
