#include "modes.hpp"

#include "calculator.hpp"
#include "console.hpp"
#include "key_parser.hpp"
#include "logger.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace calc {

namespace {
constexpr std::size_t kDisplayWidth = 20;

std::string repeat(const char* glyph, std::size_t count) {
    std::string line;
    for (std::size_t i = 0; i < count; ++i) {
        line += glyph;
    }
    return line;
}

void printHelp(std::ostream& out) {
    out << Color::GRAY
        << "  Клавиши: 0-9 . + - * / ~ % = C (также × ÷ − ±, neg, clear)\n"
        << "  Команды: :state — состояние, :q — выход, пустая строка — дисплей\n"
        << Color::RESET << "\n";
}

void printState(std::ostream& out, const Calculator& calculator) {
    out << "  Состояние:       " << Color::CYAN << toString(calculator.phase()) << Color::RESET << "\n";
    out << "  Первый операнд:  '" << calculator.firstOperand() << "'"
        << (calculator.hasDecimal(OperandSlot::First) ? " (.)" : "") << "\n";
    out << "  Операция:        '" << symbol(calculator.pendingOperator()) << "'\n";
    out << "  Второй операнд:  '" << calculator.secondOperand() << "'"
        << (calculator.hasDecimal(OperandSlot::Second) ? " (.)" : "") << "\n\n";
}
}

void printDisplay(std::ostream& out, const Calculator& calculator) {
    const std::string& text = calculator.display();
    std::size_t width = std::max(kDisplayWidth, text.size());

    out << "  ┌" << repeat("─", width + 2) << "┐\n";
    out << "  │ " << std::string(width - text.size(), ' ')
        << Color::BOLD << text << Color::RESET << " │";
    if (calculator.pendingOperator() != Operator::None) {
        out << ' ' << Color::YELLOW << symbol(calculator.pendingOperator()) << Color::RESET;
    }
    out << "\n  └" << repeat("─", width + 2) << "┘\n";
}

void runInteractiveMode(std::istream& in, std::ostream& out) {
    Calculator calculator;
    printHelp(out);
    printDisplay(out, calculator);

    std::string line;
    while (true) {
        out << Color::BOLD << "> " << Color::RESET << std::flush;
        if (!std::getline(in, line)) {
            break;
        }

        std::string command = trim(line);
        if (command == ":q" || command == "quit" || command == "exit") {
            break;
        }
        if (command == ":state") {
            printState(out, calculator);
            continue;
        }

        auto keys = KeyParser(command).parse();
        for (const Key& key : keys) {
            calculator.handle(key);
        }
        Logger::debug("%zu key(s) processed, display '%s'", keys.size(), calculator.display().c_str());
        printDisplay(out, calculator);
    }
    out << "\n";
}

} // namespace calc
