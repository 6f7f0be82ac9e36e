#pragma once

#include <cstddef>
#include <string>

namespace calc {

// Категории клавиш калькулятора
enum class KeyType {
    Digit,      // 0-9
    Dot,        // Десятичная точка
    Add,        // +
    Subtract,   // -
    Multiply,   // ×
    Divide,     // ÷
    ToggleSign, // ±
    Percent,    // %
    Equals,     // =
    Clear,      // C
    Undefined   // Нераспознанная клавиша
};

// Одно нажатие клавиши.
// digit имеет смысл только для KeyType::Digit.
struct Key {
    KeyType type = KeyType::Undefined;
    int digit = 0;
    std::string text;          // Исходная лексема
    std::size_t position = 0;  // Позиция лексемы в строке

    static Key digitKey(int value);
    static Key of(KeyType type);
};

// Каноническое обозначение типа клавиши ("+", "=", "C", ...)
const char* toString(KeyType type);

// Символ, которым клавиша выводится в журнал и в CSV
std::string glyph(const Key& key);

} // namespace calc
