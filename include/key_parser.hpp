#pragma once

#include <string>
#include <vector>

#include "key.hpp"

namespace calc {

// Лексический разбор строки нажатий.
// Каждый символ (или слово) превращается в одно нажатие клавиши.
// Пробельные символы игнорируются.
class KeyParser {
public:
    explicit KeyParser(std::string sourceText);

    // Возвращает последовательность нажатий в порядке ввода.
    // Не выбрасывает исключений: неизвестная лексема становится KeyType::Undefined.
    std::vector<Key> parse();

private:
    const std::string source;
    std::size_t index = 0;

    bool isAtEnd() const;
    char peek() const;
    char advance();
    void skipWhitespace();

    // Слово из букв: clear, neg, x и т.д.
    Key makeWord();
    // Прочие символы, в том числе ×, ÷, −, ± в UTF-8
    Key makeSymbol();
};

} // namespace calc
