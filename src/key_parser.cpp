#include "key_parser.hpp"

#include <cctype>
#include <unordered_map>

namespace calc {

namespace {
// Слова, которые распознаются как клавиши (в нижнем регистре)
const std::unordered_map<std::string, KeyType> kWords = {
    {"c", KeyType::Clear},
    {"ac", KeyType::Clear},
    {"clear", KeyType::Clear},
    {"neg", KeyType::ToggleSign},
    {"sign", KeyType::ToggleSign},
    {"x", KeyType::Multiply},
};

// Многобайтовые (UTF-8) обозначения клавиш
const std::unordered_map<std::string, KeyType> kGlyphs = {
    {"\xC3\x97", KeyType::Multiply},     // ×
    {"\xC3\xB7", KeyType::Divide},       // ÷
    {"\xE2\x88\x92", KeyType::Subtract}, // −
    {"\xC2\xB1", KeyType::ToggleSign},   // ±
};

Key makeKey(KeyType type, std::string text, std::size_t position) {
    Key key;
    key.type = type;
    key.text = std::move(text);
    key.position = position;
    return key;
}
}

Key Key::digitKey(int value) {
    Key key;
    key.type = KeyType::Digit;
    key.digit = value;
    key.text = std::string(1, static_cast<char>('0' + value));
    return key;
}

Key Key::of(KeyType type) {
    Key key;
    key.type = type;
    key.text = toString(type);
    return key;
}

const char* toString(KeyType type) {
    switch (type) {
    case KeyType::Digit:
        return "digit";
    case KeyType::Dot:
        return ".";
    case KeyType::Add:
        return "+";
    case KeyType::Subtract:
        return "-";
    case KeyType::Multiply:
        return "*";
    case KeyType::Divide:
        return "/";
    case KeyType::ToggleSign:
        return "~";
    case KeyType::Percent:
        return "%";
    case KeyType::Equals:
        return "=";
    case KeyType::Clear:
        return "C";
    case KeyType::Undefined:
        return "?";
    }
    return "?";
}

std::string glyph(const Key& key) {
    if (key.type == KeyType::Digit) {
        return std::string(1, static_cast<char>('0' + key.digit));
    }
    return toString(key.type);
}

KeyParser::KeyParser(std::string sourceText) : source(std::move(sourceText)) {}

std::vector<Key> KeyParser::parse() {
    std::vector<Key> keys;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        const std::size_t start = index;
        char ch = peek();
        switch (ch) {
        case '.':
        case ',':
            keys.push_back(makeKey(KeyType::Dot, std::string(1, advance()), start));
            break;
        case '+':
            keys.push_back(makeKey(KeyType::Add, std::string(1, advance()), start));
            break;
        case '-':
            keys.push_back(makeKey(KeyType::Subtract, std::string(1, advance()), start));
            break;
        case '*':
            keys.push_back(makeKey(KeyType::Multiply, std::string(1, advance()), start));
            break;
        case '/':
            keys.push_back(makeKey(KeyType::Divide, std::string(1, advance()), start));
            break;
        case '~':
            keys.push_back(makeKey(KeyType::ToggleSign, std::string(1, advance()), start));
            break;
        case '%':
            keys.push_back(makeKey(KeyType::Percent, std::string(1, advance()), start));
            break;
        case '=':
            keys.push_back(makeKey(KeyType::Equals, std::string(1, advance()), start));
            break;
        default:
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                // Одна цифра — одно нажатие
                Key key = Key::digitKey(advance() - '0');
                key.position = start;
                keys.push_back(std::move(key));
            } else if (std::isalpha(static_cast<unsigned char>(ch))) {
                keys.push_back(makeWord());
            } else {
                keys.push_back(makeSymbol());
            }
            break;
        }
    }
    return keys;
}

bool KeyParser::isAtEnd() const {
    return index >= source.size();
}

char KeyParser::peek() const {
    return source[index];
}

char KeyParser::advance() {
    return source[index++];
}

void KeyParser::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

// Слово сравнивается без учета регистра
Key KeyParser::makeWord() {
    std::size_t start = index;
    while (!isAtEnd() && std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }

    std::string word = source.substr(start, index - start);
    std::string lower = word;
    for (char& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    auto it = kWords.find(lower);
    KeyType type = it != kWords.end() ? it->second : KeyType::Undefined;
    return makeKey(type, std::move(word), start);
}

// Байты UTF-8 последовательности собираются в одну лексему,
// так что "×" дает одно нажатие, а неизвестный символ — одно Undefined.
Key KeyParser::makeSymbol() {
    std::size_t start = index;
    unsigned char lead = static_cast<unsigned char>(advance());
    if (lead >= 0xC0) {
        while (!isAtEnd() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
            advance();
        }
    }

    std::string text = source.substr(start, index - start);
    auto it = kGlyphs.find(text);
    KeyType type = it != kGlyphs.end() ? it->second : KeyType::Undefined;
    return makeKey(type, std::move(text), start);
}

} // namespace calc
