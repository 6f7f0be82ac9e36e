#include "display_format.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <system_error>

namespace calc {

namespace {
// Самая длинная обычная запись double: 309 цифр целой части у DBL_MAX,
// около 330 знаков у наименьшего субнормального числа
constexpr std::size_t kMaxPlainChars = 400;

// Кратчайшая обычная запись, которая читается обратно в то же число
std::string shortestPlain(double value) {
    char buffer[kMaxPlainChars];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
    if (ec != std::errc()) {
        return "nan";
    }
    return std::string(buffer, end);
}
}

double roundResult(double value) {
    if (!std::isfinite(value)) {
        return value;
    }
    double scaled = value * kRoundingScale;
    if (!std::isfinite(scaled)) {
        return value;
    }
    return std::round(scaled) / kRoundingScale;
}

std::string formatNumber(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    // Без порядка: в буфер операнда можно дописывать цифры
    std::string text = shortestPlain(value);
    if (text.find('.') == std::string::npos) {
        text += ".0";
    }
    return text;
}

bool stripWholeSuffix(std::string& text) {
    if (text.size() < 3 || text.compare(text.size() - 2, 2, ".0") != 0) {
        return false;
    }
    text.erase(text.size() - 2);
    return true;
}

std::optional<double> parseOperand(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace calc
