#pragma once

#include <optional>
#include <string>

namespace calc {

// Множитель округления: 15 знаков после запятой
constexpr double kRoundingScale = 1e15;

// Округляет результат до 15 знаков после запятой: round(x * 1e15) / 1e15.
// Убирает шум вычислений с плавающей точкой (0.1 + 0.2 -> 0.3).
// inf и nan, а также значения, для которых x * 1e15 переполняется,
// возвращаются без изменений.
double roundResult(double value);

// Текстовое представление числа.
// Конечные значения всегда в обычной записи без порядка и с дробной частью
// ("4.0", "0.25", "10000000000000000.0", "0.00001").
// Бесконечности и nan: "inf", "-inf", "nan".
std::string formatNumber(double value);

// Убирает хвост ".0" у целого результата.
// Возвращает true, если хвост был удален.
bool stripWholeSuffix(std::string& text);

// Разбор содержимого буфера операнда.
// Пустая строка и любой лишний символ дают std::nullopt.
std::optional<double> parseOperand(const std::string& text);

} // namespace calc
