#pragma once

#include <stdexcept>
#include <string>

namespace calc {

// Базовый класс ошибок движка калькулятора
class CalculatorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Нажато "=" без выбранной операции
class NoOperationError final : public CalculatorError {
public:
    NoOperationError() : CalculatorError("Операция не выбрана") {}
};

// Содержимое буфера операнда не является числом.
// При соблюдении инвариантов буферов не возникает.
class OperandParseError final : public CalculatorError {
public:
    explicit OperandParseError(std::string operandText)
        : CalculatorError("Некорректный операнд: '" + operandText + "'"),
          text(std::move(operandText)) {}

    const std::string& operand() const { return text; }

private:
    std::string text;
};

} // namespace calc
