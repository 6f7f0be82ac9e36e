#include "calculator.hpp"

#include "calculator_error.hpp"
#include "display_format.hpp"
#include "logger.hpp"

#include <cmath>

namespace calc {

namespace {
bool containsDot(const std::string& text) {
    return text.find('.') != std::string::npos;
}

// inf, -inf и nan после деления на ноль не продолжаются вводом
bool holdsNonFinite(const OperandBuffer& buffer) {
    if (buffer.empty()) {
        return false;
    }
    auto value = parseOperand(buffer.text);
    return value && !std::isfinite(*value);
}

double parseOrThrow(const std::string& text) {
    auto value = parseOperand(text);
    if (!value) {
        throw OperandParseError(text);
    }
    return *value;
}
}

const char* toString(InputPhase phase) {
    switch (phase) {
    case InputPhase::AwaitingFirstOperand:
        return "AwaitingFirstOperand";
    case InputPhase::AwaitingOperator:
        return "AwaitingOperator";
    case InputPhase::AwaitingSecondOperand:
        return "AwaitingSecondOperand";
    }
    return "?";
}

Calculator::Calculator(CalculatorState initial) : state(std::move(initial)) {
    if (state.display.empty()) {
        state.display = "0";
    }
}

std::string Calculator::handle(const Key& key) {
    try {
        press(key);
    }
    catch (const NoOperationError& ex) {
        // Обычная ситуация для пользователя: "=" без операции
        Logger::info("key '%s' ignored: %s", glyph(key).c_str(), ex.what());
    }
    catch (const CalculatorError& ex) {
        Logger::warn("key '%s' ignored: %s", glyph(key).c_str(), ex.what());
    }
    return state.display;
}

// Диспетчеризация по категории клавиши
void Calculator::press(const Key& key) {
    switch (key.type) {
    case KeyType::Digit:
        if (key.digit < 0 || key.digit > 9) {
            state.display = "0";
            break;
        }
        pressDigit(key.digit);
        break;
    case KeyType::Dot:
        pressDot();
        break;
    case KeyType::Add:
    case KeyType::Subtract:
    case KeyType::Multiply:
    case KeyType::Divide:
        pressOperator(operatorFor(key.type));
        break;
    case KeyType::ToggleSign:
        pressToggleSign();
        break;
    case KeyType::Percent:
        pressPercent();
        break;
    case KeyType::Equals:
        pressEquals();
        break;
    case KeyType::Clear:
        reset();
        break;
    case KeyType::Undefined:
        state.display = "0";
        break;
    }

    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("key '%s' -> display '%s' [%s %c %s]", glyph(key).c_str(),
            state.display.c_str(), state.first.text.c_str(), symbol(state.pending),
            state.second.text.c_str());
    }
}

bool Calculator::hasDecimal(OperandSlot slot) const {
    return slot == OperandSlot::First ? state.first.hasDecimal : state.second.hasDecimal;
}

InputPhase Calculator::phase() const {
    if (state.pending != Operator::None) {
        return InputPhase::AwaitingSecondOperand;
    }
    return state.first.empty() ? InputPhase::AwaitingFirstOperand : InputPhase::AwaitingOperator;
}

OperandBuffer& Calculator::activeBuffer() {
    return state.pending == Operator::None ? state.first : state.second;
}

// Первая цифра начинает новое число и заменяет "0" на дисплее
void Calculator::pressDigit(int digit) {
    OperandBuffer& buffer = activeBuffer();
    if (holdsNonFinite(buffer)) {
        buffer.clear();
    }
    if (buffer.empty()) {
        buffer.hasDecimal = false;
    }
    buffer.text.push_back(static_cast<char>('0' + digit));
    state.display = buffer.text;
}

// Вторая точка в том же буфере игнорируется
void Calculator::pressDot() {
    OperandBuffer& buffer = activeBuffer();
    if (holdsNonFinite(buffer)) {
        buffer.clear();
    }
    if (buffer.hasDecimal) {
        return;
    }
    buffer.hasDecimal = true;
    if (buffer.empty()) {
        buffer.text = "0";
    }
    buffer.text.push_back('.');
    state.display = buffer.text;
}

// Повторный выбор операции заменяет прежнюю без вычисления
void Calculator::pressOperator(Operator op) {
    state.pending = op;
    state.second.hasDecimal = containsDot(state.second.text);
}

void Calculator::pressToggleSign() {
    if (state.display == "0") {
        return;
    }
    std::string toggled = state.display.front() == '-'
        ? state.display.substr(1)
        : "-" + state.display;

    OperandBuffer& buffer = activeBuffer();
    buffer.text = toggled;
    buffer.hasDecimal = containsDot(toggled);
    state.display = std::move(toggled);
}

// Процент считается от первого операнда; без него клавиша ничего не делает
void Calculator::pressPercent() {
    auto lhs = parseOperand(state.first.text);
    if (!lhs) {
        return;
    }

    double result = 0.0;
    if (state.pending == Operator::None) {
        result = *lhs / 100;
    } else if (state.second.empty()) {
        result = *lhs * *lhs / 100;
    } else {
        result = *lhs * parseOrThrow(state.second.text) / 100;
    }
    commitResult(result);
}

// Без второго операнда операция применяется к первому: "5 + =" дает 10
void Calculator::pressEquals() {
    if (state.pending == Operator::None) {
        throw NoOperationError();
    }
    double lhs = parseOrThrow(state.first.text);
    double rhs = state.second.empty() ? lhs : parseOrThrow(state.second.text);
    commitResult(apply(state.pending, lhs, rhs));
}

void Calculator::reset() {
    state = CalculatorState{};
}

void Calculator::commitResult(double result) {
    std::string text = formatNumber(roundResult(result));
    stripWholeSuffix(text);

    state.first.text = text;
    state.first.hasDecimal = containsDot(text);
    state.second.clear();
    state.pending = Operator::None;
    state.display = std::move(text);
}

} // namespace calc
