#pragma once

#include <string>

#include "key.hpp"
#include "operator.hpp"

namespace calc {

// Буфер вводимого числа: цифры и не более одной точки
struct OperandBuffer {
    std::string text;
    bool hasDecimal = false; // Точка уже введена в этот буфер

    bool empty() const { return text.empty(); }
    void clear() {
        text.clear();
        hasDecimal = false;
    }
};

// Полное состояние калькулятора.
// Изменяется только через Calculator::press / Calculator::handle.
struct CalculatorState {
    OperandBuffer first;
    OperandBuffer second;
    Operator pending = Operator::None;
    std::string display = "0";
};

// Состояние автомата, выводимое из буферов и операции
enum class InputPhase {
    AwaitingFirstOperand,
    AwaitingOperator,
    AwaitingSecondOperand
};

enum class OperandSlot {
    First,
    Second
};

const char* toString(InputPhase phase);

// Контроллер ввода четырехфункционального калькулятора.
// Принимает нажатия по одному и поддерживает текст на дисплее.
// Не синхронизирован: вызовы из разных потоков должен упорядочивать вызывающий.
class Calculator {
public:
    Calculator() = default;
    explicit Calculator(CalculatorState initial);

    // Обрабатывает нажатие и возвращает новый текст дисплея.
    // Ошибки CalculatorError поглощаются: состояние и дисплей не меняются.
    std::string handle(const Key& key);

    // Строгая версия handle: выбрасывает NoOperationError и OperandParseError.
    // При исключении состояние остается прежним.
    void press(const Key& key);

    const std::string& display() const { return state.display; }
    Operator pendingOperator() const { return state.pending; }
    const std::string& firstOperand() const { return state.first.text; }
    const std::string& secondOperand() const { return state.second.text; }
    bool hasDecimal(OperandSlot slot) const;
    InputPhase phase() const;
    const CalculatorState& snapshot() const { return state; }

private:
    CalculatorState state;

    // Буфер, принимающий цифры: второй, если выбрана операция
    OperandBuffer& activeBuffer();

    void pressDigit(int digit);
    void pressDot();
    void pressOperator(Operator op);
    void pressToggleSign();
    void pressPercent();
    void pressEquals();
    void reset();

    // Округляет результат, сохраняет его первым операндом и сбрасывает операцию
    void commitResult(double result);
};

} // namespace calc
