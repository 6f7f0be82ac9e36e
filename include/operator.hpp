#pragma once

#include "key.hpp"

namespace calc {

// Бинарная операция, ожидающая второй операнд.
// None — операция не выбрана.
enum class Operator {
    None,
    Add,
    Subtract,
    Multiply,
    Divide
};

// Применяет операцию к двум операндам.
// Деление на ноль не проверяется: результат inf, -inf или nan по IEEE-754.
// Для Operator::None выбрасывает NoOperationError.
double apply(Operator op, double lhs, double rhs);

// Операция, соответствующая клавише (+ - * /), иначе Operator::None
Operator operatorFor(KeyType type);

// Символ операции для журнала и вывода
char symbol(Operator op);

} // namespace calc
