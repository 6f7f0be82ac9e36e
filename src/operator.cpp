#include "operator.hpp"
#include "calculator_error.hpp"

namespace calc {

double apply(Operator op, double lhs, double rhs) {
    switch (op) {
    case Operator::Add:
        return lhs + rhs;
    case Operator::Subtract:
        return lhs - rhs;
    case Operator::Multiply:
        return lhs * rhs;
    case Operator::Divide:
        return lhs / rhs;
    case Operator::None:
        break;
    }
    throw NoOperationError();
}

Operator operatorFor(KeyType type) {
    switch (type) {
    case KeyType::Add:
        return Operator::Add;
    case KeyType::Subtract:
        return Operator::Subtract;
    case KeyType::Multiply:
        return Operator::Multiply;
    case KeyType::Divide:
        return Operator::Divide;
    default:
        return Operator::None;
    }
}

char symbol(Operator op) {
    switch (op) {
    case Operator::Add:
        return '+';
    case Operator::Subtract:
        return '-';
    case Operator::Multiply:
        return '*';
    case Operator::Divide:
        return '/';
    case Operator::None:
        break;
    }
    return ' ';
}

} // namespace calc
