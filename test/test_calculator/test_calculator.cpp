#include <gtest/gtest.h>

#include <string>

#include "calculator.hpp"
#include "calculator_error.hpp"
#include "key_parser.hpp"

using calc::Calculator;
using calc::CalculatorState;
using calc::InputPhase;
using calc::Key;
using calc::KeyParser;
using calc::KeyType;
using calc::Operator;
using calc::OperandSlot;

// Нажимает клавиши из строки и возвращает итоговый дисплей
static std::string type(Calculator& calculator, const std::string& keys) {
    std::string display = calculator.display();
    for (const Key& key : KeyParser(keys).parse()) {
        display = calculator.handle(key);
    }
    return display;
}

TEST(CalculatorTest, InitialState) {
    Calculator calculator;
    EXPECT_EQ("0", calculator.display());
    EXPECT_EQ(Operator::None, calculator.pendingOperator());
    EXPECT_EQ(InputPhase::AwaitingFirstOperand, calculator.phase());
    EXPECT_TRUE(calculator.firstOperand().empty());
    EXPECT_TRUE(calculator.secondOperand().empty());
}

TEST(CalculatorTest, DigitsDisplayAsTyped) {
    Calculator calculator;
    EXPECT_EQ("1234567890", type(calculator, "1234567890"));

    Calculator leadingZeros;
    EXPECT_EQ("007", type(leadingZeros, "007"));
    EXPECT_EQ(InputPhase::AwaitingOperator, leadingZeros.phase());
}

TEST(CalculatorTest, ClearResetsFromAnyState) {
    const char* sequences[] = { "12.5", "3 +", "3 + 4", "3 + 4 =", "5 ~", "9 / 0 =", "#" };
    for (const char* keys : sequences) {
        Calculator calculator;
        type(calculator, keys);
        EXPECT_EQ("0", type(calculator, "C")) << keys;
        EXPECT_EQ(Operator::None, calculator.pendingOperator());
        EXPECT_TRUE(calculator.firstOperand().empty());
        EXPECT_TRUE(calculator.secondOperand().empty());
        EXPECT_FALSE(calculator.hasDecimal(OperandSlot::First));
        EXPECT_EQ(InputPhase::AwaitingFirstOperand, calculator.phase());
    }
}

TEST(CalculatorTest, WholeResultDropsTrailingZero) {
    Calculator calculator;
    EXPECT_EQ("4", type(calculator, "1.5 + 2.5 ="));
    EXPECT_EQ("4", calculator.firstOperand());
    EXPECT_FALSE(calculator.hasDecimal(OperandSlot::First));
    EXPECT_EQ(Operator::None, calculator.pendingOperator());
    EXPECT_TRUE(calculator.secondOperand().empty());
}

TEST(CalculatorTest, EqualsWithoutSecondOperandReusesFirst) {
    Calculator add;
    EXPECT_EQ("10", type(add, "5 + ="));

    Calculator multiply;
    EXPECT_EQ("9", type(multiply, "3 * ="));

    Calculator divide;
    EXPECT_EQ("1", type(divide, "7 / ="));
}

TEST(CalculatorTest, RoundingHidesFloatNoise) {
    Calculator calculator;
    EXPECT_EQ("0.3", type(calculator, "0.1 + 0.2 ="));

    Calculator third;
    EXPECT_EQ("0.333333333333333", type(third, "1 / 3 ="));
}

TEST(CalculatorTest, BasicArithmetic) {
    Calculator product;
    EXPECT_EQ("42", type(product, "6 * 7 ="));

    Calculator difference;
    EXPECT_EQ("-3", type(difference, "2 - 5 ="));

    Calculator quotient;
    EXPECT_EQ("2.5", type(quotient, "5 / 2 ="));
}

TEST(CalculatorTest, PercentRules) {
    Calculator alone;
    EXPECT_EQ("0.5", type(alone, "50 %"));

    Calculator selfSquare;
    EXPECT_EQ("0.16", type(selfSquare, "4 + %"));
    EXPECT_EQ(Operator::None, selfSquare.pendingOperator());

    Calculator withSecond;
    EXPECT_EQ("0.12", type(withSecond, "3 + 4 %"));
    EXPECT_TRUE(withSecond.secondOperand().empty());
    EXPECT_EQ("0.12", withSecond.firstOperand());

    Calculator whole;
    EXPECT_EQ("2", type(whole, "200 %"));
    EXPECT_FALSE(whole.hasDecimal(OperandSlot::First));
}

TEST(CalculatorTest, PercentWithoutFirstOperandIsNoop) {
    Calculator calculator;
    EXPECT_EQ("0", type(calculator, "%"));
    EXPECT_TRUE(calculator.firstOperand().empty());
    EXPECT_EQ(InputPhase::AwaitingFirstOperand, calculator.phase());
}

TEST(CalculatorTest, ToggleSign) {
    Calculator calculator;
    EXPECT_EQ("0", type(calculator, "~"));
    EXPECT_TRUE(calculator.firstOperand().empty());

    EXPECT_EQ("-5", type(calculator, "5 ~"));
    EXPECT_EQ("-5", calculator.firstOperand());
    EXPECT_EQ("5", type(calculator, "~"));
    EXPECT_EQ("5", calculator.firstOperand());
}

TEST(CalculatorTest, ToggleSignOnSecondOperand) {
    Calculator calculator;
    EXPECT_EQ("-3", type(calculator, "8 - 3 ~"));
    EXPECT_EQ("8", calculator.firstOperand());
    EXPECT_EQ("-3", calculator.secondOperand());
    EXPECT_EQ("11", type(calculator, "="));
}

TEST(CalculatorTest, ToggleRightAfterOperatorUsesVisibleValue) {
    Calculator calculator;
    EXPECT_EQ("5", type(calculator, "5 +"));
    EXPECT_EQ("-5", type(calculator, "~"));
    EXPECT_EQ("-5", calculator.secondOperand());
    EXPECT_EQ("0", type(calculator, "="));
}

TEST(CalculatorTest, SecondDotIsIgnored) {
    Calculator calculator;
    EXPECT_EQ("1.", type(calculator, "1 ."));
    EXPECT_EQ("1.", type(calculator, "."));
    EXPECT_EQ("1.5", type(calculator, "5 ."));
    EXPECT_EQ("1.5", calculator.firstOperand());
    EXPECT_TRUE(calculator.hasDecimal(OperandSlot::First));
}

TEST(CalculatorTest, DotOnEmptyBufferInsertsZero) {
    Calculator first;
    EXPECT_EQ("0.", type(first, "."));
    EXPECT_EQ("0.", first.firstOperand());

    Calculator second;
    EXPECT_EQ("0.5", type(second, "2 + . 5"));
    EXPECT_EQ("0.5", second.secondOperand());
    EXPECT_TRUE(second.hasDecimal(OperandSlot::Second));
    EXPECT_EQ("2.5", type(second, "="));
}

TEST(CalculatorTest, DecimalFlagIsPerBuffer) {
    Calculator calculator;
    type(calculator, "1.5 +");
    EXPECT_TRUE(calculator.hasDecimal(OperandSlot::First));
    EXPECT_FALSE(calculator.hasDecimal(OperandSlot::Second));
    EXPECT_EQ("2.5", type(calculator, "2 . 5"));
    EXPECT_EQ("4", type(calculator, "="));
}

TEST(CalculatorTest, OperatorOverwriteKeepsSecondOperand) {
    Calculator calculator;
    type(calculator, "5 + 3 -");
    EXPECT_EQ(Operator::Subtract, calculator.pendingOperator());
    EXPECT_EQ("5", calculator.firstOperand());
    EXPECT_EQ("3", calculator.secondOperand());
    EXPECT_EQ("2", type(calculator, "="));
}

TEST(CalculatorTest, OperatorOverwriteKeepsSingleDot) {
    Calculator calculator;
    type(calculator, "1 + 2.5 - .");
    EXPECT_EQ("2.5", calculator.secondOperand());
    EXPECT_TRUE(calculator.hasDecimal(OperandSlot::Second));
}

TEST(CalculatorTest, OperatorKeepsDisplay) {
    Calculator calculator;
    EXPECT_EQ("12", type(calculator, "12 *"));
    EXPECT_EQ(InputPhase::AwaitingSecondOperand, calculator.phase());
    EXPECT_EQ("3", type(calculator, "3"));
}

TEST(CalculatorTest, DivisionByZeroFormatsWithoutThrowing) {
    Calculator positive;
    EXPECT_EQ("inf", type(positive, "5 / 0 ="));

    Calculator negative;
    EXPECT_EQ("-inf", type(negative, "5 ~ / 0 ="));

    Calculator undefinedResult;
    EXPECT_EQ("nan", type(undefinedResult, "0 / 0 ="));
}

TEST(CalculatorTest, ResultOfInfinityCanBeReused) {
    Calculator calculator;
    type(calculator, "5 / 0 =");
    EXPECT_EQ("-inf", type(calculator, "~"));
    EXPECT_EQ("-inf", type(calculator, "+ 1 ="));
}

TEST(CalculatorTest, EqualsWithoutOperatorIsAbsorbed) {
    Calculator calculator;
    EXPECT_EQ("5", type(calculator, "5 ="));
    EXPECT_EQ("5", calculator.firstOperand());

    EXPECT_THROW(calculator.press(Key::of(KeyType::Equals)), calc::NoOperationError);
    EXPECT_EQ("5", calculator.display());
}

TEST(CalculatorTest, EqualsWithEmptyFirstOperandKeepsState) {
    Calculator calculator;
    EXPECT_EQ("3", type(calculator, "+ 3"));

    try {
        calculator.press(Key::of(KeyType::Equals));
        FAIL() << "OperandParseError expected";
    }
    catch (const calc::OperandParseError& ex) {
        EXPECT_TRUE(ex.operand().empty());
    }

    EXPECT_EQ("3", type(calculator, "="));
    EXPECT_EQ(Operator::Add, calculator.pendingOperator());
    EXPECT_EQ("3", calculator.secondOperand());
}

TEST(CalculatorTest, UndefinedKeyOnlyResetsDisplay) {
    Calculator calculator;
    EXPECT_EQ("0", type(calculator, "5 #"));
    EXPECT_EQ("5", calculator.firstOperand());
    EXPECT_EQ("6", type(calculator, "+ 1 ="));
}

TEST(CalculatorTest, DigitsAfterResultExtendIt) {
    Calculator calculator;
    EXPECT_EQ("4", type(calculator, "2 + 2 ="));
    EXPECT_EQ("45", type(calculator, "5"));
}

TEST(CalculatorTest, TinyResultStaysPlainAndExtends) {
    Calculator calculator;
    EXPECT_EQ("0.00001", type(calculator, "1 / 100000 ="));
    EXPECT_EQ("0.000015", type(calculator, "5"));
    EXPECT_EQ("0.00003", type(calculator, "* 2 ="));

    Calculator withDot;
    type(withDot, "1 / 100000 =");
    EXPECT_TRUE(withDot.hasDecimal(OperandSlot::First));
    EXPECT_EQ("0.00001", type(withDot, "."));
    EXPECT_EQ("1.00001", type(withDot, "+ 1 ="));
}

TEST(CalculatorTest, HugeResultStaysPlain) {
    Calculator calculator;
    EXPECT_EQ("10000000000000000", type(calculator, "100000000 * 100000000 ="));
    EXPECT_FALSE(calculator.hasDecimal(OperandSlot::First));
    EXPECT_EQ("20000000000000000", type(calculator, "* 2 ="));
}

TEST(CalculatorTest, NonFiniteResultRestartsOnDigit) {
    Calculator infinity;
    type(infinity, "5 / 0 =");
    EXPECT_EQ("7", type(infinity, "7"));
    EXPECT_EQ("7", infinity.firstOperand());
    EXPECT_EQ("8", type(infinity, "+ 1 ="));

    Calculator notANumber;
    type(notANumber, "0 / 0 =");
    EXPECT_EQ("3", type(notANumber, "3"));

    Calculator negative;
    type(negative, "5 / 0 = ~");
    EXPECT_EQ("0.", type(negative, "."));
    EXPECT_EQ("0.5", type(negative, "5"));
    EXPECT_TRUE(negative.hasDecimal(OperandSlot::First));
}

TEST(CalculatorTest, NegativeZeroResult) {
    Calculator calculator;
    EXPECT_EQ("-0", type(calculator, "0 * 5 ~ ="));
    EXPECT_EQ("-0", calculator.firstOperand());
    EXPECT_EQ("0", type(calculator, "~"));
    EXPECT_EQ("0", calculator.firstOperand());
}

TEST(CalculatorTest, InjectedState) {
    CalculatorState state;
    state.first.text = "12";
    state.second.text = "3";
    state.pending = Operator::Add;
    state.display = "3";

    Calculator calculator(state);
    EXPECT_EQ(InputPhase::AwaitingSecondOperand, calculator.phase());
    EXPECT_EQ("15", calculator.handle(Key::of(KeyType::Equals)));

    const CalculatorState& after = calculator.snapshot();
    EXPECT_EQ("15", after.first.text);
    EXPECT_FALSE(after.first.hasDecimal);
    EXPECT_TRUE(after.second.empty());
    EXPECT_EQ(Operator::None, after.pending);
    EXPECT_EQ("15", after.display);
}

TEST(CalculatorTest, BuiltKeysMatchParsedKeys) {
    Calculator calculator;
    calculator.handle(Key::digitKey(9));
    calculator.handle(Key::of(KeyType::Multiply));
    calculator.handle(Key::digitKey(9));
    EXPECT_EQ("81", calculator.handle(Key::of(KeyType::Equals)));
}
