// Генератор случайных сессий нажатий для пакетного режима.
// Сессия — цепочка "операнд операция операнд ... =" с редкими помехами
// (сброс, неизвестная клавиша, двойная точка, "=" без операции).
//

#pragma once

#include <array>
#include <random>
#include <string>

namespace calc {

// Вероятность помехи в каждом шаге (5%)
constexpr double kDisruptionProbability = 0.05;

class SequenceGenerator {
public:
    SequenceGenerator() : SequenceGenerator(std::random_device{}()) {}

    explicit SequenceGenerator(unsigned seed) : gen(seed),
        digit_dist(0, 9),
        length_dist(1, 4),
        fraction_length_dist(1, 3),
        op_dist(0, static_cast<int>(kOperators.size()) - 1),
        chance_dist(0.0, 1.0),
        disruption_dist(0, 3) {}

    // Сессия из steps операций (steps <= 0 — одно число и "=")
    std::string generate(int steps) {
        std::string session;
        session.reserve(static_cast<std::size_t>(steps > 0 ? steps : 1) * 12);
        appendOperand(session);

        for (int i = 0; i < steps; ++i) {
            maybeDisrupt(session);
            session.push_back(' ');
            session.push_back(kOperators[op_dist(gen)]);
            session.push_back(' ');

            // Иногда оставляем второй операнд пустым ("5 + =")
            if (chance_dist(gen) >= 0.1) {
                appendOperand(session);
            }

            // Между шагами результат фиксируется "=" или "%"
            if (i + 1 < steps) {
                session.append(chance_dist(gen) < 0.15 ? " %" : " =");
            }
        }

        session.append(" =");
        return session;
    }

private:
    static constexpr std::array<char, 4> kOperators = {'+', '-', '*', '/'};

    std::mt19937 gen;
    std::uniform_int_distribution<> digit_dist;
    std::uniform_int_distribution<> length_dist;
    std::uniform_int_distribution<> fraction_length_dist;
    std::uniform_int_distribution<> op_dist;
    std::uniform_real_distribution<> chance_dist;
    std::uniform_int_distribution<> disruption_dist;

    // Число: 1-4 цифры, иногда дробная часть, иногда смена знака
    void appendOperand(std::string& out) {
        int length = length_dist(gen);
        for (int i = 0; i < length; ++i) {
            out.push_back(static_cast<char>('0' + digit_dist(gen)));
        }
        if (chance_dist(gen) < 0.3) {
            out.push_back('.');
            int fraction = fraction_length_dist(gen);
            for (int i = 0; i < fraction; ++i) {
                out.push_back(static_cast<char>('0' + digit_dist(gen)));
            }
        }
        if (chance_dist(gen) < 0.1) {
            out.append(" ~");
        }
    }

    // Помеха с малой вероятностью
    void maybeDisrupt(std::string& out) {
        if (chance_dist(gen) >= kDisruptionProbability) {
            return;
        }
        switch (disruption_dist(gen)) {
        case 0: // Сброс посреди сессии
            out.append(" C ");
            appendOperand(out);
            break;
        case 1: // Неизвестная клавиша
            out.append(" #");
            break;
        case 2: // Повторная точка
            out.append("..");
            break;
        case 3: // "=" без операции
            out.append(" =");
            break;
        default:
            break;
        }
    }
};

} // namespace calc
