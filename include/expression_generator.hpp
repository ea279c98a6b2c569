// Генератор выражений LaTeX для тестирования парсера.
// Поддерживает скобки, неявное умножение (2x, 3(x + 1)), \cdot, степени,
// унарный минус и факториал. С заданной вероятностью портит выражение
// (незакрытая скобка, недопустимый символ, '!' в начале, оператор в конце).
//

#pragma once

#include <cstdio>
#include <random>
#include <string>
#include <vector>

// Вероятность генерации ошибки по умолчанию (5%)
constexpr double kDefaultErrorProbability = 0.05;

class ExpressionGenerator {
public:
    explicit ExpressionGenerator(double errorProbability = kDefaultErrorProbability)
        : ExpressionGenerator(std::random_device{}(), errorProbability) {}

    ExpressionGenerator(unsigned int seed, double errorProbability)
        : gen(seed),
          errorProbability(errorProbability),
          int_dist(0, 20),
          decimal_dist(0.01, 99.99),
          letter_dist(0, static_cast<int>(kLetters.size()) - 1),
          op_dist(0, static_cast<int>(kOperators.size()) - 1),
          type_dist(0, 19),
          leaf_dist(0, 4),
          error_dist(0.0, 1.0),
          error_type_dist(0, 3),
          bad_char_dist(0, static_cast<int>(kBadChars.size()) - 1) {}

    // Генерирует одно выражение заданной глубины
    std::string generate(int depth) {
        return introduceError(build(depth));
    }

private:
    inline static const std::string kLetters = "abcnxyz";
    inline static const std::vector<std::string> kOperators = {
        "+", "-", "\\cdot", "*", "/", "^"
    };
    inline static const std::string kBadChars = "#$&?@~";

    std::mt19937 gen;
    double errorProbability;
    std::uniform_int_distribution<> int_dist;
    std::uniform_real_distribution<> decimal_dist;
    std::uniform_int_distribution<> letter_dist;
    std::uniform_int_distribution<> op_dist;
    std::uniform_int_distribution<> type_dist;
    std::uniform_int_distribution<> leaf_dist;
    std::uniform_real_distribution<> error_dist;
    std::uniform_int_distribution<> error_type_dist;
    std::uniform_int_distribution<> bad_char_dist;

    // Каждое составное подвыражение оборачивается в скобки,
    // поэтому без внесённых ошибок результат всегда разбирается
    std::string build(int depth) {
        if (depth <= 0) {
            return generateLeaf();
        }

        int type_roll = type_dist(gen);
        if (type_roll < 12) { // Бинарная операция: (A op B) (60%)
            const std::string& op = kOperators[op_dist(gen)];
            std::string left = build(depth - 1);
            std::string right = build(depth - 1);

            std::string result;
            result.reserve(left.size() + right.size() + op.size() + 4);
            result.append("(");
            result.append(left);
            result.append(" ");
            result.append(op);
            result.append(" ");
            result.append(right);
            result.append(")");
            return result;
        } else if (type_roll < 15) { // Унарный минус (15%)
            return "-" + build(depth - 1);
        } else if (type_roll < 17) { // Факториал (10%)
            return "(" + build(depth - 1) + ")!";
        } else if (type_roll < 19) { // Неявное умножение: 3(A) (10%)
            return std::to_string(int_dist(gen)) + "(" + build(depth - 1) + ")";
        } else { // Просто лист (5%)
            return generateLeaf();
        }
    }

    // Число, переменная или короткая цепочка неявного умножения
    std::string generateLeaf() {
        switch (leaf_dist(gen)) {
        case 0:
            return std::to_string(int_dist(gen));
        case 1:
            return generateDecimal();
        case 2:
            return generateVariable();
        case 3: // 2x
            return std::to_string(int_dist(gen)) + generateVariable();
        default: // xy
            return generateVariable() + " " + generateVariable();
        }
    }

    std::string generateDecimal() {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.2f", decimal_dist(gen));
        return std::string(buffer);
    }

    // Переменная, изредка с индексом: x_1
    std::string generateVariable() {
        std::string name(1, kLetters[letter_dist(gen)]);
        if (int_dist(gen) == 0) {
            name += "_" + std::to_string(int_dist(gen) % 10);
        }
        return name;
    }

    // Вносит ошибки в выражение с заданной вероятностью.
    // Каждый вид порчи гарантированно делает выражение некорректным.
    std::string introduceError(const std::string& expr) {
        if (error_dist(gen) >= errorProbability) {
            return expr;
        }

        std::string result = expr;
        switch (error_type_dist(gen)) {
        case 0: // Незакрытая скобка: убираем последнюю закрывающую
            for (std::size_t i = result.length(); i > 0; --i) {
                if (result[i - 1] == ')') {
                    result.erase(i - 1, 1);
                    return result;
                }
            }
            return result + " +";
        case 1: // Недопустимый символ в середине выражения
            result.insert(result.length() / 2, 1, kBadChars[bad_char_dist(gen)]);
            return result;
        case 2: // Факториал без операнда слева
            return "!" + result;
        default: // Оператор без правого операнда
            return result + " " + kOperators[op_dist(gen)];
        }
    }
};
