#include "generate_mode.hpp"
#include "console.hpp"
#include "expression_generator.hpp"
#include "file_utils.hpp"
#include "user_input.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

void runGenerateMode() {
    printHeader();

    std::cout << Color::BOLD << Color::CYAN << "Режим генерации выражений\n" << Color::RESET << "\n";

    // 1. Получаем количество выражений
    std::size_t expressionCount = askExpressionCount();

    // 2. Получаем имя файла
    std::filesystem::path fileName = selectGeneratedFileName(expressionCount);

    // 3. Определяем путь к папке tests
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    std::filesystem::create_directories(testsDir);
    std::filesystem::path outputPath = testsDir / fileName;

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество выражений: " << Color::CYAN << expressionCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:        " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    // 4. Генерируем выражения
    std::cout << Color::BOLD << "Генерация выражений..." << Color::RESET << std::flush;
    auto startGen = std::chrono::steady_clock::now();

    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    ExpressionGenerator generator;
    for (std::size_t i = 0; i < expressionCount; ++i) {
        // Глубина от 2 до 6
        int depth = 2 + static_cast<int>(i % 5);
        output << generator.generate(depth) << "\n";

        // Показываем прогресс для больших файлов
        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << expressionCount
                << " выражений сгенерировано..." << Color::RESET << std::flush;
        }
    }

    output.close();
    if (output.fail()) {
        throw std::runtime_error("Ошибка записи файла: " + outputPath.string());
    }

    auto genDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startGen);

    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << expressionCount << " выражений, "
        << genDuration.count() << " мс)\n\n";

    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}
