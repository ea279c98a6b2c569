#include "user_input.hpp"
#include "console.hpp"
#include "file_utils.hpp"
#include "parser.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {
// Добавляет расширение, если у пути его нет или оно другое
std::filesystem::path withExtension(std::filesystem::path path, const std::string& extension) {
    if (path.extension() != extension) {
        path.replace_extension(extension);
    }
    return path;
}
}

std::string trim(const std::string& value) {
    std::size_t first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

std::size_t parseNumber(const std::string& value) {
    // stoul принимает знак и хвост после цифр ("-1", "12abc"), поэтому цифры проверяются заранее
    bool allDigits = !value.empty() &&
        std::all_of(value.begin(), value.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!allDigits) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }

    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Слишком большое число: " + value);
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::string prompt(const std::string& message) {
    std::cout << Color::BOLD << message << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод закрыт");
    }
    return trim(input);
}

std::filesystem::path selectInputFile() {
    std::filesystem::path projectDir = findProjectRoot();
    std::filesystem::path testsDir = projectDir / "tests";
    auto txtFiles = findTxtFiles(testsDir);

    if (txtFiles.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt файлов в папке tests.\n";
        std::cout << "Директория: " << Color::CYAN << testsDir << Color::RESET << "\n\n";
    }
    else {
        std::cout << Color::BOLD << "Найденные .txt файлы в папке tests:\n" << Color::RESET;
        for (std::size_t i = 0; i < txtFiles.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << txtFiles[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::string input = prompt("Введите номер файла или путь до входного файла: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    bool isNumber = std::all_of(input.begin(), input.end(),
                                [](unsigned char c) { return std::isdigit(c) != 0; });

    if (isNumber && !txtFiles.empty()) {
        std::size_t index = parseNumber(input);
        if (index > txtFiles.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return txtFiles[index - 1];
    }

    // Пользователь ввел путь
    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    std::cout << Color::BOLD << "Выберите способ задания выходного файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". Название по умолчанию (имя входного файла + _results_ + время)\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = prompt("Ваш выбор (1 или 2): ");

    if (choice == "1") {
        std::string inputStem = inputPath.stem().string();
        return inputPath.parent_path() / (inputStem + "_results_" + getCurrentTimeString() + ".csv");
    }
    if (choice == "2") {
        std::string customName = prompt("Введите название выходного файла (можно с путем, расширение .csv добавится автоматически): ");
        if (customName.empty()) {
            throw std::runtime_error("Пустое название файла");
        }

        std::filesystem::path customPath(customName);
        if (customPath.is_absolute()) {
            return withExtension(customPath, ".csv");
        }
        // Относительный путь отсчитывается от директории входного файла
        return withExtension(inputPath.parent_path() / customPath, ".csv");
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = std::thread::hardware_concurrency();
    if (defaultThreads == 0) {
        defaultThreads = 2; // Резервное значение
    }

    std::string input = prompt("Введите количество потоков (по умолчанию: " +
                               std::to_string(defaultThreads) + "): ");
    if (input.empty()) {
        return defaultThreads;
    }
    return parseNumber(input);
}

std::size_t selectMaxNestingDepth(std::size_t defaultDepth) {
    std::string input = prompt("Введите максимальную глубину вложенности (по умолчанию: " +
                               std::to_string(defaultDepth) + ", не более " +
                               std::to_string(texpr::kMaxNestingDepthLimit) + "): ");
    if (input.empty()) {
        return defaultDepth;
    }
    std::size_t depth = parseNumber(input);
    texpr::validateOptions(texpr::ParserOptions{depth});
    return depth;
}

bool isAffirmative(const std::string& answer) {
    std::string lower = toLowerAscii(answer);
    if (lower == "y" || lower == "yes") {
        return true;
    }
    // Кириллица в UTF-8 многобайтная, регистры перечислены явно
    return answer == "д" || answer == "Д" || answer == "да" || answer == "Да" || answer == "ДА";
}

bool askContinue() {
    std::string input;
    try {
        input = prompt("Обработать еще один файл? (y/n): ");
    }
    catch (const std::runtime_error&) {
        // Ввод закрыт: продолжать нечего
        return false;
    }
    return isAffirmative(input);
}

std::size_t askExpressionCount() {
    std::string input = prompt("Введите количество выражений для генерации: ");
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parseNumber(input);
}

std::filesystem::path selectGeneratedFileName(std::size_t expressionCount) {
    std::cout << Color::BOLD << "Выберите способ задания имени файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". Автоматическое название (generate_" << expressionCount << ".txt)\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = prompt("Ваш выбор (1 или 2): ");

    if (choice == "1") {
        return std::filesystem::path("generate_" + std::to_string(expressionCount) + ".txt");
    }
    if (choice == "2") {
        std::string customName = prompt("Введите название файла (расширение .txt добавится автоматически): ");
        if (customName.empty()) {
            throw std::runtime_error("Пустое название файла");
        }
        return withExtension(customName, ".txt");
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}
