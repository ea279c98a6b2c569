#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "batch_mode.hpp"
#include "console.hpp"
#include "generate_mode.hpp"
#include "parse_mode.hpp"
#include "user_input.hpp"

namespace {

void printUsage() {
    std::cout << Color::BOLD << "Использование:\n" << Color::RESET;
    std::cout << "  texpr                                  пакетный разбор файла в CSV (интерактивно)\n";
    std::cout << "  texpr parse [--max-depth N] [--let x=3 ...] [выражение]\n";
    std::cout << "                                         разбор, упрощение и значение выражения\n";
    std::cout << "  texpr generate                         генерация тестовых выражений\n";
    std::cout << "  texpr help                             эта справка\n\n";
}

// Аргументы режима parse: необязательные --max-depth N, --let x=3 и выражение
int runParseCommand(int argc, char** argv) {
    texpr::ParserOptions options;
    texpr::VariableMap variables;
    std::optional<std::string> expression;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                throw std::runtime_error("После --max-depth ожидалось число");
            }
            options.maxNestingDepth = parseNumber(argv[++i]);
        } else if (arg == "--let") {
            if (i + 1 >= argc) {
                throw std::runtime_error("После --let ожидалось присваивание вида x=3");
            }
            auto [name, value] = parseVariableAssignment(argv[++i]);
            variables[name] = value;
        } else if (!expression) {
            expression = arg;
        } else {
            throw std::runtime_error("Лишний аргумент: " + arg);
        }
    }
    return runParseMode(expression, options, variables);
}

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            return runBatchMode();
        }

        std::string command = argv[1];
        if (command == "generate") {
            runGenerateMode();
            return 0;
        }
        if (command == "parse") {
            return runParseCommand(argc, argv);
        }
        if (command == "help" || command == "--help" || command == "-h") {
            printUsage();
            return 0;
        }

        printError("Неизвестная команда: " + command);
        printUsage();
        return 2;
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
}
