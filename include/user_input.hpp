#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

// Удаление пробелов и табуляций по краям строки
std::string trim(const std::string& value);

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Чтение одной строки из std::cin с приглашением (без пробелов по краям)
std::string prompt(const std::string& message);

// Интерактивный выбор входного файла
std::filesystem::path selectInputFile();

// Интерактивный выбор выходного файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Интерактивный ввод максимальной глубины вложенности
std::size_t selectMaxNestingDepth(std::size_t defaultDepth);

// Положительный ответ: y, yes, д, да (без учёта регистра)
bool isAffirmative(const std::string& answer);

// Запрос продолжения работы с другим файлом
bool askContinue();

// Интерактивный ввод количества выражений для генерации
std::size_t askExpressionCount();

// Интерактивный выбор имени файла для генерации
std::filesystem::path selectGeneratedFileName(std::size_t expressionCount);
