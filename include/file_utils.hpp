#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Перевод латинских букв в нижний регистр. Байты UTF-8 остаются как есть
std::string toLowerAscii(const std::string& value);

// Быстрый подсчет количества строк в файле
// Читает файл блоками и считает символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path);

// Поиск корневой директории проекта (ищет папку tests или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Поиск всех .txt файлов в директории (без учёта регистра расширения)
std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory);

// Получение текущего времени в формате для имени файла (YYYYMMDD_HHMMSS)
std::string getCurrentTimeString();
