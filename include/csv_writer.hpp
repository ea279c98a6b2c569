#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace texpr {

// Структура для хранения результата разбора одной строки
struct ParseRecord {
    std::size_t lineNumber = 0;          // Номер строки в исходном файле
    std::string expression;              // Исходный текст выражения
    std::string status;                  // Статус (success или error)
    std::string tree;                    // Структурная запись дерева (если разбор успешен)
    std::string latex;                   // Каноническая запись LaTeX (если разбор успешен)
    std::string simplified;              // Запись после свёртки констант (если разбор успешен)
    std::string error;                   // Вид ошибки (ExpectedAtom, ...)
    std::optional<std::size_t> position; // Позиция ошибки разбора
    std::string message;                 // Сообщение об ошибке (если есть)
};

// Класс для записи результатов в формате CSV (Comma-Separated Values)
// Текстовые поля берутся в кавычки, двойные кавычки внутри заменяются одинарными.
class CsvWriter {
public:
    // Конструктор открывает файл для записи (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает пакет результатов в файл
    void write(const std::vector<ParseRecord>& records) const;

    // Инициализирует файл (записывает заголовок)
    void initialize() const;

    // Записывает один результат в файл (для потоковой записи)
    void writeRecord(const ParseRecord& record) const;

private:
    std::filesystem::path path; // Путь к выходному файлу

    // Открывает файл на дозапись
    std::ofstream openForAppend() const;

    // Форматирует одну строку CSV
    static void formatRecord(std::ostream& stream, const ParseRecord& record);
};

} // namespace texpr
