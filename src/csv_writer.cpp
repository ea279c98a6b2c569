#include "csv_writer.hpp"

#include <stdexcept>

namespace texpr {

namespace {
// Экранирование текстового поля (замена двойных кавычек на одинарные)
// и оборачивание в кавычки
std::string quoted(const std::string& value) {
    std::string sanitized = value;
    for (char& ch : sanitized) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + sanitized + '"';
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    initialize();
}

// Инициализация файла (запись заголовка)
void CsvWriter::initialize() const {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,status,tree,latex,simplified,error,position,message\n";
}

std::ofstream CsvWriter::openForAppend() const {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    return stream;
}

// Формат: line,expression,status,tree,latex,simplified,error,position,message
void CsvWriter::formatRecord(std::ostream& stream, const ParseRecord& record) {
    stream << record.lineNumber << ','
        << quoted(record.expression) << ','
        << record.status << ','
        << quoted(record.tree) << ','
        << quoted(record.latex) << ','
        << quoted(record.simplified) << ','
        << record.error << ',';

    // Позиция есть только у ошибок разбора
    if (record.position.has_value()) {
        stream << record.position.value();
    }
    stream << ',' << quoted(record.message) << '\n';
}

// Запись одного результата в файл (для потоковой записи)
void CsvWriter::writeRecord(const ParseRecord& record) const {
    auto stream = openForAppend();
    formatRecord(stream, record);
}

// Запись пакета результатов в CSV файл
void CsvWriter::write(const std::vector<ParseRecord>& records) const {
    auto stream = openForAppend();
    for (const auto& record : records) {
        formatRecord(stream, record);
    }
}

} // namespace texpr
