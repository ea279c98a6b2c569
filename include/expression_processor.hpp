#pragma once

#include "csv_writer.hpp"
#include "expression_parser.hpp"
#include "parse_pool.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace texpr {

// Разбор одной строки в запись отчёта: дерево, каноническая и упрощённая записи.
// Исключения не выбрасывает: ошибки разбора попадают в поля error/position/message
ParseRecord processLine(const ExpressionParser& parser, const ExpressionLine& line);

using BatchCallback = std::function<void(const std::vector<ParseRecord>&)>;

// Потоковое чтение и разбор файла по частям (chunks) для экономии памяти.
// Строки отправляются в пул, готовые futures собираются батчами,
// и каждый батч передаётся в callback (порядок внутри батча совпадает с порядком строк).
void processExpressionsStreaming(const std::filesystem::path& path,
                                 ParsePool& pool,
                                 const BatchCallback& processBatch,
                                 std::size_t batchSize = 1000);

} // namespace texpr
