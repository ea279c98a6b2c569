#include "expression_processor.hpp"

#include <fstream>
#include <future>
#include <stdexcept>
#include <string>

#include "parse_error.hpp"
#include "simplifier.hpp"

namespace texpr {

ParseRecord processLine(const ExpressionParser& parser, const ExpressionLine& line) {
    ParseRecord record;
    record.lineNumber = line.number;
    record.expression = line.text;

    // Файлы из Windows: отбрасываем завершающий '\r'
    if (!record.expression.empty() && record.expression.back() == '\r') {
        record.expression.pop_back();
    }

    try {
        auto tree = parser.parse(record.expression);
        record.status = "success";
        record.tree = tree->describe();
        record.latex = tree->toLatex();
        record.simplified = simplified(*tree)->toLatex();
    }
    catch (const ParseError& ex) {
        record.status = "error";
        record.error = toString(ex.kind());
        record.position = ex.position();
        record.message = ex.what();
    }
    catch (const std::exception& ex) {
        record.status = "error";
        record.message = ex.what();
    }
    return record;
}

void processExpressionsStreaming(const std::filesystem::path& path,
                                 ParsePool& pool,
                                 const BatchCallback& processBatch,
                                 std::size_t batchSize) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + path.string());
    }
    if (batchSize == 0) {
        batchSize = 1;
    }

    std::vector<std::future<ParseRecord>> futures;
    futures.reserve(batchSize);

    auto processFuturesBatch = [&]() {
        if (futures.empty()) return;

        std::vector<ParseRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
        }
        processBatch(batch);
        futures.clear();
    };

    std::string buffer;
    std::size_t lineNumber = 1;
    while (std::getline(input, buffer)) {
        futures.push_back(pool.submit({lineNumber++, std::move(buffer)}));

        if (futures.size() >= batchSize) {
            processFuturesBatch();
        }
    }

    // Обрабатываем оставшиеся futures
    processFuturesBatch();
}

} // namespace texpr
