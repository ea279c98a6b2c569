#include "batch_mode.hpp"
#include "console.hpp"
#include "csv_writer.hpp"
#include "expression_parser.hpp"
#include "expression_processor.hpp"
#include "file_utils.hpp"
#include "progress_bar.hpp"
#include "parse_pool.hpp"
#include "user_input.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

namespace {

// Строк в одном батче записи и в очереди пула
constexpr std::size_t kBatchSize = 1000;

// Итоги обработки одного файла
struct BatchSummary {
    std::size_t total = 0;
    std::size_t success = 0;
    std::size_t errors = 0;
    std::chrono::milliseconds duration{0};
};

BatchSummary processFile(const std::filesystem::path& inputPath,
                         const std::filesystem::path& outputPath,
                         std::size_t threadCount,
                         const texpr::ParserOptions& options) {
    BatchSummary summary;

    // 0. Быстрый подсчет количества строк в файле
    std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
    auto startCount = std::chrono::steady_clock::now();
    summary.total = countLinesInFile(inputPath);
    auto countDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startCount);
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " ("
        << summary.total << " строк, " << countDuration.count() << " мс)\n\n";

    // 1. Потоковое чтение и разбор файла по частям
    std::cout << Color::BOLD << "Разбор выражений:\n" << Color::RESET;
    auto startProcess = std::chrono::steady_clock::now();

    texpr::ExpressionParser parser(options);
    texpr::CsvWriter writer(outputPath);
    ProgressCounters counters;

    // Батчи приходят в порядке строк, поэтому пишем их сразу
    auto processBatch = [&](const std::vector<texpr::ParseRecord>& batch) {
        for (const auto& record : batch) {
            if (record.status == "success") {
                ++summary.success;
            } else {
                ++summary.errors;
            }
        }
        writer.write(batch);
    };

    std::thread progressThread(displayProgress, std::cref(counters), summary.total);
    try {
        texpr::ParsePool pool(parser, counters, threadCount, kBatchSize);
        texpr::processExpressionsStreaming(inputPath, pool, processBatch, kBatchSize);
    }
    catch (...) {
        // Отпускаем поток прогресса и пробрасываем ошибку дальше
        counters.completed.store(summary.total);
        progressThread.join();
        throw;
    }
    // Строк могло оказаться меньше подсчитанного, если файл изменился во время работы
    counters.completed.store(summary.total);
    progressThread.join();

    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startProcess);
    return summary;
}

void printSummary(const BatchSummary& summary, const std::filesystem::path& outputPath) {
    std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего выражений:  " << Color::CYAN << summary.total << Color::RESET << "\n";
    std::cout << "  Успешно:          " << Color::GREEN << summary.success << Color::RESET << "\n";
    if (summary.errors > 0) {
        std::cout << "  Ошибок:           " << Color::RED << summary.errors << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << Color::MAGENTA << summary.duration.count()
        << " мс" << Color::RESET << "\n";

    // Производительность (выражений в секунду)
    if (summary.duration.count() > 0) {
        std::cout << "  Производительность: " << Color::YELLOW
            << static_cast<long long>(summary.total * 1000.0 / summary.duration.count())
            << " выр/сек" << Color::RESET << "\n";
    }

    std::cout << "\n" << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n\n";
}

} // namespace

int runBatchMode() {
    printHeader();

    bool continueProcessing = true;
    while (continueProcessing) {
        try {
            std::filesystem::path inputPath = selectInputFile();
            std::filesystem::path outputPath = selectOutputFile(inputPath);
            std::size_t threadCount = selectThreadCount();

            texpr::ParserOptions options;
            options.maxNestingDepth = selectMaxNestingDepth(options.maxNestingDepth);

            std::cout << "\n";
            std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
            std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
            std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n";
            std::cout << "  Потоков:       " << Color::CYAN << threadCount << Color::RESET << "\n";
            std::cout << "  Вложенность:   " << Color::CYAN << options.maxNestingDepth << Color::RESET << "\n\n";

            BatchSummary summary = processFile(inputPath, outputPath, threadCount, options);
            printSummary(summary, outputPath);
        }
        catch (const std::exception& ex) {
            std::cerr << "\n";
            printError(ex.what());
        }

        continueProcessing = askContinue();
        if (continueProcessing) {
            std::cout << "\n";
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    return 0;
}
