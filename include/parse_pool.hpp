#pragma once

#include <condition_variable>
#include <cstddef>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "csv_writer.hpp"
#include "expression_parser.hpp"
#include "progress_bar.hpp"

namespace texpr {

// Исходная строка выражения с ее номером
struct ExpressionLine {
    std::size_t number;
    std::string text;
};

// Пул рабочих потоков, разбирающих строки одним общим ExpressionParser.
// Очередь ограничена: submit ждёт, пока в ней не освободится место,
// поэтому чтение файла не опережает разбор больше чем на queueCapacity строк.
class ParsePool {
public:
    // При threadCount == 0 или queueCapacity == 0 используется 1
    ParsePool(const ExpressionParser& parser, ProgressCounters& counters,
              std::size_t threadCount, std::size_t queueCapacity);
    ~ParsePool();

    ParsePool(const ParsePool&) = delete;
    ParsePool& operator=(const ParsePool&) = delete;

    // Ставит строку в очередь. Результат разбора придёт через future.
    std::future<ParseRecord> submit(ExpressionLine line);

    // Количество рабочих потоков
    std::size_t size() const { return workers.size(); }

private:
    struct Job {
        ExpressionLine line;
        std::promise<ParseRecord> result;
    };

    const ExpressionParser& parser;
    ProgressCounters& counters;
    const std::size_t capacity;

    std::vector<std::thread> workers;
    std::queue<Job> jobs;

    std::mutex mutex;                   // Защищает очередь и флаг остановки
    std::condition_variable hasJobs;    // Будит рабочие потоки
    std::condition_variable hasSpace;   // Будит submit при заполненной очереди
    bool stop = false;

    void workerLoop();
    void run(Job& job);
};

} // namespace texpr
