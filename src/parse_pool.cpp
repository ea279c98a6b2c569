#include "parse_pool.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "expression_processor.hpp"

namespace texpr {

ParsePool::ParsePool(const ExpressionParser& parser, ProgressCounters& counters,
                     std::size_t threadCount, std::size_t queueCapacity)
    : parser(parser), counters(counters), capacity(queueCapacity == 0 ? 1 : queueCapacity) {
    if (threadCount == 0) {
        threadCount = 1;
    }

    workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

// Строки, оставшиеся в очереди, разбираются до завершения потоков
ParsePool::~ParsePool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop = true;
    }
    hasJobs.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<ParseRecord> ParsePool::submit(ExpressionLine line) {
    Job job{std::move(line), std::promise<ParseRecord>()};
    std::future<ParseRecord> result = job.result.get_future();
    {
        std::unique_lock<std::mutex> lock(mutex);
        hasSpace.wait(lock, [this]() { return stop || jobs.size() < capacity; });
        if (stop) {
            throw std::runtime_error("Пул разбора уже остановлен");
        }
        jobs.push(std::move(job));
    }
    hasJobs.notify_one();
    return result;
}

void ParsePool::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            hasJobs.wait(lock, [this]() { return stop || !jobs.empty(); });

            if (stop && jobs.empty()) {
                return;
            }

            job = std::move(jobs.front());
            jobs.pop();
        }
        hasSpace.notify_one();

        // Разбор идёт вне блокировки
        run(job);
    }
}

// processLine сам переводит ошибки разбора в запись отчёта;
// прочие исключения передаются владельцу future
void ParsePool::run(Job& job) {
    try {
        ParseRecord record = processLine(parser, job.line);
        if (record.status != "success") {
            counters.failed.fetch_add(1);
        }
        counters.completed.fetch_add(1);
        job.result.set_value(std::move(record));
    }
    catch (...) {
        counters.completed.fetch_add(1);
        job.result.set_exception(std::current_exception());
    }
}

} // namespace texpr
