#pragma once

#include <atomic>
#include <cstddef>

// Счётчики пакетного разбора, общие для рабочих потоков и индикатора
struct ProgressCounters {
    std::atomic<std::size_t> completed{0}; // Разобрано строк
    std::atomic<std::size_t> failed{0};    // Из них с ошибкой разбора
};

// Отображение прогресс-бара разбора с числом ошибок.
// Запускается в отдельном потоке и завершается, когда completed достигает total.
void displayProgress(const ProgressCounters& counters, std::size_t total);
