#include "progress_bar.hpp"
#include "console.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

namespace {
constexpr int kBarWidth = 50;

// Одна строка индикатора: [████▒░░░]  42% (420/1000, ошибок: 3)
void renderBar(std::size_t current, std::size_t failed, std::size_t total, const char* color) {
    int percent = total == 0 ? 100 : static_cast<int>(current * 100 / total);
    int filled = kBarWidth * percent / 100;

    std::string bar;
    for (int i = 0; i < kBarWidth; ++i) {
        bar += i < filled ? "█" : (i == filled ? "▒" : "░");
    }

    std::cout << "\r  " << color << "[" << bar << "] " << Color::BOLD << std::setw(3) << percent
        << "%" << Color::RESET << " (" << current << "/" << total;
    if (failed > 0) {
        std::cout << ", " << Color::RED << "ошибок: " << failed << Color::RESET;
    }
    std::cout << ")" << std::flush;
}
}

void displayProgress(const ProgressCounters& counters, std::size_t total) {
    while (counters.completed.load() < total) {
        renderBar(counters.completed.load(), counters.failed.load(), total, Color::CYAN);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    renderBar(total, counters.failed.load(), total, Color::GREEN);
    std::cout << "\n";
}
