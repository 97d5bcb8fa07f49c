#include "progress_bar.hpp"
#include "console.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace {
constexpr std::size_t kBarWidth = 40;

// Строка вида "[████▒░░░]  37% (370/1000)"
std::string renderBar(std::size_t current, std::size_t total) {
    std::size_t filled = total == 0 ? kBarWidth : current * kBarWidth / total;
    std::size_t percent = total == 0 ? 100 : current * 100 / total;

    std::string bar = "[";
    for (std::size_t i = 0; i < kBarWidth; ++i) {
        if (i < filled) bar += "█";
        else if (i == filled) bar += "▒";
        else bar += "░";
    }
    bar += "] " + std::to_string(percent) + "% (" + std::to_string(current) + "/" +
           std::to_string(total) + ")";
    return bar;
}
}

void displayProgress(std::ostream& out, const std::atomic<std::size_t>& completed, std::size_t total) {
    while (completed.load() < total) {
        out << "\r  " << Color::CYAN << renderBar(completed.load(), total) << Color::RESET;
        out.flush();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    out << "\r  " << Color::GREEN << renderBar(total, total) << Color::RESET << "\n";
}
