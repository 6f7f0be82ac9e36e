#include "progress_bar.hpp"
#include "console.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

namespace calc {

std::string renderProgress(std::size_t current, std::size_t total, int width) {
    double fraction = total == 0 ? 1.0 : static_cast<double>(current) / static_cast<double>(total);
    if (fraction > 1.0) {
        fraction = 1.0;
    }
    int filled = static_cast<int>(width * fraction);

    std::ostringstream line;
    line << '[';
    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            line << "█";
        } else if (i == filled) {
            line << "▒";
        } else {
            line << "░";
        }
    }
    line << "] " << static_cast<int>(fraction * 100.0) << "% (" << current << '/' << total << ')';
    return line.str();
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total) {
    while (completed.load() < total) {
        std::cout << "\r  " << Color::CYAN << renderProgress(completed.load(), total)
            << Color::RESET << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    std::cout << "\r  " << Color::GREEN << renderProgress(total, total) << Color::RESET << "\n";
}

} // namespace calc
