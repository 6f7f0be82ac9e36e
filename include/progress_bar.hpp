#pragma once

#include <atomic>
#include <cstddef>
#include <string>

namespace calc {

// Строка прогресс-бара шириной width: "[███▒░░] 50% (5/10)"
std::string renderProgress(std::size_t current, std::size_t total, int width = 50);

// Перерисовывает прогресс-бар, пока completed < total.
// Запускается в отдельном потоке.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total);

} // namespace calc
