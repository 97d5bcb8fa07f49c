#pragma once

#include <atomic>
#include <cstddef>
#include <ostream>

// Отображение прогресса пакетной компиляции.
// Запускается в отдельном потоке и завершается, когда completed достигнет total.
void displayProgress(std::ostream& out, const std::atomic<std::size_t>& completed, std::size_t total);
