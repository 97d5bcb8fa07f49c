#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace exprcc {

// Пул потоков для пакетной компиляции.
// Каждая задача компилирует одно выражение со своими лексером, парсером и генератором,
// поэтому задачи не разделяют состояние и могут выполняться в любом порядке.
// Порядок результатов сохраняет вызывающий код, храня futures в порядке отправки.
class ThreadPool {
public:
    // threadCount == 0 трактуется как один поток
    explicit ThreadPool(std::size_t threadCount);

    // Дожидается выполнения всех задач, уже стоящих в очереди
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Ставит в очередь вызываемый объект без аргументов.
    // Результат или исключение задачи доступны через возвращённый future.
    // После начала остановки выбрасывает std::runtime_error.
    template <class Func>
    auto enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>>;

    // Число рабочих потоков
    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;        // Рабочие потоки
    std::queue<std::function<void()>> tasks; // Задачи, ещё не взятые потоками

    std::mutex mutex;                  // Защищает tasks и stop
    std::condition_variable condition; // Сигнал о новой задаче или остановке
    bool stop = false;                 // Выставляется деструктором

    // Цикл рабочего потока: берёт задачи, пока очередь не опустеет после stop
    void workerLoop();
};

template <class Func>
inline auto ThreadPool::enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using Return = std::invoke_result_t<Func>;

    // packaged_task некопируем, а std::function требует копирования,
    // поэтому задача живёт в shared_ptr, захваченном обёрткой
    auto task = std::make_shared<std::packaged_task<Return()>>(std::forward<Func>(func));

    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }

    // Одной задаче достаточно одного проснувшегося потока
    condition.notify_one();
    return result;
}

} // namespace exprcc
