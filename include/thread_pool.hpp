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

namespace calc {

// Пул рабочих потоков пакетного режима.
// Каждая задача создает собственный Calculator, поэтому потоки не делят состояние движка.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Ставит задачу в очередь, результат доступен через future
    template <class Func>
    auto enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>>;

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex mutex;
    std::condition_variable condition;
    bool stopping = false;

    void workerLoop();
};

template <class Func>
inline auto ThreadPool::enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using Return = std::invoke_result_t<Func>;

    // std::function требует копируемости, поэтому packaged_task хранится в shared_ptr
    auto task = std::make_shared<std::packaged_task<Return()>>(std::forward<Func>(func));
    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return result;
}

} // namespace calc
