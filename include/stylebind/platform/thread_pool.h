#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace stylebind::platform {

// hardware_concurrency(), or 1 where the platform reports 0.
size_t default_thread_count();

// Fixed set of workers draining a FIFO queue. The batch runner hands it one
// top-level file per task.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = default_thread_count());
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a task and get a future for the result
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    // Submit a fire-and-forget task. It must not throw.
    void post(std::function<void()> task);

    // Blocks until the queue is empty and no task is running.
    void wait_idle();

    size_t size() const;
    // Queued plus running tasks.
    size_t pending() const;

    // Shutdown the pool (waits for pending tasks to complete)
    void shutdown();

    bool is_running() const;

private:
    void worker_loop();
    void enqueue(std::function<void()> task);

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    std::atomic<bool> shutdown_{false};
};

// Template implementation
template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    auto future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
}

} // namespace stylebind::platform
