#pragma once

#include <vector>
#include <thread>
#include <future>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <type_traits>
#include <stdexcept>

// Runs blocking request work (streaming download bodies) off the io_context.
class ThreadPool {
public:
    // Sized from config::SessionConfig::worker_threads on first use.
    static ThreadPool& getInstance();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename Func, typename... Args>
    auto commit(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
        using ReturnType = std::invoke_result_t<Func, Args...>;

        if (_stop.load(std::memory_order_relaxed)) {
            throw std::runtime_error("ThreadPool is stopped");
        }

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<Func>(func), std::forward<Args>(args)...)
        );

        auto ret = task->get_future();
        {
            std::lock_guard<std::mutex> lock{_mtx};
            _tasks.emplace([task]() { (*task)(); });
        }
        _cv.notify_one();
        return ret;
    }

    size_t size() const { return _poolSize; }

    // Runs `func` on a thread of its own instead of a pool worker. Meant for
    // work that holds its thread for as long as a download lasts. Throws once
    // the pool is stopped.
    void runDedicated(std::function<void()> func);

    // Lets queued tasks finish, then joins every worker and dedicated thread.
    // Later commits throw.
    void stop();

private:
    using Task = std::function<void()>;

    explicit ThreadPool(unsigned int size);
    ~ThreadPool();

    void workerLoop();
    void reapDedicatedLocked();

    struct Dedicated {
        std::jthread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    std::mutex _mtx;
    std::condition_variable _cv;

    std::queue<Task> _tasks;
    std::vector<std::jthread> _threads;

    std::mutex _dedicatedMtx;
    std::list<Dedicated> _dedicated;

    std::atomic_bool _stop{false};
    size_t _poolSize{0};
};
