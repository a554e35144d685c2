#include "thread_pool.hpp"
#include "common/config/config.hpp"

#include <algorithm>

ThreadPool& ThreadPool::getInstance() {
  static ThreadPool instance{config::Config::getInstance().getSession().worker_threads};
  return instance;
}

ThreadPool::ThreadPool(unsigned int size) {
  if (size < 1) {
    _poolSize = std::max(2u, std::thread::hardware_concurrency());
  } else {
    _poolSize = size;
  }
  _threads.reserve(_poolSize);

  for (size_t i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this] { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  stop();
}

void ThreadPool::runDedicated(std::function<void()> func) {
  std::lock_guard<std::mutex> lock{_dedicatedMtx};
  if (_stop.load(std::memory_order_acquire)) {
    throw std::runtime_error("ThreadPool is stopped");
  }
  reapDedicatedLocked();

  auto done = std::make_shared<std::atomic_bool>(false);
  _dedicated.push_back(Dedicated{
    std::jthread([func = std::move(func), done] {
      func();
      done->store(true, std::memory_order_release);
    }),
    done
  });
}

void ThreadPool::reapDedicatedLocked() {
  for (auto it = _dedicated.begin(); it != _dedicated.end();) {
    if (it->done->load(std::memory_order_acquire)) {
      it->thread.join();
      it = _dedicated.erase(it);
    } else {
      ++it;
    }
  }
}

void ThreadPool::stop() {
  _stop.store(true, std::memory_order_release);
  _cv.notify_all();
  for (auto& thread : _threads) {
    if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
      thread.join();
    }
  }

  // Workers are gone, so nothing adds dedicated threads any more
  std::list<Dedicated> dedicated;
  {
    std::lock_guard<std::mutex> lock{_dedicatedMtx};
    dedicated.swap(_dedicated);
  }
  for (auto& entry : dedicated) {
    if (entry.thread.joinable() && entry.thread.get_id() != std::this_thread::get_id()) {
      entry.thread.join();
    }
  }
}

void ThreadPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{_mtx};
      // Sleep until there is work or the pool is shutting down
      _cv.wait(lock, [this]() -> bool {
        return _stop.load(std::memory_order_acquire) || !_tasks.empty();
      });

      if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
        break;
      }

      task = std::move(_tasks.front());
      _tasks.pop();
    }
    task();
  }
}
