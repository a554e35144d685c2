#include "reaper.hpp"

#include <iostream>

namespace download_service {

Reaper::Reaper(SweepFn sweep)
  : sweep_(std::move(sweep)), work_(boost::asio::make_work_guard(ioc_)) {
  thread_ = std::thread([this] { ioc_.run(); });
}

Reaper::~Reaper() {
  shutdown();
}

void Reaper::schedule(const std::string& id, Clock::time_point when) {
  {
    std::lock_guard<std::mutex> lock{ids_mutex_};
    ids_[id] = when;
  }
  boost::asio::post(ioc_, [this, id, when] { arm(id, when); });
}

void Reaper::cancel(const std::string& id) {
  {
    std::lock_guard<std::mutex> lock{ids_mutex_};
    ids_.erase(id);
  }
  boost::asio::post(ioc_, [this, id] {
    auto it = timers_.find(id);
    if (it != timers_.end()) {
      it->second.timer->cancel();
      timers_.erase(it);
    }
  });
}

bool Reaper::scheduled(const std::string& id) const {
  std::lock_guard<std::mutex> lock{ids_mutex_};
  return ids_.count(id) > 0;
}

std::size_t Reaper::pending() const {
  std::lock_guard<std::mutex> lock{ids_mutex_};
  return ids_.size();
}

void Reaper::arm(const std::string& id, Clock::time_point when) {
  {
    std::lock_guard<std::mutex> lock{ids_mutex_};
    if (!ids_.count(id)) {
      return;  // cancelled before the post ran
    }
  }

  auto& entry = timers_[id];
  if (!entry.timer) {
    entry.timer = std::make_unique<boost::asio::steady_timer>(ioc_);
  }
  entry.generation = ++next_generation_;

  auto delay = when - Clock::now();
  if (delay < Clock::duration::zero()) {
    delay = Clock::duration::zero();
  }
  entry.timer->expires_after(std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay));
  entry.timer->async_wait([this, id, generation = entry.generation](const boost::system::error_code& ec) {
    onTimer(id, generation, ec);
  });
}

void Reaper::onTimer(const std::string& id, std::uint64_t generation, const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted) {
    return;
  }
  auto it = timers_.find(id);
  if (it == timers_.end() || it->second.generation != generation) {
    return;
  }

  std::optional<Clock::time_point> next;
  try {
    next = sweep_(id);
  } catch (const std::exception& e) {
    std::cerr << "[reaper] sweep of " << id << " failed: " << e.what() << std::endl;
    next = Clock::now() + std::chrono::minutes(5);
  }

  if (next) {
    arm(id, *next);
    return;
  }

  timers_.erase(id);
  std::lock_guard<std::mutex> lock{ids_mutex_};
  ids_.erase(id);
}

void Reaper::shutdown() {
  std::call_once(shutdown_once_, [this] {
    boost::asio::post(ioc_, [this] {
      for (auto& [id, entry] : timers_) {
        entry.timer->cancel();
      }
      timers_.clear();
    });
    work_.reset();
    if (thread_.joinable()) {
      thread_.join();
    }
    std::lock_guard<std::mutex> lock{ids_mutex_};
    ids_.clear();
    std::cout << "[reaper] timers destroyed" << std::endl;
  });
}

} // namespace download_service
