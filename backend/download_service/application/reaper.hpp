#pragma once
#include "domain/download_record.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio.hpp>

namespace download_service {

// One timer per download id, run on a private io_context thread. When a timer
// fires the sweep callback decides: evicted (nullopt) or check again at the
// returned time.
class Reaper {
public:
  using SweepFn = std::function<std::optional<Clock::time_point>(const std::string& id)>;

  explicit Reaper(SweepFn sweep);
  ~Reaper();

  Reaper(const Reaper&) = delete;
  Reaper& operator=(const Reaper&) = delete;

  // (Re)arms the timer for `id` to fire at `when`. Past deadlines fire at once.
  void schedule(const std::string& id, Clock::time_point when);
  void cancel(const std::string& id);
  bool scheduled(const std::string& id) const;
  std::size_t pending() const;

  // Cancels every timer and joins the thread. Further calls are no-ops.
  void shutdown();

private:
  void arm(const std::string& id, Clock::time_point when);
  void onTimer(const std::string& id, std::uint64_t generation, const boost::system::error_code& ec);

  struct Entry {
    std::unique_ptr<boost::asio::steady_timer> timer;
    std::uint64_t generation{0};
  };

  SweepFn sweep_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;

  // Touched only on the io thread, except for the id set used by scheduled().
  std::map<std::string, Entry> timers_;
  mutable std::mutex ids_mutex_;
  std::map<std::string, Clock::time_point> ids_;
  std::uint64_t next_generation_{0};

  std::once_flag shutdown_once_;
  std::thread thread_;
};

} // namespace download_service
