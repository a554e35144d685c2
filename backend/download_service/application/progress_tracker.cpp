#include "progress_tracker.hpp"

#include <algorithm>
#include <iostream>

namespace download_service {

ProgressTracker::ProgressTracker(std::mutex& guard,
                                 std::uint64_t resume_offset,
                                 ArtifactWriter& artifact,
                                 PersistFn persist,
                                 ProgressOptions options)
  : guard_(guard),
    skip_remaining_(resume_offset),
    bytes_(resume_offset),
    artifact_(artifact),
    persist_(std::move(persist)),
    options_(options),
    last_persisted_bytes_(resume_offset),
    last_persisted_at_(std::chrono::steady_clock::now()) {}

ProgressTracker::Outcome ProgressTracker::onChunk(std::span<const std::uint8_t> chunk, ClientSink& sink) {
  {
    std::lock_guard<std::mutex> lock{guard_};
    if (stopped_) {
      return Outcome::Stopped;
    }

    if (skip_remaining_ > 0) {
      auto skip = std::min<std::uint64_t>(skip_remaining_, chunk.size());
      skip_remaining_ -= skip;
      chunk = chunk.subspan(static_cast<std::size_t>(skip));
      if (chunk.empty()) {
        return Outcome::Skipped;
      }
    }

    auto written = artifact_.write(chunk);
    if (!written) {
      std::cerr << "[tracker] " << written.error().message << std::endl;
      return Outcome::ArtifactFailed;
    }
    bytes_ += chunk.size();

    auto now = std::chrono::steady_clock::now();
    if (bytes_ - last_persisted_bytes_ >= options_.persist_every_bytes ||
        now - last_persisted_at_ >= options_.persist_interval) {
      flushLocked();
    }
  }

  // Client write stays outside the lock so a slow reader never blocks pause().
  return sink.write(chunk) ? Outcome::Forwarded : Outcome::ClientGone;
}

std::uint64_t ProgressTracker::stopLocked() {
  stopped_ = true;
  return bytes_;
}

void ProgressTracker::flushLocked() {
  if (bytes_ == last_persisted_bytes_) {
    return;
  }
  persist_(bytes_);
  last_persisted_bytes_ = bytes_;
  last_persisted_at_ = std::chrono::steady_clock::now();
}

} // namespace download_service
