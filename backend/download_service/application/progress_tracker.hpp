#pragma once
#include "domain/byte_stream.hpp"
#include "infrastructure/temp_artifact_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <span>

namespace download_service {

struct ProgressOptions {
  std::uint64_t persist_every_bytes{1024 * 1024};
  std::chrono::milliseconds persist_interval{1000};
};

// Sits between the engine's output and {artifact, client}. The artifact write,
// the counter and throttled persistence all happen under `guard`, the owning
// session's mutex, so a pause observes a counter that matches the artifact.
class ProgressTracker {
public:
  // Called with `guard` held.
  using PersistFn = std::function<void(std::uint64_t current_size)>;

  enum class Outcome { Forwarded, Skipped, Stopped, ArtifactFailed, ClientGone };

  ProgressTracker(std::mutex& guard,
                  std::uint64_t resume_offset,
                  ArtifactWriter& artifact,
                  PersistFn persist,
                  ProgressOptions options);

  // Handles one chunk of engine output. The first `resume_offset` bytes of a
  // restarted transcode are dropped, they are already in the artifact.
  Outcome onChunk(std::span<const std::uint8_t> chunk, ClientSink& sink);

  // Requires `guard` held. After stopLocked() no chunk reaches the artifact.
  std::uint64_t stopLocked();
  bool stoppedLocked() const { return stopped_; }

  std::uint64_t bytesLocked() const { return bytes_; }

  // Persists the counter now unless already persisted. Requires `guard` held.
  void flushLocked();

private:
  std::mutex& guard_;
  std::uint64_t skip_remaining_;
  std::uint64_t bytes_;
  ArtifactWriter& artifact_;
  PersistFn persist_;
  ProgressOptions options_;

  bool stopped_{false};
  std::uint64_t last_persisted_bytes_;
  std::chrono::steady_clock::time_point last_persisted_at_;
};

} // namespace download_service
