#pragma once
#include "application/engine_args.hpp"
#include "application/format_selector.hpp"
#include "domain/media_provider.hpp"
#include "domain/transcoding_engine.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace download_service {

// Everything one attempt owns: source streams, the engine process and its
// pipes, and one feeder thread per input. abort() is one-shot and only
// signals; the destructor joins feeders and reaps the engine.
class Pipeline {
public:
  Pipeline(std::unique_ptr<EngineProcess> engine,
           std::vector<std::unique_ptr<ByteStream>> sources,
           bool cover_art);
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Starts feeding sources[i] into engine input i.
  void start();

  // Reads the engine's output. 0 means the engine closed stdout.
  Result<std::size_t> readOutput(std::span<std::uint8_t> buffer);

  // Safe from any thread, any number of times.
  void abort();
  bool aborted() const { return aborted_.load(); }

  // Joins the feeders and reaps the engine. nullopt when it died by signal.
  std::optional<int> finish();

  std::optional<Error> feedError() const;
  bool coverArt() const { return cover_art_; }

private:
  void feed(std::size_t index);

  std::unique_ptr<EngineProcess> engine_;
  std::vector<std::unique_ptr<ByteStream>> sources_;
  bool cover_art_;
  std::vector<std::jthread> feeders_;
  std::atomic_bool aborted_{false};

  mutable std::mutex error_mutex_;
  std::optional<Error> feed_error_;
};

enum class CoverArtPolicy {
  Skip,        // no cover image
  BestEffort,  // embed one if it can be fetched, else continue without
  Required     // fail the build when no usable image can be fetched
};

class PipelineBuilder {
public:
  PipelineBuilder(std::shared_ptr<MediaProvider> provider,
                  std::shared_ptr<TranscodingEngine> engine,
                  std::chrono::milliseconds thumbnail_timeout);

  // Opens the source stream(s), fetches the cover image as `cover` demands
  // (audio only), and spawns the engine. A Required cover that cannot be
  // fetched fails with UpstreamError before anything is opened.
  Result<std::unique_ptr<Pipeline>> build(const ResourceDescriptor& descriptor,
                                          OutputKind kind,
                                          const std::string& quality,
                                          CoverArtPolicy cover);

private:
  std::optional<std::vector<std::uint8_t>> fetchCoverArt(const ResourceDescriptor& descriptor,
                                                         ImageFormat& format);

  std::shared_ptr<MediaProvider> provider_;
  std::shared_ptr<TranscodingEngine> engine_;
  std::chrono::milliseconds thumbnail_timeout_;
};

} // namespace download_service
