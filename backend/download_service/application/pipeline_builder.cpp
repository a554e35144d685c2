#include "pipeline_builder.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <unistd.h>

namespace download_service {

namespace {

constexpr std::size_t kFeedChunk = 64 * 1024;

class MemoryByteStream : public ByteStream {
public:
  explicit MemoryByteStream(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

  Result<std::size_t> read(std::span<std::uint8_t> buffer) override {
    if (aborted_.load()) {
      return makeError(ErrorCode::DisconnectError, "Stream aborted");
    }
    auto n = std::min(buffer.size(), data_.size() - offset_);
    std::memcpy(buffer.data(), data_.data() + offset_, n);
    offset_ += n;
    return n;
  }

  void abort() override { aborted_.store(true); }

private:
  std::vector<std::uint8_t> data_;
  std::size_t offset_{0};
  std::atomic_bool aborted_{false};
};

bool writeAll(int fd, const std::uint8_t* data, std::size_t size) {
  while (size > 0) {
    auto n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    size -= static_cast<std::size_t>(n);
  }
  return true;
}

} // namespace

Pipeline::Pipeline(std::unique_ptr<EngineProcess> engine,
                   std::vector<std::unique_ptr<ByteStream>> sources,
                   bool cover_art)
  : engine_(std::move(engine)), sources_(std::move(sources)), cover_art_(cover_art) {}

Pipeline::~Pipeline() {
  abort();
  finish();
}

void Pipeline::start() {
  feeders_.reserve(sources_.size());
  for (std::size_t i = 0; i < sources_.size(); ++i) {
    feeders_.emplace_back([this, i] { feed(i); });
  }
}

void Pipeline::feed(std::size_t index) {
  std::vector<std::uint8_t> buffer(kFeedChunk);
  auto& source = *sources_[index];
  int fd = engine_->inputFd(index);

  while (!aborted_.load()) {
    auto n = source.read(buffer);
    if (!n) {
      if (!aborted_.load()) {
        std::cerr << "[pipeline] source " << index << " failed: " << n.error().message << std::endl;
        {
          std::lock_guard<std::mutex> lock{error_mutex_};
          if (!feed_error_) feed_error_ = n.error();
        }
        abort();
      }
      return;
    }
    if (*n == 0) {
      // natural end: half-close so the engine can flush its output
      engine_->closeInput(index);
      return;
    }
    if (!writeAll(fd, buffer.data(), *n)) {
      if (!aborted_.load()) {
        std::lock_guard<std::mutex> lock{error_mutex_};
        if (!feed_error_) {
          feed_error_ = Error{ErrorCode::ProcessError,
                              "Engine closed input " + std::to_string(index) + ": " + std::strerror(errno)};
        }
      }
      return;
    }
  }
}

Result<std::size_t> Pipeline::readOutput(std::span<std::uint8_t> buffer) {
  while (true) {
    auto n = ::read(engine_->outputFd(), buffer.data(), buffer.size());
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno != EINTR) {
      return makeError(ErrorCode::ProcessError, std::string("Engine output read failed: ") + std::strerror(errno));
    }
  }
}

void Pipeline::abort() {
  if (aborted_.exchange(true)) {
    return;
  }
  for (auto& source : sources_) {
    source->abort();
  }
  engine_->terminate();
}

std::optional<int> Pipeline::finish() {
  for (auto& feeder : feeders_) {
    if (feeder.joinable()) {
      feeder.join();
    }
  }
  // feeders that stopped early may leave an input open
  for (std::size_t i = 0; i < sources_.size(); ++i) {
    engine_->closeInput(i);
  }
  return engine_->wait();
}

std::optional<Error> Pipeline::feedError() const {
  std::lock_guard<std::mutex> lock{error_mutex_};
  return feed_error_;
}

PipelineBuilder::PipelineBuilder(std::shared_ptr<MediaProvider> provider,
                                 std::shared_ptr<TranscodingEngine> engine,
                                 std::chrono::milliseconds thumbnail_timeout)
  : provider_(std::move(provider)),
    engine_(std::move(engine)),
    thumbnail_timeout_(thumbnail_timeout) {}

std::optional<std::vector<std::uint8_t>> PipelineBuilder::fetchCoverArt(const ResourceDescriptor& descriptor,
                                                                        ImageFormat& format) {
  for (const auto& url : descriptor.thumbnail_candidates) {
    auto image = provider_->fetchThumbnail(url, thumbnail_timeout_);
    if (!image) {
      std::cerr << "[pipeline] cover art fetch failed (" << image.error().message << "), trying next" << std::endl;
      continue;
    }
    format = sniffImageFormat(*image);
    if (format == ImageFormat::None) {
      std::cerr << "[pipeline] cover art at " << url << " is not a known image format" << std::endl;
      continue;
    }
    return std::move(*image);
  }
  return std::nullopt;
}

Result<std::unique_ptr<Pipeline>> PipelineBuilder::build(const ResourceDescriptor& descriptor,
                                                         OutputKind kind,
                                                         const std::string& quality,
                                                         CoverArtPolicy cover_policy) {
  auto selection = selectFormats(descriptor.formats, kind, quality);
  if (!selection) {
    return std::unexpected(selection.error());
  }

  ImageFormat image_format = ImageFormat::None;
  std::optional<std::vector<std::uint8_t>> cover;
  if (kind == OutputKind::Audio && cover_policy != CoverArtPolicy::Skip) {
    cover = fetchCoverArt(descriptor, image_format);
    if (!cover) {
      if (cover_policy == CoverArtPolicy::Required) {
        return makeError(ErrorCode::UpstreamError, "Cover art for this download is unavailable");
      }
      std::cout << "[pipeline] continuing without cover art" << std::endl;
    }
  }
  bool has_cover = cover.has_value();

  std::vector<std::unique_ptr<ByteStream>> sources;
  if (selection->video) {
    auto video = provider_->openStream(*selection->video);
    if (!video) {
      return std::unexpected(video.error());
    }
    sources.push_back(std::move(*video));
  }
  auto audio = provider_->openStream(selection->audio);
  if (!audio) {
    return std::unexpected(audio.error());
  }
  sources.push_back(std::move(*audio));
  if (has_cover) {
    sources.push_back(std::make_unique<MemoryByteStream>(std::move(*cover)));
  }

  auto args = buildEngineArgs(kind, has_cover, image_format);
  auto process = engine_->spawn(args, engineInputCount(kind, has_cover));
  if (!process) {
    for (auto& source : sources) source->abort();
    return makeError(ErrorCode::ProcessError, process.error().message);
  }

  return std::make_unique<Pipeline>(std::move(*process), std::move(sources), has_cover);
}

} // namespace download_service
