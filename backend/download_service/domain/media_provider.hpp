#pragma once
#include "domain/byte_stream.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace download_service {

struct MediaFormat {
  std::string format_id;        // provider identifier, e.g. itag "140"
  std::string quality_label;    // "720p", empty for audio-only
  std::string container;        // "mp4", "webm", "m4a"
  std::string video_codec;      // empty when the format carries no video
  std::string audio_codec;      // empty when the format carries no audio
  std::string audio_quality;    // provider marker, e.g. "AUDIO_QUALITY_HIGH"
  int height{0};
  long bitrate{0};              // bits per second, 0 when unknown
  std::optional<std::uint64_t> content_length;
  std::string url;
  std::map<std::string, std::string> http_headers;

  bool hasVideo() const { return !video_codec.empty(); }
  bool hasAudio() const { return !audio_codec.empty(); }
};

struct ResourceDescriptor {
  std::string display_title;
  std::vector<MediaFormat> formats;
  std::vector<std::string> thumbnail_candidates;  // best first
};

class MediaProvider {
public:
  virtual ~MediaProvider() = default;

  // Cheap syntactic check, no network.
  virtual bool validate(const std::string& resource_ref) const = 0;

  virtual Result<ResourceDescriptor> resolve(const std::string& resource_ref) = 0;

  virtual Result<std::unique_ptr<ByteStream>> openStream(const MediaFormat& format) = 0;

  virtual Result<std::vector<std::uint8_t>> fetchThumbnail(
    const std::string& url,
    std::chrono::milliseconds timeout) = 0;
};

} // namespace download_service
