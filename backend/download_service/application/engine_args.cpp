#include "engine_args.hpp"

#include <cstring>

namespace download_service {

namespace {

constexpr const char* kAudioBitrate = "192k";
constexpr const char* kCoverScale = "scale=500:500:force_original_aspect_ratio=decrease";

bool startsWith(std::span<const std::uint8_t> bytes, const char* magic, std::size_t offset = 0) {
  auto len = std::strlen(magic);
  return bytes.size() >= offset + len && std::memcmp(bytes.data() + offset, magic, len) == 0;
}

} // namespace

ImageFormat sniffImageFormat(std::span<const std::uint8_t> bytes) {
  if (startsWith(bytes, "\x89PNG\r\n\x1a\n")) {
    return ImageFormat::Png;
  }
  if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
    return ImageFormat::Jpeg;
  }
  if (startsWith(bytes, "GIF87a") || startsWith(bytes, "GIF89a")) {
    return ImageFormat::Gif;
  }
  if (startsWith(bytes, "RIFF") && startsWith(bytes, "WEBP", 8)) {
    return ImageFormat::Webp;
  }
  return ImageFormat::None;
}

const char* imagePipeFormat(ImageFormat format) {
  switch (format) {
    case ImageFormat::Png: return "png_pipe";
    case ImageFormat::Jpeg: return "jpeg_pipe";
    case ImageFormat::Gif: return "gif_pipe";
    case ImageFormat::Webp: return "webp_pipe";
    case ImageFormat::None: break;
  }
  return "";
}

std::size_t engineInputCount(OutputKind kind, bool has_cover_art) {
  if (kind == OutputKind::Video) {
    return 2;
  }
  return has_cover_art ? 2 : 1;
}

std::vector<std::string> buildEngineArgs(OutputKind kind, bool has_cover_art, ImageFormat image_format) {
  if (kind == OutputKind::Video) {
    return {
      "-loglevel", "error",
      "-i", "pipe:3",
      "-i", "pipe:4",
      "-map", "0:v",
      "-map", "1:a",
      "-c:v", "copy",
      "-c:a", "aac",
      "-movflags", "frag_keyframe+empty_moov+faststart",
      "-avoid_negative_ts", "make_zero",
      "-fflags", "+genpts",
      "-f", "mp4",
      "pipe:1"
    };
  }

  if (!has_cover_art || image_format == ImageFormat::None) {
    return {
      "-loglevel", "error",
      "-i", "pipe:3",
      "-c:a", "libmp3lame",
      "-b:a", kAudioBitrate,
      "-f", "mp3",
      "pipe:1"
    };
  }

  return {
    "-loglevel", "error",
    "-i", "pipe:3",
    "-f", imagePipeFormat(image_format),
    "-i", "pipe:4",
    "-map", "0:a",
    "-map", "1:v",
    "-c:a", "libmp3lame",
    "-b:a", kAudioBitrate,
    "-c:v", "mjpeg",
    "-filter:v", kCoverScale,
    "-disposition:v", "attached_pic",
    "-id3v2_version", "3",
    "-metadata:s:v", "title=Album cover",
    "-metadata:s:v", "comment=Cover (front)",
    "-f", "mp3",
    "pipe:1"
  };
}

} // namespace download_service
