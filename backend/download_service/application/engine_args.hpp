#pragma once
#include "domain/download_record.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace download_service {

enum class ImageFormat { None, Png, Jpeg, Gif, Webp };

// Decides the cover image format from its leading bytes only.
ImageFormat sniffImageFormat(std::span<const std::uint8_t> bytes);

// ffmpeg demuxer name used to read the image from a pipe.
const char* imagePipeFormat(ImageFormat format);

// Number of input pipes the argument vector expects (pipe:3, pipe:4, ...).
std::size_t engineInputCount(OutputKind kind, bool has_cover_art);

// Pure mapping from request shape to the engine's argument vector (without
// the program name). Inputs: video -> pipe:3 video, pipe:4 audio;
// audio -> pipe:3 audio, pipe:4 cover image. Output is always pipe:1.
std::vector<std::string> buildEngineArgs(OutputKind kind, bool has_cover_art, ImageFormat image_format);

} // namespace download_service
