#pragma once
#include "domain/download_record.hpp"
#include "domain/media_provider.hpp"

#include <optional>
#include <vector>

namespace download_service {

struct FormatSelection {
  std::optional<MediaFormat> video;  // set for OutputKind::Video only
  MediaFormat audio;
};

// Picks the source format(s) for one request. Video matches the quality
// label in an mp4 container and falls back to the highest video; audio
// prefers the provider's high-quality marker or itag 140 and falls back to
// the highest audio.
Result<FormatSelection> selectFormats(const std::vector<MediaFormat>& formats,
                                      OutputKind kind,
                                      const std::string& quality);

// Sum of the selected content lengths; unknown if any part is unknown.
std::optional<std::uint64_t> estimateSize(const FormatSelection& selection);

} // namespace download_service
