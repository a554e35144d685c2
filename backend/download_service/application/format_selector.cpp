#include "format_selector.hpp"

#include <algorithm>

namespace download_service {

namespace {

constexpr const char* kTargetVideoContainer = "mp4";
constexpr const char* kHighAudioMarker = "AUDIO_QUALITY_HIGH";
constexpr const char* kKnownGoodAudioId = "140";

const MediaFormat* highestVideo(const std::vector<MediaFormat>& formats) {
  const MediaFormat* best = nullptr;
  for (const auto& f : formats) {
    if (!f.hasVideo()) continue;
    if (!best || f.height > best->height ||
        (f.height == best->height && f.bitrate > best->bitrate)) {
      best = &f;
    }
  }
  return best;
}

const MediaFormat* highestAudio(const std::vector<MediaFormat>& formats) {
  const MediaFormat* best = nullptr;
  for (const auto& f : formats) {
    if (!f.hasAudio()) continue;
    bool audio_only = !f.hasVideo();
    bool best_audio_only = best && !best->hasVideo();
    if (!best || (audio_only && !best_audio_only) ||
        (audio_only == best_audio_only && f.bitrate > best->bitrate)) {
      best = &f;
    }
  }
  return best;
}

const MediaFormat* chooseAudio(const std::vector<MediaFormat>& formats) {
  auto it = std::find_if(formats.begin(), formats.end(), [](const MediaFormat& f) {
    return f.hasAudio() && (f.audio_quality == kHighAudioMarker || f.format_id == kKnownGoodAudioId);
  });
  return it != formats.end() ? &*it : highestAudio(formats);
}

} // namespace

Result<FormatSelection> selectFormats(const std::vector<MediaFormat>& formats,
                                      OutputKind kind,
                                      const std::string& quality) {
  FormatSelection selection;

  if (kind == OutputKind::Video) {
    auto it = std::find_if(formats.begin(), formats.end(), [&](const MediaFormat& f) {
      return f.hasVideo() && f.quality_label == quality && f.container == kTargetVideoContainer;
    });
    const MediaFormat* video = it != formats.end() ? &*it : highestVideo(formats);
    if (!video) {
      return makeError(ErrorCode::UpstreamError, "No video format available");
    }
    selection.video = *video;
  }

  const MediaFormat* audio = chooseAudio(formats);
  if (!audio) {
    return makeError(ErrorCode::UpstreamError, "No audio format available");
  }
  selection.audio = *audio;
  return selection;
}

std::optional<std::uint64_t> estimateSize(const FormatSelection& selection) {
  if (!selection.audio.content_length) {
    return std::nullopt;
  }
  std::uint64_t total = *selection.audio.content_length;
  if (selection.video) {
    if (!selection.video->content_length) {
      return std::nullopt;
    }
    total += *selection.video->content_length;
  }
  return total;
}

} // namespace download_service
