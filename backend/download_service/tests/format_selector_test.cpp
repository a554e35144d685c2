#include "application/format_selector.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace download_service;
using namespace download_service::test_support;

namespace {

MediaFormat audioOnly(const std::string& id, long bitrate, const std::string& marker,
                      std::optional<std::uint64_t> size = std::nullopt) {
  MediaFormat f;
  f.format_id = id;
  f.container = "webm";
  f.audio_codec = "opus";
  f.audio_quality = marker;
  f.bitrate = bitrate;
  f.content_length = size;
  f.url = "mem://" + id;
  return f;
}

} // namespace

TEST(FormatSelectorTest, AudioPrefersHighQualityMarker) {
  std::vector<MediaFormat> formats{
    audioOnly("249", 50000, "AUDIO_QUALITY_LOW"),
    audioOnly("251", 160000, "AUDIO_QUALITY_HIGH"),
    audioFormat("mem://140", 3000),
  };
  auto selection = selectFormats(formats, OutputKind::Audio, "highest");
  ASSERT_TRUE(selection.has_value());
  EXPECT_EQ(selection->audio.format_id, "251");
  EXPECT_FALSE(selection->video.has_value());
}

TEST(FormatSelectorTest, AudioFallsBackToItag140) {
  std::vector<MediaFormat> formats{
    audioOnly("249", 50000, "AUDIO_QUALITY_LOW"),
    audioFormat("mem://140", 3000),
  };
  auto selection = selectFormats(formats, OutputKind::Audio, "highest");
  ASSERT_TRUE(selection.has_value());
  EXPECT_EQ(selection->audio.format_id, "140");
}

TEST(FormatSelectorTest, AudioFallsBackToHighestAudioOnlyBitrate) {
  auto muxed = videoFormat("18", "360p", 360, "mp4", std::nullopt);
  muxed.audio_codec = "mp4a.40.2";
  muxed.bitrate = 900000;
  std::vector<MediaFormat> formats{
    muxed,
    audioOnly("249", 50000, "AUDIO_QUALITY_LOW"),
    audioOnly("250", 70000, "AUDIO_QUALITY_LOW"),
  };
  auto selection = selectFormats(formats, OutputKind::Audio, "highest");
  ASSERT_TRUE(selection.has_value());
  EXPECT_EQ(selection->audio.format_id, "250");
}

TEST(FormatSelectorTest, VideoMatchesLabelInMp4) {
  std::vector<MediaFormat> formats{
    videoFormat("248", "1080p", 1080, "webm", 9000),
    videoFormat("137", "1080p", 1080, "mp4", 8000),
    videoFormat("136", "720p", 720, "mp4", 4000),
    audioFormat("mem://140", 1000),
  };
  auto selection = selectFormats(formats, OutputKind::Video, "720p");
  ASSERT_TRUE(selection.has_value());
  ASSERT_TRUE(selection->video.has_value());
  EXPECT_EQ(selection->video->format_id, "136");
  EXPECT_EQ(selection->audio.format_id, "140");
  auto estimate = estimateSize(*selection);
  ASSERT_TRUE(estimate.has_value());
  EXPECT_EQ(*estimate, 5000u);
}

TEST(FormatSelectorTest, VideoFallsBackToHighest) {
  std::vector<MediaFormat> formats{
    videoFormat("136", "720p", 720, "mp4", 4000),
    videoFormat("248", "1080p", 1080, "webm", std::nullopt),
    audioFormat("mem://140", 1000),
  };
  auto selection = selectFormats(formats, OutputKind::Video, "highest");
  ASSERT_TRUE(selection.has_value());
  EXPECT_EQ(selection->video->format_id, "248");
  EXPECT_FALSE(estimateSize(*selection).has_value());
}

TEST(FormatSelectorTest, MissingStreamsAreUpstreamErrors) {
  std::vector<MediaFormat> audio_only{audioFormat("mem://140", 1000)};
  auto video = selectFormats(audio_only, OutputKind::Video, "720p");
  ASSERT_FALSE(video.has_value());
  EXPECT_EQ(video.error().code, ErrorCode::UpstreamError);

  std::vector<MediaFormat> video_only{videoFormat("136", "720p", 720, "mp4", 4000)};
  auto audio = selectFormats(video_only, OutputKind::Audio, "highest");
  ASSERT_FALSE(audio.has_value());
  EXPECT_EQ(audio.error().code, ErrorCode::UpstreamError);
}
