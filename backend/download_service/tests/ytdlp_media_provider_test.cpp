#include "infrastructure/ytdlp_media_provider.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace download_service;

namespace {

const char* kSample = R"({
  "title": "Sample: Clip / Live",
  "thumbnail": "https://i.ytimg.com/vi/x/maxresdefault.jpg",
  "thumbnails": [
    {"url": "https://i.ytimg.com/vi/x/default.jpg"},
    {"url": "https://i.ytimg.com/vi/x/hqdefault.jpg"},
    {"url": "https://i.ytimg.com/vi/x/maxresdefault.jpg"}
  ],
  "formats": [
    {"format_id": "sb0", "ext": "mhtml", "vcodec": "none", "acodec": "none", "url": "https://sb"},
    {"format_id": "140", "ext": "m4a", "vcodec": "none", "acodec": "mp4a.40.2",
     "format_note": "medium", "tbr": 129.5, "filesize": 3400000, "url": "https://a140",
     "http_headers": {"User-Agent": "ua", "Accept": "*/*"}},
    {"format_id": "251", "ext": "webm", "vcodec": "none", "acodec": "opus",
     "format_note": "high", "tbr": 160, "filesize_approx": 4100000.0, "url": "https://a251"},
    {"format_id": "136", "ext": "mp4", "vcodec": "avc1.4d401f", "acodec": "none",
     "format_note": "720p", "height": 720, "tbr": 1500, "url": "https://v136"},
    {"format_id": "247", "ext": "webm", "vcodec": "vp9", "acodec": "none",
     "format_note": "premium", "height": 720, "url": "https://v247"},
    {"format_id": "nourl", "ext": "mp4", "vcodec": "avc1", "acodec": "none", "height": 1080}
  ]
})";

const MediaFormat* findFormat(const ResourceDescriptor& d, const std::string& id) {
  for (const auto& f : d.formats) {
    if (f.format_id == id) return &f;
  }
  return nullptr;
}

} // namespace

TEST(YtDlpMediaProviderTest, ParsesFormats) {
  auto descriptor = YtDlpMediaProvider::parseDescriptor(kSample);
  ASSERT_TRUE(descriptor.has_value());
  EXPECT_EQ(descriptor->display_title, "Sample: Clip / Live");
  EXPECT_EQ(descriptor->formats.size(), 4u);
  EXPECT_EQ(findFormat(*descriptor, "sb0"), nullptr);
  EXPECT_EQ(findFormat(*descriptor, "nourl"), nullptr);

  auto* audio = findFormat(*descriptor, "140");
  ASSERT_NE(audio, nullptr);
  EXPECT_TRUE(audio->hasAudio());
  EXPECT_FALSE(audio->hasVideo());
  EXPECT_EQ(audio->audio_quality, "AUDIO_QUALITY_MEDIUM");
  EXPECT_EQ(audio->bitrate, 129500);
  ASSERT_TRUE(audio->content_length.has_value());
  EXPECT_EQ(*audio->content_length, 3400000u);
  EXPECT_EQ(audio->http_headers.at("User-Agent"), "ua");

  auto* high = findFormat(*descriptor, "251");
  ASSERT_NE(high, nullptr);
  EXPECT_EQ(high->audio_quality, "AUDIO_QUALITY_HIGH");
  ASSERT_TRUE(high->content_length.has_value());
  EXPECT_EQ(*high->content_length, 4100000u);

  auto* video = findFormat(*descriptor, "136");
  ASSERT_NE(video, nullptr);
  EXPECT_EQ(video->quality_label, "720p");
  EXPECT_EQ(video->container, "mp4");
  EXPECT_FALSE(video->content_length.has_value());

  auto* premium = findFormat(*descriptor, "247");
  ASSERT_NE(premium, nullptr);
  EXPECT_EQ(premium->quality_label, "720p");
}

TEST(YtDlpMediaProviderTest, ThumbnailsBestFirstWithoutDuplicates) {
  auto descriptor = YtDlpMediaProvider::parseDescriptor(kSample);
  ASSERT_TRUE(descriptor.has_value());
  std::vector<std::string> expected{
    "https://i.ytimg.com/vi/x/maxresdefault.jpg",
    "https://i.ytimg.com/vi/x/hqdefault.jpg",
    "https://i.ytimg.com/vi/x/default.jpg",
  };
  EXPECT_EQ(descriptor->thumbnail_candidates, expected);
}

TEST(YtDlpMediaProviderTest, RejectsBadDocuments) {
  auto broken = YtDlpMediaProvider::parseDescriptor("not json");
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error().code, ErrorCode::UpstreamError);

  auto empty = YtDlpMediaProvider::parseDescriptor(R"({"title": "x", "formats": []})");
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code, ErrorCode::UpstreamError);
}

TEST(YtDlpMediaProviderTest, ValidatesYoutubeReferences) {
  YtDlpMediaProvider provider{"yt-dlp", nullptr};
  EXPECT_TRUE(provider.validate("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
  EXPECT_TRUE(provider.validate("https://youtu.be/dQw4w9WgXcQ"));
  EXPECT_TRUE(provider.validate("https://www.youtube.com/watch?list=abc&v=dQw4w9WgXcQ&t=10"));
  EXPECT_TRUE(provider.validate("https://m.youtube.com/shorts/dQw4w9WgXcQ"));
  EXPECT_FALSE(provider.validate(""));
  EXPECT_FALSE(provider.validate("not a url"));
  EXPECT_FALSE(provider.validate("https://vimeo.com/12345"));
  EXPECT_FALSE(provider.validate("https://www.youtube.com/watch?v=short"));
}

TEST(YtDlpMediaProviderTest, ResolveRejectsInvalidReferenceWithoutRunningTool) {
  YtDlpMediaProvider provider{"/nonexistent/yt-dlp", nullptr};
  auto resolved = provider.resolve("ftp://example.com");
  ASSERT_FALSE(resolved.has_value());
  EXPECT_EQ(resolved.error().code, ErrorCode::InputError);
}

TEST(YtDlpMediaProviderTest, ResolveRunsToolAndParsesOutput) {
  test_support::TempDir dir;
  auto script = test_support::writeScript(dir.path(), "yt-dlp",
                                          std::string("cat <<'JSON'\n") + kSample + "\nJSON");

  YtDlpMediaProvider provider{script.string(), nullptr};
  auto resolved = provider.resolve("https://youtu.be/dQw4w9WgXcQ");

  ASSERT_TRUE(resolved.has_value()) << resolved.error().message;
  EXPECT_EQ(resolved->formats.size(), 4u);
}
