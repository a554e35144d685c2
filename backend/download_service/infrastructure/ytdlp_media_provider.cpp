#include "ytdlp_media_provider.hpp"
#include "infrastructure/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <nlohmann/json.hpp>

namespace download_service {

namespace {

std::string stringField(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return {};
}

std::string codecField(const nlohmann::json& j, const char* key) {
  auto codec = stringField(j, key);
  return codec == "none" ? std::string{} : codec;
}

bool looksLikeQualityLabel(const std::string& note) {
  static const std::regex label{R"(^\d{3,4}p(\d{2})?$)"};
  return std::regex_match(note, label);
}

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

MediaFormat parseFormat(const nlohmann::json& f) {
  MediaFormat format;
  format.format_id = stringField(f, "format_id");
  format.container = stringField(f, "ext");
  format.video_codec = codecField(f, "vcodec");
  format.audio_codec = codecField(f, "acodec");
  format.url = stringField(f, "url");

  if (f.contains("height") && f["height"].is_number()) {
    format.height = f["height"].get<int>();
  }
  if (f.contains("tbr") && f["tbr"].is_number()) {
    format.bitrate = static_cast<long>(f["tbr"].get<double>() * 1000.0);
  }

  for (const char* key : {"filesize", "filesize_approx"}) {
    if (f.contains(key) && f[key].is_number() && f[key].get<double>() > 0) {
      format.content_length = static_cast<std::uint64_t>(f[key].get<double>());
      break;
    }
  }

  auto note = stringField(f, "format_note");
  if (format.hasVideo()) {
    if (looksLikeQualityLabel(note)) {
      format.quality_label = note;
    } else if (format.height > 0) {
      format.quality_label = std::to_string(format.height) + "p";
    }
  } else if (!note.empty()) {
    format.audio_quality = "AUDIO_QUALITY_" + toUpper(note);
  }

  if (f.contains("http_headers") && f["http_headers"].is_object()) {
    for (const auto& [name, value] : f["http_headers"].items()) {
      if (value.is_string()) {
        format.http_headers[name] = value.get<std::string>();
      }
    }
  }
  return format;
}

} // namespace

YtDlpMediaProvider::YtDlpMediaProvider(std::string ytdlp_program,
                                       std::shared_ptr<Downloader> downloader,
                                       std::chrono::milliseconds resolve_timeout)
  : program_(std::move(ytdlp_program)),
    downloader_(std::move(downloader)),
    resolve_timeout_(resolve_timeout) {}

bool YtDlpMediaProvider::validate(const std::string& resource_ref) const {
  static const std::regex pattern{
    R"(^https?://(www\.|m\.|music\.)?(youtube\.com/(watch\?(.*&)?v=|shorts/|embed/|live/)|youtu\.be/)[A-Za-z0-9_-]{11}([?&#].*)?$)"};
  return std::regex_match(resource_ref, pattern);
}

Result<ResourceDescriptor> YtDlpMediaProvider::parseDescriptor(const std::string& json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const std::exception& e) {
    return makeError(ErrorCode::UpstreamError, std::string("Invalid provider response: ") + e.what());
  }

  ResourceDescriptor descriptor;
  descriptor.display_title = stringField(j, "title");

  if (j.contains("formats") && j["formats"].is_array()) {
    for (const auto& f : j["formats"]) {
      auto format = parseFormat(f);
      if (format.url.empty() || (!format.hasVideo() && !format.hasAudio())) {
        continue;
      }
      descriptor.formats.push_back(std::move(format));
    }
  }
  if (descriptor.formats.empty()) {
    return makeError(ErrorCode::UpstreamError, "Provider returned no playable formats");
  }

  auto best = stringField(j, "thumbnail");
  if (!best.empty()) {
    descriptor.thumbnail_candidates.push_back(best);
  }
  if (j.contains("thumbnails") && j["thumbnails"].is_array()) {
    // yt-dlp lists thumbnails worst first
    const auto& thumbs = j["thumbnails"];
    for (auto it = thumbs.rbegin(); it != thumbs.rend(); ++it) {
      auto url = stringField(*it, "url");
      if (!url.empty() && url != best) {
        descriptor.thumbnail_candidates.push_back(url);
      }
    }
  }
  return descriptor;
}

Result<ResourceDescriptor> YtDlpMediaProvider::resolve(const std::string& resource_ref) {
  if (!validate(resource_ref)) {
    return makeError(ErrorCode::InputError, "Invalid or missing YouTube URL");
  }

  auto output = captureOutput(
    {program_, "-J", "--no-warnings", "--no-playlist", resource_ref}, resolve_timeout_);
  if (!output) {
    return makeError(ErrorCode::UpstreamError, output.error().message);
  }
  if (output->exit_code != 0) {
    auto err = output->err.substr(0, 500);
    std::cerr << "[provider] " << program_ << " failed for " << resource_ref << ": " << err << std::endl;
    return makeError(ErrorCode::UpstreamError, "Failed to fetch media info: " + err);
  }
  return parseDescriptor(output->out);
}

Result<std::unique_ptr<ByteStream>> YtDlpMediaProvider::openStream(const MediaFormat& format) {
  if (format.url.empty()) {
    return makeError(ErrorCode::UpstreamError, "Format " + format.format_id + " has no URL");
  }
  return downloader_->openStream(format.url, format.http_headers);
}

Result<std::vector<std::uint8_t>> YtDlpMediaProvider::fetchThumbnail(const std::string& url,
                                                                     std::chrono::milliseconds timeout) {
  return downloader_->fetch(url, {}, timeout);
}

} // namespace download_service
