#include "download_record.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <uuid/uuid.h>

namespace download_service {

namespace {

// Fixed namespace for name-based download ids.
constexpr const char* kIdNamespace = "6f1c2a8e-3b7d-4c55-9e0a-1d2b3c4d5e6f";

constexpr std::size_t kMaxFilenameLength = 200;

} // namespace

const char* toString(OutputKind kind) {
  return kind == OutputKind::Audio ? "audio" : "video";
}

const char* toString(DownloadStatus status) {
  switch (status) {
    case DownloadStatus::InProgress: return "in progress";
    case DownloadStatus::Paused: return "paused";
    case DownloadStatus::Completed: return "completed";
    case DownloadStatus::Failed: return "failed";
  }
  return "failed";
}

std::optional<OutputKind> parseOutputKind(const std::string& value) {
  if (value == "audio") return OutputKind::Audio;
  if (value == "video") return OutputKind::Video;
  return std::nullopt;
}

std::optional<DownloadStatus> parseDownloadStatus(const std::string& value) {
  if (value == "in progress") return DownloadStatus::InProgress;
  if (value == "paused") return DownloadStatus::Paused;
  if (value == "completed") return DownloadStatus::Completed;
  if (value == "failed") return DownloadStatus::Failed;
  return std::nullopt;
}

std::string formatTimestamp(Clock::time_point tp) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  std::time_t seconds = static_cast<std::time_t>(millis / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis % 1000));
  return out;
}

std::optional<Clock::time_point> parseTimestamp(const std::string& value) {
  std::tm tm{};
  const char* rest = strptime(value.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
  if (!rest) {
    return std::nullopt;
  }
  int millis = 0;
  if (*rest == '.') {
    std::sscanf(rest + 1, "%3d", &millis);
  }
  auto tp = Clock::from_time_t(timegm(&tm));
  return tp + std::chrono::milliseconds(millis);
}

std::string makeDownloadId(const std::string& resource_ref,
                           OutputKind kind,
                           const std::string& quality_selector) {
  std::string name = resource_ref + "-" + toString(kind) + "-" + quality_selector;

  uuid_t ns;
  uuid_parse(kIdNamespace, ns);
  uuid_t out;
  uuid_generate_md5(out, ns, name.data(), name.size());

  static constexpr char kHex[] = "0123456789abcdef";
  std::string id;
  id.reserve(32);
  for (unsigned char byte : out) {
    id.push_back(kHex[byte >> 4]);
    id.push_back(kHex[byte & 0x0f]);
  }
  return id;
}

std::string sanitizeFilename(const std::string& title) {
  std::string out;
  out.reserve(title.size());
  for (unsigned char c : title) {
    if (c >= 0x80 || c < 0x20 || c == 0x7f) continue;
    switch (c) {
      case '/': case '\\': case '?': case '<': case '>':
      case ':': case '*': case '|': case '"':
        continue;
      default:
        out.push_back(static_cast<char>(c));
    }
  }

  auto first = out.find_first_not_of(" .");
  if (first == std::string::npos) {
    return "download";
  }
  auto last = out.find_last_not_of(" .");
  out = out.substr(first, last - first + 1);
  if (out.size() > kMaxFilenameLength) {
    out.resize(kMaxFilenameLength);
  }
  return out;
}

std::string fileExtension(OutputKind kind) {
  return kind == OutputKind::Audio ? "mp3" : "mp4";
}

std::string contentType(OutputKind kind) {
  return kind == OutputKind::Audio ? "audio/mpeg" : "video/mp4";
}

void to_json(nlohmann::json& j, const DownloadRecord& record) {
  j = nlohmann::json{
    {"downloadId", record.id},
    {"url", record.resource_ref},
    {"type", toString(record.output_kind)},
    {"quality", record.quality_selector},
    {"title", record.title},
    {"filename", record.display_filename},
    {"contentType", record.content_type},
    {"status", toString(record.status)},
    {"currentSize", record.current_size_bytes},
    {"coverArt", record.cover_art},
    {"createdAt", formatTimestamp(record.created_at)},
    {"lastModified", formatTimestamp(record.last_modified_at)}
  };
  j["totalSize"] = record.total_size_bytes ? nlohmann::json(*record.total_size_bytes) : nlohmann::json(nullptr);
  if (record.final_size_bytes) {
    j["finalSize"] = *record.final_size_bytes;
  }
  if (record.completed_at) {
    j["completedAt"] = formatTimestamp(*record.completed_at);
  }
}

void from_json(const nlohmann::json& j, DownloadRecord& record) {
  record.id = j.at("downloadId").get<std::string>();
  record.resource_ref = j.at("url").get<std::string>();

  auto kind = parseOutputKind(j.at("type").get<std::string>());
  if (!kind) {
    throw std::runtime_error("unknown output kind in record " + record.id);
  }
  record.output_kind = *kind;

  auto status = parseDownloadStatus(j.at("status").get<std::string>());
  if (!status) {
    throw std::runtime_error("unknown status in record " + record.id);
  }
  record.status = *status;

  record.quality_selector = j.at("quality").get<std::string>();
  record.title = j.value("title", std::string{});
  record.display_filename = j.at("filename").get<std::string>();
  record.content_type = j.at("contentType").get<std::string>();
  record.current_size_bytes = j.value("currentSize", std::uint64_t{0});
  record.cover_art = j.value("coverArt", false);

  record.total_size_bytes.reset();
  if (j.contains("totalSize") && j["totalSize"].is_number_unsigned()) {
    record.total_size_bytes = j["totalSize"].get<std::uint64_t>();
  }
  record.final_size_bytes.reset();
  if (j.contains("finalSize") && j["finalSize"].is_number_unsigned()) {
    record.final_size_bytes = j["finalSize"].get<std::uint64_t>();
  }

  auto created = parseTimestamp(j.at("createdAt").get<std::string>());
  if (!created) {
    throw std::runtime_error("bad createdAt in record " + record.id);
  }
  record.created_at = *created;
  record.last_modified_at = parseTimestamp(j.value("lastModified", std::string{})).value_or(record.created_at);

  record.completed_at.reset();
  if (j.contains("completedAt")) {
    record.completed_at = parseTimestamp(j["completedAt"].get<std::string>());
  }
}

} // namespace download_service
