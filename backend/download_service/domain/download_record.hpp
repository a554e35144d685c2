#pragma once
#include "domain/errors.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace download_service {

using Clock = std::chrono::system_clock;

enum class OutputKind { Audio, Video };

enum class DownloadStatus { InProgress, Paused, Completed, Failed };

const char* toString(OutputKind kind);
const char* toString(DownloadStatus status);
std::optional<OutputKind> parseOutputKind(const std::string& value);
std::optional<DownloadStatus> parseDownloadStatus(const std::string& value);

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:30:00.250Z
std::string formatTimestamp(Clock::time_point tp);
std::optional<Clock::time_point> parseTimestamp(const std::string& value);

struct DownloadRecord {
  std::string id;
  std::string resource_ref;
  OutputKind output_kind{OutputKind::Audio};
  std::string quality_selector;
  std::string title;
  std::string display_filename;
  std::string content_type;
  DownloadStatus status{DownloadStatus::InProgress};
  std::optional<std::uint64_t> total_size_bytes;
  std::uint64_t current_size_bytes{0};
  std::optional<std::uint64_t> final_size_bytes;
  bool cover_art{false};
  Clock::time_point created_at;
  Clock::time_point last_modified_at;
  std::optional<Clock::time_point> completed_at;
};

// Content hash of the request tuple; identical requests map to the same id.
std::string makeDownloadId(const std::string& resource_ref,
                           OutputKind kind,
                           const std::string& quality_selector);

// Strips everything that is unsafe in a Content-Disposition filename.
std::string sanitizeFilename(const std::string& title);

std::string fileExtension(OutputKind kind);
std::string contentType(OutputKind kind);

void to_json(nlohmann::json& j, const DownloadRecord& record);
void from_json(const nlohmann::json& j, DownloadRecord& record);

} // namespace download_service
