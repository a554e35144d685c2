#include "rest_api_handler.hpp"

#include <iostream>
#include <optional>
#include <string_view>

namespace download_service {

namespace {

const std::string DOWNLOAD_PREFIX = "/api/download";

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string percentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool parseFlag(const std::string& value, bool fallback) {
  if (value == "0" || value == "false" || value == "no") return false;
  if (value == "1" || value == "true" || value == "yes") return true;
  return fallback;
}

nlohmann::json optionalSize(const std::optional<std::uint64_t>& size) {
  return size ? nlohmann::json(*size) : nlohmann::json(nullptr);
}

// Adapts the HTTP chunk writer to the session's sink interface.
class ChunkSink : public ClientSink {
public:
  explicit ChunkSink(const common::ChunkWriter& writer) : writer_(writer) {}

  bool write(std::span<const std::uint8_t> data) override { return writer_(data); }

private:
  const common::ChunkWriter& writer_;
};

} // namespace

http::status httpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::InputError:
    case ErrorCode::InvalidState:
      return http::status::bad_request;
    case ErrorCode::NotFoundError:
      return http::status::not_found;
    case ErrorCode::ConflictError:
      return http::status::conflict;
    case ErrorCode::UpstreamError:
      return http::status::bad_gateway;
    case ErrorCode::ProcessError:
    case ErrorCode::StorageError:
    case ErrorCode::DisconnectError:
      break;
  }
  return http::status::internal_server_error;
}

RequestTarget RequestTarget::parse(std::string_view target) {
  RequestTarget result;
  auto qpos = target.find('?');
  result.path = percentDecode(target.substr(0, qpos));
  if (qpos == std::string_view::npos) {
    return result;
  }

  auto query = target.substr(qpos + 1);
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      auto key = percentDecode(pair.substr(0, eq));
      auto value = eq == std::string_view::npos ? std::string() : percentDecode(pair.substr(eq + 1));
      result.query.emplace(std::move(key), std::move(value));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1);
  }
  return result;
}

RestApiHandler::RestApiHandler(std::shared_ptr<DownloadService> download_service, std::size_t recent_limit)
    : download_service_(download_service), recent_limit_(recent_limit) {}

common::ApiResponse RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  auto target = RequestTarget::parse(std::string_view(req.target().data(), req.target().size()));
  const auto& path = target.path;

  auto idAfter = [&path](const std::string& prefix) -> std::optional<std::string> {
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
      return std::nullopt;
    }
    auto id = path.substr(prefix.size());
    if (id.find('/') != std::string::npos) {
      return std::nullopt;
    }
    return id;
  };

  if (path == DOWNLOAD_PREFIX && req.method() == http::verb::get) {
    return handleDownload(target);
  } else if (path == DOWNLOAD_PREFIX + "/recent" && req.method() == http::verb::get) {
    return handleRecent();
  } else if (auto id = idAfter(DOWNLOAD_PREFIX + "/status/"); id && req.method() == http::verb::get) {
    return handleStatus(*id);
  } else if (auto id = idAfter(DOWNLOAD_PREFIX + "/pause/"); id && req.method() == http::verb::post) {
    return handlePause(*id);
  } else if (auto id = idAfter(DOWNLOAD_PREFIX + "/resume/"); id && req.method() == http::verb::get) {
    return handleResume(*id);
  } else if (auto id = idAfter(DOWNLOAD_PREFIX + "/"); id && req.method() == http::verb::delete_) {
    return handleDelete(*id);
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

common::ApiResponse RestApiHandler::handleDownload(const RequestTarget &target) {
  auto param = [&target](const std::string& key) -> std::optional<std::string> {
    auto it = target.query.find(key);
    if (it == target.query.end()) {
      return std::nullopt;
    }
    return it->second;
  };

  DownloadRequest request;
  request.resource_ref = param("url").value_or("");
  request.output_kind = param("type").value_or("audio");
  request.quality = param("quality").value_or("highest");
  if (auto id = param("downloadId"); id && !id->empty()) {
    request.existing_id = *id;
  }
  request.cover_art = parseFlag(param("coverArt").value_or("1"), true);

  std::cout << "[http] download request url=" << request.resource_ref << " type=" << request.output_kind
            << " quality=" << request.quality << std::endl;

  auto ticket = download_service_->startOrResume(request);
  if (!ticket) {
    return createErrorResponse(ticket.error());
  }
  return createTicketResponse(std::move(*ticket));
}

common::ApiResponse RestApiHandler::handleStatus(const std::string &id) {
  auto view = download_service_->getStatus(id);
  if (!view) {
    return createErrorResponse(view.error());
  }

  const auto& record = view->record;
  nlohmann::json response_json = {
    {"downloadId", record.id},
    {"progress", view->progress},
    {"currentSize", view->stored_bytes},
    {"totalSize", optionalSize(record.total_size_bytes)},
    {"finalSize", optionalSize(record.final_size_bytes)},
    {"filename", record.display_filename},
    {"status", toString(record.status)},
    {"createdAt", formatTimestamp(record.created_at)},
    {"lastModified", formatTimestamp(record.last_modified_at)},
    {"isActive", view->is_active}
  };
  if (record.completed_at) {
    response_json["completedAt"] = formatTimestamp(*record.completed_at);
  }
  return createJsonResponse(http::status::ok, response_json);
}

common::ApiResponse RestApiHandler::handlePause(const std::string &id) {
  if (auto paused = download_service_->pause(id); !paused) {
    return createErrorResponse(paused.error());
  }
  nlohmann::json response_json = {{"success", true},
                                  {"message", "Download paused successfully"}};
  return createJsonResponse(http::status::ok, response_json);
}

common::ApiResponse RestApiHandler::handleResume(const std::string &id) {
  auto ticket = download_service_->resume(id);
  if (!ticket) {
    return createErrorResponse(ticket.error());
  }
  return createTicketResponse(std::move(*ticket));
}

common::ApiResponse RestApiHandler::handleDelete(const std::string &id) {
  if (auto removed = download_service_->remove(id); !removed) {
    return createErrorResponse(removed.error());
  }
  nlohmann::json response_json = {{"success", true},
                                  {"message", "Download files cleaned up successfully"}};
  return createJsonResponse(http::status::ok, response_json);
}

common::ApiResponse RestApiHandler::handleRecent() {
  auto records = download_service_->recent(recent_limit_);
  if (!records) {
    return createErrorResponse(records.error());
  }
  auto downloads = nlohmann::json::array();
  for (const auto& record : *records) {
    downloads.push_back(record);
  }
  nlohmann::json response_json = {{"success", true}, {"downloads", downloads}};
  return createJsonResponse(http::status::ok, response_json);
}

common::ApiResponse RestApiHandler::createTicketResponse(DownloadTicket ticket) {
  auto body = std::move(ticket.body);
  auto response = createStreamingResponse(ticket.content_type, [body](const common::ChunkWriter& writer) {
    ChunkSink sink{writer};
    return body(sink);
  });

  response.header.set(http::field::content_disposition, "attachment; filename=\"" + ticket.filename + "\"");
  response.header.set("X-Download-Id", ticket.id);
  if (ticket.total_size) {
    response.header.set("X-Total-Size", std::to_string(*ticket.total_size));
  }
  if (ticket.resume_offset > 0) {
    response.header.set("X-Resume-Offset", std::to_string(ticket.resume_offset));
  }
  return response;
}

http::response<http::string_body> RestApiHandler::createErrorResponse(const Error &error) {
  auto status = httpStatusFor(error.code);
  if (status == http::status::internal_server_error) {
    std::cerr << "[http] " << toString(error.code) << ": " << error.message << std::endl;
  }
  return createErrorResponse(status, error.message);
}

} // namespace download_service
