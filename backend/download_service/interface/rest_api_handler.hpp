#pragma once
#include "application/download_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace download_service {

http::status httpStatusFor(ErrorCode code);

// Splits a request target into its path and decoded query parameters.
struct RequestTarget {
  std::string path;
  std::map<std::string, std::string> query;

  static RequestTarget parse(std::string_view target);
};

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<DownloadService> download_service, std::size_t recent_limit);

protected:
  common::ApiResponse doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<DownloadService> download_service_;
  std::size_t recent_limit_;

  common::ApiResponse handleDownload(const RequestTarget &target);
  common::ApiResponse handleStatus(const std::string &id);
  common::ApiResponse handlePause(const std::string &id);
  common::ApiResponse handleResume(const std::string &id);
  common::ApiResponse handleDelete(const std::string &id);
  common::ApiResponse handleRecent();

  common::ApiResponse createTicketResponse(DownloadTicket ticket);
  http::response<http::string_body> createErrorResponse(const Error &error);
  using common::RestApiHandlerBase::createErrorResponse;
};

} // namespace download_service
