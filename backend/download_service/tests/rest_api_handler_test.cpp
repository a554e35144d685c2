#include "interface/rest_api_handler.hpp"
#include "infrastructure/json_file_download_repository.hpp"
#include "infrastructure/subprocess_transcoder.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace download_service;
using namespace download_service::test_support;

namespace {

constexpr std::size_t kSize = 200000;

http::request<http::string_body> makeRequest(http::verb method, const std::string& target) {
  http::request<http::string_body> req{method, target, 11};
  req.set(http::field::host, "localhost");
  return req;
}

} // namespace

TEST(RequestTargetTest, SplitsPathAndDecodesQuery) {
  auto target = RequestTarget::parse(
    "/api/download?url=https%3A%2F%2Fyoutu.be%2FdQw4w9WgXcQ&type=video&quality=720p&flag&title=a+b");
  EXPECT_EQ(target.path, "/api/download");
  EXPECT_EQ(target.query.at("url"), "https://youtu.be/dQw4w9WgXcQ");
  EXPECT_EQ(target.query.at("type"), "video");
  EXPECT_EQ(target.query.at("quality"), "720p");
  EXPECT_EQ(target.query.at("flag"), "");
  EXPECT_EQ(target.query.at("title"), "a b");
}

TEST(RequestTargetTest, ToleratesBrokenEscapes) {
  auto target = RequestTarget::parse("/x?a=%zz&b=100%");
  EXPECT_EQ(target.query.at("a"), "%zz");
  EXPECT_EQ(target.query.at("b"), "100%");
}

TEST(HttpStatusTest, MapsErrorCodes) {
  EXPECT_EQ(httpStatusFor(ErrorCode::InputError), http::status::bad_request);
  EXPECT_EQ(httpStatusFor(ErrorCode::InvalidState), http::status::bad_request);
  EXPECT_EQ(httpStatusFor(ErrorCode::NotFoundError), http::status::not_found);
  EXPECT_EQ(httpStatusFor(ErrorCode::ConflictError), http::status::conflict);
  EXPECT_EQ(httpStatusFor(ErrorCode::UpstreamError), http::status::bad_gateway);
  EXPECT_EQ(httpStatusFor(ErrorCode::ProcessError), http::status::internal_server_error);
  EXPECT_EQ(httpStatusFor(ErrorCode::StorageError), http::status::internal_server_error);
}

class RestApiHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    provider_->descriptor.display_title = "Handler Test";
    provider_->descriptor.formats = {audioFormat("mem://audio", kSize)};
    provider_->setStream("mem://audio", source_);
    auto engine = std::make_shared<SubprocessTranscoder>(writeCopyEngine(dir_.path()).string());
    auto builder = std::make_shared<PipelineBuilder>(provider_, engine, std::chrono::seconds(1));
    auto service = std::make_shared<DownloadService>(
      std::make_shared<JsonFileDownloadRepository>(dir_.path()),
      std::make_shared<TempArtifactStore>(dir_.path()),
      provider_, builder, std::make_shared<DownloadRegistry>(), DownloadServiceOptions{});
    handler_ = std::make_shared<RestApiHandler>(service, 10);
  }

  common::ApiResponse send(http::verb method, const std::string& target) {
    return handler_->handleRequest(makeRequest(method, target));
  }

  http::response<http::string_body> sendJson(http::verb method, const std::string& target) {
    auto response = send(method, target);
    EXPECT_TRUE(std::holds_alternative<http::response<http::string_body>>(response));
    return std::get<http::response<http::string_body>>(std::move(response));
  }

  TempDir dir_;
  std::vector<std::uint8_t> source_ = patternBytes(kSize, 11);
  std::shared_ptr<FakeMediaProvider> provider_ = std::make_shared<FakeMediaProvider>();
  std::shared_ptr<RestApiHandler> handler_;
  std::string id_ = makeDownloadId(kResourceRef, OutputKind::Audio, "highest");
  std::string download_target_ = "/api/download?url=https%3A%2F%2Fwww.youtube.com%2Fwatch%3Fv%3DdQw4w9WgXcQ&type=audio";
};

TEST_F(RestApiHandlerTest, PreflightGetsCorsHeaders) {
  auto res = sendJson(http::verb::options, "/api/download");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

TEST_F(RestApiHandlerTest, UnknownRouteIsNotFound) {
  auto res = sendJson(http::verb::get, "/api/nothing");
  EXPECT_EQ(res.result(), http::status::not_found);
  auto body = nlohmann::json::parse(res.body());
  EXPECT_FALSE(body["success"].get<bool>());
}

TEST_F(RestApiHandlerTest, BadReferenceIsBadRequest) {
  auto res = sendJson(http::verb::get, "/api/download?url=nope");
  EXPECT_EQ(res.result(), http::status::bad_request);
  EXPECT_EQ(nlohmann::json::parse(res.body())["error"], "Invalid or missing YouTube URL.");
  EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

TEST_F(RestApiHandlerTest, UnknownStatusIsNotFound) {
  auto res = sendJson(http::verb::get, "/api/download/status/" + std::string(32, 'a'));
  EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(RestApiHandlerTest, DownloadStreamsThenReportsStatus) {
  auto response = send(http::verb::get, download_target_);
  ASSERT_TRUE(std::holds_alternative<common::StreamingResponse>(response));
  auto& streaming = std::get<common::StreamingResponse>(response);
  EXPECT_EQ(streaming.header["X-Download-Id"], id_);
  EXPECT_EQ(streaming.header[http::field::content_type], "audio/mpeg");
  EXPECT_EQ(streaming.header[http::field::content_disposition], "attachment; filename=\"Handler Test.mp3\"");
  EXPECT_EQ(streaming.header["X-Total-Size"], std::to_string(kSize));
  EXPECT_EQ(streaming.header[http::field::access_control_allow_origin], "*");
  EXPECT_NE(std::string(streaming.header[http::field::access_control_expose_headers]).find("X-Resume-Offset"),
            std::string::npos);

  std::vector<std::uint8_t> received;
  common::ChunkWriter writer = [&](std::span<const std::uint8_t> data) {
    received.insert(received.end(), data.begin(), data.end());
    return true;
  };
  EXPECT_TRUE(streaming.body(writer));
  EXPECT_EQ(received, source_);

  auto status = sendJson(http::verb::get, "/api/download/status/" + id_);
  EXPECT_EQ(status.result(), http::status::ok);
  auto body = nlohmann::json::parse(status.body());
  EXPECT_EQ(body["downloadId"], id_);
  EXPECT_EQ(body["status"], "completed");
  EXPECT_EQ(body["progress"], 100);
  EXPECT_EQ(body["isActive"], false);

  auto recent = sendJson(http::verb::get, "/api/download/recent");
  EXPECT_EQ(nlohmann::json::parse(recent.body())["downloads"].size(), 1u);

  auto pause = sendJson(http::verb::post, "/api/download/pause/" + id_);
  EXPECT_EQ(pause.result(), http::status::bad_request);

  auto removed = sendJson(http::verb::delete_, "/api/download/" + id_);
  EXPECT_EQ(removed.result(), http::status::ok);
  auto gone = sendJson(http::verb::get, "/api/download/status/" + id_);
  EXPECT_EQ(gone.result(), http::status::not_found);
}

TEST_F(RestApiHandlerTest, ConcurrentDownloadConflicts) {
  auto first = send(http::verb::get, download_target_);
  ASSERT_TRUE(std::holds_alternative<common::StreamingResponse>(first));

  auto second = sendJson(http::verb::get, download_target_);
  EXPECT_EQ(second.result(), http::status::conflict);

  auto removed = sendJson(http::verb::delete_, "/api/download/" + id_);
  EXPECT_EQ(removed.result(), http::status::ok);
  common::ChunkWriter refuse = [](std::span<const std::uint8_t>) { return false; };
  EXPECT_FALSE(std::get<common::StreamingResponse>(first).body(refuse));
}
