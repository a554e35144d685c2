#pragma once
#include <chrono>
#include <memory>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/rest_api_handler_base.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

// One client connection. Requests are handled on the ThreadPool. Buffered
// responses are written asynchronously on the connection's strand; streaming
// responses take over the socket from a dedicated thread until their body is
// done.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket,
              std::shared_ptr<RestApiHandlerBase> api_handler,
              std::chrono::seconds read_timeout);

  void run();

private:
  void doRead();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  // Runs on a ThreadPool worker.
  void handle(http::request<http::string_body>&& req, bool keep_alive);
  void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void doClose();

  // Hands a streaming response to a dedicated thread. While it runs the
  // socket is written synchronously from that thread and nothing else
  // touches it.
  void startStreaming(StreamingResponse response, bool keep_alive);
  void writeStreaming(StreamingResponse& response, bool keep_alive);

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<void> res_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  std::chrono::seconds read_timeout_;
};

class HttpServer {
public:
  // Throws std::runtime_error when the endpoint cannot be bound.
  HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<RestApiHandlerBase> api_handler,
             std::chrono::seconds read_timeout = std::chrono::seconds(30));

  void run();

  tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  std::chrono::seconds read_timeout_;
};

}
