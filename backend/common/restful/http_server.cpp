#include "http_server.hpp"
#include "common/thread_pool.hpp"
#include <iostream>

namespace common {

// HttpServer implementation
HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       std::chrono::seconds read_timeout)
  : ioc_(ioc), acceptor_(ioc), api_handler_(api_handler), read_timeout_(read_timeout) {

  beast::error_code ec;

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    throw std::runtime_error("Failed to open acceptor: " + ec.message());
  }

  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    throw std::runtime_error("Failed to set reuse_address: " + ec.message());
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    throw std::runtime_error("Failed to bind: " + ec.message());
  }

  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("Failed to listen: " + ec.message());
  }
}

void HttpServer::run() {
  doAccept();
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    std::cerr << "[http] accept error: " << ec.message() << std::endl;
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, read_timeout_)->run();
  }

  doAccept();
}

// HttpSession implementation
HttpSession::HttpSession(tcp::socket&& socket,
                         std::shared_ptr<RestApiHandlerBase> api_handler,
                         std::chrono::seconds read_timeout)
  : stream_(std::move(socket)), api_handler_(api_handler), read_timeout_(read_timeout) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  req_ = {};

  stream_.expires_after(read_timeout_);

  http::async_read(stream_, buffer_, req_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream) {
    return doClose();
  }

  if (ec) {
    std::cerr << "[http] read error: " << ec.message() << std::endl;
    return;
  }

  // Handlers run on the ThreadPool; only the write returns to the connection's executor
  bool keep_alive = req_.keep_alive();
  auto request = std::make_shared<http::request<http::string_body>>(std::move(req_));
  auto self = shared_from_this();
  try {
    ThreadPool::getInstance().commit([self, request, keep_alive] {
      self->handle(std::move(*request), keep_alive);
    });
  } catch (const std::exception& e) {
    std::cerr << "[http] cannot schedule request: " << e.what() << std::endl;
    doClose();
  }
}

void HttpSession::handle(http::request<http::string_body>&& req, bool keep_alive) {
  auto result = api_handler_->handleRequest(std::move(req));

  if (auto* streaming = std::get_if<StreamingResponse>(&result)) {
    return startStreaming(std::move(*streaming), keep_alive);
  }

  auto response = std::make_shared<http::response<http::string_body>>(
    std::move(std::get<http::response<http::string_body>>(result)));
  response->keep_alive(keep_alive);

  net::dispatch(stream_.get_executor(), [self = shared_from_this(), response] {
    self->res_ = response;
    // The deadline set for the read may have passed while the handler ran
    self->stream_.expires_after(self->read_timeout_);
    http::async_write(self->stream_, *response,
                      beast::bind_front_handler(&HttpSession::onWrite, self,
                                                response->need_eof()));
  });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    std::cerr << "[http] write error: " << ec.message() << std::endl;
    return;
  }

  if (close) {
    return doClose();
  }

  res_ = nullptr;
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

void HttpSession::startStreaming(StreamingResponse response, bool keep_alive) {
  auto self = shared_from_this();
  auto shared = std::make_shared<StreamingResponse>(std::move(response));
  try {
    // Streams never occupy a pool worker
    ThreadPool::getInstance().runDedicated([self, shared, keep_alive] {
      self->writeStreaming(*shared, keep_alive);
    });
  } catch (const std::exception& e) {
    std::cerr << "[http] cannot schedule response: " << e.what() << std::endl;
    // The body still has to run once so its owner can settle
    shared->body([](std::span<const std::uint8_t>) { return false; });
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::doClose, self));
  }
}

void HttpSession::writeStreaming(StreamingResponse& response, bool keep_alive) {
  auto& socket = stream_.socket();
  beast::error_code ec;

  // Downloads can run far longer than the request timeout
  stream_.expires_never();

  response.header.keep_alive(keep_alive);
  response.header.chunked(true);
  http::response_serializer<http::empty_body> serializer{response.header};
  http::write_header(stream_, serializer, ec);
  if (ec) {
    std::cerr << "[http] header write error: " << ec.message() << std::endl;
  }

  ChunkWriter writer = [&socket, &ec](std::span<const std::uint8_t> data) {
    if (ec) {
      return false;
    }
    if (data.empty()) {
      return true;
    }
    net::write(socket, http::make_chunk(net::const_buffer(data.data(), data.size())), ec);
    return !ec;
  };

  bool complete = response.body(writer);
  if (complete && !ec) {
    net::write(socket, http::make_chunk_last(), ec);
  }

  if (!complete || ec) {
    // Without the last chunk the client knows the body is truncated
    beast::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
    return;
  }

  if (!keep_alive) {
    return net::dispatch(stream_.get_executor(),
                         beast::bind_front_handler(&HttpSession::doClose, shared_from_this()));
  }
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

}
