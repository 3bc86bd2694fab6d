//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "server/http_server.hpp"

#include <poll.h>

#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http.hpp>
#include <cerrno>
#include <chrono>
#include <format>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace rawthumb {
namespace {
using tcp                              = boost::asio::ip::tcp;
using error_code                       = boost::system::error_code;

// Room for multipart framing on top of the file itself
constexpr size_t kMultipartOverhead    = 64 * 1024;
constexpr auto   kHeaderReadTimeout    = std::chrono::milliseconds(10000);

/**
 * @brief Blocking socket reads bounded by a timeout. Beast's synchronous read has no deadline
 * of its own.
 */
class TimedSocketStream {
 private:
  tcp::socket&              socket_;
  std::chrono::milliseconds timeout_;

 public:
  using executor_type = tcp::socket::executor_type;

  TimedSocketStream(tcp::socket& socket, std::chrono::milliseconds timeout)
      : socket_(socket), timeout_(timeout) {}

  auto get_executor() -> executor_type { return socket_.get_executor(); }

  template <typename MutableBufferSequence>
  auto read_some(const MutableBufferSequence& buffers, error_code& ec) -> size_t {
    pollfd pfd{socket_.native_handle(), POLLIN, 0};
    int    ready = 0;
    do {
      ready = ::poll(&pfd, 1, static_cast<int>(timeout_.count()));
    } while (ready < 0 && errno == EINTR);
    if (ready == 0) {
      ec = boost::asio::error::timed_out;
      return 0;
    }
    if (ready < 0) {
      ec = error_code(errno, boost::system::system_category());
      return 0;
    }
    return socket_.read_some(buffers, ec);
  }

  template <typename MutableBufferSequence>
  auto read_some(const MutableBufferSequence& buffers) -> size_t {
    error_code ec;
    size_t     n = read_some(buffers, ec);
    if (ec) {
      throw boost::system::system_error(ec);
    }
    return n;
  }
};

// A reset or fully closed connection. A client that only shut down its sending side is still
// waiting for the response.
auto PeerAlive(tcp::socket& socket) -> bool {
  pollfd pfd{socket.native_handle(), 0, 0};
  if (::poll(&pfd, 1, 0) < 0) {
    return true;
  }
  return (pfd.revents & (POLLHUP | POLLERR)) == 0;
}

void WriteResponse(tcp::socket& socket, HttpResponse& res) {
  error_code ec;
  http::write(socket, res, ec);
  if (ec) {
    std::cout << std::format("[WARN] HttpServer: failed to write response: {}\n", ec.message());
  }
}

void CloseSocket(tcp::socket& socket) {
  error_code ec;
  socket.shutdown(tcp::socket::shutdown_send, ec);
  socket.close(ec);
}
}  // namespace

HttpServer::HttpServer(ServiceConfig config, RequestRouter& router)
    : config_(std::move(config)), router_(router), acceptor_(ioc_) {}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::Start() {
  try {
    tcp::endpoint endpoint{boost::asio::ip::make_address(config_.listen_address_), config_.port_};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    local_port_ = acceptor_.local_endpoint().port();
  } catch (const boost::system::system_error& e) {
    throw std::runtime_error(std::format("HttpServer: cannot listen on {}:{}: {}",
                                         config_.listen_address_, config_.port_, e.what()));
  }

  running_ = true;
  DoAccept();
  accept_thread_ = std::thread([this] { ioc_.run(); });
  std::cout << std::format("[INFO] HttpServer: listening on {}:{}\n", config_.listen_address_,
                           local_port_);
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::post(ioc_, [this] {
    error_code ec;
    acceptor_.close(ec);
  });
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  std::unique_lock<std::mutex> lock(sessions_mtx_);
  sessions_done_.wait(lock, [this] { return active_sessions_ == 0; });
  std::cout << "[INFO] HttpServer: stopped\n";
}

void HttpServer::DoAccept() {
  acceptor_.async_accept([this](const error_code& ec, tcp::socket socket) {
    if (!ec) {
      Dispatch(std::move(socket));
    } else if (ec != boost::asio::error::operation_aborted) {
      std::cout << std::format("[WARN] HttpServer: accept failed: {}\n", ec.message());
    }
    if (acceptor_.is_open()) {
      DoAccept();
    }
  });
}

void HttpServer::Dispatch(tcp::socket socket) {
  {
    std::lock_guard<std::mutex> lock(sessions_mtx_);
    if (active_sessions_ < config_.max_connections_) {
      ++active_sessions_;
      std::thread([this, s = std::move(socket)]() mutable { Session(std::move(s)); }).detach();
      return;
    }
  }
  auto res = RequestRouter::ErrorResponse(ErrorKind::Overloaded, "too many open connections", 11);
  WriteResponse(socket, res);
  CloseSocket(socket);
}

void HttpServer::EndSession() {
  std::lock_guard<std::mutex> lock(sessions_mtx_);
  --active_sessions_;
  sessions_done_.notify_all();
}

void HttpServer::Session(tcp::socket socket) {
  const size_t                            body_limit = config_.max_upload_bytes_ + kMultipartOverhead;
  boost::beast::flat_buffer               buffer;
  http::request_parser<http::string_body> parser;
  parser.body_limit(body_limit);

  try {
    TimedSocketStream header_stream(socket, kHeaderReadTimeout);
    error_code        ec;
    http::read_header(header_stream, buffer, parser, ec);
    if (ec) {
      if (ec != http::error::end_of_stream) {
        std::cout << std::format("[WARN] HttpServer: bad request header: {}\n", ec.message());
      }
      CloseSocket(socket);
      EndSession();
      return;
    }

    const unsigned version = parser.get().version();
    if (parser.content_length() && *parser.content_length() > body_limit) {
      auto res = RequestRouter::ErrorResponse(
          ErrorKind::PayloadTooLarge,
          std::format("body of {} bytes exceeds the limit of {} bytes", *parser.content_length(),
                      config_.max_upload_bytes_),
          version);
      WriteResponse(socket, res);
      CloseSocket(socket);
      EndSession();
      return;
    }
    if (boost::beast::iequals(parser.get()[http::field::expect], "100-continue")) {
      http::response<http::empty_body> cont{http::status::continue_, version};
      http::write(socket, cont, ec);
    }

    TimedSocketStream body_stream(socket, router_.Timeout());
    http::read(body_stream, buffer, parser, ec);
    if (ec == http::error::body_limit) {
      auto res = RequestRouter::ErrorResponse(ErrorKind::PayloadTooLarge,
                                              "request body exceeds the upload limit", version);
      WriteResponse(socket, res);
    } else if (ec) {
      std::cout << std::format("[WARN] HttpServer: failed to read request body: {}\n",
                               ec.message());
    } else {
      auto res = router_.Route(parser.release(), [&socket] { return PeerAlive(socket); });
      if (res) {
        WriteResponse(socket, *res);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << std::format("[ERROR] HttpServer: session failed: {}\n", e.what());
  }
  CloseSocket(socket);
  EndSession();
}
};  // namespace rawthumb
