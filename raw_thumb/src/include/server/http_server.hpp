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

/*
 * @file        raw_thumb/src/include/server/http_server.hpp
 * @brief       HTTP/1.1 listener. One request per connection, one thread per connection.
 */

#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

#include "config/service_config.hpp"
#include "server/request_router.hpp"

namespace rawthumb {
class HttpServer {
 private:
  ServiceConfig                  config_;
  RequestRouter&                 router_;

  boost::asio::io_context        ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::thread                    accept_thread_;
  uint16_t                       local_port_ = 0;

  std::mutex                     sessions_mtx_;
  std::condition_variable        sessions_done_;
  size_t                         active_sessions_ = 0;
  std::atomic<bool>              running_{false};

  void                           DoAccept();
  void                           Dispatch(boost::asio::ip::tcp::socket socket);
  void                           Session(boost::asio::ip::tcp::socket socket);
  void                           EndSession();

 public:
  HttpServer() = delete;
  HttpServer(ServiceConfig config, RequestRouter& router);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * @brief Bind, listen and start accepting on a background thread.
   *
   * @throws std::runtime_error when the address cannot be bound
   */
  void Start();

  /**
   * @brief Stop accepting and wait for every open connection to finish.
   */
  void Stop();

  // Bound port; differs from the configured one when port 0 was requested
  auto LocalPort() const -> uint16_t { return local_port_; }
};
};  // namespace rawthumb
