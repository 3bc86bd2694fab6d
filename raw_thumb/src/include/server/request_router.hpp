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
 * @file        raw_thumb/src/include/server/request_router.hpp
 * @brief       Maps HTTP requests onto the conversion service and errors onto status codes
 */

#pragma once

#include <atomic>
#include <boost/beast/http.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "app/conversion_service.hpp"
#include "concurrency/thread_pool.hpp"
#include "config/service_config.hpp"
#include "error/error.hpp"
#include "type/type.hpp"

namespace rawthumb {
namespace http         = boost::beast::http;

using HttpRequest      = http::request<http::string_body>;
using HttpResponse     = http::response<http::string_body>;
// Returns false once the client has gone away
using PeerAliveCheck   = std::function<bool()>;

static constexpr std::string_view kServiceName    = "raw-thumb";
static constexpr std::string_view kServiceVersion = "1.1.0";

class RequestRouter {
 private:
  ServiceConfig             config_;
  ThreadPool&               pool_;
  const ConversionService&  service_;
  std::atomic<request_id_t> next_request_id_{1};

  template <typename T>
  auto RunOnPool(std::function<T(const CancelToken&)> work, const PeerAliveCheck& peer_alive) -> T;

  auto HandleConvert(HttpRequest&& req, ConversionOptions base, const PeerAliveCheck& peer_alive)
      -> HttpResponse;
  auto HandleMetadata(HttpRequest&& req, const PeerAliveCheck& peer_alive) -> HttpResponse;
  auto HandleHealth(const HttpRequest& req) const -> HttpResponse;

 public:
  RequestRouter() = delete;
  RequestRouter(ServiceConfig config, ThreadPool& pool, const ConversionService& service)
      : config_(std::move(config)), pool_(pool), service_(service) {}

  /**
   * @brief Serve one request.
   *
   * @return std::nullopt when the client disconnected while its request was in progress;
   * nothing must be written back then.
   */
  auto        Route(HttpRequest&& req, const PeerAliveCheck& peer_alive) -> std::optional<HttpResponse>;

  /**
   * @brief JSON error response {"kind", "message"} with the status mapped from `kind`.
   */
  static auto ErrorResponse(ErrorKind kind, std::string_view message, unsigned version)
      -> HttpResponse;

  static auto StatusForKind(ErrorKind kind) -> http::status;

  auto        Timeout() const -> std::chrono::milliseconds {
    return std::chrono::milliseconds(config_.request_timeout_ms_);
  }
};
};  // namespace rawthumb
