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

#include "server/request_router.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <exception>
#include <format>
#include <future>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "server/multipart.hpp"
#include "server/query_params.hpp"

namespace rawthumb {
namespace {
constexpr auto kWaitSlice = std::chrono::milliseconds(50);

template <typename T>
struct PendingTask {
  std::promise<T> promise_;
  CancelToken     cancel_;
};

auto MakeResponse(http::status status, unsigned version, std::string content_type,
                  std::string body) -> HttpResponse {
  HttpResponse res{status, version};
  res.set(http::field::server, std::format("{}/{}", kServiceName, kServiceVersion));
  res.set(http::field::content_type, content_type);
  res.keep_alive(false);
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

auto JsonResponse(http::status status, unsigned version, const nlohmann::json& body)
    -> HttpResponse {
  return MakeResponse(status, version, "application/json", body.dump());
}

auto MethodNotAllowed(unsigned version, http::verb allowed) -> HttpResponse {
  auto res = RequestRouter::ErrorResponse(ErrorKind::InvalidOptions, "method not allowed", version);
  res.result(http::status::method_not_allowed);
  res.set(http::field::allow, http::to_string(allowed));
  return res;
}

auto AssetFromRequest(HttpRequest&& req) -> UploadedAsset {
  const std::string content_type(req[http::field::content_type]);
  if (auto boundary = MultipartBoundary(content_type)) {
    return ExtractMultipartFile(req.body(), *boundary);
  }
  UploadedAsset asset;
  asset.declared_type_ = content_type;
  std::string body     = std::move(req.body());
  asset.bytes_.assign(body.begin(), body.end());
  return asset;
}

auto ElapsedMs(std::chrono::steady_clock::time_point since) -> long long {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               since)
      .count();
}
}  // namespace

auto RequestRouter::StatusForKind(ErrorKind kind) -> http::status {
  switch (kind) {
    case ErrorKind::PayloadTooLarge:
      return http::status::payload_too_large;
    case ErrorKind::UnsupportedFormat:
    case ErrorKind::CorruptData:
      return http::status::unprocessable_entity;
    case ErrorKind::EmptyInput:
    case ErrorKind::EncodeFailed:
    case ErrorKind::InvalidOptions:
      return http::status::bad_request;
    case ErrorKind::Timeout:
      return http::status::gateway_timeout;
    case ErrorKind::Overloaded:
      return http::status::service_unavailable;
    case ErrorKind::Cancelled:
    case ErrorKind::InternalError:
    default:
      return http::status::internal_server_error;
  }
}

auto RequestRouter::ErrorResponse(ErrorKind kind, std::string_view message, unsigned version)
    -> HttpResponse {
  nlohmann::json body;
  body["kind"]    = std::string(ErrorKindName(kind));
  body["message"] = std::string(message);
  auto res        = JsonResponse(StatusForKind(kind), version, body);
  if (kind == ErrorKind::Overloaded) {
    res.set(http::field::retry_after, "1");
  }
  return res;
}

template <typename T>
auto RequestRouter::RunOnPool(std::function<T(const CancelToken&)> work,
                              const PeerAliveCheck& peer_alive) -> T {
  auto           task     = std::make_shared<PendingTask<T>>();
  std::future<T> result   = task->promise_.get_future();

  const bool     admitted = pool_.TrySubmit([task, work = std::move(work)]() {
    try {
      task->promise_.set_value(work(task->cancel_));
    } catch (...) {
      task->promise_.set_exception(std::current_exception());
    }
  });
  if (!admitted) {
    throw ServiceError(ErrorKind::Overloaded, "frontend",
                       std::format("all {} worker slots are busy", pool_.Capacity()));
  }

  const auto deadline = std::chrono::steady_clock::now() + Timeout();
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      task->cancel_.Cancel();
      throw ServiceError(ErrorKind::Timeout, "frontend",
                         std::format("request exceeded {} ms", config_.request_timeout_ms_));
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(kWaitSlice, deadline - now);
    if (result.wait_for(slice) == std::future_status::ready) {
      return result.get();
    }
    if (peer_alive && !peer_alive()) {
      task->cancel_.Cancel();
      throw ServiceError(ErrorKind::Cancelled, "frontend", "client disconnected");
    }
  }
}

auto RequestRouter::HandleConvert(HttpRequest&& req, ConversionOptions base,
                                  const PeerAliveCheck& peer_alive) -> HttpResponse {
  const unsigned          version = req.version();
  const std::string       target(req.target());
  const QueryParams       query   = QueryParams::Parse(TargetQuery(target));
  const ConversionOptions options = ApplyQueryToOptions(query, std::move(base));
  auto asset = std::make_shared<const UploadedAsset>(AssetFromRequest(std::move(req)));

  ConversionResult        result  = RunOnPool<ConversionResult>(
      [this, asset, options](const CancelToken& cancel) {
        return service_.Handle(*asset, options, &cancel);
      },
      peer_alive);

  HttpResponse res = MakeResponse(http::status::ok, version, result.content_type_,
                                  std::string(result.bytes_.begin(), result.bytes_.end()));
  res.set(http::field::etag, result.ETag());
  res.set("X-Image-Width", std::to_string(result.width_));
  res.set("X-Image-Height", std::to_string(result.height_));
  return res;
}

auto RequestRouter::HandleMetadata(HttpRequest&& req, const PeerAliveCheck& peer_alive)
    -> HttpResponse {
  const unsigned  version  = req.version();
  auto            asset    = std::make_shared<const UploadedAsset>(AssetFromRequest(std::move(req)));
  CaptureMetadata metadata = RunOnPool<CaptureMetadata>(
      [this, asset](const CancelToken&) { return service_.Inspect(*asset); }, peer_alive);
  return JsonResponse(http::status::ok, version, metadata.ToJson());
}

auto RequestRouter::HandleHealth(const HttpRequest& req) const -> HttpResponse {
  nlohmann::json body;
  body["status"]    = "ok";
  body["service"]   = std::string(kServiceName);
  body["version"]   = std::string(kServiceVersion);
  body["features"]  = {"raw-decode", "jpeg", "png", "resize", "exif", "metadata", "thumbnail"};
  body["workers"]   = pool_.ThreadCount();
  body["in_flight"] = pool_.InFlight();
  body["capacity"]  = pool_.Capacity();
  return JsonResponse(http::status::ok, req.version(), body);
}

auto RequestRouter::Route(HttpRequest&& req, const PeerAliveCheck& peer_alive)
    -> std::optional<HttpResponse> {
  EASY_BLOCK("Route");
  const request_id_t id      = next_request_id_.fetch_add(1);
  const auto         started = std::chrono::steady_clock::now();
  const unsigned     version = req.version();
  const std::string  method(req.method_string());
  const std::string  target(req.target());
  const std::string  path(TargetPath(target));

  HttpResponse       res;
  try {
    if (path == "/health") {
      res = req.method() == http::verb::get ? HandleHealth(req)
                                            : MethodNotAllowed(version, http::verb::get);
    } else if (path == "/convert" || path == "/thumbnail" || path == "/metadata") {
      if (req.method() != http::verb::post) {
        res = MethodNotAllowed(version, http::verb::post);
      } else if (path == "/metadata") {
        res = HandleMetadata(std::move(req), peer_alive);
      } else {
        res = HandleConvert(std::move(req),
                            path == "/thumbnail" ? config_.ThumbnailOptions()
                                                 : config_.DefaultOptions(),
                            peer_alive);
      }
    } else {
      res = ErrorResponse(ErrorKind::InvalidOptions, std::format("no route for {}", path), version);
      res.result(http::status::not_found);
    }
  } catch (const ServiceError& e) {
    if (e.Kind() == ErrorKind::Cancelled) {
      std::cout << std::format("[INFO] RequestRouter: #{} {} {} abandoned: {} ({} ms)\n", id,
                               method, target, e.what(), ElapsedMs(started));
      return std::nullopt;
    }
    if (e.Kind() == ErrorKind::InternalError) {
      std::cerr << std::format("[ERROR] RequestRouter: #{} {} {} failed in {}: {}\n", id, method,
                               target, e.Component(), e.what());
    }
    res = ErrorResponse(e.Kind(), e.what(), version);
  } catch (const RawThumbError& e) {
    if (e.Kind() == ErrorKind::InternalError) {
      std::cerr << std::format("[ERROR] RequestRouter: #{} {} {} failed: {}\n", id, method, target,
                               e.what());
    }
    res = ErrorResponse(e.Kind(), e.what(), version);
  } catch (const std::exception& e) {
    std::cerr << std::format("[ERROR] RequestRouter: #{} {} {} failed: {}\n", id, method, target,
                             e.what());
    res = ErrorResponse(ErrorKind::InternalError, "internal error", version);
  }

  std::cout << std::format("[INFO] RequestRouter: #{} {} {} -> {} {} bytes ({} ms)\n", id, method,
                           target, res.result_int(), res.body().size(), ElapsedMs(started));
  return res;
}
};  // namespace rawthumb
