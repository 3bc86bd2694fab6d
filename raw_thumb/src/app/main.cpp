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

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "app/conversion_service.hpp"
#include "concurrency/thread_pool.hpp"
#include "config/service_config.hpp"
#include "image/metadata_extractor.hpp"
#include "server/http_server.hpp"
#include "server/request_router.hpp"

namespace {
struct CommandLine {
  std::optional<std::string> config_path_;
  std::optional<uint16_t>    port_;
  bool                       help_ = false;
};

void PrintUsage(const char* argv0) {
  std::cout << std::format(
      "Usage: {} [--config <file.json>] [--port <n>]\n"
      "  --config  JSON configuration file (default: $RAW_THUMB_CONFIG)\n"
      "  --port    listening port, overrides $PORT and the config file\n",
      argv0);
}

auto ParseCommandLine(int argc, char** argv) -> CommandLine {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      cmd.help_ = true;
    } else if (arg == "--config" && i + 1 < argc) {
      cmd.config_path_ = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      const std::string_view value = argv[++i];
      uint16_t               port  = 0;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        throw std::invalid_argument(std::format("invalid port '{}'", value));
      }
      cmd.port_ = port;
    } else {
      throw std::invalid_argument(std::format("unknown argument '{}'", arg));
    }
  }
  return cmd;
}

auto LoadConfig(const CommandLine& cmd) -> rawthumb::ServiceConfig {
  std::optional<std::string> path = cmd.config_path_;
  if (!path) {
    if (const char* env = std::getenv("RAW_THUMB_CONFIG"); env != nullptr && *env != '\0') {
      path = env;
    }
  }
  rawthumb::ServiceConfig config =
      path ? rawthumb::ServiceConfig::LoadFile(*path) : rawthumb::ServiceConfig{};
  config.ApplyEnvironment([](const char* name) { return std::getenv(name); });
  if (cmd.port_) {
    config.port_ = *cmd.port_;
  }
  config.Validate();
  return config;
}
}  // namespace

int main(int argc, char** argv) {
  rawthumb::ServiceConfig config;
  try {
    const CommandLine cmd = ParseCommandLine(argc, argv);
    if (cmd.help_) {
      PrintUsage(argv[0]);
      return 0;
    }
    config = LoadConfig(cmd);
  } catch (const std::exception& e) {
    std::cerr << std::format("[ERROR] raw_thumb_server: {}\n", e.what());
    PrintUsage(argv[0]);
    return 1;
  }

  rawthumb::MetadataExtractor::InitializeLibraries();

  rawthumb::ConversionService service(config.max_upload_bytes_, config.max_raw_memory_mb_,
                                      config.GetOutputLimits());
  rawthumb::ThreadPool        pool(config.ResolvedWorkerThreads(), config.queue_depth_);
  rawthumb::RequestRouter     router(config, pool, service);
  rawthumb::HttpServer        server(config, router);

  try {
    server.Start();
  } catch (const std::exception& e) {
    std::cerr << std::format("[ERROR] raw_thumb_server: {}\n", e.what());
    return 1;
  }
  std::cout << std::format("[INFO] raw_thumb_server: {} workers, queue depth {}, timeout {} ms\n",
                           pool.ThreadCount(), config.queue_depth_, config.request_timeout_ms_);

  boost::asio::io_context signals_ctx;
  boost::asio::signal_set signals(signals_ctx, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code&, int signal_number) {
    std::cout << std::format("[INFO] raw_thumb_server: received signal {}, shutting down\n",
                             signal_number);
  });
  signals_ctx.run();

  server.Stop();
  return 0;
}
