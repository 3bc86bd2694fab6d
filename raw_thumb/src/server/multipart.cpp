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

#include "server/multipart.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "error/error.hpp"

namespace rawthumb {
namespace {
struct PartHeaders {
  std::string name_;
  std::string file_name_;
  std::string content_type_;
  bool        has_file_name_ = false;
};

auto EqualsIgnoreCase(std::string_view a, std::string_view b) -> bool {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

auto Trim(std::string_view s) -> std::string_view {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

auto Unquote(std::string_view s) -> std::string {
  s = Trim(s);
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    s = s.substr(1, s.size() - 2);
  }
  return std::string(s);
}

// Value of `key` in a "; key=value" header parameter list
auto HeaderParam(std::string_view header, std::string_view key) -> std::optional<std::string> {
  size_t pos = 0;
  while (pos < header.size()) {
    size_t           next  = header.find(';', pos);
    std::string_view token = Trim(header.substr(pos, next == std::string_view::npos
                                                          ? std::string_view::npos
                                                          : next - pos));
    const auto       eq    = token.find('=');
    if (eq != std::string_view::npos && EqualsIgnoreCase(Trim(token.substr(0, eq)), key)) {
      return Unquote(token.substr(eq + 1));
    }
    if (next == std::string_view::npos) break;
    pos = next + 1;
  }
  return std::nullopt;
}

auto ParsePartHeaders(std::string_view block) -> PartHeaders {
  PartHeaders headers;
  while (!block.empty()) {
    const auto       eol  = block.find("\r\n");
    std::string_view line = block.substr(0, eol);
    block = eol == std::string_view::npos ? std::string_view{} : block.substr(eol + 2);

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    std::string_view field = Trim(line.substr(0, colon));
    std::string_view value = Trim(line.substr(colon + 1));
    if (EqualsIgnoreCase(field, "Content-Disposition")) {
      headers.name_ = HeaderParam(value, "name").value_or("");
      if (auto file_name = HeaderParam(value, "filename")) {
        headers.file_name_     = *file_name;
        headers.has_file_name_ = true;
      }
    } else if (EqualsIgnoreCase(field, "Content-Type")) {
      headers.content_type_ = std::string(value);
    }
  }
  return headers;
}

auto Malformed(const char* detail) -> ServiceError {
  return ServiceError(ErrorKind::EmptyInput, "frontend",
                      std::string("malformed multipart body: ") + detail);
}
}  // namespace

auto MultipartBoundary(std::string_view content_type) -> std::optional<std::string> {
  const auto       semi = content_type.find(';');
  std::string_view mime = Trim(content_type.substr(0, semi));
  if (!EqualsIgnoreCase(mime, "multipart/form-data") || semi == std::string_view::npos) {
    return std::nullopt;
  }
  auto boundary = HeaderParam(content_type.substr(semi + 1), "boundary");
  if (!boundary || boundary->empty()) {
    return std::nullopt;
  }
  return boundary;
}

auto ExtractMultipartFile(std::string_view body, std::string_view boundary) -> UploadedAsset {
  const std::string delimiter = "--" + std::string(boundary);
  const std::string separator = "\r\n" + delimiter;

  size_t            pos       = body.find(delimiter);
  if (pos == std::string_view::npos) {
    throw Malformed("boundary not found");
  }
  pos += delimiter.size();

  std::optional<UploadedAsset> first_file;
  while (true) {
    if (body.substr(pos, 2) == "--") {
      break;
    }
    if (body.substr(pos, 2) != "\r\n") {
      throw Malformed("missing line break after boundary");
    }
    pos += 2;

    const auto header_end = body.find("\r\n\r\n", pos);
    if (header_end == std::string_view::npos) {
      throw Malformed("unterminated part headers");
    }
    PartHeaders headers   = ParsePartHeaders(body.substr(pos, header_end - pos));
    const auto  data_from = header_end + 4;
    const auto  data_to   = body.find(separator, data_from);
    if (data_to == std::string_view::npos) {
      throw Malformed("unterminated part");
    }

    if (headers.name_ == "file" || (headers.has_file_name_ && !first_file)) {
      UploadedAsset asset;
      asset.bytes_.assign(body.begin() + data_from, body.begin() + data_to);
      asset.declared_type_ = headers.content_type_;
      asset.file_name_     = headers.file_name_;
      if (headers.name_ == "file") {
        return asset;
      }
      first_file = std::move(asset);
    }
    pos = data_to + separator.size();
  }

  if (!first_file) {
    throw ServiceError(ErrorKind::EmptyInput, "frontend", "multipart body carries no file part");
  }
  return std::move(*first_file);
}
};  // namespace rawthumb
