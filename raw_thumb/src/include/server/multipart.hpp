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

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "app/conversion_service.hpp"

namespace rawthumb {
/**
 * @brief boundary parameter of a multipart/form-data Content-Type, std::nullopt for any other
 * content type.
 */
auto MultipartBoundary(std::string_view content_type) -> std::optional<std::string>;

/**
 * @brief Pull the uploaded file out of a multipart/form-data body. The part named "file" wins,
 * otherwise the first part that carries a filename.
 *
 * @throws ServiceError EmptyInput when no file part is present or the body is malformed
 */
auto ExtractMultipartFile(std::string_view body, std::string_view boundary) -> UploadedAsset;
};  // namespace rawthumb
