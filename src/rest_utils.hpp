//*****************************************************************************
// Copyright 2026 Intel Corporation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//*****************************************************************************
#pragma once

#include <string>

#include <rapidjson/document.h>

#include "inference_request.hpp"
#include "status.hpp"

namespace imgtx {

Status decodeBase64(const std::string& bytes, std::string& decodedBytes);

/**
 * @brief Serializes request into {"instances": [...]} json.
 *
 * Base64 data is written as string, decoded data as nested arrays
 * following tensor shape.
 */
Status makeJsonFromInferenceRequest(const InferenceRequest& request, std::string* outputJson);

Status makeJsonFromInstance(const Instance& instance, std::string* outputJson);

Status makeJsonFromDocument(const rapidjson::Document& document, std::string* outputJson);

Status parseJsonDocument(const std::string& json, rapidjson::Document& document);

}  // namespace imgtx
