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
#include "rest_utils.hpp"

#include <string>
#include <variant>

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "absl/strings/escaping.h"
#include "logging.hpp"

namespace imgtx {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

Status decodeBase64(const std::string& bytes, std::string& decodedBytes) {
    return absl::Base64Unescape(bytes, &decodedBytes) ? StatusCode::OK : StatusCode::REST_BASE64_DECODE_ERROR;
}

static bool writeTensorDimension(JsonWriter& writer, const ImageTensor& tensor, size_t dim, size_t& offset) {
    if (!writer.StartArray())
        return false;
    if (dim + 1 == tensor.shape.size()) {
        for (size_t i = 0; i < tensor.shape[dim]; ++i) {
            if (!writer.Double(tensor.data[offset++]))
                return false;
        }
    } else {
        for (size_t i = 0; i < tensor.shape[dim]; ++i) {
            if (!writeTensorDimension(writer, tensor, dim + 1, offset))
                return false;
        }
    }
    return writer.EndArray();
}

static Status writeTensor(JsonWriter& writer, const ImageTensor& tensor) {
    size_t expectedSize = tensor.shape.empty() ? 0 : 1;
    for (auto dim : tensor.shape) {
        expectedSize *= dim;
    }
    if (tensor.shape.empty() || expectedSize != tensor.data.size()) {
        SPDLOG_DEBUG("Tensor with {} elements does not match its shape", tensor.data.size());
        return StatusCode::JSON_SERIALIZATION_ERROR;
    }
    size_t offset = 0;
    if (!writeTensorDimension(writer, tensor, 0, offset)) {
        return StatusCode::JSON_SERIALIZATION_ERROR;
    }
    return StatusCode::OK;
}

static Status writeInstance(JsonWriter& writer, const Instance& instance) {
    writer.StartObject();
    writer.String("data");
    if (auto encoded = std::get_if<std::string>(&instance.data)) {
        writer.String(encoded->c_str(), static_cast<rapidjson::SizeType>(encoded->size()));
    } else {
        auto status = writeTensor(writer, std::get<ImageTensor>(instance.data));
        if (!status.ok())
            return status;
    }
    for (const auto& member : instance.extensions.GetObject()) {
        writer.String(member.name.GetString(), member.name.GetStringLength());
        if (!member.value.Accept(writer))
            return StatusCode::JSON_SERIALIZATION_ERROR;
    }
    if (!writer.EndObject())
        return StatusCode::JSON_SERIALIZATION_ERROR;
    return StatusCode::OK;
}

Status makeJsonFromInferenceRequest(const InferenceRequest& request, std::string* outputJson) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writer.String("instances");
    writer.StartArray();
    for (const auto& instance : request.instances) {
        auto status = writeInstance(writer, instance);
        if (!status.ok())
            return status;
    }
    writer.EndArray();
    if (!writer.EndObject() || !writer.IsComplete())
        return StatusCode::JSON_SERIALIZATION_ERROR;
    *outputJson = std::string(buffer.GetString(), buffer.GetSize());
    return StatusCode::OK;
}

Status makeJsonFromInstance(const Instance& instance, std::string* outputJson) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    auto status = writeInstance(writer, instance);
    if (!status.ok())
        return status;
    *outputJson = std::string(buffer.GetString(), buffer.GetSize());
    return StatusCode::OK;
}

Status makeJsonFromDocument(const rapidjson::Document& document, std::string* outputJson) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    if (!document.Accept(writer))
        return StatusCode::JSON_SERIALIZATION_ERROR;
    *outputJson = std::string(buffer.GetString(), buffer.GetSize());
    return StatusCode::OK;
}

Status parseJsonDocument(const std::string& json, rapidjson::Document& document) {
    rapidjson::ParseResult result = document.Parse(json.c_str(), json.size());
    if (!result) {
        SPDLOG_DEBUG("JSON parse error: {} at offset {}", rapidjson::GetParseError_En(result.Code()), result.Offset());
        return StatusCode::JSON_INVALID;
    }
    return StatusCode::OK;
}

}  // namespace imgtx
