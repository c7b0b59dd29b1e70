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
#include "status.hpp"

namespace imgtx {

const std::unordered_map<StatusCode, const std::string> Status::statusMessageMap = {
    {StatusCode::OK, ""},

    {StatusCode::JSON_INVALID, "The content is not valid json"},
    {StatusCode::JSON_SERIALIZATION_ERROR, "Data serialization to json format failed"},
    {StatusCode::INTERNAL_ERROR, "Internal server error"},
    {StatusCode::UNKNOWN_ERROR, "Unknown error"},
    {StatusCode::NOT_IMPLEMENTED, "Functionality not implemented"},

    {StatusCode::MODEL_NAME_MISSING, "Model with requested name is not found"},

    // REST handler
    {StatusCode::REST_INVALID_URL, "Malformed REST request url"},
    {StatusCode::REST_UNSUPPORTED_METHOD, "Unsupported method"},

    // REST parser
    {StatusCode::REST_BODY_IS_NOT_AN_OBJECT, "Request body should be JSON object"},
    {StatusCode::REST_NO_INSTANCES_FOUND, "Invalid JSON structure. Missing instances in request"},
    {StatusCode::REST_INSTANCES_NOT_AN_ARRAY, "Invalid JSON structure. Instances is not an array"},
    {StatusCode::REST_NAMED_INSTANCE_NOT_AN_OBJECT, "Invalid JSON structure. Instance is not a JSON object"},
    {StatusCode::REST_INSTANCE_DATA_MISSING, "Invalid JSON structure. Instance is missing data field"},
    {StatusCode::REST_INSTANCE_DATA_NOT_A_STRING, "Invalid JSON structure. Instance data field is not a string"},
    {StatusCode::REST_BASE64_DECODE_ERROR, "Decode Base64 to string error"},

    // Binary inputs
    {StatusCode::IMAGE_PARSING_FAILED, "Image parsing failed"},

    // Upstream
    {StatusCode::UPSTREAM_HTTP_ERROR, "Upstream service returned an error"},
    {StatusCode::UPSTREAM_TIMEOUT, "Upstream service request timed out"},
    {StatusCode::UPSTREAM_UNAVAILABLE, "Upstream service is unavailable"},
    {StatusCode::UPSTREAM_INVALID_RESPONSE, "Upstream service returned invalid json"},

    // Server Start errors
    {StatusCode::OPTIONS_USAGE_ERROR, "options validation error"},
    {StatusCode::FAILED_TO_START_REST_SERVER, "Failed to start the REST server"},
};

}  // namespace imgtx
