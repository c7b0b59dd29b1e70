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

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "inference_request.hpp"
#include "status.hpp"

namespace imgtx {
class Model;

enum RequestType { Predict,
    Explain };

struct HttpRequestComponents {
    RequestType type;
    std::string_view http_method;
    std::string model_name;
    std::string processing_method;
};

struct HttpResponseComponents {
    // set when backend answered with non-200 code, body is relayed as is
    std::optional<int> upstreamStatusCode;
    std::string upstreamContentType;
};

class HttpRestApiHandler {
public:
    static const std::string inferenceRegexExp;

    /**
     * @brief Construct a new HttpRest Api Handler
     *
     * @param model served under /v1/models/{name}
     */
    HttpRestApiHandler(std::shared_ptr<Model> model);

    Status parseRequestComponents(HttpRequestComponents& components,
        const std::string_view http_method,
        const std::string& request_path);

    Status dispatchToProcessor(
        const std::string& request_body,
        const HttpHeaders& headers,
        std::string* response,
        const HttpRequestComponents& request_components,
        HttpResponseComponents& response_components);

    /**
     * @brief Process Request
     *
     * @param http_method
     * @param request_path
     * @param request_body
     * @param headers
     * @param response
     * @param response_components
     *
     * @return Status
     */
    Status processRequest(
        const std::string_view http_method,
        const std::string_view request_path,
        const std::string& request_body,
        const HttpHeaders& headers,
        std::string* response,
        HttpResponseComponents& response_components);

    /**
     * @brief Runs preprocess, predict or explain and postprocess for single request
     *
     * @param request_components
     * @param request_body
     * @param headers
     * @param response
     * @param response_components
     *
     * @return Status
     */
    Status processInferenceRequest(
        const HttpRequestComponents& request_components,
        const std::string& request_body,
        const HttpHeaders& headers,
        std::string* response,
        HttpResponseComponents& response_components);

private:
    const std::regex inferenceRegex;

    std::shared_ptr<Model> model;
};

std::string urlDecode(const std::string& encoded);

}  // namespace imgtx
