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
#include "http_rest_api_handler.hpp"

#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <rapidjson/document.h>

#include "http_client.hpp"
#include "logging.hpp"
#include "model.hpp"
#include "rest_parser.hpp"
#include "rest_utils.hpp"

namespace imgtx {

const std::string HttpRestApiHandler::inferenceRegexExp =
    R"((.?)\/v1\/models\/([^\/:]+):(predict|explain))";

HttpRestApiHandler::HttpRestApiHandler(std::shared_ptr<Model> model) :
    inferenceRegex(inferenceRegexExp),
    model(std::move(model)) {}

Status HttpRestApiHandler::parseRequestComponents(HttpRequestComponents& requestComponents,
    const std::string_view http_method,
    const std::string& request_path) {
    std::smatch sm;
    requestComponents.http_method = http_method;
    if (!std::regex_match(request_path, sm, inferenceRegex)) {
        return StatusCode::REST_INVALID_URL;
    }
    if (http_method != "POST") {
        return StatusCode::REST_UNSUPPORTED_METHOD;
    }
    requestComponents.model_name = urlDecode(sm[2]);
    requestComponents.processing_method = sm[3];
    requestComponents.type = requestComponents.processing_method == "explain" ? Explain : Predict;
    return StatusCode::OK;
}

Status HttpRestApiHandler::dispatchToProcessor(
    const std::string& request_body,
    const HttpHeaders& headers,
    std::string* response,
    const HttpRequestComponents& request_components,
    HttpResponseComponents& response_components) {
    switch (request_components.type) {
    case Predict:
    case Explain:
        return processInferenceRequest(request_components, request_body, headers, response, response_components);
    }
    return StatusCode::UNKNOWN_ERROR;
}

Status HttpRestApiHandler::processRequest(
    const std::string_view http_method,
    const std::string_view request_path,
    const std::string& request_body,
    const HttpHeaders& headers,
    std::string* response,
    HttpResponseComponents& responseComponents) {
    std::string request_path_str(request_path);
    HttpRequestComponents requestComponents;
    auto status = parseRequestComponents(requestComponents, http_method, request_path_str);
    if (!status.ok())
        return status;

    response->clear();
    return dispatchToProcessor(request_body, headers, response, requestComponents, responseComponents);
}

Status HttpRestApiHandler::processInferenceRequest(
    const HttpRequestComponents& request_components,
    const std::string& request_body,
    const HttpHeaders& headers,
    std::string* response,
    HttpResponseComponents& response_components) {
    const std::string& modelName = request_components.model_name;
    SPDLOG_DEBUG("Processing REST {} request for model: {}", request_components.processing_method, modelName);
    if (modelName != model->getName()) {
        SPDLOG_DEBUG("Model matching request parameters not found - name: {}", modelName);
        return StatusCode::MODEL_NAME_MISSING;
    }

    RestParser requestParser;
    auto status = requestParser.parse(request_body.c_str());
    if (!status.ok()) {
        return status;
    }

    InferenceRequest processed;
    status = model->preprocess(requestParser.getRequest(), headers, processed);
    if (!status.ok()) {
        return status;
    }

    rapidjson::Document responseDocument;
    HttpClientResponse upstream;
    if (request_components.type == Explain) {
        status = model->explain(processed, headers, responseDocument, upstream);
    } else {
        status = model->predict(processed, headers, responseDocument, upstream);
    }
    if (status == StatusCode::UPSTREAM_HTTP_ERROR) {
        response_components.upstreamStatusCode = static_cast<int>(upstream.code);
        response_components.upstreamContentType = std::move(upstream.contentType);
        *response = std::move(upstream.body);
        return status;
    }
    if (!status.ok()) {
        return status;
    }

    status = model->postprocess(responseDocument);
    if (!status.ok()) {
        return status;
    }
    status = makeJsonFromDocument(responseDocument, response);
    if (!status.ok()) {
        return status;
    }
    return StatusCode::OK;
}

std::string urlDecode(const std::string& encoded) {
    std::ostringstream decoded;
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%') {
            if (i + 2 < encoded.size() &&
                std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
                std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
                int value = 0;
                std::stringstream hexValue;
                hexValue << encoded.substr(i + 1, 2);
                hexValue >> std::hex >> value;
                decoded << static_cast<char>(value);
                i += 2;
            } else {
                // invalid escape sequence
                decoded << '%';
            }
        } else {
            decoded << encoded[i];
        }
    }
    return decoded.str();
}

}  // namespace imgtx
