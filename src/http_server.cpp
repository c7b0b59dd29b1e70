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
#include "http_server.hpp"

#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include <httplib.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "http_rest_api_handler.hpp"
#include "logging.hpp"
#include "status.hpp"

namespace imgtx {

const HTTPStatusCode http(const Status& status) {
    const std::unordered_map<StatusCode, HTTPStatusCode> httpStatusMap = {
        {StatusCode::OK, HTTPStatusCode::OK},

        // REST handler failure
        {StatusCode::REST_INVALID_URL, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_UNSUPPORTED_METHOD, HTTPStatusCode::NONE_ACC},
        {StatusCode::MODEL_NAME_MISSING, HTTPStatusCode::NOT_FOUND},

        // REST parser failure
        {StatusCode::JSON_INVALID, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_BODY_IS_NOT_AN_OBJECT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NO_INSTANCES_FOUND, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_INSTANCES_NOT_AN_ARRAY, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_NAMED_INSTANCE_NOT_AN_OBJECT, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_INSTANCE_DATA_MISSING, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::REST_INSTANCE_DATA_NOT_A_STRING, HTTPStatusCode::BAD_REQUEST},

        // Preprocessing
        {StatusCode::REST_BASE64_DECODE_ERROR, HTTPStatusCode::BAD_REQUEST},
        {StatusCode::IMAGE_PARSING_FAILED, HTTPStatusCode::BAD_REQUEST},

        // Backend calls
        {StatusCode::NOT_IMPLEMENTED, HTTPStatusCode::NOT_IMPLEMENTED},
        {StatusCode::UPSTREAM_TIMEOUT, HTTPStatusCode::GATEWAY_TIMEOUT},
        {StatusCode::UPSTREAM_UNAVAILABLE, HTTPStatusCode::BAD_GATEWAY},
        {StatusCode::UPSTREAM_HTTP_ERROR, HTTPStatusCode::BAD_GATEWAY},
        {StatusCode::UPSTREAM_INVALID_RESPONSE, HTTPStatusCode::BAD_GATEWAY},

        {StatusCode::JSON_SERIALIZATION_ERROR, HTTPStatusCode::ERROR},
        {StatusCode::INTERNAL_ERROR, HTTPStatusCode::ERROR},
    };
    auto it = httpStatusMap.find(status.getCode());
    if (it != httpStatusMap.end()) {
        return it->second;
    } else {
        return HTTPStatusCode::ERROR;
    }
}

std::string createErrorJson(const Status& status) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.String("error");
    writer.String(status.string().c_str());
    writer.EndObject();
    return buffer.GetString();
}

class RestApiRequestDispatcher {
public:
    RestApiRequestDispatcher(std::shared_ptr<Model> model) {
        handler_ = std::make_unique<HttpRestApiHandler>(std::move(model));
    }

    void dispatch(const httplib::Request& req, httplib::Response& res) {
        try {
            this->processRequest(req, res);
        } catch (const std::exception& e) {
            SPDLOG_ERROR("Exception caught in REST request handler: {}", e.what());
            res.status = static_cast<int>(HTTPStatusCode::ERROR);
            res.set_content(createErrorJson(StatusCode::INTERNAL_ERROR), "application/json");
        }
    }

private:
    void processRequest(const httplib::Request& req, httplib::Response& res) {
        SPDLOG_DEBUG("REST request {}", req.path);
        HttpHeaders headers;
        for (const auto& [name, value] : req.headers) {
            headers.emplace_back(name, value);
        }
        SPDLOG_DEBUG("Processing HTTP request: {} {} body: {} bytes",
            req.method,
            req.path,
            req.body.size());

        std::string output;
        HttpResponseComponents responseComponents;
        const auto status = handler_->processRequest(req.method, req.path, req.body, headers, &output, responseComponents);
        int httpCode = static_cast<int>(http(status));
        std::string contentType = "application/json";
        if (responseComponents.upstreamStatusCode.has_value()) {
            // backend error relayed with its own code, body and content type
            httpCode = responseComponents.upstreamStatusCode.value();
            contentType = responseComponents.upstreamContentType.empty() ? "text/plain" : responseComponents.upstreamContentType;
        } else if (!status.ok() && output.empty()) {
            output = createErrorJson(status);
        }
        if (!status.ok()) {
            SPDLOG_DEBUG("Processing HTTP/REST request failed: {} {}. Reason: {}",
                req.method,
                req.path,
                status.string());
        }
        res.status = httpCode;
        res.set_content(output, contentType);
    }

    std::unique_ptr<HttpRestApiHandler> handler_;
};

std::unique_ptr<CppHttpLibHttpServer> createAndStartHttpServer(const std::string& address, int port, int num_threads, std::shared_ptr<Model> model) {
    auto server = std::make_unique<CppHttpLibHttpServer>(num_threads, port, address);
    auto dispatcher = std::make_shared<RestApiRequestDispatcher>(std::move(model));
    server->registerRequestDispatcher([dispatcher](const httplib::Request& req, httplib::Response& res) {
        dispatcher->dispatch(req, res);
    });
    if (!server->startAcceptingRequests()) {
        SPDLOG_ERROR("Failed to start REST server on {}:{}", address, port);
        return nullptr;
    }
    return server;
}

}  // namespace imgtx
