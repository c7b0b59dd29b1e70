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
#include "image_transformer.hpp"

#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "image_conversion.hpp"
#include "rest_utils.hpp"
#include "status.hpp"

namespace imgtx {

const std::string ImageTransformer::PREDICT_URL_FORMAT = "http://{}/v1/models/{}:predict";
const std::string ImageTransformer::EXPLAIN_URL_FORMAT = "http://{}/v1/models/{}:explain";

ImageTransformer::ImageTransformer(const ModelSettingsImpl& settings, std::shared_ptr<HttpClient> httpClient, std::shared_ptr<spdlog::logger> logger) :
    settings(settings),
    httpClient(std::move(httpClient)),
    logger(std::move(logger)) {
    SPDLOG_LOGGER_INFO(this->logger, "MODEL NAME {}", settings.modelName);
    SPDLOG_LOGGER_INFO(this->logger, "PREDICTOR URL {}", getPredictUrl());
    if (settings.explainerHost.has_value()) {
        SPDLOG_LOGGER_INFO(this->logger, "EXPLAINER URL {}", getExplainUrl());
    } else {
        SPDLOG_LOGGER_INFO(this->logger, "EXPLAINER URL not set, explain requests will be rejected");
    }
}

std::string ImageTransformer::getPredictUrl() const {
    return fmt::format(PREDICT_URL_FORMAT, settings.predictorHost, settings.modelName);
}

std::string ImageTransformer::getExplainUrl() const {
    if (!settings.explainerHost.has_value()) {
        return "";
    }
    return fmt::format(EXPLAIN_URL_FORMAT, settings.explainerHost.value(), settings.modelName);
}

Status ImageTransformer::preprocess(const InferenceRequest& request, const HttpHeaders& headers, InferenceRequest& processed) {
    SPDLOG_LOGGER_DEBUG(logger, "Model: {} preprocessing {} instances", getName(), request.instances.size());
    std::vector<Instance> transformed;
    transformed.reserve(request.instances.size());
    for (size_t i = 0; i < request.instances.size(); ++i) {
        const Instance& source = request.instances[i];
        Instance instance;
        instance.data = source.data;
        instance.extensions.CopyFrom(source.extensions, instance.extensions.GetAllocator());
        if (!instance.isDecoded()) {
            auto status = transformImage(instance, settings.normalization, logger);
            if (!status.ok()) {
                SPDLOG_LOGGER_DEBUG(logger, "Model: {} instance {} preprocessing failed: {}", getName(), i, status.string());
                return status;
            }
        }
        transformed.push_back(std::move(instance));
    }
    processed.instances = std::move(transformed);
    return StatusCode::OK;
}

Status ImageTransformer::forward(const std::string& url, const InferenceRequest& request, rapidjson::Document& response, HttpClientResponse& upstream) {
    std::string body;
    auto status = makeJsonFromInferenceRequest(request, &body);
    if (!status.ok()) {
        return status;
    }
    const HttpHeaders headers{{"Content-Type", "application/json"}};
    status = httpClient->post(url, body, headers, settings.timeoutSeconds, upstream);
    if (!status.ok()) {
        return status;
    }
    if (upstream.code != 200) {
        SPDLOG_LOGGER_ERROR(logger, "Model: {} request to {} failed with code {}", getName(), url, upstream.code);
        return Status(StatusCode::UPSTREAM_HTTP_ERROR, "code " + std::to_string(upstream.code) + ": " + upstream.body);
    }
    status = parseJsonDocument(upstream.body, response);
    if (!status.ok()) {
        SPDLOG_LOGGER_ERROR(logger, "Model: {} response from {} is not valid json", getName(), url);
        return Status(StatusCode::UPSTREAM_INVALID_RESPONSE, url);
    }
    return StatusCode::OK;
}

Status ImageTransformer::predict(const InferenceRequest& request, const HttpHeaders& headers, rapidjson::Document& response, HttpClientResponse& upstream) {
    return forward(getPredictUrl(), request, response, upstream);
}

Status ImageTransformer::postprocess(rapidjson::Document& response) {
    return StatusCode::OK;
}

Status ImageTransformer::explain(const InferenceRequest& request, const HttpHeaders& headers, rapidjson::Document& response, HttpClientResponse& upstream) {
    if (!settings.explainerHost.has_value()) {
        SPDLOG_LOGGER_DEBUG(logger, "Model: {} explain requested but explainer host is not configured", getName());
        return StatusCode::NOT_IMPLEMENTED;
    }
    return forward(getExplainUrl(), request, response, upstream);
}

}  // namespace imgtx
