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
#include <string>

#include "model.hpp"
#include "server_settings.hpp"

namespace spdlog {
class logger;
}

namespace imgtx {

/**
 * @brief Decodes base64 images into normalized tensors and forwards
 * requests to predictor and explainer services.
 */
class ImageTransformer : public Model {
    const ModelSettingsImpl settings;
    std::shared_ptr<HttpClient> httpClient;
    std::shared_ptr<spdlog::logger> logger;

    Status forward(const std::string& url, const InferenceRequest& request, rapidjson::Document& response, HttpClientResponse& upstream);

public:
    static const std::string PREDICT_URL_FORMAT;
    static const std::string EXPLAIN_URL_FORMAT;

    ImageTransformer(const ModelSettingsImpl& settings, std::shared_ptr<HttpClient> httpClient, std::shared_ptr<spdlog::logger> logger);

    const std::string& getName() const override {
        return settings.modelName;
    }

    const ModelSettingsImpl& getSettings() const {
        return settings;
    }

    std::string getPredictUrl() const;
    std::string getExplainUrl() const;

    Status preprocess(const InferenceRequest& request, const HttpHeaders& headers, InferenceRequest& processed) override;
    Status predict(const InferenceRequest& request, const HttpHeaders& headers, rapidjson::Document& response, HttpClientResponse& upstream) override;
    Status postprocess(rapidjson::Document& response) override;
    Status explain(const InferenceRequest& request, const HttpHeaders& headers, rapidjson::Document& response, HttpClientResponse& upstream) override;
};

}  // namespace imgtx
