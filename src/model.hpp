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

#include "http_client.hpp"
#include "inference_request.hpp"

namespace imgtx {
class Status;

/**
 * @brief Set of request hooks invoked by the REST frontend
 *
 * Request flow is preprocess -> predict or explain -> postprocess.
 */
class Model {
public:
    virtual ~Model() = default;

    virtual const std::string& getName() const = 0;

    /**
     * @brief Transforms request before it is sent to backend
     *
     * @param request
     * @param headers
     * @param processed receives transformed request, untouched on failure
     */
    virtual Status preprocess(const InferenceRequest& request, const HttpHeaders& headers, InferenceRequest& processed) = 0;

    /**
     * @param upstream receives code and body of backend response, if any was received
     */
    virtual Status predict(const InferenceRequest& request, const HttpHeaders& headers, rapidjson::Document& response, HttpClientResponse& upstream) = 0;

    virtual Status postprocess(rapidjson::Document& response) = 0;

    /**
     * @param upstream receives code and body of backend response, if any was received
     */
    virtual Status explain(const InferenceRequest& request, const HttpHeaders& headers, rapidjson::Document& response, HttpClientResponse& upstream) = 0;
};

}  // namespace imgtx
