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

namespace imgtx {
class Status;

/**
 * @brief This class encapsulates http request body string parsing to InferenceRequest.
 */
class RestParser {
    InferenceRequest request;

    /**
     * @brief Parses single instance object
     *
     * Rapid json node expected to be passed in following structure:
     * {
     *     "data": "<base64 encoded image>",
     *     "other_key": ...,
     *     ...
     * }
     */
    Status parseInstance(rapidjson::Value& node, Instance& instance);

    Status parseInstances(rapidjson::Value& node);

public:
    /**
     * @brief Parses http request body
     *
     * @param json request body
     *
     * @return Status indicating if processing succeeded, error code otherwise
     */
    Status parse(const char* json);

    InferenceRequest& getRequest() {
        return request;
    }
};

}  // namespace imgtx
