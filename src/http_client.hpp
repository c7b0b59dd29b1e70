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

#include <cstdint>
#include <string>

#include "inference_request.hpp"

namespace imgtx {
class Status;

struct HttpClientResponse {
    long code = 0;
    std::string body;
    std::string contentType;
};

/**
 * @brief Outbound HTTP calls to predictor and explainer services.
 *
 * Implementations must be safe to call from multiple REST worker threads.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Sends POST request and waits for the response
     *
     * @param url
     * @param body
     * @param headers
     * @param timeoutSeconds
     * @param response filled with status code and body when any response was received
     *
     * @return StatusCode::OK if upstream responded (with any HTTP code),
     * UPSTREAM_TIMEOUT or UPSTREAM_UNAVAILABLE otherwise
     */
    virtual Status post(const std::string& url, const std::string& body, const HttpHeaders& headers, int64_t timeoutSeconds, HttpClientResponse& response) = 0;
};

}  // namespace imgtx
