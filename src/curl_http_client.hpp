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

#include "http_client.hpp"

namespace imgtx {

/**
 * @brief libcurl based client, each call uses its own easy handle.
 *
 * curl_global_init has to be called once before first request,
 * see CurlGlobalGuard.
 */
class CurlHttpClient : public HttpClient {
public:
    Status post(const std::string& url, const std::string& body, const HttpHeaders& headers, int64_t timeoutSeconds, HttpClientResponse& response) override;
};

class CurlGlobalGuard {
public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();
    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

}  // namespace imgtx
