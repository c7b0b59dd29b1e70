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
#include "curl_http_client.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>

#include "logging.hpp"
#include "status.hpp"
#include "version.hpp"

namespace imgtx {

static size_t appendChunkCallback(void* receivedChunk, size_t size, size_t nmemb, void* body) {
    size_t realsize = size * nmemb;
    auto& mem = *static_cast<std::string*>(body);
    mem.append(static_cast<char*>(receivedChunk), realsize);
    return realsize;
}

#define CHECK_CURL_CALL(call)                                                                                                 \
    do {                                                                                                                      \
        CURLcode curlCode = call;                                                                                             \
        if (curlCode != CURLE_OK) {                                                                                           \
            SPDLOG_LOGGER_ERROR(upstream_logger, "curl error: {}. Error code: {}", curl_easy_strerror(curlCode), (int)curlCode); \
            return StatusCode::INTERNAL_ERROR;                                                                                \
        }                                                                                                                     \
    } while (0)

Status CurlHttpClient::post(const std::string& url, const std::string& body, const HttpHeaders& headers, int64_t timeoutSeconds, HttpClientResponse& response) {
    std::string agentString = std::string(PROJECT_NAME) + "/" + std::string(PROJECT_VERSION);

    CURL* curl = curl_easy_init();
    if (!curl) {
        SPDLOG_LOGGER_ERROR(upstream_logger, "Failed to initialize cURL.");
        return StatusCode::INTERNAL_ERROR;
    }
    auto handleGuard = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>(curl, curl_easy_cleanup);

    struct curl_slist* headerList = nullptr;
    for (const auto& [name, value] : headers) {
        struct curl_slist* extended = curl_slist_append(headerList, (name + ": " + value).c_str());
        if (!extended) {
            curl_slist_free_all(headerList);
            SPDLOG_LOGGER_ERROR(upstream_logger, "Failed to prepare request headers");
            return StatusCode::INTERNAL_ERROR;
        }
        headerList = extended;
    }
    auto headersGuard = std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>(headerList, curl_slist_free_all);

    std::string responseBody;
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_URL, url.c_str()));
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_POST, 1L));
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str()));
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size())));
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList));
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendChunkCallback));
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody));
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_USERAGENT, agentString.c_str()));
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds)));
    // called from REST worker threads, signals cannot be used for timeouts
    CHECK_CURL_CALL(curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L));

    SPDLOG_LOGGER_DEBUG(upstream_logger, "Sending POST {} body: {} bytes timeout: {}s", url, body.size(), timeoutSeconds);
    CURLcode performCode = curl_easy_perform(curl);
    if (performCode == CURLE_OPERATION_TIMEDOUT) {
        SPDLOG_LOGGER_ERROR(upstream_logger, "Request to {} timed out after {} seconds", url, timeoutSeconds);
        return Status(StatusCode::UPSTREAM_TIMEOUT, url);
    }
    if (performCode != CURLE_OK) {
        SPDLOG_LOGGER_ERROR(upstream_logger, "Request to {} failed: {}", url, curl_easy_strerror(performCode));
        return Status(StatusCode::UPSTREAM_UNAVAILABLE, curl_easy_strerror(performCode));
    }
    long httpCode = 0;
    CHECK_CURL_CALL(curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode));
    SPDLOG_LOGGER_DEBUG(upstream_logger, "Response from {}: code {} body: {} bytes", url, httpCode, responseBody.size());
    char* contentType = nullptr;
    CHECK_CURL_CALL(curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &contentType));
    response.code = httpCode;
    response.body = std::move(responseBody);
    response.contentType = contentType ? contentType : "";
    return StatusCode::OK;
}

CurlGlobalGuard::CurlGlobalGuard() {
    CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw std::runtime_error{std::string("curl_global_init failed: ") + curl_easy_strerror(code)};
    }
}

CurlGlobalGuard::~CurlGlobalGuard() {
    curl_global_cleanup();
}

}  // namespace imgtx
