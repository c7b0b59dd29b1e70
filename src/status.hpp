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
#include <unordered_map>
#include <utility>

namespace imgtx {

enum class StatusCode {
    OK, /*!< Success */

    JSON_INVALID,             /*!< The content is not valid json */
    JSON_SERIALIZATION_ERROR, /*!< Data serialization to json format failed */

    INTERNAL_ERROR,

    UNKNOWN_ERROR,

    NOT_IMPLEMENTED,

    // Model lookup
    MODEL_NAME_MISSING, /*!< Model with requested name is not found */

    // REST handler
    REST_INVALID_URL,        /*!< Malformed REST request url */
    REST_UNSUPPORTED_METHOD, /*!< Request sent with unsupported method */

    // REST Parse
    REST_BODY_IS_NOT_AN_OBJECT,        /*!< REST body should be JSON object */
    REST_NO_INSTANCES_FOUND,           /*!< Missing instances in request */
    REST_INSTANCES_NOT_AN_ARRAY,       /*!< Instances must be an array */
    REST_NAMED_INSTANCE_NOT_AN_OBJECT, /*!< Each instance needs to be an object */
    REST_INSTANCE_DATA_MISSING,        /*!< Instance lacks data field */
    REST_INSTANCE_DATA_NOT_A_STRING,   /*!< Instance data field is not a base64 string */
    REST_BASE64_DECODE_ERROR,          /*!< Error while decoding base64 REST binary input */

    // Binary inputs
    IMAGE_PARSING_FAILED,

    // Upstream calls
    UPSTREAM_HTTP_ERROR,       /*!< Upstream service responded with non 200 code */
    UPSTREAM_TIMEOUT,          /*!< Upstream service did not respond in time */
    UPSTREAM_UNAVAILABLE,      /*!< Could not connect to upstream service */
    UPSTREAM_INVALID_RESPONSE, /*!< Upstream service responded with body that is not valid json */

    // Server Start errors
    OPTIONS_USAGE_ERROR,
    FAILED_TO_START_REST_SERVER,

    STATUS_CODE_END
};

class Status {
    StatusCode code;
    std::unique_ptr<std::string> message;

    static const std::unordered_map<StatusCode, const std::string> statusMessageMap;

    void appendDetails(const std::string& details) {
        ensureMessageAllocated();
        *this->message += " - " + details;
    }

public:
    void ensureMessageAllocated() {
        if (nullptr == message) {
            message = std::make_unique<std::string>();
        }
    }

    Status(StatusCode code = StatusCode::OK) :
        code(code) {
        if (code == StatusCode::OK) {
            return;
        }
        auto it = statusMessageMap.find(code);
        if (it != statusMessageMap.end())
            this->message = std::make_unique<std::string>(it->second);
        else
            this->message = std::make_unique<std::string>("Undefined error");
    }

    Status(StatusCode code, const std::string& details) :
        Status(code) {
        appendDetails(details);
    }

    Status(const Status& rhs) :
        code(rhs.code),
        message(rhs.message != nullptr ? std::make_unique<std::string>(*(rhs.message)) : nullptr) {}

    Status(Status&& rhs) = default;

    Status& operator=(const Status& rhs) {
        this->code = rhs.code;
        this->message = (rhs.message != nullptr ? std::make_unique<std::string>(*rhs.message) : nullptr);
        return *this;
    }

    Status& operator=(Status&&) = default;

    bool ok() const {
        return code == StatusCode::OK;
    }

    StatusCode getCode() const {
        return this->code;
    }

    bool operator==(const Status& status) const {
        return this->code == status.code;
    }

    bool operator!=(const Status& status) const {
        return this->code != status.code;
    }

    const std::string& string() const {
        return this->message ? *this->message : statusMessageMap.at(code);
    }
    operator const std::string&() const {
        return this->string();
    }
};
}  // namespace imgtx
