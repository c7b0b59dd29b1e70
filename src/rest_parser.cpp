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
#include "rest_parser.hpp"

#include <string>
#include <utility>

#include "logging.hpp"
#include "status.hpp"

namespace imgtx {

static const char* DATA_KEY = "data";

Status RestParser::parseInstance(rapidjson::Value& node, Instance& instance) {
    if (!node.IsObject()) {
        return StatusCode::REST_NAMED_INSTANCE_NOT_AN_OBJECT;
    }
    auto dataItr = node.FindMember(DATA_KEY);
    if (dataItr == node.MemberEnd()) {
        return StatusCode::REST_INSTANCE_DATA_MISSING;
    }
    if (!dataItr->value.IsString()) {
        return StatusCode::REST_INSTANCE_DATA_NOT_A_STRING;
    }
    instance.data = std::string(dataItr->value.GetString(), dataItr->value.GetStringLength());

    auto& allocator = instance.extensions.GetAllocator();
    for (auto& member : node.GetObject()) {
        if (member.name == DATA_KEY) {
            continue;
        }
        rapidjson::Value name(member.name, allocator);
        rapidjson::Value value(member.value, allocator);
        instance.extensions.AddMember(name, value, allocator);
    }
    return StatusCode::OK;
}

Status RestParser::parseInstances(rapidjson::Value& node) {
    if (!node.IsArray()) {
        return StatusCode::REST_INSTANCES_NOT_AN_ARRAY;
    }
    request.instances.clear();
    request.instances.reserve(node.GetArray().Size());
    for (auto& instanceNode : node.GetArray()) {
        Instance instance;
        auto status = parseInstance(instanceNode, instance);
        if (!status.ok()) {
            SPDLOG_DEBUG("Instance no. {} could not be parsed: {}", request.instances.size(), status.string());
            request.instances.clear();
            return status;
        }
        request.instances.emplace_back(std::move(instance));
    }
    return StatusCode::OK;
}

Status RestParser::parse(const char* json) {
    rapidjson::Document doc;
    if (doc.Parse(json).HasParseError()) {
        return StatusCode::JSON_INVALID;
    }
    if (!doc.IsObject()) {
        return StatusCode::REST_BODY_IS_NOT_AN_OBJECT;
    }
    auto instancesItr = doc.FindMember("instances");
    if (instancesItr == doc.MemberEnd()) {
        return StatusCode::REST_NO_INSTANCES_FOUND;
    }
    if (doc.MemberCount() > 1) {
        SPDLOG_DEBUG("Request contains {} top level members, only instances are used", doc.MemberCount());
    }
    return parseInstances(instancesItr->value);
}

}  // namespace imgtx
