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
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <rapidjson/document.h>

#include "../rest_utils.hpp"
#include "../status.hpp"
#include "test_utils.hpp"

using namespace imgtx;

class Base64DecodeTest : public ::testing::Test {};

TEST_F(Base64DecodeTest, Correct) {
    std::string bytes = "abcd";
    std::string decodedBytes;
    EXPECT_EQ(decodeBase64(bytes, decodedBytes), StatusCode::OK);
    EXPECT_EQ(decodedBytes, "i\xB7\x1D");
}

TEST_F(Base64DecodeTest, Text) {
    std::string decodedBytes;
    EXPECT_EQ(decodeBase64("aGVsbG8=", decodedBytes), StatusCode::OK);
    EXPECT_EQ(decodedBytes, "hello");
}

TEST_F(Base64DecodeTest, WrongLength) {
    std::string bytes = "abcde";
    std::string decodedBytes;
    EXPECT_EQ(decodeBase64(bytes, decodedBytes), StatusCode::REST_BASE64_DECODE_ERROR);
}

TEST_F(Base64DecodeTest, InvalidCharacters) {
    std::string decodedBytes;
    EXPECT_EQ(decodeBase64("not-base64!!", decodedBytes), StatusCode::REST_BASE64_DECODE_ERROR);
}

class MakeJsonFromInferenceRequestTest : public ::testing::Test {
protected:
    InferenceRequest request;
    std::string json;

    static Instance createDecodedInstance(shape_t shape, std::vector<float> data) {
        Instance instance;
        ImageTensor tensor;
        tensor.shape = std::move(shape);
        tensor.data = std::move(data);
        instance.data = std::move(tensor);
        return instance;
    }
};

TEST_F(MakeJsonFromInferenceRequestTest, EmptyInstances) {
    ASSERT_EQ(makeJsonFromInferenceRequest(request, &json), StatusCode::OK);
    EXPECT_EQ(json, R"({"instances":[]})");
}

TEST_F(MakeJsonFromInferenceRequestTest, EncodedDataWrittenAsString) {
    request.instances.push_back(createInstance("aGVsbG8="));
    ASSERT_EQ(makeJsonFromInferenceRequest(request, &json), StatusCode::OK);
    EXPECT_EQ(json, R"({"instances":[{"data":"aGVsbG8="}]})");
}

TEST_F(MakeJsonFromInferenceRequestTest, TensorWrittenAsNestedArrays) {
    request.instances.push_back(createDecodedInstance({1, 2, 3}, {0.0f, 1.0f, 2.0f, 3.0f, 4.0f, 5.0f}));
    ASSERT_EQ(makeJsonFromInferenceRequest(request, &json), StatusCode::OK);
    EXPECT_EQ(json, R"({"instances":[{"data":[[[0.0,1.0,2.0],[3.0,4.0,5.0]]]}]})");
}

TEST_F(MakeJsonFromInferenceRequestTest, ExtensionsWrittenAfterData) {
    Instance instance = createInstance("abcd");
    auto& allocator = instance.extensions.GetAllocator();
    instance.extensions.AddMember("key", "value", allocator);
    instance.extensions.AddMember("id", 7, allocator);
    request.instances.push_back(std::move(instance));
    ASSERT_EQ(makeJsonFromInferenceRequest(request, &json), StatusCode::OK);
    EXPECT_EQ(json, R"({"instances":[{"data":"abcd","key":"value","id":7}]})");
}

TEST_F(MakeJsonFromInferenceRequestTest, ShapeDataMismatch) {
    request.instances.push_back(createDecodedInstance({1, 2, 2}, {0.0f, 1.0f, 2.0f}));
    EXPECT_EQ(makeJsonFromInferenceRequest(request, &json), StatusCode::JSON_SERIALIZATION_ERROR);
}

TEST_F(MakeJsonFromInferenceRequestTest, EmptyShape) {
    request.instances.push_back(createDecodedInstance({}, {}));
    EXPECT_EQ(makeJsonFromInferenceRequest(request, &json), StatusCode::JSON_SERIALIZATION_ERROR);
}

TEST(ParseJsonDocumentTest, Valid) {
    rapidjson::Document document;
    ASSERT_EQ(parseJsonDocument(R"({"explanations":[1,2,3]})", document), StatusCode::OK);
    ASSERT_TRUE(document.IsObject());
    ASSERT_TRUE(document["explanations"].IsArray());
    EXPECT_EQ(document["explanations"].Size(), 3);
}

TEST(ParseJsonDocumentTest, Invalid) {
    rapidjson::Document document;
    EXPECT_EQ(parseJsonDocument("server error", document), StatusCode::JSON_INVALID);
    EXPECT_EQ(parseJsonDocument("", document), StatusCode::JSON_INVALID);
}

TEST(MakeJsonFromDocumentTest, WritesCompactJson) {
    rapidjson::Document document;
    ASSERT_EQ(parseJsonDocument(R"({ "predictions" : [ 0.5, 1 ] })", document), StatusCode::OK);
    std::string json;
    ASSERT_EQ(makeJsonFromDocument(document, &json), StatusCode::OK);
    EXPECT_EQ(json, R"({"predictions":[0.5,1]})");
}
