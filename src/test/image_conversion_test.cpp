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
#include <memory>
#include <string>
#include <variant>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../image_conversion.hpp"
#include "../logging.hpp"
#include "../status.hpp"
#include "test_utils.hpp"

using namespace imgtx;

class ConvertStringToMatTest : public ::testing::Test {};

TEST_F(ConvertStringToMatTest, Png) {
    cv::Mat source = createGradientImage(4, 5);
    cv::Mat image;
    ASSERT_EQ(convertStringToMat(encodeImage(source, ".png"), image), StatusCode::OK);
    EXPECT_EQ(image.rows, 4);
    EXPECT_EQ(image.cols, 5);
    EXPECT_EQ(image.channels(), 1);
    EXPECT_EQ(image.depth(), CV_8U);
    EXPECT_EQ(cv::countNonZero(image != source), 0);
}

TEST_F(ConvertStringToMatTest, Bmp) {
    cv::Mat source = createGradientImage(3, 3);
    cv::Mat image;
    ASSERT_EQ(convertStringToMat(encodeImage(source, ".bmp"), image), StatusCode::OK);
    EXPECT_EQ(cv::countNonZero(image != source), 0);
}

TEST_F(ConvertStringToMatTest, ColorImageReducedToSingleChannel) {
    cv::Mat color(6, 7, CV_8UC3, cv::Scalar(10, 120, 250));
    cv::Mat image;
    ASSERT_EQ(convertStringToMat(encodeImage(color, ".png"), image), StatusCode::OK);
    EXPECT_EQ(image.rows, 6);
    EXPECT_EQ(image.cols, 7);
    EXPECT_EQ(image.channels(), 1);
}

TEST_F(ConvertStringToMatTest, NotAnImage) {
    cv::Mat image;
    EXPECT_EQ(convertStringToMat("hello", image), StatusCode::IMAGE_PARSING_FAILED);
    EXPECT_TRUE(image.empty());
}

TEST_F(ConvertStringToMatTest, Empty) {
    cv::Mat image;
    EXPECT_EQ(convertStringToMat("", image), StatusCode::IMAGE_PARSING_FAILED);
}

class NormalizeImageTest : public ::testing::Test {};

TEST_F(NormalizeImageTest, Values) {
    cv::Mat image = createGradientImage(2, 3);
    image.at<uint8_t>(1, 2) = 255;
    ImageTensor tensor;
    ASSERT_EQ(normalizeImage(image, NormalizationSettingsImpl{}, tensor), StatusCode::OK);
    ASSERT_EQ(tensor.shape, shape_t({1, 2, 3}));
    ASSERT_EQ(tensor.data.size(), 6);
    EXPECT_NEAR(tensor.data[0], (0.0f - 0.1307f) / 0.3081f, 1e-5);
    EXPECT_NEAR(tensor.data[1], (1.0f / 255.0f - 0.1307f) / 0.3081f, 1e-5);
    EXPECT_NEAR(tensor.data[5], (1.0f - 0.1307f) / 0.3081f, 1e-5);
    for (int i = 0; i < 5; ++i) {
        EXPECT_NEAR(tensor.data[i], expectedNormalizedValue(static_cast<uint8_t>(i)), 1e-5);
    }
}

TEST_F(NormalizeImageTest, RowMajorOrder) {
    cv::Mat image(2, 2, CV_8UC1);
    image.at<uint8_t>(0, 0) = 0;
    image.at<uint8_t>(0, 1) = 50;
    image.at<uint8_t>(1, 0) = 100;
    image.at<uint8_t>(1, 1) = 200;
    ImageTensor tensor;
    ASSERT_EQ(normalizeImage(image, NormalizationSettingsImpl{}, tensor), StatusCode::OK);
    EXPECT_NEAR(tensor.data[1], expectedNormalizedValue(50), 1e-5);
    EXPECT_NEAR(tensor.data[2], expectedNormalizedValue(100), 1e-5);
    EXPECT_NEAR(tensor.data[3], expectedNormalizedValue(200), 1e-5);
}

TEST_F(NormalizeImageTest, CustomSettings) {
    cv::Mat image(1, 1, CV_8UC1, cv::Scalar(255));
    NormalizationSettingsImpl settings;
    settings.mean = 0.5f;
    settings.std = 0.5f;
    ImageTensor tensor;
    ASSERT_EQ(normalizeImage(image, settings, tensor), StatusCode::OK);
    EXPECT_NEAR(tensor.data[0], 1.0f, 1e-5);
}

TEST_F(NormalizeImageTest, Deterministic) {
    cv::Mat image = createGradientImage(8, 8);
    ImageTensor first, second;
    ASSERT_EQ(normalizeImage(image, NormalizationSettingsImpl{}, first), StatusCode::OK);
    ASSERT_EQ(normalizeImage(image, NormalizationSettingsImpl{}, second), StatusCode::OK);
    EXPECT_EQ(first.shape, second.shape);
    EXPECT_EQ(first.data, second.data);
}

TEST_F(NormalizeImageTest, MultiChannelRejected) {
    cv::Mat image(2, 2, CV_8UC3, cv::Scalar(1, 2, 3));
    ImageTensor tensor;
    EXPECT_EQ(normalizeImage(image, NormalizationSettingsImpl{}, tensor), StatusCode::INTERNAL_ERROR);
}

class TransformImageTest : public ::testing::Test {
protected:
    NormalizationSettingsImpl settings;
};

TEST_F(TransformImageTest, ReplacesDataWithTensor) {
    cv::Mat source = createGradientImage(28, 28);
    Instance instance = createInstance(encodeImageBase64(source));
    ASSERT_EQ(transformImage(instance, settings, transformer_logger), StatusCode::OK);
    ASSERT_TRUE(instance.isDecoded());
    const auto& tensor = std::get<ImageTensor>(instance.data);
    EXPECT_EQ(tensor.shape, shape_t({1, 28, 28}));
    EXPECT_EQ(tensor.channels(), 1);
    EXPECT_EQ(tensor.height(), 28);
    EXPECT_EQ(tensor.width(), 28);
    ASSERT_EQ(tensor.data.size(), 28 * 28);
    EXPECT_NEAR(tensor.data[0], expectedNormalizedValue(0), 1e-5);
    EXPECT_NEAR(tensor.data[100], expectedNormalizedValue(100), 1e-5);
}

TEST_F(TransformImageTest, Deterministic) {
    std::string encoded = encodeImageBase64(createGradientImage(5, 9));
    Instance first = createInstance(encoded);
    Instance second = createInstance(encoded);
    ASSERT_EQ(transformImage(first, settings, transformer_logger), StatusCode::OK);
    ASSERT_EQ(transformImage(second, settings, transformer_logger), StatusCode::OK);
    EXPECT_EQ(std::get<ImageTensor>(first.data).data, std::get<ImageTensor>(second.data).data);
}

TEST_F(TransformImageTest, ColorImage) {
    cv::Mat color(10, 12, CV_8UC3, cv::Scalar(30, 60, 90));
    Instance instance = createInstance(encodeImageBase64(color));
    ASSERT_EQ(transformImage(instance, settings, transformer_logger), StatusCode::OK);
    EXPECT_EQ(std::get<ImageTensor>(instance.data).shape, shape_t({1, 10, 12}));
}

TEST_F(TransformImageTest, InvalidBase64LeavesInstanceUnchanged) {
    Instance instance = createInstance("not-base64!!");
    EXPECT_EQ(transformImage(instance, settings, transformer_logger), StatusCode::REST_BASE64_DECODE_ERROR);
    ASSERT_FALSE(instance.isDecoded());
    EXPECT_EQ(std::get<std::string>(instance.data), "not-base64!!");
}

TEST_F(TransformImageTest, NotAnImage) {
    Instance instance = createInstance("aGVsbG8=");
    EXPECT_EQ(transformImage(instance, settings, transformer_logger), StatusCode::IMAGE_PARSING_FAILED);
    EXPECT_FALSE(instance.isDecoded());
}

TEST_F(TransformImageTest, AlreadyDecoded) {
    Instance instance;
    instance.data = ImageTensor{};
    EXPECT_EQ(transformImage(instance, settings, transformer_logger), StatusCode::REST_INSTANCE_DATA_NOT_A_STRING);
}
