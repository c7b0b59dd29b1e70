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
#include "image_conversion.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "logging.hpp"
#include "rest_utils.hpp"

namespace imgtx {

Status convertStringToMat(const std::string& imageBytes, cv::Mat& image) {
    if (imageBytes.empty()) {
        return Status(StatusCode::IMAGE_PARSING_FAILED, "empty image content");
    }
    std::vector<uint8_t> data(imageBytes.begin(), imageBytes.end());
    cv::Mat dataMat(data);

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(dataMat, cv::IMREAD_GRAYSCALE);
    } catch (const cv::Exception& e) {
        SPDLOG_DEBUG("Error during string to mat conversion: {}", e.what());
        return StatusCode::IMAGE_PARSING_FAILED;
    }
    if (decoded.empty()) {
        SPDLOG_DEBUG("Error during string to mat conversion: unrecognized image format");
        return StatusCode::IMAGE_PARSING_FAILED;
    }
    image = std::move(decoded);
    return StatusCode::OK;
}

Status normalizeImage(const cv::Mat& image, const NormalizationSettingsImpl& settings, ImageTensor& tensor) {
    if (image.empty() || image.channels() != 1 || image.depth() != CV_8U) {
        SPDLOG_DEBUG("Normalization requires single channel 8-bit image, got channels: {} depth: {}", image.channels(), image.depth());
        return StatusCode::INTERNAL_ERROR;
    }
    cv::Mat scaled;
    image.convertTo(scaled, CV_32F, 1.0 / 255.0);
    cv::Mat normalized = (scaled - cv::Scalar(settings.mean)) / static_cast<double>(settings.std);

    tensor.shape = {1, static_cast<size_t>(normalized.rows), static_cast<size_t>(normalized.cols)};
    tensor.data.clear();
    tensor.data.reserve(normalized.total());
    for (int row = 0; row < normalized.rows; ++row) {
        const float* rowPtr = normalized.ptr<float>(row);
        tensor.data.insert(tensor.data.end(), rowPtr, rowPtr + normalized.cols);
    }
    return StatusCode::OK;
}

Status transformImage(Instance& instance, const NormalizationSettingsImpl& settings, const std::shared_ptr<spdlog::logger>& logger) {
    auto encoded = std::get_if<std::string>(&instance.data);
    if (encoded == nullptr) {
        return StatusCode::REST_INSTANCE_DATA_NOT_A_STRING;
    }
    std::string imageBytes;
    auto status = decodeBase64(*encoded, imageBytes);
    if (!status.ok()) {
        SPDLOG_LOGGER_DEBUG(logger, "Instance data is not valid base64");
        return status;
    }
    cv::Mat image;
    status = convertStringToMat(imageBytes, image);
    if (!status.ok()) {
        return status;
    }
    ImageTensor tensor;
    status = normalizeImage(image, settings, tensor);
    if (!status.ok()) {
        return status;
    }
    instance.data = std::move(tensor);

    const auto& decoded = std::get<ImageTensor>(instance.data);
    SPDLOG_LOGGER_INFO(logger, "Image decoded into tensor of shape {}", fmt::join(decoded.shape, "x"));
    // full tensor can be large, dumped only on trace
    if (logger->should_log(spdlog::level::trace)) {
        std::string instanceJson;
        if (makeJsonFromInstance(instance, &instanceJson).ok()) {
            SPDLOG_LOGGER_TRACE(logger, "Transformed instance: {}", instanceJson);
        }
    }
    return StatusCode::OK;
}

}  // namespace imgtx
