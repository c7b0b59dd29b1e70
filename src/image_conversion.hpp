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

#include <opencv2/core.hpp>

#include "inference_request.hpp"
#include "server_settings.hpp"
#include "status.hpp"

namespace spdlog {
class logger;
}

namespace imgtx {

/**
 * @brief Decodes encoded image bytes (png, jpeg, bmp...) into single channel 8-bit matrix.
 */
Status convertStringToMat(const std::string& imageBytes, cv::Mat& image);

/**
 * @brief Converts single channel image into {1, H, W} float tensor.
 *
 * Every pixel is scaled to [0, 1] and then normalized as (value - mean) / std.
 */
Status normalizeImage(const cv::Mat& image, const NormalizationSettingsImpl& settings, ImageTensor& tensor);

/**
 * @brief Replaces base64 encoded image in instance data with normalized tensor.
 *
 * Instance is left unchanged if decoding fails.
 */
Status transformImage(Instance& instance, const NormalizationSettingsImpl& settings, const std::shared_ptr<spdlog::logger>& logger);

}  // namespace imgtx
