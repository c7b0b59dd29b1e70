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

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace imgtx {

using shape_t = std::vector<size_t>;
using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Normalized image in CHW order, row-major.
 */
struct ImageTensor {
    shape_t shape;
    std::vector<float> data;

    size_t channels() const { return shape.size() == 3 ? shape[0] : 0; }
    size_t height() const { return shape.size() == 3 ? shape[1] : 0; }
    size_t width() const { return shape.size() == 3 ? shape[2] : 0; }
};

/**
 * @brief Single entry of "instances" array.
 *
 * Only "data" is interpreted. It holds base64 encoded image as received,
 * or normalized tensor after preprocessing. Remaining members of the JSON
 * object are kept untouched in extensions.
 */
struct Instance {
    std::variant<std::string, ImageTensor> data;
    rapidjson::Document extensions;

    Instance() {
        extensions.SetObject();
    }
    Instance(Instance&&) = default;
    Instance& operator=(Instance&&) = default;

    bool isDecoded() const { return std::holds_alternative<ImageTensor>(data); }
};

struct InferenceRequest {
    std::vector<Instance> instances;
};

}  // namespace imgtx
