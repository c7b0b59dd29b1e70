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
#include <optional>
#include <string>

namespace imgtx {

// MNIST dataset statistics
constexpr float DEFAULT_NORMALIZATION_MEAN = 0.1307f;
constexpr float DEFAULT_NORMALIZATION_STD = 0.3081f;

constexpr int64_t UPSTREAM_TIMEOUT_SECONDS = 100;

struct NormalizationSettingsImpl {
    float mean = DEFAULT_NORMALIZATION_MEAN;
    float std = DEFAULT_NORMALIZATION_STD;
};

struct ServerSettingsImpl {
    uint32_t restPort = 0;
    std::string restBindAddress = "0.0.0.0";
    std::optional<uint32_t> restWorkers;
    std::string logLevel = "INFO";
    std::string logPath;
};

struct ModelSettingsImpl {
    std::string modelName;
    std::string predictorHost;
    std::optional<std::string> explainerHost;
    NormalizationSettingsImpl normalization;
    int64_t timeoutSeconds = UPSTREAM_TIMEOUT_SECONDS;
};

}  // namespace imgtx
