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
#include "logging.hpp"

#include <vector>

namespace imgtx {

std::shared_ptr<spdlog::logger> transformer_logger = std::make_shared<spdlog::logger>("transformer");
std::shared_ptr<spdlog::logger> upstream_logger = std::make_shared<spdlog::logger>("upstream");

const std::string default_pattern = "[%Y-%m-%d %T.%f][%t][%n][%l][%s:%#] %v";

static void set_log_level(const std::string log_level, std::shared_ptr<spdlog::logger> logger) {
    logger->set_level(spdlog::level::info);
    if (!log_level.empty()) {
        if (log_level == "DEBUG") {
            logger->set_level(spdlog::level::debug);
            logger->flush_on(spdlog::level::debug);
        } else if (log_level == "ERROR") {
            logger->set_level(spdlog::level::err);
            logger->flush_on(spdlog::level::err);
        } else if (log_level == "WARNING") {
            logger->set_level(spdlog::level::warn);
            logger->flush_on(spdlog::level::warn);
        } else if (log_level == "TRACE") {
            logger->set_level(spdlog::level::trace);
            logger->flush_on(spdlog::level::trace);
        }
    }
}

static void register_loggers(const std::string& log_level, std::vector<spdlog::sink_ptr> sinks) {
    auto serving_logger = std::make_shared<spdlog::logger>("serving", begin(sinks), end(sinks));
    serving_logger->set_pattern(default_pattern);
    for (auto& sink : sinks) {
        transformer_logger->sinks().push_back(sink);
        upstream_logger->sinks().push_back(sink);
    }
    // pattern is applied to sinks, so it has to be set after they are attached
    transformer_logger->set_pattern(default_pattern);
    upstream_logger->set_pattern(default_pattern);
    set_log_level(log_level, serving_logger);
    set_log_level(log_level, transformer_logger);
    set_log_level(log_level, upstream_logger);
    spdlog::set_default_logger(serving_logger);
}

void configure_logger(const std::string& log_level, const std::string& log_path) {
    static bool wasRun = false;
    if (wasRun) {
        SPDLOG_WARN("Tried to configure loggers twice. Keeping previous settings.");
        return;
    }
    wasRun = true;
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    if (!log_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path));
    }
    register_loggers(log_level, sinks);
}

}  // namespace imgtx
