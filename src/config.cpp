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
#include "config.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <regex>
#include <thread>
#include <vector>

#include <netdb.h>

#include "cli_parser.hpp"
#include "imgtx_exit_codes.hpp"
#include "stringutils.hpp"

namespace imgtx {

const uint32_t AVAILABLE_CORES = std::thread::hardware_concurrency();
const uint32_t MAX_PORT_NUMBER = std::numeric_limits<uint16_t>::max();

const uint64_t DEFAULT_REST_WORKERS = std::max<uint32_t>(AVAILABLE_CORES, 2);
const uint64_t MAX_REST_WORKERS = 10'000;

Config& Config::parse(int argc, char** argv) {
    imgtx::CLIParser parser;
    imgtx::ServerSettingsImpl serverSettings;
    imgtx::ModelSettingsImpl modelSettings;
    parser.parse(argc, argv);
    parser.prepare(&serverSettings, &modelSettings);
    if (!this->parse(&serverSettings, &modelSettings))
        exit(IMGTX_EX_USAGE);
    return *this;
}

bool Config::parse(ServerSettingsImpl* serverSettings, ModelSettingsImpl* modelSettings) {
    this->serverSettings = *serverSettings;
    this->modelSettings = *modelSettings;
    return validate();
}

bool Config::is_ipv6(const std::string& s) {
    addrinfo hints{};
    hints.ai_family = AF_INET6;
    hints.ai_flags = AI_NUMERICHOST;
    addrinfo* res = nullptr;
    const int rc = getaddrinfo(s.c_str(), nullptr, &hints, &res);
    if (res) {
        freeaddrinfo(res);
    }
    return rc == 0;
}

bool Config::check_hostname_or_ip(const std::string& input) {
    auto split = imgtx::tokenize(input, ',');
    if (split.size() > 1) {
        for (const auto& part : split) {
            if (!check_hostname_or_ip(part)) {
                return false;
            }
        }
        return true;
    }

    if (input.size() > 255) {
        return false;
    }
    bool all_numeric = true;
    for (char c : input) {
        if (c == '.' || c == ':') {
            continue;
        }
        if (!::isxdigit(c)) {
            all_numeric = false;
        }
    }
    if (all_numeric) {
        static const std::regex valid_ipv4_regex("^(([0-9]|[1-9][0-9]|1[0-9]{2}|2[0-4][0-9]|25[0-5])\\.){3}([0-9]|[1-9][0-9]|1[0-9]{2}|2[0-4][0-9]|25[0-5])$");
        return std::regex_match(input, valid_ipv4_regex) || is_ipv6(input);
    } else {
        static const std::regex valid_hostname_regex("^(([a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9\\-]*[a-zA-Z0-9])\\.)*([A-Za-z0-9]|[A-Za-z0-9][A-Za-z0-9\\-]*[A-Za-z0-9])$");
        return std::regex_match(input, valid_hostname_regex);
    }
}

bool Config::check_service_address(const std::string& input) {
    std::string host = input;
    std::string port;
    if (!input.empty() && input.front() == '[') {
        // [ipv6]:port
        auto closing = input.find(']');
        if (closing == std::string::npos) {
            return false;
        }
        host = input.substr(1, closing - 1);
        std::string rest = input.substr(closing + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return false;
            }
            port = rest.substr(1);
            if (port.empty()) {
                return false;
            }
        }
        if (!is_ipv6(host)) {
            return false;
        }
    } else {
        auto colon = input.rfind(':');
        if (colon != std::string::npos) {
            host = input.substr(0, colon);
            port = input.substr(colon + 1);
            if (port.empty()) {
                return false;
            }
        }
        if (host.empty() || host.find(',') != std::string::npos || !check_hostname_or_ip(host)) {
            return false;
        }
    }
    if (!port.empty()) {
        auto portNumber = stou32(port);
        if (!portNumber.has_value() || portNumber.value() == 0 || portNumber.value() > MAX_PORT_NUMBER) {
            return false;
        }
    }
    return true;
}

bool Config::validate() {
    if (modelName().empty()) {
        std::cerr << "model_name parameter is required" << std::endl;
        return false;
    }

    if (predictorHost().empty()) {
        std::cerr << "predictor_host parameter is required" << std::endl;
        return false;
    }

    if (!check_service_address(predictorHost())) {
        std::cerr << "predictor_host has invalid format: hostname or IP address with optional port expected." << std::endl;
        return false;
    }

    if (this->modelSettings.explainerHost.has_value() && !check_service_address(this->modelSettings.explainerHost.value())) {
        std::cerr << "explainer_host has invalid format: hostname or IP address with optional port expected." << std::endl;
        return false;
    }

    if (restPort() == 0) {
        std::cerr << "rest_port parameter is required" << std::endl;
        return false;
    }

    if (restPort() > MAX_PORT_NUMBER) {
        std::cerr << "rest_port number out of range from 1 to " << MAX_PORT_NUMBER << std::endl;
        return false;
    }

    // check rest_workers value
    if (((restWorkers() > MAX_REST_WORKERS) || (restWorkers() < 2))) {
        std::cerr << "rest_workers count should be from 2 to " << MAX_REST_WORKERS << std::endl;
        return false;
    }

    // check bind address:
    if (!restBindAddress().empty() && check_hostname_or_ip(restBindAddress()) == false) {
        std::cerr << "rest_bind_address has invalid format: proper hostname or IP address expected." << std::endl;
        return false;
    }

    // check normalization values
    const auto& normalization = this->modelSettings.normalization;
    if (!std::isfinite(normalization.mean)) {
        std::cerr << "mean has to be a finite number" << std::endl;
        return false;
    }
    if (!std::isfinite(normalization.std) || normalization.std == 0.0f) {
        std::cerr << "std has to be a finite, non-zero number" << std::endl;
        return false;
    }

    // check log_level values
    std::vector v({"TRACE", "DEBUG", "INFO", "WARNING", "ERROR"});
    if (std::find(v.begin(), v.end(), logLevel()) == v.end()) {
        std::cerr << "log_level should be one of: TRACE, DEBUG, INFO, WARNING, ERROR" << std::endl;
        return false;
    }
    return true;
}

uint32_t Config::restPort() const { return this->serverSettings.restPort; }
const std::string& Config::restBindAddress() const { return this->serverSettings.restBindAddress; }
uint32_t Config::restWorkers() const { return this->serverSettings.restWorkers.value_or(DEFAULT_REST_WORKERS); }
const std::string& Config::logLevel() const { return this->serverSettings.logLevel; }
const std::string& Config::logPath() const { return this->serverSettings.logPath; }
const std::string& Config::modelName() const { return this->modelSettings.modelName; }
const std::string& Config::predictorHost() const { return this->modelSettings.predictorHost; }

}  // namespace imgtx
