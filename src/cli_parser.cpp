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
#include "cli_parser.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include "imgtx_exit_codes.hpp"
#include "server_settings.hpp"
#include "version.hpp"

namespace imgtx {

void CLIParser::parse(int argc, char** argv) {
    try {
        options = std::make_unique<cxxopts::Options>(argv[0], PROJECT_NAME);

        // clang-format off
        options->add_options()
            ("h, help",
                "Show this help message and exit")
            ("version",
                "Show binary version")
            ("rest_port",
                "REST server port",
                cxxopts::value<uint32_t>()->default_value("0"),
                "REST_PORT")
            ("rest_bind_address",
                "Network interface address to bind to for the REST API",
                cxxopts::value<std::string>()->default_value("0.0.0.0"),
                "REST_BIND_ADDRESS")
            ("rest_workers",
                "Number of worker threads in REST server. Default value depends on number of CPUs.",
                cxxopts::value<uint32_t>(),
                "REST_WORKERS")
            ("log_level",
                "serving log level - one of TRACE, DEBUG, INFO, WARNING, ERROR",
                cxxopts::value<std::string>()->default_value("INFO"), "LOG_LEVEL")
            ("log_path",
                "Optional path to the log file",
                cxxopts::value<std::string>(), "LOG_PATH");

        options->add_options("model")
            ("model_name",
                "Name of the model served under /v1/models/<model_name>",
                cxxopts::value<std::string>(),
                "MODEL_NAME")
            ("predictor_host",
                "Predictor service address in form host[:port]",
                cxxopts::value<std::string>(),
                "PREDICTOR_HOST")
            ("explainer_host",
                "Explainer service address in form host[:port]. Defaults to predictor_host",
                cxxopts::value<std::string>(),
                "EXPLAINER_HOST")
            ("mean",
                "Mean subtracted from every pixel scaled to [0, 1]",
                cxxopts::value<float>()->default_value(std::to_string(DEFAULT_NORMALIZATION_MEAN)),
                "MEAN")
            ("std",
                "Standard deviation every pixel is divided by after mean subtraction",
                cxxopts::value<float>()->default_value(std::to_string(DEFAULT_NORMALIZATION_STD)),
                "STD");
        // clang-format on

        result = std::make_unique<cxxopts::ParseResult>(options->parse(argc, argv));

        if (result->count("version")) {
            std::string project_name(PROJECT_NAME);
            std::string project_version(PROJECT_VERSION);
            std::cout << project_name + " " + project_version << std::endl;
            exit(IMGTX_EX_OK);
        }

        if (result->count("help") || result->arguments().size() == 0) {
            std::cout << options->help({"", "model"}) << std::endl;
            exit(IMGTX_EX_OK);
        }
    } catch (const std::exception& e) {
        std::cerr << "error parsing options: " << e.what() << std::endl;
        exit(IMGTX_EX_USAGE);
    }
}

void CLIParser::prepare(ServerSettingsImpl* serverSettings, ModelSettingsImpl* modelSettings) {
    if (nullptr == result) {
        throw std::logic_error("Tried to prepare server and model settings without parse result");
    }
    prepareServer(*serverSettings);
    prepareModel(*modelSettings);
}

void CLIParser::prepareServer(ServerSettingsImpl& serverSettings) {
    serverSettings.restPort = result->operator[]("rest_port").as<uint32_t>();

    if (result->count("rest_bind_address"))
        serverSettings.restBindAddress = result->operator[]("rest_bind_address").as<std::string>();

    if (result->count("rest_workers"))
        serverSettings.restWorkers = result->operator[]("rest_workers").as<uint32_t>();

    if (result->count("log_level"))
        serverSettings.logLevel = result->operator[]("log_level").as<std::string>();
    if (result->count("log_path"))
        serverSettings.logPath = result->operator[]("log_path").as<std::string>();
}

void CLIParser::prepareModel(ModelSettingsImpl& modelSettings) {
    if (result->count("model_name"))
        modelSettings.modelName = result->operator[]("model_name").as<std::string>();

    if (result->count("predictor_host"))
        modelSettings.predictorHost = result->operator[]("predictor_host").as<std::string>();

    if (result->count("explainer_host")) {
        modelSettings.explainerHost = result->operator[]("explainer_host").as<std::string>();
    } else if (!modelSettings.predictorHost.empty()) {
        // predictor serves explain endpoint as well
        modelSettings.explainerHost = modelSettings.predictorHost;
    }

    modelSettings.normalization.mean = result->operator[]("mean").as<float>();
    modelSettings.normalization.std = result->operator[]("std").as<float>();
}

}  // namespace imgtx
