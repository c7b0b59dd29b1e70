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
#include "server.hpp"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include <signal.h>
#include <sysexits.h>

#include "cli_parser.hpp"
#include "config.hpp"
#include "curl_http_client.hpp"
#include "cpphttplib_http_server.hpp"
#include "http_server.hpp"
#include "image_transformer.hpp"
#include "imgtx_exit_codes.hpp"
#include "logging.hpp"
#include "status.hpp"
#include "version.hpp"

namespace imgtx {
namespace {
volatile sig_atomic_t shutdown_request = 0;
}

Server& Server::instance() {
    static Server global;
    return global;
}

Server::Server() = default;

Server::~Server() {
    shutdown();
}

static void logConfig(const Config& config) {
    std::string project_name(PROJECT_NAME);
    std::string project_version(PROJECT_VERSION);
    SPDLOG_INFO(project_name + " " + project_version);
    SPDLOG_DEBUG("CLI parameters passed to imgtx server");
    SPDLOG_DEBUG("model_name: {}", config.modelName());
    SPDLOG_DEBUG("predictor_host: {}", config.predictorHost());
    SPDLOG_DEBUG("explainer_host: {}", config.getModelSettings().explainerHost.value_or(""));
    SPDLOG_DEBUG("mean: {}", config.getModelSettings().normalization.mean);
    SPDLOG_DEBUG("std: {}", config.getModelSettings().normalization.std);
    SPDLOG_DEBUG("rest_port: {}", config.restPort());
    SPDLOG_DEBUG("rest_bind_address: {}", config.restBindAddress());
    SPDLOG_DEBUG("rest_workers: {}", config.restWorkers());
    SPDLOG_DEBUG("log_level: {}", config.logLevel());
    SPDLOG_DEBUG("log_path: {}", config.logPath());
}

static void onInterrupt(int status) {
    shutdown_request = 1;
}

static void onTerminate(int status) {
    shutdown_request = 1;
}

static void onIllegal(int status) {
    shutdown_request = 2;
}

static void installSignalHandlers() {
    static struct sigaction sigIntHandler;
    sigIntHandler.sa_handler = onInterrupt;
    sigemptyset(&sigIntHandler.sa_mask);
    sigIntHandler.sa_flags = 0;
    sigaction(SIGINT, &sigIntHandler, NULL);

    static struct sigaction sigTermHandler;
    sigTermHandler.sa_handler = onTerminate;
    sigemptyset(&sigTermHandler.sa_mask);
    sigTermHandler.sa_flags = 0;
    sigaction(SIGTERM, &sigTermHandler, NULL);

    static struct sigaction sigIllHandler;
    sigIllHandler.sa_handler = onIllegal;
    sigemptyset(&sigIllHandler.sa_mask);
    sigIllHandler.sa_flags = 0;
    sigaction(SIGILL, &sigIllHandler, NULL);
}

int Server::getShutdownStatus() {
    return shutdown_request;
}

void Server::setShutdownRequest(int i) {
    shutdown_request = i;
}

bool Server::isLive() const {
    std::lock_guard<std::mutex> lock(startMtx);
    return httpServer != nullptr;
}

const std::shared_ptr<Model>& Server::getModel() const {
    return model;
}

std::shared_ptr<HttpClient> Server::createHttpClient() {
    return std::make_shared<CurlHttpClient>();
}

static int statusToExitCode(const Status& status) {
    if (status.ok()) {
        return IMGTX_EX_OK;
    } else if (status == StatusCode::OPTIONS_USAGE_ERROR) {
        return IMGTX_EX_USAGE;
    }
    return IMGTX_EX_FAILURE;
}

int Server::start(int argc, char** argv) {
    installSignalHandlers();

    try {
        CLIParser parser;
        ServerSettingsImpl serverSettings;
        ModelSettingsImpl modelSettings;
        parser.parse(argc, argv);
        parser.prepare(&serverSettings, &modelSettings);

        Status ret = start(&serverSettings, &modelSettings);
        if (!ret.ok()) {
            shutdown();
            return statusToExitCode(ret);
        }
        while (!shutdown_request) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        if (shutdown_request == 2) {
            SPDLOG_ERROR("Illegal operation. Server received SIGILL");
        }
        SPDLOG_INFO("Shutting down");
        shutdown();
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Exception; {}", e.what());
        return IMGTX_EX_FAILURE;
    }

    return EXIT_SUCCESS;
}

Status Server::start(ServerSettingsImpl* serverSettings, ModelSettingsImpl* modelSettings) {
    try {
        std::lock_guard<std::mutex> lock(startMtx);
        if (httpServer) {
            SPDLOG_ERROR("Cannot start server - server is already live");
            return StatusCode::INTERNAL_ERROR;
        }
        auto& config = imgtx::Config::instance();
        if (!config.parse(serverSettings, modelSettings))
            return StatusCode::OPTIONS_USAGE_ERROR;
        configure_logger(config.logLevel(), config.logPath());
        logConfig(config);

        if (!curlGuard) {
            curlGuard = std::make_unique<CurlGlobalGuard>();
        }
        model = std::make_shared<ImageTransformer>(config.getModelSettings(), createHttpClient(), transformer_logger);
        SPDLOG_INFO("Will start {} REST workers", config.restWorkers());
        httpServer = createAndStartHttpServer(config.restBindAddress(), config.restPort(), config.restWorkers(), model);
        if (httpServer == nullptr) {
            std::string msg = "Failed to start REST server under address " + config.restBindAddress() + ":" + std::to_string(config.restPort());
            SPDLOG_ERROR(msg);
            return Status(StatusCode::FAILED_TO_START_REST_SERVER, msg);
        }
        return StatusCode::OK;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Exception catch: {} - will now terminate.", e.what());
        return Status(StatusCode::INTERNAL_ERROR, e.what());
    }
}

void Server::shutdown() {
    std::lock_guard<std::mutex> lock(startMtx);
    if (httpServer) {
        SPDLOG_INFO("Shutting down REST server");
        httpServer->terminate();
        httpServer.reset();
    }
    model.reset();
}

}  // namespace imgtx
