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
#include "cpphttplib_http_server.hpp"

#include <chrono>
#include <utility>

#include <httplib.h>

#include "logging.hpp"

namespace imgtx {

CppHttpLibHttpServer::CppHttpLibHttpServer(size_t num_workers, int port, const std::string& address) :
    num_workers(num_workers),
    port_(port),
    address_(address),
    server_(std::make_unique<httplib::Server>()) {
    SPDLOG_DEBUG("Creating thread pool ({} threads)", num_workers);
    server_->new_task_queue = [num_workers] {
        return new httplib::ThreadPool(num_workers);
    };
}

CppHttpLibHttpServer::~CppHttpLibHttpServer() {
    terminate();
}

bool CppHttpLibHttpServer::startAcceptingRequests() {
    SPDLOG_DEBUG("CppHttpLibHttpServer::startAcceptingRequests()");

    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        auto start = std::chrono::high_resolution_clock::now();

        this->dispatcher_(req, res);

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        SPDLOG_DEBUG("CppHttpLibHttpServer request handling took {} milliseconds", duration.count() / 1000.f);
    };
    // routing is done by dispatcher, unsupported methods are reported there
    server_->Get(R"(/.*)", handler);
    server_->Post(R"(/.*)", handler);
    server_->Put(R"(/.*)", handler);
    server_->Delete(R"(/.*)", handler);

    if (!server_->bind_to_port(address_, port_)) {
        SPDLOG_ERROR("Failed to bind cpp-httplib server to {}:{}", address_, port_);
        return false;
    }
    listener_ = std::thread([this] {
        SPDLOG_DEBUG("Starting to listen on port {}", port_);
        server_->listen_after_bind();
        SPDLOG_DEBUG("Stopped listening");
    });

    server_->wait_until_ready();
    if (!server_->is_running()) {
        SPDLOG_ERROR("Failed to start cpp-httplib server on port {}", port_);
        terminate();
        return false;
    }

    SPDLOG_INFO("REST server listening on port {} with {} threads", port_, num_workers);
    return true;
}

void CppHttpLibHttpServer::terminate() {
    SPDLOG_DEBUG("CppHttpLibHttpServer::terminate()");
    if (server_) {
        server_->stop();
    }
    if (listener_.joinable()) {
        listener_.join();  // task queue shutdown waits for workers
    }
}

void CppHttpLibHttpServer::registerRequestDispatcher(
    std::function<void(
        const httplib::Request& req, httplib::Response& res)>
        dispatcher) {
    dispatcher_ = std::move(dispatcher);
}

}  // namespace imgtx
