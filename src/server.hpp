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
#include <csignal>
#include <memory>
#include <mutex>

#include "server_settings.hpp"

namespace imgtx {
class Config;
class CppHttpLibHttpServer;
class CurlGlobalGuard;
class HttpClient;
class Model;
class Status;

class Server {
    mutable std::mutex startMtx;

    std::unique_ptr<CurlGlobalGuard> curlGuard;
    std::shared_ptr<Model> model;
    std::unique_ptr<CppHttpLibHttpServer> httpServer;

protected:
    Server();
    virtual std::shared_ptr<HttpClient> createHttpClient();

public:
    static Server& instance();
    int start(int argc, char** argv);
    Status start(ServerSettingsImpl*, ModelSettingsImpl*);
    bool isLive() const;
    const std::shared_ptr<Model>& getModel() const;

    int getShutdownStatus();
    void setShutdownRequest(int i);
    virtual ~Server();
    void shutdown();
};
}  // namespace imgtx
