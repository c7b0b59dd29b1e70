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
#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <httplib.h>

#include "../model.hpp"
#include "../server.hpp"
#include "../status.hpp"
#include "test_utils.hpp"

using namespace imgtx;

class TestServer : public Server {
public:
    std::shared_ptr<MockHttpClient> httpClient = std::make_shared<testing::NiceMock<MockHttpClient>>();

    TestServer() = default;

protected:
    std::shared_ptr<HttpClient> createHttpClient() override {
        return httpClient;
    }
};

TEST(ServerTest, InvalidSettings) {
    TestServer server;
    ServerSettingsImpl serverSettings;
    ModelSettingsImpl modelSettings;
    EXPECT_EQ(server.start(&serverSettings, &modelSettings), StatusCode::OPTIONS_USAGE_ERROR);
    EXPECT_FALSE(server.isLive());
}

TEST(ServerTest, StartAndShutdown) {
    TestServer server;
    ServerSettingsImpl serverSettings;
    serverSettings.restPort = 19174;
    serverSettings.restBindAddress = "127.0.0.1";
    serverSettings.restWorkers = 2;
    serverSettings.logLevel = "TRACE";
    ModelSettingsImpl modelSettings = createModelSettings();
    ASSERT_EQ(server.start(&serverSettings, &modelSettings), StatusCode::OK);
    EXPECT_TRUE(server.isLive());
    ASSERT_NE(server.getModel(), nullptr);
    EXPECT_EQ(server.getModel()->getName(), "mnist");

    httplib::Client client("127.0.0.1", 19174);
    auto res = client.Post("/v1/models/mnist:predict", R"({"instances":[{"data":"not-base64!!"}]})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    // second start is rejected while running
    EXPECT_EQ(server.start(&serverSettings, &modelSettings), StatusCode::INTERNAL_ERROR);

    server.shutdown();
    EXPECT_FALSE(server.isLive());
    EXPECT_EQ(server.getModel(), nullptr);
}
