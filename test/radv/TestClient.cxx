// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "radv/MockDaemon.hxx"
#include "radv/Client.hxx"
#include "radv/Config.hxx"
#include "radv/Error.hxx"
#include "lib/curl/Error.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <string_view>
#include <thread>

using std::string_view_literals::operator""sv;
using namespace std::chrono_literals;
using namespace RadvControl;

class CurlEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        ASSERT_EQ(curl_global_init(CURL_GLOBAL_ALL), CURLE_OK);
    }

    void TearDown() override {
        curl_global_cleanup();
    }
};

[[maybe_unused]] static auto *const curl_environment =
    ::testing::AddGlobalTestEnvironment(new CurlEnvironment);

static const Config test_config{{
    {"eth0", 1000},
    {"eth1", 30000},
}};

TEST(ClientTest, ReloadOK)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::OK, {});

    const Client client{daemon.GetHost()};
    client.Reload(test_config);

    const auto requests = daemon.GetRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests.front().method, "POST");
    EXPECT_EQ(requests.front().path, "/reload");
    EXPECT_EQ(requests.front().content_type, "application/json");
    EXPECT_EQ(DecodeConfig(requests.front().body), test_config);

    daemon.CheckRethrowError();
}

TEST(ClientTest, ReloadIgnoresBody)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::OK, "this is not JSON");

    const Client client{daemon.GetHost()};
    client.Reload(test_config);
    EXPECT_EQ(daemon.GetRequestCount(), 1u);
}

TEST(ClientTest, ReloadRejected)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::UNPROCESSABLE_ENTITY,
                       EncodeDaemonError("duplicate interface name"));

    const Client client{daemon.GetHost()};

    try {
        client.Reload({{{"eth0", 1000}, {"eth0", 2000}}});
        FAIL();
    } catch (const DaemonError &e) {
        EXPECT_EQ(e.GetKind(), ControlErrorKind::DAEMON);
        EXPECT_EQ(e.GetStatus(), HttpStatus::UNPROCESSABLE_ENTITY);
        EXPECT_EQ(e.GetMessage(), "duplicate interface name"sv);
    }

    EXPECT_EQ(daemon.GetRequestCount(), 1u);
}

TEST(ClientTest, ReloadServerError)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::INTERNAL_SERVER_ERROR, "crash");

    const Client client{daemon.GetHost()};

    try {
        client.Reload(test_config);
        FAIL();
    } catch (const ServerError &e) {
        EXPECT_EQ(e.GetStatus(), HttpStatus::INTERNAL_SERVER_ERROR);
        EXPECT_STREQ(e.what(), "500 Internal Server Error");
    }

    EXPECT_EQ(daemon.GetRequestCount(), 1u);
}

TEST(ClientTest, ServerErrorCustomReason)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::INTERNAL_SERVER_ERROR, {}, "Oops");

    const Client client{daemon.GetHost()};

    try {
        client.GetStatus();
        FAIL();
    } catch (const ServerError &e) {
        EXPECT_STREQ(e.what(), "500 Oops");
    }
}

TEST(ClientTest, StatusOK)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::OK,
                       R"({"interfaces":[{"name":"eth0","state":"Running"},{"name":"eth1","state":"Init"}]})");

    const Client client{daemon.GetHost()};
    const auto status = client.GetStatus();

    const Status expected{{
        {"eth0", InterfaceState::RUNNING},
        {"eth1", InterfaceState::INIT},
    }};
    EXPECT_EQ(status, expected);

    const auto requests = daemon.GetRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests.front().method, "GET");
    EXPECT_EQ(requests.front().path, "/status");
    EXPECT_TRUE(requests.front().body.empty());
}

TEST(ClientTest, StatusServerError)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::INTERNAL_SERVER_ERROR, {});

    const Client client{daemon.GetHost()};

    try {
        client.GetStatus();
        FAIL();
    } catch (const ServerError &e) {
        EXPECT_NE(std::string_view{e.what()}.find("500"sv), std::string_view::npos);
    }

    EXPECT_EQ(daemon.GetRequestCount(), 1u);
}

TEST(ClientTest, StatusRejected)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::BAD_REQUEST,
                       EncodeDaemonError("bad interface"));

    const Client client{daemon.GetHost()};

    try {
        client.GetStatus();
        FAIL();
    } catch (const DaemonError &e) {
        EXPECT_EQ(e.GetStatus(), HttpStatus::BAD_REQUEST);
        EXPECT_EQ(e.GetMessage(), "bad interface"sv);
    }

    EXPECT_EQ(daemon.GetRequestCount(), 1u);
}

TEST(ClientTest, StatusUnknownState)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::OK,
                       R"({"interfaces":[{"name":"eth0","state":"Sleeping"}]})");

    const Client client{daemon.GetHost()};
    EXPECT_THROW(client.GetStatus(), DecodeError);
}

TEST(ClientTest, StatusMalformed)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::OK, "<html></html>");

    const Client client{daemon.GetHost()};
    EXPECT_THROW(client.GetStatus(), DecodeError);
}

TEST(ClientTest, NonJSONErrorBody)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::BAD_REQUEST, "Bad Request");

    const Client client{daemon.GetHost()};

    EXPECT_THROW(client.Reload(test_config), DecodeError);
    EXPECT_THROW(client.GetStatus(), DecodeError);

    /* no retries */
    EXPECT_EQ(daemon.GetRequestCount(), 2u);
}

TEST(ClientTest, NoContent)
{
    /* only "200 OK" is a success; anything else must carry an
       error object */
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::NO_CONTENT, {});

    const Client client{daemon.GetHost()};
    EXPECT_THROW(client.Reload(test_config), DecodeError);
}

TEST(ClientTest, EncodeErrorSendsNothing)
{
    MockDaemon daemon;

    const Client client{daemon.GetHost()};

    EXPECT_THROW(client.Reload({{{"eth\xc3", 1000}}}), EncodeError);
    EXPECT_EQ(daemon.GetRequestCount(), 0u);
}

TEST(ClientTest, MalformedHost)
{
    for (const char *host : {"", "foo bar", "localhost:", "localhost:http",
                             "localhost:0", "localhost:65536", "[::1"}) {
        const Client client{host};

        try {
            client.GetStatus();
            FAIL() << host;
        } catch (const RequestError &e) {
            EXPECT_EQ(e.GetKind(), ControlErrorKind::REQUEST);
        }
    }
}

TEST(ClientTest, MalformedHostBeforeEncode)
{
    /* encoding comes first */
    const Client client{"foo bar"};
    EXPECT_THROW(client.Reload({{{"\xff", 1}}}), EncodeError);
    EXPECT_THROW(client.Reload(test_config), RequestError);
}

TEST(ClientTest, ConnectionRefused)
{
    const Client client{fmt::format("127.0.0.1:{}", FindUnusedPort())};

    try {
        client.Reload(test_config);
        FAIL();
    } catch (const TransportError &e) {
        EXPECT_EQ(e.GetKind(), ControlErrorKind::TRANSPORT);

        const auto *curl = FindNested<Curl::Error>(std::current_exception());
        ASSERT_NE(curl, nullptr);
        EXPECT_EQ(curl->GetCode(), CURLE_COULDNT_CONNECT);
    }
}

TEST(ClientTest, Timeout)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::OK, R"({"interfaces":[]})");
    daemon.SetDelay(10s);

    const Client client{daemon.GetHost()};

    try {
        client.GetStatus({.timeout = 200ms});
        FAIL();
    } catch (const TransportError &) {
        const auto *curl = FindNested<Curl::Error>(std::current_exception());
        ASSERT_NE(curl, nullptr);
        EXPECT_EQ(curl->GetCode(), CURLE_OPERATION_TIMEDOUT);
    }

    EXPECT_EQ(daemon.GetRequestCount(), 1u);
}

TEST(ClientTest, Cancel)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::OK, {});
    daemon.SetDelay(10s);

    const Client client{daemon.GetHost()};

    std::atomic_bool cancel{false};
    std::thread canceller{[&cancel]{
        std::this_thread::sleep_for(100ms);
        cancel = true;
    }};

    try {
        client.Reload(test_config, {.cancel = &cancel});
        canceller.join();
        FAIL();
    } catch (const TransportError &) {
        canceller.join();

        const auto *curl = FindNested<Curl::Error>(std::current_exception());
        ASSERT_NE(curl, nullptr);
        EXPECT_EQ(curl->GetCode(), CURLE_ABORTED_BY_CALLBACK);
    }
}

TEST(ClientTest, Concurrent)
{
    MockDaemon daemon;
    daemon.SetResponse(HttpStatus::OK,
                       R"({"interfaces":[{"name":"eth0","state":"Running"}]})");

    const Client client{daemon.GetHost()};

    std::atomic_uint n_ok{0}, n_failed{0};

    std::thread threads[4];
    for (auto &t : threads)
        t = std::thread{[&client, &n_ok, &n_failed]{
            for (unsigned i = 0; i < 4; ++i) {
                try {
                    if (client.GetStatus().interfaces.size() == 1)
                        ++n_ok;
                } catch (const ControlError &) {
                    ++n_failed;
                }
            }
        }};

    for (auto &t : threads)
        t.join();

    EXPECT_EQ(n_failed.load(), 0u);
    EXPECT_EQ(n_ok.load(), 16u);
    EXPECT_EQ(daemon.GetRequestCount(), 16u);
}
