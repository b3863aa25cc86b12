#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "anticaptcha/client.hpp"
#include "anticaptcha/errors.hpp"
#include "test_support.hpp"

using namespace anticaptcha;
using namespace anticaptcha::testing;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::StrictMock;
using ::testing::Throw;

class ClientTest : public ::testing::Test {
protected:
    ClientTest()
        : transport(std::make_shared<StrictMock<MockTransport>>()),
          logger(std::make_shared<CapturingLogger>()) {
        config.apiKey = "secret-key-123";
        config.baseUrl = "https://api.example.test";
    }

    Client makeClient() const { return Client(config, transport, logger); }

    ClientConfig config;
    std::shared_ptr<StrictMock<MockTransport>> transport;
    std::shared_ptr<CapturingLogger> logger;
};

TEST_F(ClientTest, RejectsEmptyApiKey) {
    config.apiKey.clear();
    EXPECT_THROW(makeClient(), std::invalid_argument);
}

TEST_F(ClientTest, PostsJsonWithClientKeyToEndpoint) {
    std::string url;
    std::string body;
    std::vector<std::string> headers;
    EXPECT_CALL(*transport, post(_, _, _, _, _))
        .WillOnce(DoAll(SaveArg<0>(&url), SaveArg<1>(&body), SaveArg<2>(&headers),
                        Return(ok(R"({"errorId":0,"taskId":7})"))));

    Client client = makeClient();
    SolveContext context(std::chrono::seconds(5));
    nlohmann::json response = client.request("/createTask", {{"task", {{"type", "ImageToTextTask"}}}}, context);

    EXPECT_EQ(url, "https://api.example.test/createTask");
    auto sent = nlohmann::json::parse(body);
    EXPECT_EQ(sent["clientKey"], "secret-key-123");
    EXPECT_EQ(sent["task"]["type"], "ImageToTextTask");
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0], "Content-Type: application/json");
    EXPECT_EQ(response["taskId"], 7);
}

TEST_F(ClientTest, TrailingSlashInBaseUrlIsIgnored) {
    config.baseUrl = "https://api.example.test/";
    std::string url;
    EXPECT_CALL(*transport, post(_, _, _, _, _))
        .WillOnce(DoAll(SaveArg<0>(&url), Return(ok("{}"))));

    SolveContext context(std::chrono::seconds(5));
    makeClient().request("/getBalance", nlohmann::json::object(), context);
    EXPECT_EQ(url, "https://api.example.test/getBalance");
}

TEST_F(ClientTest, TimeoutIsClippedToContextDeadline) {
    config.httpTimeout = std::chrono::seconds(60);
    std::chrono::milliseconds timeout{0};
    EXPECT_CALL(*transport, post(_, _, _, _, _))
        .WillOnce(DoAll(SaveArg<3>(&timeout), Return(ok("{}"))));

    SolveContext context(std::chrono::seconds(2));
    makeClient().request("/getBalance", nlohmann::json::object(), context);
    EXPECT_LE(timeout.count(), 2000);
    EXPECT_GT(timeout.count(), 0);
}

TEST_F(ClientTest, InvalidBaseUrlIsTransportError) {
    config.baseUrl = "api.example.test";
    SolveContext context(std::chrono::seconds(5));
    EXPECT_THROW(makeClient().request("/createTask", nlohmann::json::object(), context), TransportError);
}

TEST_F(ClientTest, NonSuccessStatusIsTransportError) {
    EXPECT_CALL(*transport, post(_, _, _, _, _))
        .WillOnce(Return(HttpResponse{503, "unavailable"}));

    SolveContext context(std::chrono::seconds(5));
    try {
        makeClient().request("/createTask", nlohmann::json::object(), context);
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.status(), 503);
    }
    EXPECT_TRUE(logger->contains("503"));
}

TEST_F(ClientTest, MalformedJsonIsTransportError) {
    EXPECT_CALL(*transport, post(_, _, _, _, _)).WillOnce(Return(ok("{not json")));

    SolveContext context(std::chrono::seconds(5));
    EXPECT_THROW(makeClient().request("/createTask", nlohmann::json::object(), context), TransportError);
}

TEST_F(ClientTest, NonObjectJsonIsTransportError) {
    EXPECT_CALL(*transport, post(_, _, _, _, _)).WillOnce(Return(ok("[1,2,3]")));

    SolveContext context(std::chrono::seconds(5));
    EXPECT_THROW(makeClient().request("/createTask", nlohmann::json::object(), context), TransportError);
}

TEST_F(ClientTest, NetworkFailurePropagatesAfterOneAttempt) {
    EXPECT_CALL(*transport, post(_, _, _, _, _))
        .Times(1)
        .WillOnce(Throw(TransportError("connection refused")));

    SolveContext context(std::chrono::seconds(5));
    EXPECT_THROW(makeClient().request("/createTask", nlohmann::json::object(), context), TransportError);
    EXPECT_TRUE(logger->contains("connection refused"));
}

TEST_F(ClientTest, ForeignTransportExceptionBecomesTransportError) {
    EXPECT_CALL(*transport, post(_, _, _, _, _))
        .WillOnce(Throw(std::runtime_error("Failed to initialize libcurl")));

    SolveContext context(std::chrono::seconds(5));
    EXPECT_THROW(makeClient().request("/createTask", nlohmann::json::object(), context), TransportError);
    EXPECT_TRUE(logger->contains("Failed to initialize libcurl"));
}

TEST_F(ClientTest, ExpiredContextSkipsTransport) {
    SolveContext context(std::chrono::seconds(5));
    context.cancel();
    EXPECT_THROW(makeClient().request("/createTask", nlohmann::json::object(), context), CancellationError);
}

TEST_F(ClientTest, ApiKeyNeverReachesTheLog) {
    EXPECT_CALL(*transport, post(_, _, _, _, _))
        .WillOnce(Return(HttpResponse{500, R"({"clientKey":"secret-key-123"})"}));

    SolveContext context(std::chrono::seconds(5));
    EXPECT_THROW(makeClient().request("/createTask", nlohmann::json::object(), context), TransportError);
    ASSERT_FALSE(logger->lines().empty());
    EXPECT_FALSE(logger->contains("secret-key-123"));
    EXPECT_TRUE(logger->contains("bytes"));
}

TEST_F(ClientTest, GetBalanceReadsBalanceField) {
    std::string body;
    EXPECT_CALL(*transport, post("https://api.example.test/getBalance", _, _, _, _))
        .WillOnce(DoAll(SaveArg<1>(&body), Return(ok(R"({"errorId":0,"balance":3.5})"))));

    EXPECT_DOUBLE_EQ(makeClient().getBalance(), 3.5);
    EXPECT_EQ(nlohmann::json::parse(body)["clientKey"], "secret-key-123");
}

TEST_F(ClientTest, GetBalanceSurfacesApiError) {
    EXPECT_CALL(*transport, post(_, _, _, _, _))
        .WillOnce(Return(ok(R"({"errorId":1,"errorCode":"ERROR_KEY_DOES_NOT_EXIST","errorDescription":"Account authorization key not found in the system"})")));

    try {
        makeClient().getBalance();
        FAIL() << "expected APIError";
    } catch (const APIError& e) {
        EXPECT_STREQ(e.what(), "Account authorization key not found in the system");
        EXPECT_EQ(e.errorCode(), "ERROR_KEY_DOES_NOT_EXIST");
        EXPECT_EQ(e.errorId(), 1);
    }
}

TEST_F(ClientTest, GetBalanceWithoutBalanceIsFormatError) {
    EXPECT_CALL(*transport, post(_, _, _, _, _)).WillOnce(Return(ok(R"({"errorId":0})")));
    EXPECT_THROW(makeClient().getBalance(), ResponseFormatError);
}
