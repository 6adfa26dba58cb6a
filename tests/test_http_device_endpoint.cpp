#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <pipeline/http_device_endpoint.hpp>
#include <deque>

namespace {

// Returns queued responses and keeps the requests it saw
class FakeTransport : public Transport {
public:
    std::deque<HttpResponse> replies;
    std::vector<HttpRequest> sent;

    void reply(int status, const std::string& body = "") {
        HttpResponse r;
        r.status_code = status;
        r.body = body;
        replies.push_back(r);
    }

    HttpResponse send(const HttpRequest& request) override {
        sent.push_back(request);
        if (replies.empty()) throw TransportError("no scripted reply");
        HttpResponse r = replies.front();
        replies.pop_front();
        return r;
    }
};

} // namespace

TEST(HttpDeviceEndpoint, ParseToken) {
    EXPECT_EQ(HttpDeviceEndpoint::parse_token(R"({"code": 0, "token": "abc"})"), "abc");
    EXPECT_EQ(HttpDeviceEndpoint::parse_token(R"({"token": "xyz", "expires": 3600})"), "xyz");
}

TEST(HttpDeviceEndpoint, ParseTokenRejects) {
    EXPECT_THROW(HttpDeviceEndpoint::parse_token("[1, 2]"), AuthError);
    EXPECT_THROW(HttpDeviceEndpoint::parse_token(R"({"code": 0})"), AuthError);
    EXPECT_THROW(HttpDeviceEndpoint::parse_token(R"({"token": ""})"), AuthError);
    EXPECT_THROW(HttpDeviceEndpoint::parse_token("{unterminated"), AuthError);

    try {
        HttpDeviceEndpoint::parse_token(R"({"code": 7, "msg": "bad password"})");
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_NE(std::string(e.what()).find("bad password"), std::string::npos);
    }
}

TEST(HttpDeviceEndpoint, AuthenticatePostsForm) {
    auto transport = std::make_shared<FakeTransport>();
    transport->reply(200, R"({"code": 0, "token": "tok-1"})");
    HttpDeviceEndpoint endpoint(transport);

    EXPECT_EQ(endpoint.authenticate({"admin", "p&ss"}), "tok-1");

    ASSERT_EQ(transport->sent.size(), 1u);
    const auto& req = transport->sent[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/api/auth");
    EXPECT_TRUE(req.idempotent);
    EXPECT_EQ(req.body, "password=p%26ss&username=admin");
    EXPECT_EQ(req.headers.at("Content-Type"), "application/x-www-form-urlencoded");
}

TEST(HttpDeviceEndpoint, AuthenticateRejected) {
    auto transport = std::make_shared<FakeTransport>();
    transport->reply(401);
    HttpDeviceEndpoint endpoint(transport);
    EXPECT_THROW(endpoint.authenticate({"admin", "wrong"}), AuthError);
}

TEST(HttpDeviceEndpoint, AuthenticateUnexpectedStatus) {
    auto transport = std::make_shared<FakeTransport>();
    transport->reply(404);
    HttpDeviceEndpoint endpoint(transport);
    EXPECT_THROW(endpoint.authenticate({"admin", "admin"}), TransportError);
}

TEST(HttpDeviceEndpoint, DeliverUploadsWithBearer) {
    auto transport = std::make_shared<FakeTransport>();
    transport->reply(200);
    EndpointConfig paths;
    paths.deliver_path = "/cgi-bin/upgrade";
    HttpDeviceEndpoint endpoint(transport, paths);

    endpoint.deliver_and_trigger("tok-1", std::string("\x1f\x8b\x08", 3));

    ASSERT_EQ(transport->sent.size(), 1u);
    const auto& req = transport->sent[0];
    EXPECT_EQ(req.path, "/cgi-bin/upgrade");
    EXPECT_FALSE(req.idempotent);
    EXPECT_EQ(req.headers.at("Authorization"), "Bearer tok-1");
    EXPECT_EQ(req.headers.at("Content-Type"), "application/gzip");
    EXPECT_EQ(req.body.size(), 3u);
}

TEST(HttpDeviceEndpoint, DeliverTokenRefused) {
    auto transport = std::make_shared<FakeTransport>();
    transport->reply(403);
    HttpDeviceEndpoint endpoint(transport);
    EXPECT_THROW(endpoint.deliver_and_trigger("tok-1", "x"), AuthError);
}

TEST(HttpDeviceEndpoint, DeliverServerError) {
    auto transport = std::make_shared<FakeTransport>();
    transport->reply(500);
    HttpDeviceEndpoint endpoint(transport);
    EXPECT_THROW(endpoint.deliver_and_trigger("tok-1", "x"), TransportError);
}
