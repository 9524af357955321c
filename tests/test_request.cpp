#include <string>

#include "gtest/gtest.h"
#include "relay_cpp/headers.hpp"
#include "relay_cpp/request.hpp"
#include "relay_cpp/url.hpp"

using relay_cpp::FormFields;
using relay_cpp::Headers;
using relay_cpp::HttpMethod;
using relay_cpp::HttpRequest;
using relay_cpp::RequestBody;
using relay_cpp::RequestParameters;
using relay_cpp::UrlComponents;
namespace headers = relay_cpp::headers;

namespace {

    UrlComponents url(const char* s) { return relay_cpp::parse_url(s).value(); }

    HttpRequest make(HttpMethod method, const char* target, Headers h = {},
                     RequestBody body = {},
                     std::optional<UrlComponents> proxy = std::nullopt,
                     Headers unredirected = {},
                     RequestParameters params = {}) {
        return HttpRequest(method, url(target), std::move(proxy), std::move(h),
                           std::move(unredirected), std::move(body),
                           std::move(params), nullptr);
    }

}  // namespace

TEST(RequestTest, EncodesHostFirstAndContentLength) {
    auto req = make(HttpMethod::Post, "http://example.test/a",
                    headers::make({{"X-A", "1"}}),
                    RequestBody{std::string("hi")});

    EXPECT_EQ(req.encode(),
              "POST /a HTTP/1.1\r\n"
              "Host: example.test\r\n"
              "X-A: 1\r\n"
              "Content-Type: text/plain; charset=utf-8\r\n"
              "Content-Length: 2\r\n"
              "\r\n"
              "hi");
}

TEST(RequestTest, NonDefaultPortInHost) {
    auto req = make(HttpMethod::Get, "http://example.test:8080/");
    EXPECT_EQ(req.encode(),
              "GET / HTTP/1.1\r\n"
              "Host: example.test:8080\r\n"
              "\r\n");
}

TEST(RequestTest, ContentLengthRules) {
    auto empty_post = make(HttpMethod::Post, "http://example.test/");
    EXPECT_NE(empty_post.encode().find("Content-Length: 0\r\n"),
              std::string::npos);

    auto del = make(HttpMethod::Delete, "http://example.test/");
    EXPECT_EQ(del.encode().find("Content-Length"), std::string::npos);

    auto chunked = make(HttpMethod::Put, "http://example.test/",
                        headers::make({{"Transfer-Encoding", "chunked"}}),
                        RequestBody{std::string("x")});
    EXPECT_EQ(chunked.encode().find("Content-Length"), std::string::npos);
}

TEST(RequestTest, GetFoldsBodyIntoQuery) {
    auto req = make(HttpMethod::Get, "http://example.test/s?a=1", {},
                    RequestBody{FormFields{{"q", "x y"}}});
    EXPECT_EQ(req.url().query, "a=1&q=x+y");
    EXPECT_TRUE(relay_cpp::body_empty(req.body()));
    EXPECT_TRUE(req.encoded_body().empty());
    EXPECT_EQ(req.first_line(), "GET /s?a=1&q=x+y HTTP/1.1");
}

TEST(RequestTest, OrdinaryHeadersOverrideUnredirected) {
    auto req = make(HttpMethod::Get, "http://example.test/",
                    headers::make({{"X-Shared", "ordinary"}}), {},
                    std::nullopt,
                    headers::make({{"X-Shared", "unredirected"},
                                   {"X-Only", "kept"}}));
    auto wire = req.encode();
    EXPECT_NE(wire.find("X-Shared: ordinary\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("unredirected"), std::string::npos);
    EXPECT_NE(wire.find("X-Only: kept\r\n"), std::string::npos);
}

TEST(RequestTest, KeyIncludesTimeout) {
    RequestParameters fast;
    fast.timeout = std::chrono::milliseconds(100);
    auto a = make(HttpMethod::Get, "http://Example.test/a");
    auto b = make(HttpMethod::Get, "http://example.test/b", {}, {},
                  std::nullopt, {}, fast);

    EXPECT_EQ(a.key().host, "example.test");
    EXPECT_EQ(a.key().port, "80");
    EXPECT_EQ(a.key().scheme, "http");
    EXPECT_FALSE(a.key() == b.key());
    EXPECT_TRUE(a.key() ==
                make(HttpMethod::Post, "http://example.test/c").key());
}

TEST(RequestTest, PlainHttpThroughProxyUsesAbsoluteForm) {
    auto req = make(HttpMethod::Get, "http://example.test/a?b=1",
                    headers::make({{"Proxy-Authorization", "Basic xyz"}}), {},
                    url("http://proxy:3128"));

    EXPECT_FALSE(req.tunnel());
    EXPECT_EQ(req.key().host, "proxy");
    EXPECT_EQ(req.key().port, "3128");
    EXPECT_EQ(req.first_line(), "GET http://example.test/a?b=1 HTTP/1.1");
    // The proxy reads this one
    EXPECT_NE(req.encode().find("Proxy-Authorization: Basic xyz"),
              std::string::npos);

    auto plan = req.connect_plan();
    EXPECT_EQ(plan.host, "proxy");
    EXPECT_FALSE(plan.tunnel_authority.has_value());
}

TEST(RequestTest, HttpsThroughProxyTunnels) {
    auto req = make(HttpMethod::Get, "https://example.test/x",
                    headers::make({{"Proxy-Authorization", "Basic xyz"}}), {},
                    url("http://proxy:8080"));

    EXPECT_TRUE(req.tunnel());
    EXPECT_EQ(req.key().scheme, "https");
    EXPECT_EQ(req.key().host, "example.test");
    EXPECT_EQ(req.first_line(), "GET /x HTTP/1.1");
    EXPECT_EQ(req.encode().find("Proxy-Authorization"), std::string::npos);

    auto plan = req.connect_plan();
    EXPECT_EQ(plan.host, "proxy");
    EXPECT_EQ(plan.port, "8080");
    ASSERT_TRUE(plan.tunnel_authority.has_value());
    EXPECT_EQ(*plan.tunnel_authority, "example.test:443");
    EXPECT_EQ(plan.tunnel_headers["Proxy-Authorization"], "Basic xyz");
    EXPECT_EQ(plan.sni_host, "example.test");
}

TEST(RequestTest, ConnectEncodesToNothing) {
    HttpRequest req(HttpMethod::Connect,
                    relay_cpp::parse_authority("example.test:443").value(),
                    std::nullopt, {}, {}, RequestBody{std::string("ignored")},
                    {}, nullptr);

    EXPECT_EQ(req.encode(), "");
    EXPECT_TRUE(relay_cpp::body_empty(req.body()));
    EXPECT_EQ(req.key().scheme, "connect");
    EXPECT_EQ(req.full_url(), "example.test:443");
    EXPECT_EQ(req.first_line(), "CONNECT example.test:443 HTTP/1.1");

    auto plan = req.connect_plan();
    EXPECT_EQ(plan.host, "example.test");
    EXPECT_EQ(plan.port, "443");
    EXPECT_FALSE(plan.tls);
}
