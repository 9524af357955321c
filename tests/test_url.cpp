#include <string>

#include "gtest/gtest.h"
#include "relay_cpp/url.hpp"

using relay_cpp::parse_authority;
using relay_cpp::parse_url;
using relay_cpp::resolve_reference;
using relay_cpp::UrlComponents;
using namespace relay_cpp::url_utils;

TEST(ParseUrlTest, ParsesHttpUrl) {
    auto result = parse_url("http://example.com/foo/bar?baz=1");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_FALSE(url.https());
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, "80");
    EXPECT_EQ(url.path, "/foo/bar");
    EXPECT_EQ(url.query, "baz=1");
    EXPECT_EQ(url.target(), "/foo/bar?baz=1");
}

TEST(ParseUrlTest, ParsesHttpsUrl) {
    auto result = parse_url("HTTPS://Example.COM:8443/path#frag");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_TRUE(url.https());
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, "8443");
    EXPECT_EQ(url.fragment, "frag");
    EXPECT_EQ(url.target(), "/path");
    EXPECT_EQ(url.authority(), "example.com:8443");
}

TEST(ParseUrlTest, DefaultPortAndPath) {
    auto result = parse_url("https://hostonly");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_EQ(url.port, "443");
    EXPECT_EQ(url.target(), "/");
    EXPECT_EQ(url.authority(), "hostonly");
    EXPECT_EQ(url.authority(true), "hostonly:443");
    EXPECT_EQ(url.to_string(), "https://hostonly/");
}

TEST(ParseUrlTest, Ipv6Host) {
    auto result = parse_url("http://[::1]:8080/x");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().host, "::1");
    EXPECT_EQ(result.value().port, "8080");
    EXPECT_EQ(result.value().authority(), "[::1]:8080");
}

TEST(ParseUrlTest, Rejects) {
    for (const char* bad : {"example.com", "ftp://example.com/", "http:///foo",
                            "http://host:", "http://host:99999/",
                            "http://host:12ab/", "http://user@host/"}) {
        auto result = parse_url(bad);
        ASSERT_TRUE(result.has_error()) << bad;
        EXPECT_EQ(result.error().code, relay_cpp::Error::Code::InvalidUrl)
            << bad;
    }
}

TEST(ParseAuthorityTest, HostAndPortRequired) {
    auto ok = parse_authority("example.test:443");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value().host, "example.test");
    EXPECT_EQ(ok.value().port, "443");

    EXPECT_TRUE(parse_authority("example.test").has_error());
    EXPECT_TRUE(parse_authority("example.test:").has_error());
    EXPECT_TRUE(parse_authority("example.test:443/path").has_error());
}

TEST(UrlUtilsTest, IsAbsoluteUrlWithProtocol) {
    EXPECT_TRUE(is_absolute_url_with_protocol("http://example.com"));
    EXPECT_TRUE(is_absolute_url_with_protocol("HTTPS://example.com"));
    EXPECT_FALSE(is_absolute_url_with_protocol("ftp://example.com"));
    EXPECT_FALSE(is_absolute_url_with_protocol("/relative"));
}

TEST(UrlUtilsTest, EncodeForm) {
    EXPECT_EQ(url_encode("a b&c"), "a%20b%26c");
    EXPECT_EQ(encode_form({{"q", "a b"}, {"x", "1/2"}}), "q=a+b&x=1%2F2");
}

TEST(UrlUtilsTest, RemoveDotSegments) {
    EXPECT_EQ(remove_dot_segments("/a/b/../c"), "/a/c");
    EXPECT_EQ(remove_dot_segments("/a/./b"), "/a/b");
    EXPECT_EQ(remove_dot_segments("/../x"), "/x");
}

TEST(ResolveReferenceTest, RelativeForms) {
    auto base = parse_url("http://host/a/b?x=1").value();

    auto sibling = resolve_reference(base, "c");
    ASSERT_TRUE(sibling.has_value());
    EXPECT_EQ(sibling.value().target(), "/a/c");

    auto parent = resolve_reference(base, "../d?y=2");
    ASSERT_TRUE(parent.has_value());
    EXPECT_EQ(parent.value().target(), "/d?y=2");

    auto query_only = resolve_reference(base, "?z=3");
    ASSERT_TRUE(query_only.has_value());
    EXPECT_EQ(query_only.value().target(), "/a/b?z=3");

    auto absolute_path = resolve_reference(base, "/root");
    ASSERT_TRUE(absolute_path.has_value());
    EXPECT_EQ(absolute_path.value().host, "host");
    EXPECT_EQ(absolute_path.value().target(), "/root");
}

TEST(ResolveReferenceTest, OtherOrigin) {
    auto base = parse_url("https://host/a").value();

    auto abs = resolve_reference(base, "http://other:81/x");
    ASSERT_TRUE(abs.has_value());
    EXPECT_EQ(abs.value().scheme, "http");
    EXPECT_EQ(abs.value().host, "other");
    EXPECT_EQ(abs.value().port, "81");

    auto scheme_relative = resolve_reference(base, "//cdn.test/y");
    ASSERT_TRUE(scheme_relative.has_value());
    EXPECT_EQ(scheme_relative.value().scheme, "https");
    EXPECT_EQ(scheme_relative.value().host, "cdn.test");
    EXPECT_EQ(scheme_relative.value().target(), "/y");
}
