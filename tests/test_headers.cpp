#include <string>

#include "gtest/gtest.h"
#include "relay_cpp/headers.hpp"

using relay_cpp::Headers;
namespace headers = relay_cpp::headers;

TEST(HeadersTest, HopByHopStrippingKeepsOrdinaryHeaders) {
    auto raw = headers::make({{"Connection", "keep-alive"},
                              {"Transfer-Encoding", "chunked"},
                              {"Content-Type", "text/plain"},
                              {"X-Trace", "abc"}});

    Headers visible = headers::strip_hop_by_hop(raw);

    size_t count = 0;
    for (const auto& f : visible) {
        (void)f;
        ++count;
    }
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(visible["Content-Type"], "text/plain");
    EXPECT_EQ(visible["X-Trace"], "abc");
    EXPECT_EQ(visible.find("Connection"), visible.end());
    EXPECT_EQ(visible.find("Transfer-Encoding"), visible.end());
}

TEST(HeadersTest, EveryHopByHopFieldIsStripped) {
    auto raw = headers::make({{"Keep-Alive", "timeout=5"},
                              {"Proxy-Authenticate", "Basic"},
                              {"Proxy-Authorization", "Basic Zm9v"},
                              {"TE", "trailers"},
                              {"Trailer", "Expires"},
                              {"Upgrade", "websocket"},
                              {"Expires", "0"}});

    Headers visible = headers::strip_hop_by_hop(raw);
    EXPECT_EQ(visible.find("Trailer"), visible.end());
    EXPECT_EQ(visible.find("TE"), visible.end());
    EXPECT_EQ(visible.find("Keep-Alive"), visible.end());
    EXPECT_EQ(visible.find("Proxy-Authenticate"), visible.end());
    EXPECT_EQ(visible.find("Proxy-Authorization"), visible.end());
    EXPECT_EQ(visible.find("Upgrade"), visible.end());
    EXPECT_EQ(visible["Expires"], "0");
    EXPECT_TRUE(headers::is_hop_by_hop("trailer"));
}

TEST(HeadersTest, ConnectionTokensNameExtraHopHeaders) {
    auto raw = headers::make({{"Connection", "close, X-Private"},
                              {"X-Private", "secret"},
                              {"X-Public", "ok"}});

    Headers visible = headers::strip_hop_by_hop(raw);
    EXPECT_EQ(visible.find("X-Private"), visible.end());
    EXPECT_EQ(visible["X-Public"], "ok");
}

TEST(HeadersTest, HasTokenIsCaseInsensitive) {
    auto h = headers::make({{"connection", "Upgrade, Keep-Alive"}});
    EXPECT_TRUE(headers::has_token(h, "Connection", "keep-alive"));
    EXPECT_TRUE(headers::has_token(h, "CONNECTION", "upgrade"));
    EXPECT_FALSE(headers::has_token(h, "Connection", "close"));
    EXPECT_FALSE(headers::has_token(h, "Upgrade", "keep-alive"));
}

TEST(HeadersTest, SplitTokensTrims) {
    auto toks = headers::split_tokens(" a ,b,, c\t");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0], "a");
    EXPECT_EQ(toks[1], "b");
    EXPECT_EQ(toks[2], "c");
}

TEST(HeadersTest, MergeOverrideWinsAndKeepsDuplicates) {
    auto base = headers::make({{"Accept", "*/*"},
                               {"X-Multi", "1"},
                               {"X-Multi", "2"},
                               {"User-Agent", "base"}});
    auto over = headers::make({{"user-agent", "mine"}, {"X-New", "n"}});

    Headers merged = headers::merge(base, over);
    EXPECT_EQ(merged["User-Agent"], "mine");
    EXPECT_EQ(merged["Accept"], "*/*");
    EXPECT_EQ(merged["X-New"], "n");
    EXPECT_EQ(merged.count("X-Multi"), 2u);
    EXPECT_EQ(merged.count("User-Agent"), 1u);
}
