#include <string>
#include <unordered_set>

#include "gtest/gtest.h"
#include "muxpool/origin.hpp"
#include "muxpool/url.hpp"

using muxpool::OriginKey;
using muxpool::parse_url;
using muxpool::UrlComponents;
using namespace muxpool::url_utils;

TEST(ParseUrlTest, ParsesHttpUrl) {
    auto result = parse_url("http://example.com/foo/bar?baz=1");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_FALSE(url.https);
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, 80);
    EXPECT_EQ(url.target, "/foo/bar?baz=1");
}

TEST(ParseUrlTest, ParsesHttpsUrl) {
    auto result = parse_url("https://example.com:8443/path");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_TRUE(url.https);
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, 8443);
    EXPECT_EQ(url.target, "/path");
}

TEST(ParseUrlTest, DefaultPort) {
    auto result = parse_url("https://hostonly");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_TRUE(url.https);
    EXPECT_EQ(url.host, "hostonly");
    EXPECT_EQ(url.port, 443);
    EXPECT_EQ(url.target, "/");
}

TEST(ParseUrlTest, QueryWithoutPathAndFragment) {
    auto q = parse_url("http://host?x=1");
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q.value().host, "host");
    EXPECT_EQ(q.value().target, "/?x=1");

    auto f = parse_url("http://host/a#frag");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f.value().target, "/a");
}

TEST(ParseUrlTest, Ipv6Literal) {
    auto result = parse_url("http://[::1]:8080/x");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().host, "::1");
    EXPECT_EQ(result.value().port, 8080);
    EXPECT_EQ(result.value().target, "/x");
}

TEST(ParseUrlTest, MissingScheme) {
    auto result = parse_url("example.com");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, muxpool::Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EmptyHost) {
    auto result = parse_url("http:///foo");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, muxpool::Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EmptyPort) {
    auto result = parse_url("http://host:");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, muxpool::Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, BadPorts) {
    EXPECT_TRUE(parse_url("http://host:0/").has_error());
    EXPECT_TRUE(parse_url("http://host:65536/").has_error());
    EXPECT_TRUE(parse_url("http://host:80a/").has_error());
    EXPECT_TRUE(parse_url("http://[::1/").has_error());
    EXPECT_TRUE(parse_url("http://user@host/").has_error());
}

TEST(UrlUtilsTest, IsAbsoluteUrlWithProtocol) {
    EXPECT_TRUE(is_absolute_url_with_protocol("http://example.com"));
    EXPECT_TRUE(is_absolute_url_with_protocol("https://example.com"));
    EXPECT_FALSE(is_absolute_url_with_protocol("ftp://example.com"));
    EXPECT_FALSE(is_absolute_url_with_protocol("example.com"));
}

TEST(UrlUtilsTest, ParsePort) {
    std::uint16_t port = 0;
    EXPECT_TRUE(parse_port("65535", port));
    EXPECT_EQ(port, 65535);
    EXPECT_FALSE(parse_port("", port));
    EXPECT_FALSE(parse_port("123456", port));
    EXPECT_FALSE(parse_port("-1", port));
}

TEST(OriginKeyTest, NormalizesSchemeHostAndPort) {
    auto a = OriginKey::make("HTTPS", "Example.COM");
    EXPECT_EQ(a.scheme(), "https");
    EXPECT_EQ(a.host(), "example.com");
    EXPECT_EQ(a.port(), 443);
    EXPECT_TRUE(a.https());
    EXPECT_EQ(a, OriginKey::make("https", "example.com", 443));
    EXPECT_EQ(a.to_string(), "https://example.com:443");
}

TEST(OriginKeyTest, PathAndQueryDoNotMatter) {
    auto a = OriginKey::parse("http://example.com/a?x=1");
    auto b = OriginKey::parse("http://EXAMPLE.com:80/b");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a.value(), b.value());

    auto c = OriginKey::parse("http://example.com:8080/a");
    ASSERT_TRUE(c.has_value());
    EXPECT_NE(a.value(), c.value());
    EXPECT_NE(OriginKey::make("http", "example.com"),
              OriginKey::make("https", "example.com", 80));
}

TEST(OriginKeyTest, HashesEqualKeysTogether) {
    std::unordered_set<OriginKey> set;
    set.insert(OriginKey::make("http", "a"));
    set.insert(OriginKey::make("HTTP", "A", 80));
    set.insert(OriginKey::make("http", "a", 81));
    EXPECT_EQ(set.size(), 2u);
}

TEST(OriginKeyTest, Ipv6IsBracketedInText) {
    auto k = OriginKey::parse("https://[::1]:8443/");
    ASSERT_TRUE(k.has_value());
    EXPECT_EQ(k.value().to_string(), "https://[::1]:8443");
}

TEST(OriginKeyTest, InvalidUrlIsRejected) {
    auto k = OriginKey::parse("mailto:someone");
    ASSERT_TRUE(k.has_error());
    EXPECT_EQ(k.error().code, muxpool::Error::Code::InvalidUrl);
}
