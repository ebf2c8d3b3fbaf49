#include <gtest/gtest.h>

#include "utils/Url.hpp"

using portal::utils::Url;

TEST(UrlTest, Https_DefaultPort) {
    auto url = Url::parse("https://unifi");

    EXPECT_EQ(url.scheme, "https");
    EXPECT_EQ(url.host, "unifi");
    EXPECT_EQ(url.port, 443);
    EXPECT_EQ(url.basePath, "");
    EXPECT_TRUE(url.isHttps());
    EXPECT_EQ(url.hostHeader(), "unifi");
}

TEST(UrlTest, ExplicitPortAndPrefix_TrailingSlashDropped) {
    auto url = Url::parse("https://192.168.1.1:8443/controller/");

    EXPECT_EQ(url.host, "192.168.1.1");
    EXPECT_EQ(url.port, 8443);
    EXPECT_EQ(url.basePath, "/controller");
    EXPECT_EQ(url.hostHeader(), "192.168.1.1:8443");
}

TEST(UrlTest, Http_DefaultPort80) {
    auto url = Url::parse("HTTP://unifi.local/");

    EXPECT_EQ(url.scheme, "http");
    EXPECT_FALSE(url.isHttps());
    EXPECT_EQ(url.port, 80);
    EXPECT_EQ(url.basePath, "");
}

TEST(UrlTest, Ipv6Literal) {
    auto url = Url::parse("https://[fd00::1]:8443");

    EXPECT_EQ(url.host, "fd00::1");
    EXPECT_EQ(url.port, 8443);
    EXPECT_EQ(url.hostHeader(), "[fd00::1]:8443");
}

TEST(UrlTest, Ipv6Literal_DefaultPort_BracketsKept) {
    auto url = Url::parse("https://[::1]/");

    EXPECT_EQ(url.host, "::1");
    EXPECT_EQ(url.hostHeader(), "[::1]");
}

TEST(UrlTest, Invalid_Throws) {
    EXPECT_THROW(Url::parse("unifi:8443"), std::invalid_argument);
    EXPECT_THROW(Url::parse("ftp://unifi"), std::invalid_argument);
    EXPECT_THROW(Url::parse("https://"), std::invalid_argument);
    EXPECT_THROW(Url::parse("https://unifi:abc"), std::invalid_argument);
    EXPECT_THROW(Url::parse("https://unifi:84x3"), std::invalid_argument);
    EXPECT_THROW(Url::parse("https://unifi:70000"), std::invalid_argument);
}
