#include <gtest/gtest.h>

#include "security/client_ip.hpp"

using gradebox::security::ClientIp;

TEST(ClientIpTest, PrefersFirstForwardedForEntry) {
    httplib::Headers headers{{"X-Forwarded-For", " 203.0.113.7 , 10.0.0.1"}, {"X-Real-IP", "10.0.0.2"}};
    EXPECT_EQ(ClientIp(headers, "127.0.0.1"), "203.0.113.7");
}

TEST(ClientIpTest, FallsBackThroughProxyHeaders) {
    EXPECT_EQ(ClientIp(httplib::Headers{{"X-Real-IP", "10.0.0.2"}}, ""), "10.0.0.2");
    EXPECT_EQ(ClientIp(httplib::Headers{{"CF-Connecting-IP", "10.0.0.3"}}, ""), "10.0.0.3");
    EXPECT_EQ(ClientIp(httplib::Headers{}, "192.168.1.9"), "192.168.1.9");
    EXPECT_EQ(ClientIp(httplib::Headers{}, ""), "unknown");
}
