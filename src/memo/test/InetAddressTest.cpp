#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <stdexcept>

#include "memo/base/InetAddress.h"

// InetAddress 构造函数与基本访问接口测试
TEST(InetAddressTest, ConstructAndAccessors) {
    InetAddress addr("127.0.0.1", 8080);

    EXPECT_EQ(addr.get_ip(), "127.0.0.1");
    EXPECT_EQ(addr.get_port(), 8080);
    EXPECT_EQ(addr.get_ip_port(), "127.0.0.1:8080");
}

TEST(InetAddressTest, DifferentIpAndPort) {
    InetAddress addr("192.168.1.100", 65535);

    EXPECT_EQ(addr.get_ip(), "192.168.1.100");
    EXPECT_EQ(addr.get_port(), 65535);
    EXPECT_EQ(addr.get_ip_port(), "192.168.1.100:65535");
}

// 从 sockaddr_in 构造（accept/getsockname 得到的地址）
TEST(InetAddressTest, ConstructFromSockaddr) {
    sockaddr_in raw{};
    raw.sin_family = AF_INET;
    raw.sin_port = htons(9000);
    ASSERT_EQ(::inet_pton(AF_INET, "10.0.0.7", &raw.sin_addr), 1);

    InetAddress addr(raw);
    EXPECT_EQ(addr.get_ip_port(), "10.0.0.7:9000");
    EXPECT_EQ(addr.get_sockaddr().sin_port, htons(9000));
}

// 非法 ip 直接抛异常，不会悄悄绑定到 0.0.0.0
TEST(InetAddressTest, InvalidIpThrows) {
    EXPECT_FALSE(InetAddress::is_valid_ipv4("not-an-ip"));
    EXPECT_FALSE(InetAddress::is_valid_ipv4("256.1.1.1"));
    EXPECT_FALSE(InetAddress::is_valid_ipv4("localhost"));
    EXPECT_TRUE(InetAddress::is_valid_ipv4("0.0.0.0"));

    EXPECT_THROW(InetAddress("localhost", 80), std::runtime_error);
    EXPECT_THROW(InetAddress("127.0.0.l", 80), std::runtime_error);
    EXPECT_THROW(InetAddress("", 80), std::runtime_error);
}
