/**
 * @file InetAddress.h
 * @brief 封装结构体 sockaddr_in
 */

#pragma once
#include <netinet/in.h>
#include <cstdint>
#include <string>

class InetAddress {
private:
    sockaddr_in address_;

public:
    explicit InetAddress(const std::string& ip, uint16_t port); // ip 不是合法的点分十进制时抛出 std::runtime_error
    explicit InetAddress(const sockaddr_in& addr);
    InetAddress(const InetAddress& other) = default;
    InetAddress& operator=(const InetAddress& other) = default;
    ~InetAddress() = default;

    const sockaddr_in& get_sockaddr() const;

    std::string get_ip() const;
    uint16_t get_port() const;
    std::string get_ip_port() const;

    // ip 字符串是否是合法的 IPv4 点分十进制
    static bool is_valid_ipv4(const std::string& ip);
};
