/**
 * @file InetAddress.cpp
 * @brief 封装结构体 sockaddr_in
 */

#include "InetAddress.h"

#include <arpa/inet.h>
#include <string.h>
#include <sstream>
#include <stdexcept>

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    memset(&address_, 0, sizeof(address_));
    address_.sin_family = AF_INET;
    address_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &address_.sin_addr) != 1) {
        throw std::runtime_error("invalid IPv4 address: '" + ip + "'"); // 不做退化，避免误绑定到所有网卡
    }
}

InetAddress::InetAddress(const sockaddr_in& addr) :
    address_(addr) {
}

const sockaddr_in& InetAddress::get_sockaddr() const {
    return address_;
}

std::string InetAddress::get_ip() const {
    // 网络字节序的二进制 IP 地址转换为可读的字符串格式
    char buffer[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &address_.sin_addr, buffer, sizeof(buffer));
    return std::string(buffer);
}

uint16_t InetAddress::get_port() const {
    return ntohs(address_.sin_port);
}

std::string InetAddress::get_ip_port() const {
    std::stringstream ss;
    ss << get_ip() << ":" << get_port();
    return ss.str();
}

bool InetAddress::is_valid_ipv4(const std::string& ip) {
    in_addr addr;
    return ::inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}
