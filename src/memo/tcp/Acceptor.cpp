/**
 * @file Acceptor.cpp
 * @brief 监听新连接的接入器（封装 listenFd 及持有其 Channel），在有连接到来时接受并上报给上层
 */

#include "Acceptor.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

#include "Channel.h"
#include "EventLoop.h"
#include "spdlog/spdlog.h"

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr) :
    loop_(loop),
    listenAddr_(listenAddr),
    listenFd_(-1),
    channel_(nullptr),
    newConnectCallback_(nullptr),
    acceptedConnFd_(-1),
    acceptedPeerAddr_("0.0.0.0", 0) {

    listenFd_ = create_fd();
    try {
        bind_address(listenFd_);
        start_listen(listenFd_);
    }
    catch (const std::runtime_error&) {
        ::close(listenFd_); // channel_ 还没接管 fd
        throw;
    }

    channel_.reset(new Channel(loop_, listenFd_));
    channel_->set_read_callback(std::bind(&Acceptor::on_read, this, std::placeholders::_1));
    channel_->set_error_callback(std::bind(&Acceptor::on_error, this, std::placeholders::_1));
    channel_->set_close_callback(std::bind(&Acceptor::on_close, this, std::placeholders::_1));
    channel_->set_write_callback(std::bind(&Acceptor::on_write, this, std::placeholders::_1));
    channel_->enable_reading();
}

void Acceptor::set_connect_callback(NewConnectCallback cb) {
    newConnectCallback_ = std::move(cb);
}

int Acceptor::get_accepted_fd() {
    int fd = acceptedConnFd_;
    acceptedConnFd_ = -1; // 取出后重置，防止重复使用同一个 fd
    return fd;
}

const InetAddress& Acceptor::get_accepted_peer_addr() const {
    return acceptedPeerAddr_;
}

int Acceptor::get_listen_fd() const {
    return listenFd_;
}

int Acceptor::create_fd() {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        spdlog::critical("Acceptor::create_fd(). socket error, errno: {} ({})", errno, strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    int on = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
        spdlog::warn("Acceptor::create_fd(). SO_REUSEADDR failed, errno: {}", errno);
    }
    return fd;
}

void Acceptor::bind_address(int listenFd) {
    sockaddr_in address = listenAddr_.get_sockaddr();
    if (::bind(listenFd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == -1) {
        spdlog::critical("Acceptor::bind_address(). bind {} error, errno: {} ({})", listenAddr_.get_ip_port(), errno, strerror(errno));
        throw std::runtime_error("bind " + listenAddr_.get_ip_port() + " failed: " + strerror(errno));
    }

    // 端口为 0 时由内核分配，回填实际地址
    sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (::getsockname(listenFd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        listenAddr_ = InetAddress(bound);
    }
}

void Acceptor::start_listen(int listenFd) {
    if (::listen(listenFd, SOMAXCONN) == -1) {
        spdlog::critical("Acceptor::start_listen(). listen error, errno: {} ({})", errno, strerror(errno));
        throw std::runtime_error(std::string("listen failed: ") + strerror(errno));
    }
}

void Acceptor::on_error(Channel& channel) {
    spdlog::error("Acceptor::on_error(). listenFd {} error.", channel.get_fd());
}

void Acceptor::on_close(Channel& channel) {
    spdlog::error("Acceptor::on_close(). listenFd {} is closed.", channel.get_fd());
}

void Acceptor::on_write(Channel& channel) {
    spdlog::warn("Acceptor::on_write(). listenFd {} write event.", channel.get_fd());
}

void Acceptor::on_read(Channel& channel) {
    // 水平触发：一次只 accept 一个，没取完的连接下一轮 poll 还会触发
    sockaddr_in clientAddr;
    socklen_t len = sizeof(clientAddr);
    int connFd = ::accept4(channel.get_fd(), reinterpret_cast<sockaddr*>(&clientAddr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connFd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            spdlog::error("Acceptor::on_read(). accept error, errno: {} ({})", errno, strerror(errno));
        }
        return; // 失败直接返回，不能触发上层回调
    }

    acceptedConnFd_ = connFd;
    acceptedPeerAddr_ = InetAddress(clientAddr);
    spdlog::debug("Acceptor: connFd {} is accepted from {}.", acceptedConnFd_, acceptedPeerAddr_.get_ip_port());

    handle_connect_callback();
}

void Acceptor::handle_connect_callback() {
    if (!newConnectCallback_) {
        spdlog::warn("Acceptor: no connect callback, close fd {}.", acceptedConnFd_);
        ::close(get_accepted_fd());
        return;
    }
    newConnectCallback_(*this);
}
