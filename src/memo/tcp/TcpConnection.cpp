/**
 * @file TcpConnection.cpp
 * @brief 面向连接的 TCP 会话封装，负责收发缓冲、事件回调与半关闭。
 */

#include "TcpConnection.h"

#include <cassert>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

#include "Buffer.h"
#include "Channel.h"
#include "EventLoop.h"
#include "spdlog/spdlog.h"

TcpConnection::TcpConnection(EventLoop* loop, int connFd, const InetAddress& peerAddr) :
    loop_(loop),
    channel_(nullptr),
    peerAddr_(peerAddr),
    readBuffer_(new Buffer()),
    writeBuffer_(new Buffer()),
    messageCallback_(nullptr),
    closeCallback_(nullptr),
    closed_(false),
    shutdownPending_(false),
    lastErrorCode_(0),
    lastErrorMsg_() {

    channel_.reset(new Channel(loop_, connFd));
    channel_->set_read_callback(std::bind(&TcpConnection::on_read, this, std::placeholders::_1));
    channel_->set_write_callback([this](Channel& channel) {
        this->on_write(channel);
        });
    channel_->set_close_callback([this](Channel& channel) {
        this->on_close(channel);
        });
    channel_->set_error_callback([this](Channel& channel) {
        this->on_error(channel);
        });
}

TcpConnection::~TcpConnection() {
    spdlog::debug("TcpConnection::~TcpConnection() called. fd: {}", channel_->get_fd());
}

void TcpConnection::connection_establish() {
    loop_->assert_in_loop_thread();
    channel_->tie_to_object(shared_from_this());
    channel_->enable_reading(); // tie 之后再关注读事件，保证回调期间对象有效
}

void TcpConnection::connection_destroy() {
    loop_->assert_in_loop_thread();
    closed_ = true;
    channel_->disable_all();
}

int TcpConnection::get_fd() const {
    return channel_->get_fd();
}

void TcpConnection::set_message_callback(MessageCallback cb) {
    messageCallback_ = std::move(cb);
}

void TcpConnection::set_close_callback(CloseCallback cb) {
    closeCallback_ = std::move(cb);
}

void TcpConnection::send(const std::string& msg) {
    loop_->assert_in_loop_thread();
    if (closed_) {
        spdlog::warn("TcpConnection::send() on closed connection, fd: {}", get_fd());
        return;
    }
    writeBuffer_->write_to_buffer(msg);
    channel_->enable_writing();
}

std::string TcpConnection::receive() {
    loop_->assert_in_loop_thread();
    return readBuffer_->read_from_buffer();
}

void TcpConnection::shutdown() {
    loop_->assert_in_loop_thread();
    if (closed_) {
        return;
    }
    shutdownPending_ = true;
    if (!channel_->is_writing()) {
        shutdown_write();
    }
    // 否则等 on_write 把 writeBuffer 写空后再关闭写端
}

void TcpConnection::shutdown_write() {
    if (::shutdown(channel_->get_fd(), SHUT_WR) < 0) {
        spdlog::error("TcpConnection::shutdown_write(). fd: {}, errno: {}", channel_->get_fd(), errno);
    }
}

void TcpConnection::on_read(Channel& channel) {
    loop_->assert_in_loop_thread();

    int savedErrno = 0;
    ssize_t n = readBuffer_->read_from_fd(channel.get_fd(), &savedErrno);
    if (n > 0) {
        this->handle_message_callback();
    }
    else if (n == 0) { // 对端关闭
        on_close(channel);
    }
    else {
        if (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK || savedErrno == EINTR) {
            return; // 等下次 EPOLLIN
        }
        lastErrorCode_ = savedErrno;
        lastErrorMsg_ = std::string("read error: ") + strerror(savedErrno);
        on_error(channel);
    }
}

void TcpConnection::on_write(Channel& channel) {
    loop_->assert_in_loop_thread();
    if (!channel.is_writing()) {
        return; // 已关闭或已写完
    }

    int savedErrno = 0;
    ssize_t n = writeBuffer_->write_to_fd(channel.get_fd(), &savedErrno);
    if (n >= 0) {
        if (writeBuffer_->readable_bytes() == 0) {
            channel.disable_writing();
            if (shutdownPending_) {
                shutdown_write();
            }
        }
        return;
    }
    if (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK || savedErrno == EINTR) {
        return;
    }
    lastErrorCode_ = savedErrno;
    lastErrorMsg_ = std::string("write error: ") + strerror(savedErrno);
    on_error(channel);
}

void TcpConnection::on_close(Channel& channel) {
    loop_->assert_in_loop_thread();
    if (closed_) {
        return;
    }
    closed_ = true;
    spdlog::debug("TcpConnection::on_close() called. fd: {}", channel.get_fd());

    channel.disable_all();
    this->handle_close_callback(); // TcpServer 删除 shared_ptr，实际析构推迟到 Channel::handle_events 结束
}

void TcpConnection::on_error(Channel& channel) {
    loop_->assert_in_loop_thread();
    if (lastErrorCode_ == 0) {
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(channel.get_fd(), SOL_SOCKET, SO_ERROR, &err, &len) == 0) {
            lastErrorCode_ = err;
            lastErrorMsg_ = std::string("socket error: ") + strerror(err);
        }
    }
    spdlog::warn("TcpConnection::on_error() fd: {}, error: {}", channel.get_fd(), lastErrorMsg_);

    on_close(channel); // 出错即关闭连接
}

void TcpConnection::handle_message_callback() {
    if (messageCallback_) {
        messageCallback_(shared_from_this());
    }
}

void TcpConnection::handle_close_callback() {
    if (closeCallback_) {
        std::shared_ptr<TcpConnection> guardThis(shared_from_this()); // 回调过程中延长生命周期
        closeCallback_(guardThis);
    }
}
