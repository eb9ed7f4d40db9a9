/**
 * @file TcpConnection.h
 * @brief 面向连接的 TCP 会话封装，负责收发缓冲、事件回调与半关闭。
 * @details
 *
 * 职责：
 * - 持有已建立连接的 fd 对应的 Channel，处理读/写/关闭/错误事件。
 * - 维护读写 Buffer，向上提供 send()/receive()/shutdown()，通过回调对接 TcpServer 与业务层。
 *
 * 线程模型与约定：
 * - 与所属 EventLoop 线程绑定；send/receive/shutdown 必须在该线程调用。
 *
 * 生命周期与所有权：
 * - 由 TcpServer 以 shared_ptr 持有；enable_shared_from_this + Channel tie 保证回调执行期对象有效。
 *
 * 错误处理与边界：
 * - EAGAIN/EWOULDBLOCK 视为本轮读完；read 返回 0 视为对端关闭。
 * - send() 只追加到 writeBuffer 并关注写事件，不阻塞。
 * - shutdown() 在 writeBuffer 写空之后才真正 SHUT_WR，保证响应完整发出。
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "memo/base/InetAddress.h"

class EventLoop;
class Channel;
class Buffer;
class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
    using MessageCallback = std::function<void(const std::shared_ptr<TcpConnection>&)>;
    using CloseCallback = std::function<void(const std::shared_ptr<TcpConnection>&)>;

private:
    EventLoop* loop_;
    std::unique_ptr<Channel> channel_;
    InetAddress peerAddr_;
    std::unique_ptr<Buffer> readBuffer_;
    std::unique_ptr<Buffer> writeBuffer_;

    MessageCallback messageCallback_;
    CloseCallback closeCallback_;

    bool closed_;              // on_close 已执行，避免重复通知上层
    bool shutdownPending_;     // 调用了 shutdown()，等 writeBuffer 写空再 SHUT_WR

    int lastErrorCode_;
    std::string lastErrorMsg_;

public:
    TcpConnection(EventLoop* loop, int connFd, const InetAddress& peerAddr);
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;
    ~TcpConnection();

    void connection_establish(); // 绑定 tie，开始关注读事件
    void connection_destroy();   // 服务器析构时调用：不再关注任何事件，也不再回调上层

    EventLoop* get_loop() const { return loop_; }
    int get_fd() const;
    const InetAddress& get_peer_addr() const { return peerAddr_; }

    void set_message_callback(MessageCallback cb);
    void set_close_callback(CloseCallback cb);

    int get_last_error() const { return lastErrorCode_; }
    const std::string& get_last_error_msg() const { return lastErrorMsg_; }

    void send(const std::string& msg);
    std::string receive();  // 取走 readBuffer 中的全部数据
    void shutdown();        // 半关闭：数据发完后关闭写端

private:
    void on_read(Channel& channel);
    void on_write(Channel& channel);
    void on_close(Channel& channel);
    void on_error(Channel& channel);

    void shutdown_write();

    void handle_message_callback();
    void handle_close_callback();
};
