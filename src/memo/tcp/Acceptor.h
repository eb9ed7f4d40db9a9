/**
 * @file Acceptor.h
 * @brief 监听新连接的接入器（封装 listenFd 及持有其 Channel），在有连接到来时接受并上报给上层。
 * @details
 *
 * 职责：
 * - 创建、绑定、监听非阻塞 listenFd（create_fd/bind_address/start_listen），失败时抛出 std::runtime_error。
 * - 将 listenFd 注册到所属 EventLoop 的 Channel 上，可读时 accept 得到 connFd 并通过回调发布给上层（TcpServer）。
 * - 对已接受的 connFd 只发布，不负责其后续生命周期（由 TcpConnection 的 Channel 管理）。
 *
 * 线程模型与约定：
 * - 与所属 EventLoop（mainLoop）线程绑定。
 */

#pragma once
#include <functional>
#include <memory>

#include "memo/base/InetAddress.h"

class EventLoop;
class Channel;
class Acceptor {
    // 回调参数为 Acceptor 引用，上层通过 get_accepted_fd()/get_accepted_peer_addr() 获取新连接信息
    using NewConnectCallback = std::function<void(Acceptor&)>;

private:
    EventLoop* loop_;
    InetAddress listenAddr_;               // 实际监听地址（端口为 0 时 bind 后回填内核分配的端口）
    int listenFd_;                         // 只使用，不负责生命周期（由 channel_ 关闭）
    std::unique_ptr<Channel> channel_;
    NewConnectCallback newConnectCallback_;

    int acceptedConnFd_;
    InetAddress acceptedPeerAddr_;

public:
    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    Acceptor(const Acceptor&) = delete;
    Acceptor& operator=(const Acceptor&) = delete;
    ~Acceptor() = default;

    int get_listen_fd() const;
    const InetAddress& get_listen_addr() const { return listenAddr_; }
    void set_connect_callback(NewConnectCallback cb);

    // 在 newConnectCallback 回调中使用
    int get_accepted_fd();
    const InetAddress& get_accepted_peer_addr() const;

private:
    int create_fd();
    void bind_address(int listenFd);
    void start_listen(int listenFd);

    // listenFd 理论上只有读事件，其余回调只记录日志
    void on_error(Channel& channel);
    void on_close(Channel& channel);
    void on_write(Channel& channel);
    void on_read(Channel& channel);

    void handle_connect_callback();
};
