/**
 * @file TcpServer.h
 * @brief TCP 服务器：管理 Acceptor、IO 线程池与 TcpConnection
 * @details
 *
 * - 持有 EventLoopThreadPool（1 个 mainLoop + N 个 ioLoop）与 Acceptor。
 * - 新连接轮询分配到 ioLoop，在 ioLoop 线程内创建 TcpConnection，维护 fd -> TcpConnection 映射。
 * - start() 在调用线程运行 mainLoop 直到 stop()；stop() 可跨线程调用。
 * - 析构时在各自的 loop 线程内销毁剩余连接。
 */

#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "memo/base/InetAddress.h"
#include "EventLoopThreadPool.h"

class EventLoop;
class Acceptor;
class TcpConnection;
class TcpServer {
    // 回调参数统一为 shared_ptr<TcpConnection>：业务层可以获取对端地址、收发数据，且回调期间对象不会析构
    // MessageCallback 不传 msg，业务层通过 conn->receive() 主动取数据
    using ConnectionCallback = std::function<void(const std::shared_ptr<TcpConnection>&)>;
    using MessageCallback = std::function<void(const std::shared_ptr<TcpConnection>&)>;
    using CloseCallback = std::function<void(const std::shared_ptr<TcpConnection>&)>;

private:
    std::unique_ptr<EventLoopThreadPool> loopThreadPool_; // 最先构造、最后析构

    std::unique_ptr<Acceptor> acceptor_;
    std::unordered_map<int, std::shared_ptr<TcpConnection>> connections_;
    std::mutex connectionsMutex_; // 多个 IO loop 线程都会增删 connections_

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    CloseCallback closeCallback_;

public:
    // 构造即创建 mainLoop 并 bind/listen，失败抛出 std::runtime_error
    TcpServer(const std::string& ip, uint16_t port, int ioLoopNum = 0);
    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;
    ~TcpServer();

    const InetAddress& get_listen_addr() const;
    int get_num_threads() const { return loopThreadPool_->get_num_threads(); }

    void set_connection_callback(ConnectionCallback cb);
    void set_message_callback(MessageCallback cb);
    void set_close_callback(CloseCallback cb);

    void start(); // 阻塞运行 mainLoop
    void stop();

private:
    void on_connect(Acceptor& acceptor);
    void on_message(const std::shared_ptr<TcpConnection>& conn);
    void on_close(const std::shared_ptr<TcpConnection>& conn);

    void remove_connection(const std::shared_ptr<TcpConnection>& conn);
    void destroy_connections_in_loop(EventLoop* loop);
};
