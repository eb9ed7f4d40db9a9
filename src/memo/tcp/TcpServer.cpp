/**
 * @file TcpServer.cpp
 * @brief TCP 服务器：管理 Acceptor、IO 线程池与 TcpConnection
 */

#include "TcpServer.h"

#include <vector>

#include "Acceptor.h"
#include "Channel.h"
#include "EventLoop.h"
#include "TcpConnection.h"
#include "spdlog/spdlog.h"

TcpServer::TcpServer(const std::string& ip, uint16_t port, int ioLoopNum) :
    loopThreadPool_(nullptr),
    acceptor_(nullptr),
    connections_(),
    connectionsMutex_(),
    connectionCallback_(nullptr),
    messageCallback_(nullptr),
    closeCallback_(nullptr) {

    // 创建线程池（mainLoop 在这里创建，ioLoops 在 start() 时创建）
    loopThreadPool_.reset(new EventLoopThreadPool("TcpServerLoopPool", ioLoopNum));

    acceptor_.reset(new Acceptor(loopThreadPool_->get_main_loop(), InetAddress(ip, port)));
    acceptor_->set_connect_callback(std::bind(&TcpServer::on_connect, this, std::placeholders::_1));
}

TcpServer::~TcpServer() {
    acceptor_.reset(); // 不再接受新连接

    // 连接的 Channel 必须在所属 loop 线程内析构：投递到各 loop，IO loop 退出前会执行完剩余任务
    std::vector<EventLoop*> loops = loopThreadPool_->get_all_loops();
    for (size_t i = 0; i < loops.size(); ++i) {
        EventLoop* loop = loops[i];
        loop->run_in_loop([this, loop]() {
            destroy_connections_in_loop(loop);
            });
    }
    // mainLoop 上可能也有连接（ioLoopNum 为 0 时）
    EventLoop* mainLoop = loopThreadPool_->get_main_loop();
    if (loops.empty() || loops.front() != mainLoop) {
        destroy_connections_in_loop(mainLoop);
    }

    loopThreadPool_.reset(); // join IO 线程
}

const InetAddress& TcpServer::get_listen_addr() const {
    return acceptor_->get_listen_addr();
}

void TcpServer::start() {
    EventLoop* mainLoop = loopThreadPool_->get_main_loop();
    spdlog::info("TcpServer: listening on {} with {} loop(s)", get_listen_addr().get_ip_port(), get_num_threads());
    loopThreadPool_->start();
    mainLoop->loop();
}

void TcpServer::stop() {
    spdlog::info("TcpServer: stopping {}", get_listen_addr().get_ip_port());
    loopThreadPool_->get_main_loop()->quit();
}

void TcpServer::set_connection_callback(ConnectionCallback cb) {
    connectionCallback_ = std::move(cb);
}

void TcpServer::set_message_callback(MessageCallback cb) {
    messageCallback_ = std::move(cb);
}

void TcpServer::set_close_callback(CloseCallback cb) {
    closeCallback_ = std::move(cb);
}

void TcpServer::on_connect(Acceptor& acceptor) {
    loopThreadPool_->get_main_loop()->assert_in_loop_thread();

    int connFd = acceptor.get_accepted_fd();
    InetAddress peerAddr = acceptor.get_accepted_peer_addr();
    spdlog::debug("TcpServer: new connection from {} on fd {}", peerAddr.get_ip_port(), connFd);

    // 初始化必须在目标 IO 线程执行：Channel 构造要求在 loop 线程，且要先设置好回调再开始关注事件
    EventLoop* ioLoop = loopThreadPool_->get_next_loop();
    ioLoop->run_in_loop([this, connFd, ioLoop, peerAddr]() {
        std::shared_ptr<TcpConnection> conn = std::make_shared<TcpConnection>(ioLoop, connFd, peerAddr);
        conn->set_message_callback(std::bind(&TcpServer::on_message, this, std::placeholders::_1));
        conn->set_close_callback(std::bind(&TcpServer::on_close, this, std::placeholders::_1));
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            connections_[connFd] = conn;
        }
        if (connectionCallback_) {
            connectionCallback_(conn); // 上层先建立好自己的上下文，再开始读
        }
        conn->connection_establish();
        });
}

void TcpServer::on_message(const std::shared_ptr<TcpConnection>& conn) {
    if (!messageCallback_) {
        spdlog::warn("TcpServer::on_message(). messageCallback is nullptr, drop data on fd: {}", conn->get_fd());
        conn->receive();
        return;
    }
    messageCallback_(conn);
}

void TcpServer::on_close(const std::shared_ptr<TcpConnection>& conn) {
    if (closeCallback_) {
        closeCallback_(conn);
    }
    remove_connection(conn);
}

void TcpServer::remove_connection(const std::shared_ptr<TcpConnection>& conn) {
    // close 回调由 TcpConnection 在其 loop 线程触发，直接删除即可
    conn->get_loop()->assert_in_loop_thread();

    int fd = conn->get_fd();
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    auto findIt = connections_.find(fd);
    if (findIt == connections_.end() || findIt->second != conn) {
        spdlog::error("TcpServer::remove_connection(). connection not found, fd: {}", fd);
        return;
    }
    connections_.erase(findIt);
}

void TcpServer::destroy_connections_in_loop(EventLoop* loop) {
    std::vector<std::shared_ptr<TcpConnection>> doomed;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->second->get_loop() == loop) {
                doomed.push_back(std::move(it->second));
                it = connections_.erase(it);
            }
            else {
                ++it;
            }
        }
    }
    for (size_t i = 0; i < doomed.size(); ++i) {
        doomed[i]->connection_destroy();
    }
    // doomed 在本 loop 线程内析构
}
