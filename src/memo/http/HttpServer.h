/**
 * @file HttpServer.h
 * @brief HTTP 服务器类，基于 TcpServer 实现 HTTP 协议封装
 * @details
 *
 * HttpServer 对 TcpServer 进行 HTTP 语义封装：
 *  - 每个连接 fd 维护一个 HttpContext，负责 HTTP 报文解析
 *  - 收到完整的 HttpRequest 后，交给上层回调生成 HttpResponse
 *  - 将 HttpResponse 打包为字符串并通过 TcpConnection 发送
 *  - 同一次读到的多个请求（pipelining）按到达顺序依次处理
 *  - 请求要求关闭（Connection: close 或 HTTP/1.0）、报文解析失败（400）、消息体超限（413）时，
 *    发送完响应后半关闭连接
 */

#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "memo/tcp/TcpServer.h"
#include "HttpRequest.h"
#include "HttpResponse.h"
#include "HttpContext.h"

class TcpConnection;
class HttpServer {
    // 上层业务回调：根据 HttpRequest 填充 HttpResponse
    using HttpCallback = std::function<void(const HttpRequest& req, HttpResponse& resp)>;

private:
    std::unique_ptr<TcpServer> tcpServer_;
    size_t maxBodyBytes_;

    // 以连接 fd 作为 key 维护每个连接的 HttpContext。shared_ptr 使锁外使用 HttpContext 仍然安全
    std::unordered_map<int, std::shared_ptr<HttpContext>> httpContexts_;
    std::mutex contextsMutex_;

    HttpCallback httpCallback_;

public:
    // 构造即 bind/listen，失败抛出 std::runtime_error
    HttpServer(const std::string& ip, uint16_t port, int threadNum = 0);
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    ~HttpServer(); // 先停掉 TcpServer 及其 IO 线程，之后才能销毁 httpContexts_

    void set_http_callback(const HttpCallback& cb) { httpCallback_ = cb; }
    void set_max_body_bytes(size_t n) { maxBodyBytes_ = n; } // 仅对之后建立的连接生效，请在 start() 前设置

    const InetAddress& get_listen_addr() const { return tcpServer_->get_listen_addr(); }

    void start(); // 阻塞直到 stop()
    void stop();  // 可跨线程调用

private:
    void on_connect(const std::shared_ptr<TcpConnection>& conn);
    void on_message(const std::shared_ptr<TcpConnection>& conn);
    void on_close(const std::shared_ptr<TcpConnection>& conn);

    std::shared_ptr<HttpContext> find_context(int fd);

    // 处理一个完整请求，返回是否需要关闭连接
    bool process_request(const std::shared_ptr<TcpConnection>& conn, const HttpRequest& req);
    void send_response(const std::shared_ptr<TcpConnection>& conn, HttpResponse& resp);

    void handle_http_callback(const HttpRequest& req, HttpResponse& resp);

    static void check_and_set_content_length(HttpResponse& resp);
    static HttpResponse generate_bad_response();
    static HttpResponse generate_too_large_response();
    static HttpResponse generate_404_response();
};
