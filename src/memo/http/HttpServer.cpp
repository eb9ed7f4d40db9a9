/**
 * @file HttpServer.cpp
 * @brief HTTP 服务器类，基于 TcpServer 实现 HTTP 协议封装
 */

#include "HttpServer.h"

#include "memo/tcp/TcpConnection.h"
#include "spdlog/spdlog.h"

HttpServer::HttpServer(const std::string& ip, uint16_t port, int threadNum) :
    tcpServer_(nullptr),
    maxBodyBytes_(HttpContext::kDefaultMaxBodyBytes),
    httpContexts_(),
    contextsMutex_(),
    httpCallback_(nullptr) {

    tcpServer_.reset(new TcpServer(ip, port, threadNum)); // 兼容 C++11：不使用 std::make_unique
    tcpServer_->set_connection_callback(
        [this](const std::shared_ptr<TcpConnection>& conn) {
            on_connect(conn);
        });
    tcpServer_->set_message_callback(
        [this](const std::shared_ptr<TcpConnection>& conn) {
            on_message(conn);
        });
    tcpServer_->set_close_callback(
        [this](const std::shared_ptr<TcpConnection>& conn) {
            on_close(conn);
        });
}

HttpServer::~HttpServer() {
    tcpServer_.reset();
}

void HttpServer::start() {
    spdlog::info("HttpServer: starting at {}", get_listen_addr().get_ip_port());
    tcpServer_->start();
}

void HttpServer::stop() {
    tcpServer_->stop();
}

void HttpServer::on_connect(const std::shared_ptr<TcpConnection>& conn) {
    spdlog::debug("HttpServer: new connection fd={} from {}", conn->get_fd(), conn->get_peer_addr().get_ip_port());
    std::lock_guard<std::mutex> lock(contextsMutex_);
    httpContexts_[conn->get_fd()].reset(new HttpContext(maxBodyBytes_));
}

void HttpServer::on_close(const std::shared_ptr<TcpConnection>& conn) {
    spdlog::debug("HttpServer: connection closed fd={}", conn->get_fd());
    std::lock_guard<std::mutex> lock(contextsMutex_);
    httpContexts_.erase(conn->get_fd());
}

std::shared_ptr<HttpContext> HttpServer::find_context(int fd) {
    // 锁内只做查找和 shared_ptr 拷贝，缩小临界区
    std::lock_guard<std::mutex> lock(contextsMutex_);
    auto it = httpContexts_.find(fd);
    if (it == httpContexts_.end()) {
        return nullptr;
    }
    return it->second;
}

void HttpServer::on_message(const std::shared_ptr<TcpConnection>& conn) {
    const int fd = conn->get_fd();
    std::string data = conn->receive();

    std::shared_ptr<HttpContext> ctx = find_context(fd);
    if (!ctx) {
        spdlog::error("HttpServer: no HttpContext found for fd={}", fd);
        return;
    }
    if (ctx->is_closing()) {
        spdlog::debug("HttpServer: dropping {} bytes on closing connection fd={}", data.size(), fd);
        return;
    }

    bool ok = ctx->parse(data.data(), data.size());

    // 先按顺序处理解析错误之前已经完整的请求
    while (ctx->is_complete()) {
        HttpRequest req = ctx->get_request();
        ctx->pop_request();
        if (process_request(conn, req)) {
            ctx->mark_closing();
            conn->shutdown();
            return;
        }
    }

    if (!ok) {
        HttpResponse resp = ctx->is_body_too_large() ? generate_too_large_response() : generate_bad_response();
        spdlog::debug("HttpServer: rejecting request from fd={} with {}: {}",
            fd, resp.get_status_code(), ctx->get_error_reason());
        send_response(conn, resp);
        ctx->mark_closing();
        conn->shutdown();
    }
}

bool HttpServer::process_request(const std::shared_ptr<TcpConnection>& conn, const HttpRequest& req) {
    spdlog::debug("HttpServer: {} {} fd={}", req.get_method(), req.get_url(), conn->get_fd());

    HttpResponse resp;
    handle_http_callback(req, resp);

    if (!req.is_keep_alive()) {
        resp.set_close_connection(true);
    }
    send_response(conn, resp);
    return resp.get_close_connection();
}

void HttpServer::send_response(const std::shared_ptr<TcpConnection>& conn, HttpResponse& resp) {
    check_and_set_content_length(resp);
    if (resp.get_close_connection()) {
        resp.add_header("Connection", "close");
    }
    conn->send(resp.package_to_string());
}

void HttpServer::handle_http_callback(const HttpRequest& req, HttpResponse& resp) {
    if (!httpCallback_) {
        spdlog::critical("HttpServer: no HTTP callback set, using default 404 response");
        resp = generate_404_response();
        return;
    }
    httpCallback_(req, resp);
}

void HttpServer::check_and_set_content_length(HttpResponse& resp) {
    if (!resp.is_body_allowed()) {
        resp.remove_header("Content-Length");
        return;
    }
    if (!resp.has_header("Content-Length")) {
        resp.add_header("Content-Length", std::to_string(resp.get_body().size()));
    }
}

HttpResponse HttpServer::generate_bad_response() {
    HttpResponse resp;
    resp.set_status(400, "Bad Request");
    resp.set_close_connection(true);
    return resp;
}

HttpResponse HttpServer::generate_too_large_response() {
    HttpResponse resp;
    resp.set_status(413, "Payload Too Large");
    resp.set_close_connection(true);
    return resp;
}

HttpResponse HttpServer::generate_404_response() {
    HttpResponse resp;
    resp.set_status(404, "Not Found");
    return resp;
}
