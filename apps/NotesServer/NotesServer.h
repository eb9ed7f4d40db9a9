#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "memo/http/HttpServer.h"
#include "service/NotesService.h"
#include "store/INoteStore.h"

struct NotesServerConfig {
    std::string ip = "127.0.0.1";
    uint16_t port = 8080; // 0 表示由内核分配端口
    int threadNum = 0;

    size_t maxBodyBytes = HttpContext::kDefaultMaxBodyBytes;       // HTTP 层消息体上限
    size_t maxRequestBytes = NotesService::kDefaultMaxRequestBytes; // 创建/更新笔记的 body 上限
};

class NotesServer {
public:
    // 构造即 bind/listen，失败抛出 std::runtime_error
    NotesServer(NotesServerConfig cfg, std::shared_ptr<INoteStore> store);
    NotesServer(const NotesServer&) = delete;
    NotesServer& operator=(const NotesServer&) = delete;

    void start(); // 阻塞直到 stop()
    void stop();  // 可跨线程调用

    const InetAddress& get_listen_addr() const { return httpServer_->get_listen_addr(); }

private:
    NotesServerConfig cfg_;
    std::unique_ptr<NotesService> service_;
    std::unique_ptr<HttpServer> httpServer_;
};
