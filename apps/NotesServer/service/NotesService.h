#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "memo/http/HttpRequest.h"
#include "memo/http/HttpResponse.h"
#include "memo/router/Router.h"
#include "store/INoteStore.h"

// 笔记业务层：注册四条路由，校验输入，调用 store 一次，把结果映射为 HTTP 状态码与 JSON。
// 不依赖网络，可以直接构造 HttpRequest 进行测试。
class NotesService {
public:
    static const size_t kDefaultMaxRequestBytes = 16 * 1024;

public:
    explicit NotesService(std::shared_ptr<INoteStore> store, size_t maxRequestBytes = kDefaultMaxRequestBytes);
    NotesService(const NotesService&) = delete;
    NotesService& operator=(const NotesService&) = delete;

    // HttpServer 的回调入口
    void on_http_request(const HttpRequest& req, HttpResponse& resp);

private:
    void handle_list(const HttpRequest& req, const Router::PathParams& params, HttpResponse& resp);
    void handle_create(const HttpRequest& req, const Router::PathParams& params, HttpResponse& resp);
    void handle_update(const HttpRequest& req, const Router::PathParams& params, HttpResponse& resp);
    void handle_delete(const HttpRequest& req, const Router::PathParams& params, HttpResponse& resp);

    static bool parse_id_param(const Router::PathParams& params, NoteId& outId);

    static void respond_json(HttpResponse& resp, int code, const std::string& message, const std::string& body);
    static void respond_empty(HttpResponse& resp, int code, const std::string& message);

private:
    std::shared_ptr<INoteStore> store_;
    size_t maxRequestBytes_;
    Router router_;
};
