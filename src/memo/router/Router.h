/**
 * @file Router.h
 * @brief Minimal HTTP router: method + path -> handler 分发
 * @details Router 根据请求的 HTTP 方法和 URL 路径将请求分发到不同的处理函数（handler）。
 * - 精确路由的 key 是 (Method, Path) 对，同一路径不同方法可以注册不同 handler。
 * - 模式路由允许路径段写成 {name}，例如 "/notes/{id}"，命中后段值放入 PathParams 交给 handler。
 * - 先查精确路由，再按注册顺序尝试模式路由；都未命中（包括路径存在但方法不匹配）时返回 404。
 *
 * 用法概览：
 *   Router r;
 *   r.add_get_route("/notes", listHandler);
 *   r.add_route("DELETE", "/notes/{id}", deleteHandler);
 *   r.dispatch(req, resp); // 未命中会自动给 404
 */

#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "memo/http/HttpRequest.h"
#include "memo/http/HttpResponse.h"

enum class DispatchResult {
    Matched,  // 命中并已执行 handler
    NotFound  // 没有匹配的 method + path
};

struct RouteKey {
    std::string method;
    std::string path;
    bool operator==(const RouteKey& other) const {
        return method == other.method && path == other.path;
    }
};

struct RouteKeyHash {
    std::size_t operator()(const RouteKey& key) const {
        const std::size_t h1 = std::hash<std::string>{}(key.method);
        const std::size_t h2 = std::hash<std::string>{}(key.path);
        // hash_combine (boost 风格)
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

class Router {
public:
    using PathParams = std::unordered_map<std::string, std::string>;
    // 约定：handler 读取 req 与路径参数，并把 resp 填好（状态码/头/body）
    using Handler = std::function<void(const HttpRequest&, const PathParams&, HttpResponse&)>;

public:
    // 注册路由；请在服务启动前完成注册，当前实现未做并发防护。
    // path 中含有 {name} 段时注册为模式路由，否则为精确路由。
    void add_route(const std::string& method, const std::string& path, Handler handler);
    void add_get_route(const std::string& path, Handler handler);
    void add_post_route(const std::string& path, Handler handler);
    void add_patch_route(const std::string& path, Handler handler);
    void add_delete_route(const std::string& path, Handler handler);

    DispatchResult dispatch(const HttpRequest& req, HttpResponse& resp) const;

    void set_not_found_handler(Handler handler);

private:
    struct PatternRoute {
        std::string method;
        std::vector<std::string> segments; // 以 '/' 切分后的各段，{name} 保留原样
        Handler handler;
    };

    static std::vector<std::string> split_path(const std::string& path);
    static bool is_param_segment(const std::string& segment);
    static bool match_pattern(const PatternRoute& route, const std::vector<std::string>& segments, PathParams& params);

    static void fill_default_not_found(HttpResponse& resp);

private:
    std::unordered_map<RouteKey, Handler, RouteKeyHash> routes_;
    std::vector<PatternRoute> patternRoutes_; // 按注册顺序尝试
    Handler notFoundHandler_;
};
