/**
 * @file Router.cpp
 * @brief Minimal HTTP router: method + path -> handler 分发
 */

#include "Router.h"

void Router::add_route(const std::string& method, const std::string& path, Handler handler) {
    std::vector<std::string> segments = split_path(path);
    bool hasParam = false;
    for (const auto& seg : segments) {
        if (is_param_segment(seg)) {
            hasParam = true;
            break;
        }
    }

    if (!hasParam) {
        routes_[RouteKey{ method, path }] = std::move(handler);
        return;
    }

    PatternRoute route;
    route.method = method;
    route.segments = std::move(segments);
    route.handler = std::move(handler);
    patternRoutes_.push_back(std::move(route));
}

void Router::add_get_route(const std::string& path, Handler handler) {
    add_route("GET", path, std::move(handler));
}

void Router::add_post_route(const std::string& path, Handler handler) {
    add_route("POST", path, std::move(handler));
}

void Router::add_patch_route(const std::string& path, Handler handler) {
    add_route("PATCH", path, std::move(handler));
}

void Router::add_delete_route(const std::string& path, Handler handler) {
    add_route("DELETE", path, std::move(handler));
}

void Router::set_not_found_handler(Handler handler) {
    notFoundHandler_ = std::move(handler);
}

DispatchResult Router::dispatch(const HttpRequest& req, HttpResponse& resp) const {
    PathParams params;

    // 1) 精确匹配
    auto it = routes_.find(RouteKey{ req.get_method(), req.get_path() });
    if (it != routes_.end()) {
        it->second(req, params, resp);
        return DispatchResult::Matched;
    }

    // 2) 模式路由，按注册顺序
    if (!patternRoutes_.empty()) {
        std::vector<std::string> segments = split_path(req.get_path());
        for (const auto& route : patternRoutes_) {
            if (route.method != req.get_method()) {
                continue;
            }
            params.clear();
            if (match_pattern(route, segments, params)) {
                route.handler(req, params, resp);
                return DispatchResult::Matched;
            }
        }
    }

    // 3) 未命中 -> 404
    params.clear();
    if (notFoundHandler_) {
        notFoundHandler_(req, params, resp);
    }
    else {
        fill_default_not_found(resp);
    }
    return DispatchResult::NotFound;
}

// "/notes/1" -> ["notes", "1"]；"/" -> [""]；保留空段，"/notes/" 与 "/notes" 不同
std::vector<std::string> Router::split_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = (!path.empty() && path[0] == '/') ? 1 : 0;
    while (true) {
        size_t pos = path.find('/', start);
        if (pos == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return segments;
}

bool Router::is_param_segment(const std::string& segment) {
    return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

bool Router::match_pattern(const PatternRoute& route, const std::vector<std::string>& segments, PathParams& params) {
    if (route.segments.size() != segments.size()) {
        return false;
    }
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& expected = route.segments[i];
        if (is_param_segment(expected)) {
            if (segments[i].empty()) {
                return false;
            }
            params[expected.substr(1, expected.size() - 2)] = segments[i];
        }
        else if (expected != segments[i]) {
            return false;
        }
    }
    return true;
}

void Router::fill_default_not_found(HttpResponse& resp) {
    resp.set_http_version("HTTP/1.1");
    resp.set_status(404, "Not Found");
    resp.set_body("");
}
