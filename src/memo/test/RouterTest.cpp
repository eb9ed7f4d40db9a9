#include <gtest/gtest.h>
#include <string>

#include "memo/router/Router.h"

namespace {

HttpRequest make_request(const std::string& method, const std::string& path) {
    HttpRequest req;
    req.set_method(method);
    req.set_path(path);
    req.set_url(path);
    return req;
}

} // namespace

// 精确路由：method + path 都要匹配
TEST(RouterTest, ExactRoute) {
    Router r;
    int hits = 0;
    r.add_get_route("/notes", [&hits](const HttpRequest&, const Router::PathParams& params, HttpResponse& resp) {
        ++hits;
        EXPECT_TRUE(params.empty());
        resp.set_status(200, "OK");
    });

    HttpResponse resp;
    EXPECT_EQ(r.dispatch(make_request("GET", "/notes"), resp), DispatchResult::Matched);
    EXPECT_EQ(hits, 1);
    EXPECT_EQ(resp.get_status_code(), 200);
}

// 同一路径不同方法分发到不同 handler
TEST(RouterTest, SamePathDifferentMethods) {
    Router r;
    std::string called;
    r.add_get_route("/notes", [&called](const HttpRequest&, const Router::PathParams&, HttpResponse&) { called = "list"; });
    r.add_post_route("/notes", [&called](const HttpRequest&, const Router::PathParams&, HttpResponse&) { called = "create"; });

    HttpResponse resp;
    r.dispatch(make_request("POST", "/notes"), resp);
    EXPECT_EQ(called, "create");
    r.dispatch(make_request("GET", "/notes"), resp);
    EXPECT_EQ(called, "list");
}

// {param} 路由：段值通过 PathParams 传入
TEST(RouterTest, PatternRouteExtractsParam) {
    Router r;
    std::string gotId;
    r.add_delete_route("/notes/{id}", [&gotId](const HttpRequest&, const Router::PathParams& params, HttpResponse&) {
        gotId = params.at("id");
    });

    HttpResponse resp;
    EXPECT_EQ(r.dispatch(make_request("DELETE", "/notes/42"), resp), DispatchResult::Matched);
    EXPECT_EQ(gotId, "42");

    // 段值原样传入，是否合法由 handler 决定
    EXPECT_EQ(r.dispatch(make_request("DELETE", "/notes/abc"), resp), DispatchResult::Matched);
    EXPECT_EQ(gotId, "abc");
}

// 段数不同、空段、前缀不同都不匹配
TEST(RouterTest, PatternRouteRequiresExactShape) {
    Router r;
    r.add_patch_route("/notes/{id}", [](const HttpRequest&, const Router::PathParams&, HttpResponse& resp) {
        resp.set_status(204, "No Content");
    });

    HttpResponse resp;
    EXPECT_EQ(r.dispatch(make_request("PATCH", "/notes"), resp), DispatchResult::NotFound);
    EXPECT_EQ(r.dispatch(make_request("PATCH", "/notes/"), resp), DispatchResult::NotFound);
    EXPECT_EQ(r.dispatch(make_request("PATCH", "/notes/1/extra"), resp), DispatchResult::NotFound);
    EXPECT_EQ(r.dispatch(make_request("PATCH", "/other/1"), resp), DispatchResult::NotFound);
}

// 未注册路径、或路径存在但方法不匹配，默认都是空 body 的 404
TEST(RouterTest, DefaultNotFound) {
    Router r;
    r.add_get_route("/notes", [](const HttpRequest&, const Router::PathParams&, HttpResponse&) {});

    HttpResponse resp;
    EXPECT_EQ(r.dispatch(make_request("PUT", "/notes"), resp), DispatchResult::NotFound);
    EXPECT_EQ(resp.get_status_code(), 404);
    EXPECT_TRUE(resp.get_body().empty());

    HttpResponse resp2;
    EXPECT_EQ(r.dispatch(make_request("GET", "/missing"), resp2), DispatchResult::NotFound);
    EXPECT_EQ(resp2.get_status_code(), 404);
}

// 自定义 404 handler
TEST(RouterTest, CustomNotFoundHandler) {
    Router r;
    bool called = false;
    r.set_not_found_handler([&called](const HttpRequest&, const Router::PathParams&, HttpResponse& resp) {
        called = true;
        resp.set_status(404, "Nope");
    });

    HttpResponse resp;
    EXPECT_EQ(r.dispatch(make_request("GET", "/"), resp), DispatchResult::NotFound);
    EXPECT_TRUE(called);
    EXPECT_EQ(resp.get_status_message(), "Nope");
}
