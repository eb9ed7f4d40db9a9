#include <gtest/gtest.h>
#include <string>

#include "memo/http/HttpResponse.h"

// 默认构造为 HTTP/1.1 200 OK
TEST(HttpResponseTest, Defaults) {
    HttpResponse resp;
    EXPECT_EQ(resp.get_http_version(), "HTTP/1.1");
    EXPECT_EQ(resp.get_status_code(), 200);
    EXPECT_EQ(resp.get_status_message(), "OK");
    EXPECT_FALSE(resp.get_close_connection());
    EXPECT_TRUE(resp.get_body().empty());
}

// 打包：状态行 + 头部 + 空行 + body
TEST(HttpResponseTest, PackageWithBody) {
    HttpResponse resp;
    resp.set_status(201, "Created");
    resp.add_header("Content-Type", "application/json; charset=utf-8");
    resp.add_header("Content-Length", "2");
    resp.set_body("{}");

    const std::string s = resp.package_to_string();
    EXPECT_EQ(s.find("HTTP/1.1 201 Created\r\n"), 0u);
    EXPECT_NE(s.find("Content-Type: application/json; charset=utf-8\r\n"), std::string::npos);
    EXPECT_NE(s.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_EQ(s.substr(s.size() - 6), "\r\n\r\n{}");
}

// 204 不输出 body
TEST(HttpResponseTest, NoContentHasNoBody) {
    HttpResponse resp;
    resp.set_status(204, "No Content");
    resp.set_body("ignored");

    EXPECT_FALSE(resp.is_body_allowed());
    EXPECT_EQ(resp.package_to_string(), "HTTP/1.1 204 No Content\r\n\r\n");
}

TEST(HttpResponseTest, HeaderAccessors) {
    HttpResponse resp;
    EXPECT_FALSE(resp.has_header("X-Test"));
    EXPECT_TRUE(resp.get_header("X-Test").empty());

    resp.add_header("X-Test", "1");
    EXPECT_TRUE(resp.has_header("X-Test"));
    EXPECT_EQ(resp.get_header("X-Test"), "1");

    resp.remove_header("X-Test");
    EXPECT_FALSE(resp.has_header("X-Test"));
}
