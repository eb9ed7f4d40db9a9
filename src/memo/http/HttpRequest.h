/**
 * @file HttpRequest.h
 * @brief HTTP 请求报文封装类
 * @details
 *
 * - 封装请求报文的各个部分：方法、URL（拆分为 path 和 query）、协议版本、头部字段、消息体。
 *   例如 URL 为 /notes?x=1，则 path 为 /notes，query 为 x=1。
 * - 头部字段名按原样保存，get_header() 查找时不区分大小写。
 * - keepAlive 由解析器根据版本号与 Connection 头给出。
 * - 服务器端只解析请求，不需要 package_to_string()。
 */

#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

class HttpRequest {
public:
    using Headers = std::unordered_map<std::string, std::string>;

public:
    HttpRequest();
    ~HttpRequest() = default;

    void set_method(const std::string& m) { method_ = m; }
    const std::string& get_method() const { return method_; }

    void set_url(const std::string& u) { url_ = u; }
    const std::string& get_url() const { return url_; }

    void set_path(const std::string& p) { path_ = p; }
    const std::string& get_path() const { return path_; }

    void set_query(const std::string& q) { query_ = q; }
    const std::string& get_query() const { return query_; }

    void set_version(const std::string& v) { version_ = v; }
    const std::string& get_version() const { return version_; }

    void add_header(const std::string& field, const std::string& value);
    const Headers& get_headers() const { return headers_; }
    const std::string& get_header(const std::string& field) const;

    void append_body(const char* data, size_t len) { body_.append(data, len); }
    void set_body(const std::string& b) { body_ = b; }
    const std::string& get_body() const { return body_; }

    void set_keep_alive(bool on) { keepAlive_ = on; }
    bool is_keep_alive() const { return keepAlive_; }

    void clear();

private:
    std::string method_;
    std::string url_;
    std::string path_;
    std::string query_;
    std::string version_;
    Headers headers_;
    std::string body_;
    bool keepAlive_;
};
