/**
 * @file HttpResponse.h
 * @brief HTTP 响应报文封装类
 * @details
 *
 * - 封装响应报文的各个部分：版本号、状态码、状态消息、头部字段、消息体。
 * - package_to_string() 把响应打包成字符串，便于通过网络发送。
 * - closeConnection 为 true 时，HttpServer 发送完响应后关闭连接。
 */

#pragma once
#include <string>
#include <unordered_map>

class HttpResponse {
public:
    using Headers = std::unordered_map<std::string, std::string>;

public:
    HttpResponse();
    ~HttpResponse() = default;

    std::string package_to_string() const;

    void set_http_version(const std::string& version) { httpVersion_ = version; }
    const std::string& get_http_version() const { return httpVersion_; }

    void set_status(int code, const std::string& message) {
        statusCode_ = code;
        statusMessage_ = message;
    }
    int get_status_code() const { return statusCode_; }
    const std::string& get_status_message() const { return statusMessage_; }

    void add_header(const std::string& field, const std::string& value) { headers_[field] = value; }
    void remove_header(const std::string& field) { headers_.erase(field); }
    bool has_header(const std::string& field) const { return headers_.find(field) != headers_.end(); }
    const std::string& get_header(const std::string& field) const;
    const Headers& get_headers() const { return headers_; }

    void set_body(const std::string& body) { body_ = body; }
    const std::string& get_body() const { return body_; }

    void set_close_connection(bool on) { closeConnection_ = on; }
    bool get_close_connection() const { return closeConnection_; }

    // 1xx/204/304 响应不允许带消息体，也不发送 Content-Length
    bool is_body_allowed() const;

private:
    std::string httpVersion_;
    int statusCode_;
    std::string statusMessage_;
    Headers headers_;
    std::string body_;
    bool closeConnection_;
};
