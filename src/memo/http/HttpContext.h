/**
 * @file HttpContext.h
 * @brief HTTP 报文解析上下文封装类
 * @details
 *
 * - 基于 llhttp 增量解析 HTTP 请求报文，每个连接一个 HttpContext，结果存储在 HttpRequest 对象中。
 *
 * - 对外接口：
 *   - parse(): 解析传入的数据，返回是否成功。一次调用可能解析出多个完整请求（pipelining），
 *     依次放入内部队列；未完成的报文保留在 llhttp 内部状态中，等待下一次 parse 继续。
 *   - is_complete(): 队列中是否有已完整解析的请求
 *   - get_request() / pop_request(): 按到达顺序取出已完成的请求
 *   - is_body_too_large(): parse 失败是否因为消息体超过上限（上层据此返回 413 而非 400）
 *   - reset(): 重置解析器状态
 *
 * - 消息体上限在 on_headers_complete（Content-Length）和 on_body（chunked 累计）两处检查，
 *   超限时回调返回错误，超限的消息体不会被缓存。
 */

#pragma once
#include <cstddef>
#include <deque>
#include <string>

#include "HttpRequest.h"
#include "llhttp.h"

class HttpContext {
public:
    static const size_t kDefaultMaxBodyBytes = 1024 * 1024;

public:
    explicit HttpContext(size_t maxBodyBytes = kDefaultMaxBodyBytes);

    // 禁止拷贝和移动。llhttp_t 内部 data 指针指向 HttpContext 实例，拷贝或移动会导致指针失效。
    HttpContext(const HttpContext&) = delete;
    HttpContext& operator=(const HttpContext&) = delete;
    HttpContext(HttpContext&&) = delete;
    HttpContext& operator=(HttpContext&&) = delete;

    bool parse(const char* data, size_t len);

    bool is_complete() const { return !completed_.empty(); }
    const HttpRequest& get_request() const { return completed_.front(); }
    void pop_request() { completed_.pop_front(); }

    bool is_body_too_large() const { return bodyTooLarge_; }
    const std::string& get_error_reason() const { return errorReason_; }

    // 连接进入关闭流程后，后续数据直接丢弃
    void mark_closing() { closing_ = true; }
    bool is_closing() const { return closing_; }

    void reset();

private:
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    static HttpContext* get_context(llhttp_t* parser) {
        return static_cast<HttpContext*>(parser->data);
    }

    void on_message_begin_impl();
    void on_url_impl(const char* at, size_t length);
    void on_header_field_impl(const char* at, size_t length);
    void on_header_value_impl(const char* at, size_t length);
    int on_headers_complete_impl();
    int on_body_impl(const char* at, size_t length);
    void on_message_complete_impl();

    void flush_header();

private:
    llhttp_t parser_;
    llhttp_settings_t settings_;

    size_t maxBodyBytes_;
    HttpRequest request_;               // 正在解析的请求
    std::deque<HttpRequest> completed_; // 已完成、待处理的请求

    std::string currentHeaderField_;
    std::string currentHeaderValue_;
    bool lastWasValue_;

    bool bodyTooLarge_;
    bool closing_;
    std::string errorReason_;
};
