/**
 * @file HttpContext.cpp
 * @brief HTTP 报文解析上下文封装类
 */

#include "HttpContext.h"

#include "spdlog/spdlog.h"

const size_t HttpContext::kDefaultMaxBodyBytes;

HttpContext::HttpContext(size_t maxBodyBytes) :
    parser_(),
    settings_(),
    maxBodyBytes_(maxBodyBytes),
    request_(),
    completed_(),
    currentHeaderField_(),
    currentHeaderValue_(),
    lastWasValue_(false),
    bodyTooLarge_(false),
    closing_(false),
    errorReason_() {

    llhttp_settings_init(&settings_);
    settings_.on_message_begin = &HttpContext::on_message_begin;
    settings_.on_url = &HttpContext::on_url;
    settings_.on_header_field = &HttpContext::on_header_field;
    settings_.on_header_value = &HttpContext::on_header_value;
    settings_.on_headers_complete = &HttpContext::on_headers_complete;
    settings_.on_body = &HttpContext::on_body;
    settings_.on_message_complete = &HttpContext::on_message_complete;

    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = this;
}

bool HttpContext::parse(const char* data, size_t len) {
    llhttp_errno_t err = llhttp_execute(&parser_, data, len);
    if (err == HPE_OK) {
        return true;
    }

    const char* reason = llhttp_get_error_reason(&parser_);
    errorReason_ = reason ? reason : llhttp_errno_name(err);
    spdlog::debug("HttpContext::parse failed: {} ({})", llhttp_errno_name(err), errorReason_);
    return false;
}

void HttpContext::reset() {
    request_.clear();
    completed_.clear();
    currentHeaderField_.clear();
    currentHeaderValue_.clear();
    lastWasValue_ = false;
    bodyTooLarge_ = false;
    closing_ = false;
    errorReason_.clear();
    llhttp_reset(&parser_);
}

int HttpContext::on_message_begin(llhttp_t* parser) {
    get_context(parser)->on_message_begin_impl();
    return 0;
}

int HttpContext::on_url(llhttp_t* parser, const char* at, size_t length) {
    get_context(parser)->on_url_impl(at, length);
    return 0;
}

int HttpContext::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    get_context(parser)->on_header_field_impl(at, length);
    return 0;
}

int HttpContext::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    get_context(parser)->on_header_value_impl(at, length);
    return 0;
}

int HttpContext::on_headers_complete(llhttp_t* parser) {
    return get_context(parser)->on_headers_complete_impl();
}

int HttpContext::on_body(llhttp_t* parser, const char* at, size_t length) {
    return get_context(parser)->on_body_impl(at, length);
}

int HttpContext::on_message_complete(llhttp_t* parser) {
    get_context(parser)->on_message_complete_impl();
    return 0;
}

void HttpContext::on_message_begin_impl() {
    request_.clear();
    currentHeaderField_.clear();
    currentHeaderValue_.clear();
    lastWasValue_ = false;
}

void HttpContext::on_url_impl(const char* at, size_t length) {
    // URL 可能分多次回调到达，这里累积，path/query 在 headers 完成时再拆分
    request_.set_url(request_.get_url() + std::string(at, length));
}

void HttpContext::on_header_field_impl(const char* at, size_t length) {
    // 上一个是 value，说明一个完整的 field-value 对已经结束
    if (lastWasValue_) {
        flush_header();
    }
    currentHeaderField_.append(at, length);
}

void HttpContext::on_header_value_impl(const char* at, size_t length) {
    currentHeaderValue_.append(at, length);
    lastWasValue_ = true;
}

int HttpContext::on_headers_complete_impl() {
    flush_header();

    const char* method = llhttp_method_name(static_cast<llhttp_method_t>(parser_.method));
    request_.set_method(method ? method : "");
    request_.set_version("HTTP/" + std::to_string(parser_.http_major) + "." + std::to_string(parser_.http_minor));

    request_.set_keep_alive(llhttp_should_keep_alive(&parser_) != 0);

    const std::string& url = request_.get_url();
    auto pos = url.find('?');
    if (pos == std::string::npos) {
        request_.set_path(url);
    }
    else {
        request_.set_path(url.substr(0, pos));
        request_.set_query(url.substr(pos + 1));
    }

    if ((parser_.flags & F_CONTENT_LENGTH) && parser_.content_length > maxBodyBytes_) {
        spdlog::debug("HttpContext: Content-Length {} exceeds limit {}", parser_.content_length, maxBodyBytes_);
        bodyTooLarge_ = true;
        return -1;
    }
    return 0;
}

int HttpContext::on_body_impl(const char* at, size_t length) {
    if (request_.get_body().size() + length > maxBodyBytes_) {
        spdlog::debug("HttpContext: body exceeds limit {}", maxBodyBytes_);
        bodyTooLarge_ = true;
        return -1;
    }
    request_.append_body(at, length);
    return 0;
}

void HttpContext::on_message_complete_impl() {
    completed_.push_back(request_);
    request_.clear();
}

void HttpContext::flush_header() {
    if (!currentHeaderField_.empty()) {
        request_.add_header(currentHeaderField_, currentHeaderValue_);
    }
    currentHeaderField_.clear();
    currentHeaderValue_.clear();
    lastWasValue_ = false;
}
