/**
 * @file HttpResponse.cpp
 * @brief HTTP 响应报文封装类
 */

#include "HttpResponse.h"

HttpResponse::HttpResponse() :
    httpVersion_("HTTP/1.1"),
    statusCode_(200),
    statusMessage_("OK"),
    headers_(),
    body_(),
    closeConnection_(false) {
}

const std::string& HttpResponse::get_header(const std::string& field) const {
    static const std::string empty;
    auto it = headers_.find(field);
    return it == headers_.end() ? empty : it->second;
}

bool HttpResponse::is_body_allowed() const {
    return !(statusCode_ < 200 || statusCode_ == 204 || statusCode_ == 304);
}

std::string HttpResponse::package_to_string() const {
    std::string result;
    result.reserve(128 + body_.size());

    result.append(httpVersion_);
    result.push_back(' ');
    result.append(std::to_string(statusCode_));
    result.push_back(' ');
    result.append(statusMessage_);
    result.append("\r\n");

    for (const auto& kv : headers_) {
        result.append(kv.first);
        result.append(": ");
        result.append(kv.second);
        result.append("\r\n");
    }

    result.append("\r\n");
    if (is_body_allowed()) {
        result.append(body_);
    }
    return result;
}
