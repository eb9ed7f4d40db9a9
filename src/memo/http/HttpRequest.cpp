/**
 * @file HttpRequest.cpp
 * @brief HTTP 请求报文封装类
 */

#include "HttpRequest.h"

#include <strings.h>

HttpRequest::HttpRequest() :
    method_(),
    url_(),
    path_(),
    query_(),
    version_(),
    headers_(),
    body_(),
    keepAlive_(true) {
}

void HttpRequest::add_header(const std::string& field, const std::string& value) {
    headers_[field] = value;
}

const std::string& HttpRequest::get_header(const std::string& field) const {
    static const std::string empty;
    auto it = headers_.find(field);
    if (it != headers_.end()) {
        return it->second;
    }
    // 头部字段名大小写不敏感，精确查找失败后再线性比较
    for (const auto& kv : headers_) {
        if (kv.first.size() == field.size() && ::strcasecmp(kv.first.c_str(), field.c_str()) == 0) {
            return kv.second;
        }
    }
    return empty;
}

void HttpRequest::clear() {
    method_.clear();
    url_.clear();
    path_.clear();
    query_.clear();
    version_.clear();
    headers_.clear();
    body_.clear();
    keepAlive_ = true;
}
