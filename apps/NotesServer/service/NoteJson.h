#pragma once

#include <string>
#include <vector>

#include "store/Note.h"

// 笔记与 JSON 之间的编解码，基于 nlohmann::json。
// 输出字段顺序固定为 id、title、content。
namespace notejson {

struct CreateRequest {
    std::string title;
    std::string content; // 缺省为 ""
};

std::string to_json(const Note& note);
std::string to_json(const std::vector<Note>& notes);

// 解析 POST /notes 的 body：必须是 JSON 对象，title 为必填字符串，content 为可选字符串。
// null 视为字段缺失，未知字段忽略。失败返回 false 并在 outError 中给出原因。
bool parse_create_request(const std::string& body, CreateRequest& out, std::string& outError);

// 解析 PATCH /notes/{id} 的 body：title/content 均为可选字符串，存在与否记录在 NotePatch 中。
// 两个字段都缺失不算解析错误，由调用方决定如何处理。
bool parse_update_request(const std::string& body, NotePatch& out, std::string& outError);

} // namespace notejson
