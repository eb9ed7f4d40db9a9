#include "NoteJson.h"

#include "nlohmann/json.hpp"

namespace notejson {

namespace {

using ordered_json = nlohmann::ordered_json;

ordered_json note_to_object(const Note& note) {
    ordered_json j;
    j["id"] = note.id.value();
    j["title"] = note.title;
    j["content"] = note.content;
    return j;
}

bool parse_object(const std::string& body, nlohmann::json& out, std::string& outError) {
    try {
        out = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::exception& e) {
        outError = e.what();
        return false;
    }
    if (!out.is_object()) {
        outError = "body must be a JSON object";
        return false;
    }
    return true;
}

// 读取可选字符串字段：缺失或 null 时 outPresent 为 false；类型不是字符串时返回 false。
bool read_optional_string(const nlohmann::json& obj, const char* key,
    bool& outPresent, std::string& outValue, std::string& outError) {
    outPresent = false;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        outError = std::string("field '") + key + "' must be a string";
        return false;
    }
    outValue = it->get<std::string>();
    outPresent = true;
    return true;
}

} // namespace

std::string to_json(const Note& note) {
    return note_to_object(note).dump();
}

std::string to_json(const std::vector<Note>& notes) {
    ordered_json arr = ordered_json::array();
    for (const auto& note : notes) {
        arr.push_back(note_to_object(note));
    }
    return arr.dump();
}

bool parse_create_request(const std::string& body, CreateRequest& out, std::string& outError) {
    nlohmann::json obj;
    if (!parse_object(body, obj, outError)) {
        return false;
    }

    bool hasTitle = false;
    bool hasContent = false;
    CreateRequest req;
    if (!read_optional_string(obj, "title", hasTitle, req.title, outError)) {
        return false;
    }
    if (!hasTitle) {
        outError = "field 'title' is required";
        return false;
    }
    if (!read_optional_string(obj, "content", hasContent, req.content, outError)) {
        return false;
    }

    out = std::move(req);
    return true;
}

bool parse_update_request(const std::string& body, NotePatch& out, std::string& outError) {
    nlohmann::json obj;
    if (!parse_object(body, obj, outError)) {
        return false;
    }

    NotePatch patch;
    if (!read_optional_string(obj, "title", patch.hasTitle, patch.title, outError)) {
        return false;
    }
    if (!read_optional_string(obj, "content", patch.hasContent, patch.content, outError)) {
        return false;
    }

    out = std::move(patch);
    return true;
}

} // namespace notejson
