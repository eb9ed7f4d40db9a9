#pragma once

#include <string>

#include "NoteId.h"

struct Note {
    NoteId id;
    std::string title;
    std::string content;
};

// 部分更新：只有 hasXxx 为 true 的字段才会被写入。
// 字段“缺失”与“存在但为空字符串”需要区分开。
struct NotePatch {
    bool hasTitle = false;
    std::string title;
    bool hasContent = false;
    std::string content;

    bool empty() const { return !hasTitle && !hasContent; }
};
