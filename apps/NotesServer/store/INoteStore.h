#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "Note.h"

class INoteStore {
public:
    virtual ~INoteStore() = default;

    // 笔记 store：负责 id 分配与笔记集合的维护，调用方拿到的都是拷贝。
    // 注意：HttpServer 的多个 IO 线程会并发调用，实现需要自行保证并发安全。
    virtual std::vector<Note> list() = 0;
    virtual Note create(const std::string& title, const std::string& content) = 0;
    virtual bool update(const NoteId& id, const NotePatch& patch) = 0; // id 不存在返回 false
    virtual bool remove(const NoteId& id) = 0;                         // id 不存在返回 false
    virtual size_t size() = 0;
};
