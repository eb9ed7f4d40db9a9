#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

#include "INoteStore.h"

class InMemoryNoteStore : public INoteStore {
public:
    // 进程内 vector，按插入顺序保存；重启即丢数据。
    // 一把互斥锁覆盖集合与 id 计数器，list 与写操作使用同一把锁。
    InMemoryNoteStore();

    std::vector<Note> list() override;
    Note create(const std::string& title, const std::string& content) override;
    bool update(const NoteId& id, const NotePatch& patch) override;
    bool remove(const NoteId& id) override;
    size_t size() override;

private:
    std::vector<Note>::iterator find_locked(const NoteId& id);

private:
    std::mutex mutex_;
    std::vector<Note> notes_;
    std::atomic<uint64_t> nextId_; // 只在持有 mutex_ 时推进，id 从 1 开始且永不复用
};
