#pragma once

#include <cstdint>
#include <functional>
#include <string>

// 笔记 id：对 uint64_t 的薄封装，只能由 store 分配或从路径段解析得到。
class NoteId {
public:
    NoteId() : value_(0) {}
    explicit NoteId(uint64_t value) : value_(value) {}

    uint64_t value() const { return value_; }
    std::string to_string() const { return std::to_string(value_); }

    // 仅接受非空的纯 ASCII 数字串，且不能超出 uint64_t 范围。
    // 不接受符号、空白、前缀 0x 等；失败返回 false，outId 不变。
    static bool parse(const std::string& segment, NoteId& outId);

    bool operator==(const NoteId& other) const { return value_ == other.value_; }
    bool operator!=(const NoteId& other) const { return value_ != other.value_; }
    bool operator<(const NoteId& other) const { return value_ < other.value_; }

private:
    uint64_t value_;
};
