/**
 * @file Buffer.cpp
 * @brief 字节缓冲区，管理可读/可写/预留区域，并支持与 fd 的非阻塞读写。
 */

#include "Buffer.h"

#include <algorithm>
#include <cassert>
#include <errno.h>
#include <sys/uio.h>
#include <unistd.h>

#include "spdlog/spdlog.h"

const size_t Buffer::kCheapPrepend_ = 8;
const size_t Buffer::kInitialSize_ = 1024;

Buffer::Buffer(size_t initialSize) :
    buffer_(kCheapPrepend_ + initialSize),
    readIndex_(kCheapPrepend_),
    writeIndex_(kCheapPrepend_) {

    assert(readable_bytes() == 0);
    assert(writable_bytes() == initialSize);
    assert(prependable_bytes() == kCheapPrepend_);
}

std::string Buffer::read_from_buffer(size_t len) {
    if (len > readable_bytes()) {
        spdlog::warn("Buffer::read_from_buffer(). len {} > readable_bytes {}, truncated.", len, readable_bytes());
        len = readable_bytes();
    }

    const char* start = readable_start_ptr();
    std::string str(start, len);
    maintain_read_index(len);
    return str;
}

std::string Buffer::read_from_buffer() {
    return read_from_buffer(readable_bytes());
}

void Buffer::write_to_buffer(const char* data, size_t len) {
    if (writable_bytes() < len) {
        make_space(len); // 要么扩容要么搬移
    }
    std::copy(data, data + len, buffer_.begin() + writeIndex_);
    writeIndex_ += len;
}

void Buffer::write_to_buffer(const std::string& str) {
    write_to_buffer(str.data(), str.size());
}

ssize_t Buffer::read_from_fd(int fd, int* savedErrno) {
    // LT 模式，一次没读完下次还会触发，不用 while 读。
    // readv + 栈上 extraBuf：buffer 不必预先开很大
    char extraBuf[65536];
    const size_t writableBytes = writable_bytes();

    struct iovec vec[2];
    vec[0].iov_base = buffer_.data() + writeIndex_;
    vec[0].iov_len = writableBytes;
    vec[1].iov_base = extraBuf;
    vec[1].iov_len = sizeof(extraBuf);

    const int cnt = (writableBytes < sizeof(extraBuf)) ? 2 : 1;
    ssize_t n = ::readv(fd, vec, cnt);
    if (n < 0) {
        *savedErrno = errno;
    }
    else if (static_cast<size_t>(n) <= writableBytes) {
        writeIndex_ += n;
    }
    else {
        writeIndex_ = buffer_.size();
        write_to_buffer(extraBuf, n - writableBytes);
    }
    return n;
}

ssize_t Buffer::write_to_fd(int fd, int* savedErrno) {
    ssize_t n = ::write(fd, readable_start_ptr(), readable_bytes());
    if (n < 0) {
        *savedErrno = errno;
    }
    else {
        maintain_read_index(n);
    }
    return n;
}

size_t Buffer::readable_bytes() const {
    return writeIndex_ - readIndex_;
}

size_t Buffer::writable_bytes() const {
    return buffer_.size() - writeIndex_;
}

size_t Buffer::prependable_bytes() const {
    return readIndex_;
}

const char* Buffer::readable_start_ptr() const {
    return buffer_.data() + readIndex_;
}

void Buffer::maintain_read_index(size_t len) {
    if (len < readable_bytes()) {
        readIndex_ += len;
        return;
    }
    maintain_all_index(); // 读完了直接重置
}

void Buffer::maintain_all_index() {
    readIndex_ = kCheapPrepend_;
    writeIndex_ = kCheapPrepend_;
}

void Buffer::make_space(size_t len) {
    // 搬移后仍不够才扩容
    if (writable_bytes() + prependable_bytes() < len + kCheapPrepend_) {
        buffer_.resize(writeIndex_ + len);
        return;
    }
    const size_t readableBytes = readable_bytes();
    std::copy(buffer_.begin() + readIndex_, buffer_.begin() + writeIndex_, buffer_.begin() + kCheapPrepend_);
    readIndex_ = kCheapPrepend_;
    writeIndex_ = readIndex_ + readableBytes; // 不可直接调用 readable_bytes()，正在维护 index
}
