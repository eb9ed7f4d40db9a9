/**
 * @file Buffer.h
 * @brief 字节缓冲区，管理可读/可写/预留区域，并支持与 fd 的非阻塞读写。
 * @details
 *
 * 内部模型（参考 Netty ChannelBuffer / muduo Buffer）：
 *   @code
 *   +-------------------+------------------+------------------+
 *   | prependable bytes |  readable bytes  |  writable bytes  |
 *   |                   |     (CONTENT)    |                  |
 *   +-------------------+------------------+------------------+
 *   |                   |                  |                  |
 *   0      <=      readIndex    <=    writeIndex      <=     size
 *   @endcode
 *
 * - 两个数据流向：
 *   1. fd -> readBuffer（read_from_fd），上层通过 read_from_buffer 取走
 *   2. 上层 write_to_buffer -> writeBuffer，再由 write_to_fd 写入内核
 *
 * 线程模型：
 * - 非线程安全；只在所属连接的 EventLoop 线程内使用。
 */

#pragma once
#include <sys/types.h>
#include <string>
#include <vector>

class Buffer {
private:
    static const size_t kCheapPrepend_;
    static const size_t kInitialSize_;

    std::vector<char> buffer_;
    size_t readIndex_;
    size_t writeIndex_;

public:
    explicit Buffer(size_t initialSize = kInitialSize_);
    ~Buffer() = default;

    size_t prependable_bytes() const;
    size_t readable_bytes() const;
    size_t writable_bytes() const;

    const char* readable_start_ptr() const;

    void maintain_read_index(size_t len);   // 读走 len 个字节，维护 index
    void maintain_all_index();              // 读走所有字节，维护 index

    std::string read_from_buffer(size_t len); // 读走 len 个字节（超过可读字节数时只读走可读部分）
    std::string read_from_buffer();
    void write_to_buffer(const char* data, size_t len);
    void write_to_buffer(const std::string& str);

    // 提供给 TcpConnection 使用的接口
    ssize_t read_from_fd(int fd, int* savedErrno); // fd ==> buffer
    ssize_t write_to_fd(int fd, int* savedErrno);  // buffer ==> fd

private:
    void make_space(size_t len);
};
