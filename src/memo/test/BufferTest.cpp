#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

#include "memo/tcp/Buffer.h"

// 新建 Buffer：可读为 0，预留区为 kCheapPrepend
TEST(BufferTest, InitialState) {
    Buffer buf;
    EXPECT_EQ(buf.readable_bytes(), 0u);
    EXPECT_EQ(buf.writable_bytes(), 1024u);
    EXPECT_EQ(buf.prependable_bytes(), 8u);
}

TEST(BufferTest, WriteThenPartialRead) {
    Buffer buf;
    buf.write_to_buffer("hello world");
    EXPECT_EQ(buf.readable_bytes(), 11u);

    EXPECT_EQ(buf.read_from_buffer(5), "hello");
    EXPECT_EQ(buf.readable_bytes(), 6u);
    EXPECT_EQ(buf.prependable_bytes(), 13u);

    EXPECT_EQ(buf.read_from_buffer(), " world");
    EXPECT_EQ(buf.readable_bytes(), 0u);
    EXPECT_EQ(buf.prependable_bytes(), 8u); // 读完后 index 重置
}

// 读取长度超过可读字节数时只返回可读部分
TEST(BufferTest, ReadMoreThanReadableIsTruncated) {
    Buffer buf;
    buf.write_to_buffer("abc");
    EXPECT_EQ(buf.read_from_buffer(100), "abc");
    EXPECT_EQ(buf.readable_bytes(), 0u);
}

// 写入超过初始容量时自动扩容，内容保持不变
TEST(BufferTest, GrowsBeyondInitialSize) {
    Buffer buf(16);
    const std::string big(5000, 'x');
    buf.write_to_buffer("head");
    buf.write_to_buffer(big);
    EXPECT_EQ(buf.readable_bytes(), 5004u);
    EXPECT_EQ(buf.read_from_buffer(4), "head");
    EXPECT_EQ(buf.read_from_buffer(), big);
}

// 前部已读空间足够时搬移数据而不是扩容
TEST(BufferTest, ReusesPrependSpace) {
    Buffer buf(32);
    buf.write_to_buffer(std::string(30, 'a'));
    buf.read_from_buffer(20);
    buf.write_to_buffer(std::string(15, 'b'));
    EXPECT_EQ(buf.readable_bytes(), 25u);
    EXPECT_EQ(buf.read_from_buffer(), std::string(10, 'a') + std::string(15, 'b'));
}

// 通过 pipe 测试 read_from_fd / write_to_fd
TEST(BufferTest, ReadAndWriteFd) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    Buffer out;
    out.write_to_buffer("ping over pipe");
    int savedErrno = 0;
    EXPECT_EQ(out.write_to_fd(fds[1], &savedErrno), 14);
    EXPECT_EQ(out.readable_bytes(), 0u);

    Buffer in(4); // 小于数据长度，走 extraBuf 路径
    EXPECT_EQ(in.read_from_fd(fds[0], &savedErrno), 14);
    EXPECT_EQ(in.read_from_buffer(), "ping over pipe");

    ::close(fds[0]);
    ::close(fds[1]);
}
