/**
 * @file EventLoopThread.h
 * @brief 将 EventLoop 和线程绑定的封装类
 * @details
 *
 * - 直接使用 std::thread / std::mutex / std::condition_variable，不做二次封装。
 * - EventLoop 在新线程内创建（one loop per thread），start() 等到 loop 创建完成才返回。
 */

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

class EventLoop;
class EventLoopThread {
private:
    std::unique_ptr<EventLoop> loop_;    // 线程内创建并持有 EventLoop
    std::unique_ptr<std::thread> thread_;

    std::mutex mutex_;
    std::condition_variable condition_;

    bool started_;

public:
    EventLoopThread();
    EventLoopThread(const EventLoopThread&) = delete;
    EventLoopThread& operator=(const EventLoopThread&) = delete;
    ~EventLoopThread();

    void start();
    EventLoop* get_loop();

private:
    void thread_func();
};
