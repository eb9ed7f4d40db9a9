/**
 * @file EventLoopThreadPool.h
 * @brief 一个 mainLoop（监听）+ 多个 IO EventLoopThread 组成的线程池
 * @details
 *
 * - EventLoop 需要绑定线程，所以直接用 EventLoopThread 组成线程池。
 * - numThreads 为 0 时所有连接都在 mainLoop 上处理。
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

class EventLoop;
class EventLoopThread;
class EventLoopThreadPool {
private:
    std::unique_ptr<EventLoop> mainLoop_;                        // 在构造线程中创建

    std::vector<std::unique_ptr<EventLoopThread>> ioLoopThreads_;
    size_t ioLoopsIndex_;                                        // 轮询索引

    std::string name_;
    int numThreads_;                                             // IO 线程数量（构造时确定）

    bool started_;

public:
    explicit EventLoopThreadPool(const std::string& name = std::string(), int numThreads = 0);
    EventLoopThreadPool(const EventLoopThreadPool&) = delete;
    EventLoopThreadPool& operator=(const EventLoopThreadPool&) = delete;
    ~EventLoopThreadPool();

    void start();

    EventLoop* get_main_loop() { return mainLoop_.get(); }
    EventLoop* get_next_loop();
    std::vector<EventLoop*> get_all_loops() const;

    const std::string& get_name() const { return name_; }
    int get_num_threads() const { return numThreads_ + 1; } // 包括 mainLoop
};
