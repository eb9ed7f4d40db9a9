/**
 * @file EventLoop.h
 * @brief 事件循环（Reactor）核心类，驱动 I/O 事件的收集与回调执行。
 * @details
 *
 * - 持有一个 EpollPoller（unique_ptr），loop() 中持续调用 poller->poll()，由 poller 分发就绪 channels 的事件。
 * - 对外暴露 update_channel()/remove_channel()，供 Channel 向 poller 注册或注销自身。
 * - run_in_loop()/queue_in_loop() + eventfd 唤醒，支持其他线程把任务投递到本 loop 线程执行。
 *
 * 线程模型与约定：
 * - One loop per thread：构造所在线程即所属线程，同一线程只能有一个 EventLoop。
 * - 除 quit()/run_in_loop()/queue_in_loop()/wakeup() 外，其余方法须在所属线程调用。
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

#include "EpollPoller.h"

class Channel;
class EventLoop {
    using Functor = std::function<void()>;

private:
    std::unique_ptr<EpollPoller> poller_;                   // 先于 wakeupChannel_ 构造、后于其析构
    std::atomic<bool> isQuit_;

    const std::thread::id threadId_;                        // 所属线程 id，断言线程安全使用

    int wakeupFd_;                                          // eventfd，用于跨线程唤醒
    std::unique_ptr<Channel> wakeupChannel_;

    std::atomic<bool> isCallingPendingFunctors_;
    std::queue<Functor> pendingFunctors_;                   // 需要在 loop 线程执行的任务
    std::mutex mutex_;                                      // 保护 pendingFunctors_

public:
    EventLoop();
    ~EventLoop();
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void loop(int timeoutMs = 10000);
    void quit();                                            // 可跨线程调用

    bool has_channel(Channel* channel) const;
    void update_channel(Channel* channel) const;
    void remove_channel(Channel* channel) const;

    bool is_in_loop_thread() const;
    void assert_in_loop_thread() const;

    void run_in_loop(const Functor& cb);                    // 在 loop 线程则直接执行，否则入队
    void queue_in_loop(const Functor& cb);                  // 入队并在需要时唤醒 loop 线程
    void wakeup();                                          // 打断 epoll_wait 阻塞，尽快执行 pending functors

private:
    void on_read();                                         // wakeupChannel_ 的读事件回调
    void do_pending_functors();
};
