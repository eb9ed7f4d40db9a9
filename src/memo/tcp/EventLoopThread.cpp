/**
 * @file EventLoopThread.cpp
 * @brief 将 EventLoop 和线程绑定的封装类
 */

#include "EventLoopThread.h"

#include "EventLoop.h"

EventLoopThread::EventLoopThread()
    : loop_(nullptr)
    , thread_(nullptr)
    , mutex_()
    , condition_()
    , started_(false) {
}

EventLoopThread::~EventLoopThread() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_) {
            loop_->quit();
        }
    }
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
}

void EventLoopThread::start() {
    thread_.reset(new std::thread(&EventLoopThread::thread_func, this));

    // 线程创建是异步的，等新线程创建好 EventLoop 后再返回，保证 get_loop() 有效
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (loop_ == nullptr) { // 防止虚假唤醒
            condition_.wait(lock);
        }
    }
    started_ = true;
}

EventLoop* EventLoopThread::get_loop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return loop_.get();
}

void EventLoopThread::thread_func() {
    // 必须在本线程内创建 EventLoop，构造函数会记录所属线程
    std::unique_ptr<EventLoop> eventLoop(new EventLoop());

    EventLoop* loop = eventLoop.get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = std::move(eventLoop);
        condition_.notify_one();
    }

    loop->loop();

    // 退出后在本线程内析构 EventLoop
    std::lock_guard<std::mutex> lock(mutex_);
    loop_.reset();
}
