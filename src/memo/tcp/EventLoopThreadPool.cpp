/**
 * @file EventLoopThreadPool.cpp
 * @brief 一个 mainLoop（监听）+ 多个 IO EventLoopThread 组成的线程池
 */

#include "EventLoopThreadPool.h"

#include <cassert>

#include "EventLoop.h"
#include "EventLoopThread.h"
#include "spdlog/spdlog.h"

EventLoopThreadPool::EventLoopThreadPool(const std::string& name, int numThreads) :
    mainLoop_(nullptr),
    ioLoopThreads_(),
    ioLoopsIndex_(0),
    name_(name),
    numThreads_(numThreads < 0 ? 0 : numThreads),
    started_(false) {

    mainLoop_.reset(new EventLoop());
}

EventLoopThreadPool::~EventLoopThreadPool() {
    // IO 线程先退出（EventLoopThread 析构时 quit + join），mainLoop 最后在构造线程内析构
    ioLoopThreads_.clear();
}

void EventLoopThreadPool::start() {
    mainLoop_->assert_in_loop_thread();
    assert(!started_);

    for (int i = 0; i < numThreads_; ++i) {
        std::unique_ptr<EventLoopThread> ioThread(new EventLoopThread());
        ioThread->start();
        ioLoopThreads_.push_back(std::move(ioThread));
    }

    spdlog::debug("EventLoopThreadPool {} started with {} io threads.", name_, numThreads_);
    started_ = true;
}

EventLoop* EventLoopThreadPool::get_next_loop() {
    mainLoop_->assert_in_loop_thread();
    assert(started_);

    // 轮询选择 IO loop；没有 IO 线程时返回 mainLoop
    EventLoop* loop = mainLoop_.get();
    if (!ioLoopThreads_.empty()) {
        loop = ioLoopThreads_[ioLoopsIndex_]->get_loop();
        ioLoopsIndex_ = (ioLoopsIndex_ + 1) % ioLoopThreads_.size();
    }
    return loop;
}

std::vector<EventLoop*> EventLoopThreadPool::get_all_loops() const {
    std::vector<EventLoop*> loops;
    if (ioLoopThreads_.empty()) {
        loops.push_back(mainLoop_.get());
        return loops;
    }
    for (size_t i = 0; i < ioLoopThreads_.size(); ++i) {
        loops.push_back(ioLoopThreads_[i]->get_loop());
    }
    return loops;
}
