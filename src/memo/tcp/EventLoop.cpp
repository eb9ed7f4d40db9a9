/**
 * @file EventLoop.cpp
 * @brief 事件循环（Reactor）核心类的实现
 */

#include "EventLoop.h"

#include <cassert>
#include <cerrno>
#include <stdexcept>
#include <sys/eventfd.h>
#include <unistd.h>

#include "Channel.h"
#include "spdlog/spdlog.h"

namespace {

// one loop per thread：用 thread_local 标记当前线程已有的 EventLoop
thread_local EventLoop* loopInThisThread = nullptr;

int create_event_fd() {
    int eventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (eventFd < 0) {
        spdlog::critical("EventLoop: failed in eventfd creation, errno={}", errno);
        throw std::runtime_error("eventfd creation failed");
    }
    return eventFd;
}

} // namespace

EventLoop::EventLoop() :
    poller_(new EpollPoller(this)),
    isQuit_(false),
    threadId_(std::this_thread::get_id()),
    wakeupFd_(-1),
    wakeupChannel_(nullptr),
    isCallingPendingFunctors_(false),
    pendingFunctors_(),
    mutex_() {

    if (loopInThisThread != nullptr) {
        spdlog::critical("EventLoop: another EventLoop exists in this thread.");
        throw std::logic_error("one EventLoop per thread");
    }

    // 先有 poller，再创建 wakeupChannel（Channel 构造时即注册到 poller）
    wakeupFd_ = create_event_fd();
    wakeupChannel_.reset(new Channel(this, wakeupFd_));
    wakeupChannel_->set_read_callback(std::bind(&EventLoop::on_read, this));
    wakeupChannel_->enable_reading();

    loopInThisThread = this;

    spdlog::debug("EventLoop created in thread: {}", std::hash<std::thread::id>{}(threadId_));
}

EventLoop::~EventLoop() {
    wakeupChannel_.reset(); // Channel 析构时 close(wakeupFd_)
    if (loopInThisThread == this) {
        loopInThisThread = nullptr;
        spdlog::debug("EventLoop destroyed in its thread");
    }
    else {
        spdlog::error("EventLoop destroyed in wrong thread.");
    }
}

void EventLoop::loop(int timeoutMs) {
    assert_in_loop_thread();
    spdlog::debug("EventLoop start looping...");

    while (!isQuit_) {
        poller_->poll(timeoutMs);

        // wakeupChannel 的 on_read 只负责清除事件，真正要执行的逻辑在这里
        do_pending_functors();
    }
    do_pending_functors(); // 退出前把 quit 之前投递的任务执行完（例如 TcpServer 析构时投递的连接销毁）

    spdlog::debug("EventLoop stop looping.");
}

void EventLoop::quit() {
    isQuit_ = true;

    // 不在 loop 线程时需要唤醒，否则可能阻塞在 epoll_wait 上直到超时
    if (!is_in_loop_thread()) {
        wakeup();
    }
}

bool EventLoop::has_channel(Channel* channel) const {
    assert_in_loop_thread();
    return poller_->has_channel(channel);
}

void EventLoop::update_channel(Channel* channel) const {
    assert_in_loop_thread();
    poller_->update_channel(channel);
}

void EventLoop::remove_channel(Channel* channel) const {
    assert_in_loop_thread();
    poller_->remove_channel(channel);
}

void EventLoop::assert_in_loop_thread() const {
    assert(is_in_loop_thread());
}

bool EventLoop::is_in_loop_thread() const {
    return threadId_ == std::this_thread::get_id();
}

void EventLoop::run_in_loop(const Functor& cb) {
    if (is_in_loop_thread()) {
        cb();
    }
    else {
        queue_in_loop(cb);
    }
}

void EventLoop::queue_in_loop(const Functor& cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingFunctors_.push(cb);
    }
    // 正在执行 pending functors 时新加入的任务不会在本轮执行，也需要唤醒，避免下一轮阻塞在 poll 上
    if (!is_in_loop_thread() || isCallingPendingFunctors_) {
        wakeup();
    }
}

void EventLoop::wakeup() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeupFd_, &one, sizeof(one));
    if (n != sizeof(one)) {
        spdlog::error("EventLoop::wakeup() writes {} bytes instead of 8", n);
    }
}

void EventLoop::on_read() {
    uint64_t one = 0;
    ssize_t n = ::read(wakeupFd_, &one, sizeof(one));
    if (n != sizeof(one)) {
        spdlog::error("EventLoop::on_read() reads {} bytes instead of 8", n);
    }
}

void EventLoop::do_pending_functors() {
    // 交换到局部变量，缩小临界区（不能在锁内执行回调）
    std::queue<Functor> functors;
    isCallingPendingFunctors_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pendingFunctors_);
    }

    while (!functors.empty()) {
        Functor functor = functors.front(); // 拷贝，不能是引用：pop 后引用悬空
        functors.pop();
        functor();
    }
    isCallingPendingFunctors_ = false;
}
