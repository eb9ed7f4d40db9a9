/**
 * @file Channel.cpp
 * @brief Channel 把 IO 事件与回调绑定起来，可以理解为 fd + 事件 + 回调 几者的结合体
 */

#include "Channel.h"

#include <cassert>
#include <sys/epoll.h>
#include <unistd.h>

#include "EventLoop.h"
#include "spdlog/spdlog.h"

const uint32_t Channel::kNoneEvent_ = 0;
const uint32_t Channel::kReadEvent_ = EPOLLIN | EPOLLPRI;
const uint32_t Channel::kWriteEvent_ = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop)
    , fd_(fd)
    , events_(kNoneEvent_)
    , revents_(kNoneEvent_)
    , tie_()
    , isTied_(false)
    , readCallback_(nullptr)
    , writeCallback_(nullptr)
    , closeCallback_(nullptr)
    , errorCallback_(nullptr) {

    // channel 创建即注册到 poller，严格同步 fd 和 channel，保证 poller 访问的 channel 一定有效
    loop_->assert_in_loop_thread();
    this->update_in_register();
}

Channel::~Channel() {
    // Channel 负责 fd 的生命期：注销后 close
    loop_->assert_in_loop_thread();
    disable_all();
    remove_in_register();
    ::close(fd_);
}

void Channel::set_read_callback(ReadEventCallback cb) {
    this->readCallback_ = std::move(cb);
}

void Channel::set_write_callback(WriteEventCallback cb) {
    this->writeCallback_ = std::move(cb);
}

void Channel::set_close_callback(CloseEventCallback cb) {
    this->closeCallback_ = std::move(cb);
}

void Channel::set_error_callback(ErrorEventCallback cb) {
    this->errorCallback_ = std::move(cb);
}

void Channel::set_revents(uint32_t revents) {
    this->revents_ = revents;
}

void Channel::handle_events() {
    // 对端关闭时 close 回调会让 TcpServer 删除 TcpConnection，Channel 随之析构，
    // 而此时 handle_events_with_guard 还没返回。通过 tie 锁住上层对象，把析构推迟到本函数结束
    if (isTied_) {
        std::shared_ptr<void> guard = tie_.lock();
        if (guard) {
            this->handle_events_with_guard();
        }
    }
    else {
        handle_events_with_guard();
    }
}

void Channel::tie_to_object(const std::shared_ptr<void>& obj) {
    tie_ = obj;
    isTied_ = true;
}

EventLoop* Channel::get_owner_loop() const {
    return loop_;
}

int Channel::get_fd() const {
    return fd_;
}

void Channel::enable_reading() {
    this->events_ |= Channel::kReadEvent_;
    this->update_in_register();
}

void Channel::enable_writing() {
    this->events_ |= Channel::kWriteEvent_;
    this->update_in_register();
}

void Channel::disable_reading() {
    this->events_ &= ~Channel::kReadEvent_;
    this->update_in_register();
}

void Channel::disable_writing() {
    this->events_ &= ~Channel::kWriteEvent_;
    this->update_in_register();
}

void Channel::disable_all() {
    this->events_ = Channel::kNoneEvent_;
    this->update_in_register();
}

bool Channel::is_none_event() const {
    return this->events_ == Channel::kNoneEvent_;
}

bool Channel::is_writing() const {
    return (this->events_ & Channel::kWriteEvent_) != 0;
}

bool Channel::is_reading() const {
    return (this->events_ & Channel::kReadEvent_) != 0;
}

uint32_t Channel::get_events() const {
    return this->events_;
}

void Channel::update_in_register() {
    loop_->update_channel(this);
}

void Channel::remove_in_register() {
    loop_->remove_channel(this);
}

void Channel::handle_events_with_guard() {
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        this->handle_close_callback();
        return;
    }
    if (revents_ & EPOLLERR) {
        spdlog::error("Channel::handle_events_with_guard(). EPOLLERR on fd: {}", fd_);
        this->handle_error_callback();
        return;
    }
    if (revents_ & (EPOLLIN | EPOLLPRI)) {
        this->handle_read_callback();
    }
    if (revents_ & EPOLLOUT) {
        this->handle_write_callback();
    }
}

void Channel::handle_read_callback() {
    assert(readCallback_ != nullptr);
    readCallback_(*this);
}

void Channel::handle_write_callback() {
    assert(writeCallback_ != nullptr);
    writeCallback_(*this);
}

void Channel::handle_close_callback() {
    assert(closeCallback_ != nullptr);
    closeCallback_(*this);
}

void Channel::handle_error_callback() {
    assert(errorCallback_ != nullptr);
    errorCallback_(*this);
}
