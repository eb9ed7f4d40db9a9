/**
 * @file EpollPoller.cpp
 * @brief 基于 epoll 的 Poller 实现
 */

#include "EpollPoller.h"

#include <cassert>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

#include "Channel.h"
#include "EventLoop.h"
#include "spdlog/spdlog.h"

EpollPoller::EpollPoller(EventLoop* loop)
    : loop_(loop)
    , epollFd_(::epoll_create1(EPOLL_CLOEXEC)) // EPOLL_CLOEXEC 避免 fork 出来的子进程继承 epoll fd
    , eventList_(EpollPoller::initEventListSize_)
    , channels_() {

    if (epollFd_ < 0) {
        spdlog::critical("EpollPoller::EpollPoller() error: epoll_create1 failed, errno={} ({})", errno, strerror(errno));
        throw std::runtime_error("epoll_create1 failed");
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollFd_);
}

void EpollPoller::poll(int timeoutMs) {
    spdlog::trace("EpollPoller::poll(). monitored channels: {}", channels_.size());

    int numReady = get_ready_num(timeoutMs);
    if (numReady <= 0) {
        return;
    }
    std::vector<Channel*> activeChannels = get_activate_channels(numReady);
    dispatch_events(activeChannels);
    resize_event_list(numReady); // 分发完成后再调整，防止使用过程中 eventList_ 大小变化
}

void EpollPoller::update_channel(Channel* channel) {
    loop_->assert_in_loop_thread();

    int fd = channel->get_fd();
    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = channel->get_events(); // 水平触发
    ev.data.fd = fd;

    auto findIt = channels_.find(fd);
    if (findIt == channels_.end()) {
        channels_[fd] = channel;
        if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            spdlog::error("epoll_ctl ADD failed, fd={}, events={}, errno={} ({})", fd, static_cast<uint32_t>(ev.events), errno, strerror(errno));
        }
    }
    else {
        assert(findIt->second == channel);
        if (::epoll_ctl(epollFd_, EPOLL_CTL_MOD, fd, &ev) != 0) {
            spdlog::error("epoll_ctl MOD failed, fd={}, events={}, errno={} ({})", fd, static_cast<uint32_t>(ev.events), errno, strerror(errno));
        }
    }
}

void EpollPoller::remove_channel(Channel* channel) {
    loop_->assert_in_loop_thread();

    // epollFd 和 channels_ 保持同步
    int fd = channel->get_fd();
    channels_.erase(fd);
    if (::epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
        spdlog::error("epoll_ctl DEL failed, fd={}, errno={} ({})", fd, errno, strerror(errno));
    }
}

bool EpollPoller::has_channel(Channel* channel) const {
    loop_->assert_in_loop_thread();

    auto findIt = channels_.find(channel->get_fd());
    return findIt != channels_.end() && findIt->second == channel;
}

int EpollPoller::get_ready_num(int timeoutMs) {
    int numReady = ::epoll_wait(epollFd_, eventList_.data(), static_cast<int>(eventList_.size()), timeoutMs);
    if (numReady < 0 && errno != EINTR) {
        spdlog::error("EpollPoller::poll() error: epoll_wait errno={} ({})", errno, strerror(errno));
    }
    return numReady;
}

std::vector<Channel*> EpollPoller::get_activate_channels(int numReady) {
    std::vector<Channel*> activeChannels;
    activeChannels.reserve(numReady);

    for (int i = 0; i < numReady; ++i) {
        const epoll_event& event = eventList_[i];
        auto findIt = channels_.find(event.data.fd);
        if (findIt == channels_.end()) {
            spdlog::error("EpollPoller: ready fd {} has no channel.", event.data.fd); // epoll 与 channels_ 不同步
            continue;
        }
        Channel* channel = findIt->second;
        channel->set_revents(event.events);
        activeChannels.push_back(channel);
    }
    return activeChannels;
}

void EpollPoller::dispatch_events(const std::vector<Channel*>& activeChannels) {
    for (auto channel : activeChannels) {
        channel->handle_events();
    }
}

void EpollPoller::resize_event_list(int numReady) {
    const double loadFactor = static_cast<double>(numReady) / eventList_.size();
    const double expandThreshold = 0.9;
    const double shrinkThreshold = 0.25;

    if (loadFactor >= expandThreshold) {
        eventList_.resize(eventList_.size() * 3 / 2);
        return;
    }
    if (eventList_.size() > EpollPoller::initEventListSize_ && loadFactor <= shrinkThreshold) {
        eventList_.resize(eventList_.size() / 2);
    }
}
