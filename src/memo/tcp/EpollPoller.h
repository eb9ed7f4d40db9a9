/**
 * @file EpollPoller.h
 * @brief 基于 epoll 的 Poller 实现 — 多路 I/O 事件监听、分发器（Reactor 的 I/O 多路复用层）
 * @details
 *
 * - 封装 epoll_create1 / epoll_ctl / epoll_wait。
 * - 维护 fd -> Channel* 的映射（注册中心），把内核返回的就绪事件翻译为 Channel 并分发。
 * - 非线程安全：所有操作在所属 EventLoop 线程执行。
 * - eventList_ 根据就绪数量自动扩缩，避免丢事件或长期占用内存。
 * - 不拥有 Channel（仅保存裸指针），Channel 的生存期由上层（Acceptor / TcpConnection / EventLoop）管理。
 */

#pragma once
#include <sys/epoll.h>
#include <unordered_map>
#include <vector>

class EventLoop;
class Channel;
class EpollPoller {
private:
    static const size_t initEventListSize_ = 16;

    EventLoop* loop_;
    int epollFd_;
    std::vector<epoll_event> eventList_;          // 存放 epoll_wait 返回的就绪事件
    std::unordered_map<int, Channel*> channels_;  // fd -> Channel*

public:
    explicit EpollPoller(EventLoop* loop);
    EpollPoller(const EpollPoller&) = delete;
    EpollPoller& operator=(const EpollPoller&) = delete;
    ~EpollPoller();

    // 等待事件并分发给就绪的 channels
    void poll(int timeoutMs);

    void update_channel(Channel* channel);
    void remove_channel(Channel* channel);
    bool has_channel(Channel* channel) const;

private:
    int get_ready_num(int timeoutMs);
    std::vector<Channel*> get_activate_channels(int numReady);
    void dispatch_events(const std::vector<Channel*>& activeChannels);
    void resize_event_list(int numReady);
};
