/**
 * @file Channel.h
 * @brief Channel 把 IO 事件与回调绑定起来，可以理解为 fd + 事件 + 回调 几者的结合体
 * @details
 *
 * 主要职责：
 *  - 表示某个 fd 的 “感兴趣事件”（events）和 poller 返回的 “发生事件”（revents）。
 *  - 保存该 fd 在可读/可写/关闭/错误时需要触发的回调函数。
 *  - 事件发生时由 EpollPoller 调用 handle_events，按 revents 分发到对应回调。
 *  - 修改感兴趣事件（enable/disable）时，通过 update_in_register 同步到 EventLoop / Poller。
 *  - 拥有 fd：析构时从 poller 注销并 close(fd)。
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

class EventLoop;
class Channel {
    using ReadEventCallback = std::function<void(Channel&)>;
    using WriteEventCallback = std::function<void(Channel&)>;
    using CloseEventCallback = std::function<void(Channel&)>;
    using ErrorEventCallback = std::function<void(Channel&)>;

private:
    static const uint32_t kNoneEvent_;
    static const uint32_t kReadEvent_;
    static const uint32_t kWriteEvent_;

    EventLoop* loop_;                    // 依赖注入
    int fd_;
    uint32_t events_;                    // interesting events
    uint32_t revents_;                   // received events

    std::weak_ptr<void> tie_;            // 绑定上层对象，防止 handle_events 过程中上层对象被析构
    bool isTied_;                        // Acceptor 不需要 tie，TcpConnection 需要

    ReadEventCallback readCallback_;
    WriteEventCallback writeCallback_;
    CloseEventCallback closeCallback_;
    ErrorEventCallback errorCallback_;

public:
    explicit Channel(EventLoop* loop, int fd);
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    ~Channel();

    EventLoop* get_owner_loop() const;
    int get_fd() const;

    void enable_reading();
    void enable_writing();
    void disable_reading();
    void disable_writing();
    void disable_all();
    bool is_none_event() const;
    bool is_writing() const;
    bool is_reading() const;
    uint32_t get_events() const;

    void set_revents(uint32_t revents);  // poller 监听到事件后调用

    // Tie this channel to the owner object managed by shared_ptr
    void tie_to_object(const std::shared_ptr<void>& obj);

    void set_read_callback(ReadEventCallback cb);
    void set_write_callback(WriteEventCallback cb);
    void set_close_callback(CloseEventCallback cb);
    void set_error_callback(ErrorEventCallback cb);

    // 核心函数：事件发生后调用回调
    void handle_events();

private:
    void update_in_register();
    void remove_in_register();

    void handle_events_with_guard();

    void handle_read_callback();
    void handle_write_callback();
    void handle_close_callback();
    void handle_error_callback();
};
