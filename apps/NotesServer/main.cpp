/**
 * @file main.cpp
 * @brief NotesServer 程序入口：内存笔记服务（GET/POST /notes，PATCH/DELETE /notes/{id}）
 */

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>

#include "ConfigLoader.h"
#include "NotesServer.h"
#include "store/InMemoryNoteStore.h"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

static void set_logger(const std::string& level, const std::string& logPath) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!logPath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath, false));
    }

    auto logger = std::make_shared<spdlog::logger>("notes", begin(sinks), end(sinks));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] [thread %t] %v");
}

int main(int argc, char* argv[]) {
    NotesServerBootstrap boot;
    std::string error;
    if (!load_notes_server_bootstrap(argc, argv, boot, error)) {
        std::cerr << error << "\n" << notes_server_usage(argv[0]);
        return 1;
    }
    if (boot.showHelp) {
        std::cout << notes_server_usage(argv[0]);
        return 0;
    }

    try {
        set_logger(boot.logLevel, boot.logFile);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to set up logging: " << e.what() << std::endl;
        return 1;
    }

    // 对端关闭后继续写不应杀死进程
    ::signal(SIGPIPE, SIG_IGN);

    // 在创建任何线程之前屏蔽 SIGINT/SIGTERM，由专门的线程 sigwait 后通知服务器退出
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    std::unique_ptr<NotesServer> server;
    try {
        server.reset(new NotesServer(boot.cfg, std::make_shared<InMemoryNoteStore>()));
    }
    catch (const std::exception& e) {
        spdlog::critical("NotesServer failed to start: {}", e.what());
        return 1;
    }

    std::atomic<bool> serverExited(false);
    std::thread signalThread([&server, &serverExited, stopSignals]() {
        int sig = 0;
        if (sigwait(&stopSignals, &sig) != 0 || serverExited) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", sig);
        server->stop();
    });

    std::cout << "NotesServer started: http://" << server->get_listen_addr().get_ip_port() << std::endl;
    std::cout << "List:    GET    /notes" << std::endl;
    std::cout << "Create:  POST   /notes" << std::endl;
    std::cout << "Update:  PATCH  /notes/{id}" << std::endl;
    std::cout << "Delete:  DELETE /notes/{id}" << std::endl;

    server->start();

    // start() 也可能不经信号返回：唤醒仍阻塞在 sigwait 的线程，避免 join 永远等待
    serverExited = true;
    pthread_kill(signalThread.native_handle(), SIGTERM);
    signalThread.join();
    server.reset();
    spdlog::info("NotesServer stopped");
    return 0;
}
