#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "NotesServer.h"
#include "store/InMemoryNoteStore.h"

namespace {

struct ClientResponse {
    int status = 0;
    std::string head; // 状态行 + 头部
    std::string body;
};

// 阻塞式测试客户端，只支持带 Content-Length（或无 body）的响应
class TestClient {
public:
    explicit TestClient(uint16_t port) : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
        EXPECT_GE(fd_, 0);
        timeval tv{};
        tv.tv_sec = 5;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        connected_ = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }
    ~TestClient() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    bool connected() const { return connected_; }

    void send_raw(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                ADD_FAILURE() << "send failed";
                return;
            }
            sent += static_cast<size_t>(n);
        }
    }

    void send_request(const std::string& method, const std::string& path, const std::string& body = "",
        const std::string& extraHeaders = "") {
        std::string req = method + " " + path + " HTTP/1.1\r\nHost: localhost\r\n" + extraHeaders;
        if (!body.empty()) {
            req += "Content-Type: application/json\r\nContent-Length: " + std::to_string(body.size()) + "\r\n";
        }
        req += "\r\n" + body;
        send_raw(req);
    }

    bool read_response(ClientResponse& out) {
        size_t headerEnd;
        while ((headerEnd = pending_.find("\r\n\r\n")) == std::string::npos) {
            if (!fill()) {
                return false;
            }
        }
        out.head = pending_.substr(0, headerEnd + 2);
        pending_.erase(0, headerEnd + 4);

        // "HTTP/1.1 200 OK"
        if (out.head.size() < 12) {
            return false;
        }
        out.status = std::atoi(out.head.c_str() + 9);

        size_t contentLength = 0;
        const std::string key = "Content-Length: ";
        size_t pos = out.head.find(key);
        if (pos != std::string::npos) {
            contentLength = static_cast<size_t>(std::strtoul(out.head.c_str() + pos + key.size(), nullptr, 10));
        }
        while (pending_.size() < contentLength) {
            if (!fill()) {
                return false;
            }
        }
        out.body = pending_.substr(0, contentLength);
        pending_.erase(0, contentLength);
        return true;
    }

    ClientResponse request(const std::string& method, const std::string& path, const std::string& body = "") {
        send_request(method, path, body);
        ClientResponse resp;
        EXPECT_TRUE(read_response(resp)) << method << " " << path;
        return resp;
    }

    // 对端关闭（读到 EOF）返回 true
    bool wait_eof() {
        char buf[256];
        while (true) {
            ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n == 0) {
                return true;
            }
            if (n < 0) {
                return false;
            }
        }
    }

private:
    bool fill() {
        char buf[4096];
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n <= 0) {
            return false;
        }
        pending_.append(buf, static_cast<size_t>(n));
        return true;
    }

    int fd_;
    bool connected_ = false;
    std::string pending_;
};

// 在后台线程中构造并运行服务器（mainLoop 属于构造它的线程），端口由内核分配
class NotesServerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 服务端向已关闭的连接写入时不应杀死测试进程（与 main 一致）
        ::signal(SIGPIPE, SIG_IGN);

        std::promise<NotesServer*> ready;
        std::future<NotesServer*> readyFuture = ready.get_future();
        std::shared_future<void> release = release_.get_future().share();

        serverThread_ = std::thread([&ready, release]() {
            NotesServerConfig cfg;
            cfg.ip = "127.0.0.1";
            cfg.port = 0;
            cfg.threadNum = 2;
            cfg.maxBodyBytes = 1024;
            cfg.maxRequestBytes = 256;

            std::unique_ptr<NotesServer> server;
            try {
                server.reset(new NotesServer(cfg, std::make_shared<InMemoryNoteStore>()));
            }
            catch (const std::exception& e) {
                ADD_FAILURE() << "server construction failed: " << e.what();
                ready.set_value(nullptr);
                return;
            }
            ready.set_value(server.get());
            server->start();
            release.wait(); // stop() 返回之后才析构
        });

        server_ = readyFuture.get();
        ASSERT_NE(server_, nullptr);
        port_ = server_->get_listen_addr().get_port();
        ASSERT_NE(port_, 0);
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        release_.set_value();
        if (serverThread_.joinable()) {
            serverThread_.join();
        }
    }

    NotesServer* server_ = nullptr;
    uint16_t port_ = 0;
    std::promise<void> release_;
    std::thread serverThread_;
};

} // namespace

// 同一个 keep-alive 连接上跑完整流程
TEST_F(NotesServerIntegrationTest, FullScenarioOverKeepAlive) {
    TestClient client(port_);
    ASSERT_TRUE(client.connected());

    ClientResponse r1 = client.request("POST", "/notes", "{\"title\":\"Lorem Ipsum\"}");
    EXPECT_EQ(r1.status, 201);
    EXPECT_NE(r1.head.find("Content-Type: application/json; charset=utf-8"), std::string::npos);
    EXPECT_EQ(r1.body, "{\"id\":1,\"title\":\"Lorem Ipsum\",\"content\":\"\"}");

    ClientResponse r2 = client.request("GET", "/notes");
    EXPECT_EQ(r2.status, 200);
    EXPECT_EQ(r2.body, "[{\"id\":1,\"title\":\"Lorem Ipsum\",\"content\":\"\"}]");

    ClientResponse r3 = client.request("PATCH", "/notes/1", "{\"content\":\"hi\"}");
    EXPECT_EQ(r3.status, 204);
    EXPECT_EQ(r3.head.find("Content-Length"), std::string::npos);
    EXPECT_TRUE(r3.body.empty());

    ClientResponse r4 = client.request("GET", "/notes");
    EXPECT_EQ(r4.body, "[{\"id\":1,\"title\":\"Lorem Ipsum\",\"content\":\"hi\"}]");

    EXPECT_EQ(client.request("DELETE", "/notes/1").status, 204);

    ClientResponse r6 = client.request("GET", "/notes");
    EXPECT_EQ(r6.status, 200);
    EXPECT_EQ(r6.body, "[]");

    EXPECT_EQ(client.request("DELETE", "/notes/1").status, 404);
}

// 一次写入多个请求，响应按顺序返回
TEST_F(NotesServerIntegrationTest, PipelinedRequests) {
    TestClient client(port_);
    ASSERT_TRUE(client.connected());

    const std::string a = "{\"title\":\"a\"}";
    const std::string b = "{\"title\":\"b\"}";
    client.send_raw(
        "POST /notes HTTP/1.1\r\nContent-Length: " + std::to_string(a.size()) + "\r\n\r\n" + a +
        "POST /notes HTTP/1.1\r\nContent-Length: " + std::to_string(b.size()) + "\r\n\r\n" + b +
        "GET /notes HTTP/1.1\r\n\r\n");

    ClientResponse r1, r2, r3;
    ASSERT_TRUE(client.read_response(r1));
    ASSERT_TRUE(client.read_response(r2));
    ASSERT_TRUE(client.read_response(r3));
    EXPECT_EQ(r1.body, "{\"id\":1,\"title\":\"a\",\"content\":\"\"}");
    EXPECT_EQ(r2.body, "{\"id\":2,\"title\":\"b\",\"content\":\"\"}");
    EXPECT_EQ(r3.body, "[{\"id\":1,\"title\":\"a\",\"content\":\"\"},{\"id\":2,\"title\":\"b\",\"content\":\"\"}]");
}

// 多个连接共享同一个 store
TEST_F(NotesServerIntegrationTest, ConnectionsShareStore) {
    TestClient c1(port_);
    TestClient c2(port_);
    ASSERT_TRUE(c1.connected());
    ASSERT_TRUE(c2.connected());

    EXPECT_EQ(c1.request("POST", "/notes", "{\"title\":\"from c1\"}").status, 201);
    EXPECT_EQ(c2.request("GET", "/notes").body, "[{\"id\":1,\"title\":\"from c1\",\"content\":\"\"}]");
}

// Connection: close：响应带 Connection: close，随后服务器关闭连接
TEST_F(NotesServerIntegrationTest, ConnectionCloseIsHonoured) {
    TestClient client(port_);
    ASSERT_TRUE(client.connected());

    client.send_request("GET", "/notes", "", "Connection: close\r\n");
    ClientResponse resp;
    ASSERT_TRUE(client.read_response(resp));
    EXPECT_EQ(resp.status, 200);
    EXPECT_NE(resp.head.find("Connection: close"), std::string::npos);
    EXPECT_TRUE(client.wait_eof());
}

// 超过 HTTP 层上限：413 并关闭连接
TEST_F(NotesServerIntegrationTest, OversizedHttpBodyIs413) {
    TestClient client(port_);
    ASSERT_TRUE(client.connected());

    client.send_raw("POST /notes HTTP/1.1\r\nContent-Length: 5000\r\n\r\n");
    ClientResponse resp;
    ASSERT_TRUE(client.read_response(resp));
    EXPECT_EQ(resp.status, 413);
    EXPECT_TRUE(client.wait_eof());
}

// 超过笔记 body 上限但在 HTTP 上限之内：413，连接保持
TEST_F(NotesServerIntegrationTest, OversizedNoteBodyIs413) {
    TestClient client(port_);
    ASSERT_TRUE(client.connected());

    ClientResponse resp = client.request("POST", "/notes", "{\"title\":\"" + std::string(500, 'x') + "\"}");
    EXPECT_EQ(resp.status, 413);
    EXPECT_EQ(client.request("GET", "/notes").body, "[]");
}

// 非法 HTTP：400 并关闭连接
TEST_F(NotesServerIntegrationTest, MalformedHttpIs400) {
    TestClient client(port_);
    ASSERT_TRUE(client.connected());

    client.send_raw("THIS IS NOT HTTP\r\n\r\n");
    ClientResponse resp;
    ASSERT_TRUE(client.read_response(resp));
    EXPECT_EQ(resp.status, 400);
    EXPECT_TRUE(client.wait_eof());
}

// 未知路径：404 空 body
TEST_F(NotesServerIntegrationTest, UnknownRouteIs404) {
    TestClient client(port_);
    ASSERT_TRUE(client.connected());

    ClientResponse resp = client.request("GET", "/nope");
    EXPECT_EQ(resp.status, 404);
    EXPECT_TRUE(resp.body.empty());
    EXPECT_NE(resp.head.find("Content-Length: 0"), std::string::npos);
}

// 非法监听地址：构造失败并抛异常，而不是监听 0.0.0.0
TEST(NotesServerStartupTest, InvalidIpFailsToStart) {
    NotesServerConfig cfg;
    cfg.ip = "localhost";
    cfg.port = 0;
    EXPECT_THROW(NotesServer(cfg, std::make_shared<InMemoryNoteStore>()), std::runtime_error);
}
