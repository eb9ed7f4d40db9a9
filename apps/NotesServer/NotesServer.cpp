#include "NotesServer.h"

#include "spdlog/spdlog.h"

NotesServer::NotesServer(NotesServerConfig cfg, std::shared_ptr<INoteStore> store) :
    cfg_(std::move(cfg)),
    service_(nullptr),
    httpServer_(nullptr) {

    service_.reset(new NotesService(std::move(store), cfg_.maxRequestBytes));

    httpServer_.reset(new HttpServer(cfg_.ip, cfg_.port, cfg_.threadNum));
    httpServer_->set_max_body_bytes(cfg_.maxBodyBytes);
    httpServer_->set_http_callback(
        [this](const HttpRequest& req, HttpResponse& resp) {
            service_->on_http_request(req, resp);
        });
}

void NotesServer::start() {
    spdlog::info("NotesServer listening on {} threadNum={} maxRequestBytes={}",
        get_listen_addr().get_ip_port(), cfg_.threadNum, cfg_.maxRequestBytes);
    httpServer_->start();
}

void NotesServer::stop() {
    httpServer_->stop();
}
