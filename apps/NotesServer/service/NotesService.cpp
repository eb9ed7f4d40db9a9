#include "NotesService.h"

#include <functional>
#include <vector>

#include "NoteJson.h"
#include "spdlog/spdlog.h"

const size_t NotesService::kDefaultMaxRequestBytes;

NotesService::NotesService(std::shared_ptr<INoteStore> store, size_t maxRequestBytes) :
    store_(std::move(store)),
    maxRequestBytes_(maxRequestBytes),
    router_() {

    using namespace std::placeholders;
    router_.add_get_route("/notes", std::bind(&NotesService::handle_list, this, _1, _2, _3));
    router_.add_post_route("/notes", std::bind(&NotesService::handle_create, this, _1, _2, _3));
    router_.add_patch_route("/notes/{id}", std::bind(&NotesService::handle_update, this, _1, _2, _3));
    router_.add_delete_route("/notes/{id}", std::bind(&NotesService::handle_delete, this, _1, _2, _3));
    router_.set_not_found_handler(
        [](const HttpRequest& req, const Router::PathParams&, HttpResponse& resp) {
            spdlog::debug("NotesService: no route for {} {}", req.get_method(), req.get_path());
            respond_empty(resp, 404, "Not Found");
        });
}

void NotesService::on_http_request(const HttpRequest& req, HttpResponse& resp) {
    router_.dispatch(req, resp);
}

void NotesService::handle_list(const HttpRequest& /*req*/, const Router::PathParams& /*params*/, HttpResponse& resp) {
    std::vector<Note> notes = store_->list();
    respond_json(resp, 200, "OK", notejson::to_json(notes));
}

void NotesService::handle_create(const HttpRequest& req, const Router::PathParams& /*params*/, HttpResponse& resp) {
    const std::string& body = req.get_body();
    if (body.size() > maxRequestBytes_) {
        spdlog::debug("NotesService: create rejected, body {} bytes exceeds {}", body.size(), maxRequestBytes_);
        respond_empty(resp, 413, "Payload Too Large");
        return;
    }

    notejson::CreateRequest in;
    std::string error;
    if (!notejson::parse_create_request(body, in, error)) {
        spdlog::debug("NotesService: create rejected, {}", error);
        respond_empty(resp, 400, "Bad Request");
        return;
    }

    Note note = store_->create(in.title, in.content);
    spdlog::info("created note id={}", note.id.value());
    respond_json(resp, 201, "Created", notejson::to_json(note));
}

void NotesService::handle_update(const HttpRequest& req, const Router::PathParams& params, HttpResponse& resp) {
    NoteId id;
    if (!parse_id_param(params, id)) {
        respond_empty(resp, 404, "Not Found");
        return;
    }

    const std::string& body = req.get_body();
    if (body.size() > maxRequestBytes_) {
        spdlog::debug("NotesService: update rejected, body {} bytes exceeds {}", body.size(), maxRequestBytes_);
        respond_empty(resp, 413, "Payload Too Large");
        return;
    }

    NotePatch patch;
    std::string error;
    if (!notejson::parse_update_request(body, patch, error)) {
        spdlog::debug("NotesService: update rejected, {}", error);
        respond_empty(resp, 400, "Bad Request");
        return;
    }
    if (patch.empty()) {
        spdlog::debug("NotesService: update of id={} has no fields", id.value());
        respond_empty(resp, 422, "Unprocessable Entity");
        return;
    }

    if (!store_->update(id, patch)) {
        respond_empty(resp, 404, "Not Found");
        return;
    }
    spdlog::info("updated note id={}", id.value());
    respond_empty(resp, 204, "No Content");
}

void NotesService::handle_delete(const HttpRequest& /*req*/, const Router::PathParams& params, HttpResponse& resp) {
    NoteId id;
    if (!parse_id_param(params, id) || !store_->remove(id)) {
        respond_empty(resp, 404, "Not Found");
        return;
    }
    spdlog::info("deleted note id={}", id.value());
    respond_empty(resp, 204, "No Content");
}

bool NotesService::parse_id_param(const Router::PathParams& params, NoteId& outId) {
    auto it = params.find("id");
    if (it == params.end()) {
        return false;
    }
    return NoteId::parse(it->second, outId);
}

void NotesService::respond_json(HttpResponse& resp, int code, const std::string& message, const std::string& body) {
    resp.set_status(code, message);
    resp.add_header("Content-Type", "application/json; charset=utf-8");
    resp.set_body(body);
}

void NotesService::respond_empty(HttpResponse& resp, int code, const std::string& message) {
    resp.set_status(code, message);
    resp.set_body("");
}
