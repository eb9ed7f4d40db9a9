#include "InMemoryNoteStore.h"

#include <algorithm>

InMemoryNoteStore::InMemoryNoteStore() :
    mutex_(),
    notes_(),
    nextId_(1) {
}

std::vector<Note> InMemoryNoteStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_;
}

Note InMemoryNoteStore::create(const std::string& title, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    Note note;
    note.id = NoteId(nextId_.fetch_add(1));
    note.title = title;
    note.content = content;
    notes_.push_back(note);
    return note;
}

bool InMemoryNoteStore::update(const NoteId& id, const NotePatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(id);
    if (it == notes_.end()) {
        return false;
    }
    if (patch.hasTitle) {
        it->title = patch.title;
    }
    if (patch.hasContent) {
        it->content = patch.content;
    }
    return true;
}

bool InMemoryNoteStore::remove(const NoteId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(id);
    if (it == notes_.end()) {
        return false;
    }
    notes_.erase(it);
    return true;
}

size_t InMemoryNoteStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return notes_.size();
}

std::vector<Note>::iterator InMemoryNoteStore::find_locked(const NoteId& id) {
    return std::find_if(notes_.begin(), notes_.end(),
        [&id](const Note& n) { return n.id == id; });
}
