#include "notes/Store.hpp"
#include "util/strings.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>

using namespace nb::notes;
using namespace nb::notes::model;
using namespace nb::util;
using namespace nb::log;

Store::Store(const unsigned int maxPageSize) : maxPageSize_(std::max(1u, maxPageSize)) {}

Timestamp Store::now() {
    return std::chrono::floor<std::chrono::microseconds>(Clock::now());
}

Note Store::insertLocked(const NoteDraft& draft, const Timestamp now) {
    Note note{
        .id = nextId_++,
        .title = draft.title,
        .content = draft.content,
        .tags = draft.tags,
        .created_at = now,
        .updated_at = now
    };
    notes_.emplace(note.id, note);
    return note;
}

Note Store::create(const NoteDraft& draft) {
    std::unique_lock lock(mutex_);
    auto note = insertLocked(draft, now());
    Registry::store()->debug("[Store] Created note {}", note.id);
    return note;
}

std::vector<Note> Store::createAll(const std::vector<NoteDraft>& drafts) {
    std::unique_lock lock(mutex_);

    std::vector<Note> created;
    created.reserve(drafts.size());
    for (const auto& draft : drafts) created.push_back(insertLocked(draft, now()));

    Registry::store()->debug("[Store] Created {} notes in batch", created.size());
    return created;
}

std::optional<Note> Store::get(const unsigned int id) const {
    std::shared_lock lock(mutex_);
    const auto it = notes_.find(id);
    if (it == notes_.end()) return std::nullopt;
    return it->second;
}

std::optional<Note> Store::update(const unsigned int id, const NotePatch& patch) {
    std::unique_lock lock(mutex_);

    const auto it = notes_.find(id);
    if (it == notes_.end()) return std::nullopt;

    auto& note = it->second;
    if (patch.title) note.title = *patch.title;
    if (patch.content) note.content = *patch.content;
    if (patch.tags) note.tags = *patch.tags;

    // updated_at never moves backwards, even if the wall clock does
    note.updated_at = std::max(now(), note.updated_at);

    Registry::store()->debug("[Store] Updated note {}", id);
    return note;
}

bool Store::remove(const unsigned int id) {
    std::unique_lock lock(mutex_);
    if (notes_.erase(id) == 0) return false;
    Registry::store()->debug("[Store] Deleted note {}", id);
    return true;
}

Page Store::list(const ListQuery& query) const {
    Page page{
        .items = {},
        .total = 0,
        .page = std::max(1u, query.page),
        .page_size = std::clamp(query.page_size, 1u, maxPageSize_)
    };

    const auto needle = query.q ? toLower(*query.q) : std::string{};
    const auto matches = [&needle](const Note& n) {
        return needle.empty() || containsIgnoreCase(n.title, needle) || containsIgnoreCase(n.content, needle);
    };

    const auto offset = static_cast<std::size_t>(page.page - 1) * page.page_size;

    std::shared_lock lock(mutex_);
    for (const auto& note : notes_ | std::views::values) {
        if (!matches(note)) continue;
        if (page.total >= offset && page.items.size() < page.page_size) page.items.push_back(note);
        ++page.total;
    }

    return page;
}

void Store::reset() {
    std::unique_lock lock(mutex_);
    const auto removed = notes_.size();
    notes_.clear();
    nextId_ = 1;
    Registry::store()->debug("[Store] Reset, {} notes removed", removed);
}

std::size_t Store::size() const {
    std::shared_lock lock(mutex_);
    return notes_.size();
}
