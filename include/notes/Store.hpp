#pragma once

#include "notes/model/Note.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace nb::notes {

/**
 * Thread-safe in-memory note repository.
 *
 * Writers (create, update, remove, reset) hold the lock exclusively, readers
 * share it. Notes are kept ordered by id, which is also insertion order, so
 * listings are stable without a secondary sort key.
 */
class Store {
public:
    explicit Store(unsigned int maxPageSize = 100);
    virtual ~Store() = default;

    virtual model::Note create(const model::NoteDraft& draft);

    // All drafts are inserted under a single lock, in order.
    virtual std::vector<model::Note> createAll(const std::vector<model::NoteDraft>& drafts);

    [[nodiscard]] virtual std::optional<model::Note> get(unsigned int id) const;

    virtual std::optional<model::Note> update(unsigned int id, const model::NotePatch& patch);

    virtual bool remove(unsigned int id);

    [[nodiscard]] virtual model::Page list(const model::ListQuery& query) const;

    virtual void reset();

    [[nodiscard]] virtual std::size_t size() const;

    [[nodiscard]] unsigned int maxPageSize() const { return maxPageSize_; }

private:
    mutable std::shared_mutex mutex_;
    std::map<unsigned int, model::Note> notes_;
    unsigned int nextId_ = 1;
    unsigned int maxPageSize_;

    model::Note insertLocked(const model::NoteDraft& draft, util::Timestamp now);

    static util::Timestamp now();
};

}
