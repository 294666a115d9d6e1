#include "seed_notes.hpp"

#include "notes/Store.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace nb::notes;
using namespace nb::notes::model;
using namespace nb::log;

std::vector<NoteDraft> nb::seed::sampleDrafts(const unsigned int count) {
    std::vector<NoteDraft> drafts;
    drafts.reserve(count);

    for (unsigned int i = 1; i <= count; ++i) {
        drafts.push_back({
            .title = fmt::format("Sample Note {}", i),
            .content = fmt::format("This is a sample note #{}.", i),
            .tags = i % 2 == 1 ? std::vector<std::string>{"sample", "demo"} : std::vector<std::string>{"notes"}
        });
    }

    return drafts;
}

unsigned int nb::seed::seed(Store& store, const unsigned int count) {
    const auto created = store.createAll(sampleDrafts(count));
    Registry::notes()->info("[seed] Seeded {} sample notes", created.size());
    return static_cast<unsigned int>(created.size());
}

void nb::seed::reset(Store& store) {
    store.reset();
    Registry::notes()->info("[seed] Note store reset");
}
