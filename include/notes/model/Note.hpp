#pragma once

#include "util/timestamp.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace nb::notes::model {

// Fields a client supplies on create.
struct NoteDraft {
    std::string title;
    std::string content;
    std::vector<std::string> tags;
};

// Partial update; unset members are left untouched.
struct NotePatch {
    std::optional<std::string> title;
    std::optional<std::string> content;
    std::optional<std::vector<std::string>> tags;

    [[nodiscard]] bool empty() const { return !title && !content && !tags; }
};

struct Note {
    unsigned int id{0};
    std::string title;
    std::string content;
    std::vector<std::string> tags;
    util::Timestamp created_at{};
    util::Timestamp updated_at{};
};

struct ListQuery {
    unsigned int page{1};
    unsigned int page_size{10};
    std::optional<std::string> q;
};

struct Page {
    std::vector<Note> items;
    std::size_t total{0};
    unsigned int page{1};
    unsigned int page_size{10};
};

void to_json(nlohmann::json& j, const Note& n);
void to_json(nlohmann::json& j, const Page& p);

}
