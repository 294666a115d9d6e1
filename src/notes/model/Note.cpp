#include "notes/model/Note.hpp"

#include <nlohmann/json.hpp>

using namespace nb::util;

namespace nb::notes::model {

void to_json(nlohmann::json& j, const Note& n) {
    j = {
        {"id", n.id},
        {"title", n.title},
        {"content", n.content},
        {"tags", n.tags},
        {"created_at", timestampToString(n.created_at)},
        {"updated_at", timestampToString(n.updated_at)}
    };
}

void to_json(nlohmann::json& j, const Page& p) {
    j = {
        {"items", p.items},
        {"total", p.total},
        {"page", p.page},
        {"page_size", p.page_size}
    };
}

}
