#include "notes/Validation.hpp"
#include "util/strings.hpp"

#include <nlohmann/json.hpp>

using namespace nb::notes;
using namespace nb::notes::model;
using json = nlohmann::json;

namespace {

constexpr const char* BODY_FIELD = "body";

std::optional<std::string> checkTitle(const json& v, const unsigned int maxTitleLength) {
    if (!v.is_string()) return "title must be a string";
    const auto& s = v.get_ref<const std::string&>();
    if (s.empty()) return "title must not be empty";
    if (nb::util::utf8Length(s) > maxTitleLength)
        return "title must be at most " + std::to_string(maxTitleLength) + " characters";
    return std::nullopt;
}

std::optional<std::string> checkContent(const json& v) {
    if (!v.is_string()) return "content must be a string";
    return std::nullopt;
}

std::optional<std::string> checkTags(const json& v) {
    if (!v.is_array()) return "tags must be a list of strings";
    for (const auto& tag : v)
        if (!tag.is_string()) return "tags must be a list of strings";
    return std::nullopt;
}

bool present(const json& body, const char* key) {
    const auto it = body.find(key);
    return it != body.end() && !it->is_null();
}

}

std::string ValidationError::message() const {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e.field + ": " + e.message;
    }
    return out;
}

Validated<NoteDraft> nb::notes::validateCreate(const json& body, const unsigned int maxTitleLength) {
    if (!body.is_object()) return ValidationError{{{BODY_FIELD, "request body must be a JSON object"}}};

    ValidationError err;

    if (!present(body, "title")) err.errors.push_back({"title", "field required"});
    else if (auto msg = checkTitle(body.at("title"), maxTitleLength)) err.errors.push_back({"title", *msg});

    if (!present(body, "content")) err.errors.push_back({"content", "field required"});
    else if (auto msg = checkContent(body.at("content"))) err.errors.push_back({"content", *msg});

    if (present(body, "tags"))
        if (auto msg = checkTags(body.at("tags"))) err.errors.push_back({"tags", *msg});

    if (!err.errors.empty()) return err;

    NoteDraft draft{
        .title = body.at("title").get<std::string>(),
        .content = body.at("content").get<std::string>(),
        .tags = {}
    };
    if (present(body, "tags")) draft.tags = body.at("tags").get<std::vector<std::string>>();
    return draft;
}

Validated<NotePatch> nb::notes::validatePatch(const json& body, const unsigned int maxTitleLength) {
    if (!body.is_object()) return ValidationError{{{BODY_FIELD, "request body must be a JSON object"}}};

    ValidationError err;
    NotePatch patch;

    if (present(body, "title")) {
        if (auto msg = checkTitle(body.at("title"), maxTitleLength)) err.errors.push_back({"title", *msg});
        else patch.title = body.at("title").get<std::string>();
    }

    if (present(body, "content")) {
        if (auto msg = checkContent(body.at("content"))) err.errors.push_back({"content", *msg});
        else patch.content = body.at("content").get<std::string>();
    }

    if (present(body, "tags")) {
        if (auto msg = checkTags(body.at("tags"))) err.errors.push_back({"tags", *msg});
        else patch.tags = body.at("tags").get<std::vector<std::string>>();
    }

    if (!err.errors.empty()) return err;
    return patch;
}

void nb::notes::to_json(json& j, const FieldError& e) {
    j = {
        {"field", e.field},
        {"message", e.message}
    };
}

void nb::notes::to_json(json& j, const ValidationError& e) {
    j = {
        {"detail", "Validation failed"},
        {"errors", e.errors}
    };
}
