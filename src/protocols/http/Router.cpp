#include "protocols/http/Router.hpp"
#include "notes/Store.hpp"
#include "notes/Validation.hpp"
#include "seed_notes.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <limits>
#include <variant>

using namespace nb::protocols::http;
using namespace nb::notes;
using namespace nb::notes::model;
using namespace nb::log;
using json = nlohmann::json;

namespace {

constexpr const char* NOTE_NOT_FOUND = "Note not found";
constexpr std::string_view NOTES_PREFIX = "/notes/";

std::variant<json, std::string> parseJsonBody(const request& req) {
    try {
        return json::parse(req.body());
    } catch (const json::parse_error& e) {
        return std::string("Invalid JSON body: ") + e.what();
    }
}

// Absent keys leave `out` untouched; malformed values are recorded in `err`.
void readIntParam(const QueryParams& params, const std::string& key, long long& out, ValidationError& err) {
    const auto it = params.find(key);
    if (it == params.end()) return;
    if (const auto v = parseInteger(it->second)) out = *v;
    else err.errors.push_back({key, key + " must be an integer"});
}

unsigned int clampToUnsigned(const long long v) {
    return static_cast<unsigned int>(std::clamp<long long>(v, 1, std::numeric_limits<unsigned int>::max()));
}

}

Router::Router(std::shared_ptr<Store> store, nb::config::NotesConfig notes, Cors cors)
    : store_(std::move(store)), notes_(notes), cors_(std::move(cors)) {
    if (!store_) throw std::invalid_argument("Store cannot be null");
}

string_response Router::route(request&& req) const {
    try {
        if (Cors::isPreflight(req)) return cors_.preflight(req);

        auto res = dispatch(req);
        cors_.apply(req, res);

        Registry::http()->debug("[Router] {} {} -> {}",
                                to_std(req.method_string()), to_std(req.target()), res.result_int());
        return res;
    } catch (const std::exception& e) {
        Registry::http()->error("[Router] Unhandled error for {} {}: {}",
                                to_std(req.method_string()), to_std(req.target()), e.what());
        auto res = makeErrorResponse(req, "Internal Server Error", status::internal_server_error);
        cors_.apply(req, res);
        return res;
    }
}

string_response Router::dispatch(const request& req) const {
    Target target;
    try {
        target = parseTarget(to_std(req.target()));
    } catch (const std::invalid_argument& e) {
        return makeErrorResponse(req, e.what(), status::bad_request);
    }

    const auto& path = target.path;

    if (path == "/health") {
        if (req.method() != verb::get) return makeMethodNotAllowed(req, "GET");
        return makeJsonResponse(req, json{{"status", "ok"}});
    }

    if (path == "/notes") return handleNotes(req, target.params);

    if (path.starts_with(NOTES_PREFIX)) {
        const auto segment = path.substr(NOTES_PREFIX.size());
        if (!segment.empty() && segment.find('/') == std::string::npos) return handleNote(req, segment);
    }

    if (path == "/utils/seed") return handleSeed(req, target.params);
    if (path == "/utils/reset") return handleReset(req);

    return makeErrorResponse(req, "Not Found", status::not_found);
}

string_response Router::handleNotes(const request& req, const QueryParams& params) const {
    if (req.method() == verb::get) return listNotes(req, params);
    if (req.method() == verb::post) return createNote(req);
    return makeMethodNotAllowed(req, "GET, POST");
}

string_response Router::handleNote(const request& req, const std::string& idSegment) const {
    if (req.method() != verb::get && req.method() != verb::put && req.method() != verb::delete_)
        return makeMethodNotAllowed(req, "DELETE, GET, PUT");

    const auto id = parseInteger(idSegment);
    if (!id || *id < 1 || *id > std::numeric_limits<unsigned int>::max())
        return makeValidationResponse(req, ValidationError{{{"note_id", "note_id must be an integer >= 1"}}});

    const auto noteId = static_cast<unsigned int>(*id);
    switch (req.method()) {
    case verb::get:     return getNote(req, noteId);
    case verb::put:     return updateNote(req, noteId);
    default:            return deleteNote(req, noteId);
    }
}

string_response Router::listNotes(const request& req, const QueryParams& params) const {
    long long page = 1;
    long long pageSize = notes_.default_page_size;

    ValidationError err;
    readIntParam(params, "page", page, err);
    readIntParam(params, "page_size", pageSize, err);
    if (!err.errors.empty()) return makeValidationResponse(req, err);

    ListQuery query{
        .page = clampToUnsigned(page),
        .page_size = clampToUnsigned(pageSize),
        .q = std::nullopt
    };
    if (const auto it = params.find("q"); it != params.end() && !it->second.empty()) query.q = it->second;

    return makeJsonResponse(req, store_->list(query));
}

string_response Router::createNote(const request& req) const {
    auto body = parseJsonBody(req);
    if (const auto* msg = std::get_if<std::string>(&body))
        return makeErrorResponse(req, *msg, status::unprocessable_entity);

    const auto result = validateCreate(std::get<json>(body), notes_.max_title_length);
    if (const auto* err = std::get_if<ValidationError>(&result)) {
        Registry::http()->debug("[Router] Rejected note create: {}", err->message());
        return makeValidationResponse(req, *err);
    }

    const auto note = store_->create(std::get<NoteDraft>(result));
    Registry::audit()->info("[notes] Created note {} '{}'", note.id, note.title);
    return makeJsonResponse(req, note, status::created);
}

string_response Router::getNote(const request& req, const unsigned int id) const {
    const auto note = store_->get(id);
    if (!note) return makeErrorResponse(req, NOTE_NOT_FOUND, status::not_found);
    return makeJsonResponse(req, *note);
}

string_response Router::updateNote(const request& req, const unsigned int id) const {
    auto body = parseJsonBody(req);
    if (const auto* msg = std::get_if<std::string>(&body))
        return makeErrorResponse(req, *msg, status::unprocessable_entity);

    const auto result = validatePatch(std::get<json>(body), notes_.max_title_length);
    if (const auto* err = std::get_if<ValidationError>(&result)) {
        Registry::http()->debug("[Router] Rejected update of note {}: {}", id, err->message());
        return makeValidationResponse(req, *err);
    }

    const auto note = store_->update(id, std::get<NotePatch>(result));
    if (!note) return makeErrorResponse(req, NOTE_NOT_FOUND, status::not_found);

    Registry::audit()->info("[notes] Updated note {}", id);
    return makeJsonResponse(req, *note);
}

string_response Router::deleteNote(const request& req, const unsigned int id) const {
    if (!store_->remove(id)) return makeErrorResponse(req, NOTE_NOT_FOUND, status::not_found);

    Registry::audit()->info("[notes] Deleted note {}", id);
    return makeEmptyResponse(req, status::no_content);
}

string_response Router::handleSeed(const request& req, const QueryParams& params) const {
    if (req.method() != verb::post) return makeMethodNotAllowed(req, "POST");

    unsigned int count = notes_.default_seed_count;
    if (const auto it = params.find("count"); it != params.end()) {
        const auto v = parseInteger(it->second);
        if (!v || *v < 1 || *v > notes_.max_seed_count)
            return makeValidationResponse(req, ValidationError{{{
                "count", fmt::format("count must be an integer between 1 and {}", notes_.max_seed_count)}}});
        count = static_cast<unsigned int>(*v);
    }

    const auto created = nb::seed::seed(*store_, count);
    Registry::audit()->info("[utils] Seeded {} notes", created);
    return makeJsonResponse(req, json{{"created", created}});
}

string_response Router::handleReset(const request& req) const {
    if (req.method() != verb::post) return makeMethodNotAllowed(req, "POST");

    nb::seed::reset(*store_);
    Registry::audit()->info("[utils] Reset note store");
    return makeJsonResponse(req, json{{"status", "reset"}});
}

string_response Router::makeJsonResponse(const request& req, const json& j, const status code) {
    string_response res{code, req.version()};
    res.set(field::content_type, "application/json");
    // Parser messages echo raw request bytes, which need not be valid UTF-8
    res.body() = j.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

string_response Router::makeErrorResponse(const request& req, const std::string& msg, const status code) {
    return makeJsonResponse(req, json{{"detail", msg}}, code);
}

string_response Router::makeValidationResponse(const request& req, const ValidationError& err) {
    return makeJsonResponse(req, err, status::unprocessable_entity);
}

string_response Router::makeEmptyResponse(const request& req, const status code) {
    string_response res{code, req.version()};
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

string_response Router::makeMethodNotAllowed(const request& req, const std::string& allow) {
    auto res = makeErrorResponse(req, "Method Not Allowed", status::method_not_allowed);
    res.set(field::allow, allow);
    return res;
}
