#pragma once

#include "protocols/http/types.hpp"
#include "protocols/http/query.hpp"
#include "protocols/http/Cors.hpp"
#include "config/Config.hpp"

#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>

namespace nb::notes { class Store; struct ValidationError; }

namespace nb::protocols::http {

/**
 * Maps HTTP requests onto the note store.
 *
 *   GET    /health
 *   GET    /notes            ?page&page_size&q
 *   POST   /notes
 *   GET    /notes/{id}
 *   PUT    /notes/{id}
 *   DELETE /notes/{id}
 *   POST   /utils/seed       ?count
 *   POST   /utils/reset
 *
 * route() never throws: handler exceptions become a 500 JSON response.
 */
class Router {
public:
    Router(std::shared_ptr<notes::Store> store, config::NotesConfig notes, Cors cors);

    string_response route(request&& req) const;

    static string_response makeJsonResponse(const request& req,
                                            const nlohmann::json& j,
                                            status code = status::ok);

    static string_response makeErrorResponse(const request& req,
                                             const std::string& msg,
                                             status code = status::not_found);

    static string_response makeValidationResponse(const request& req, const notes::ValidationError& err);

    static string_response makeEmptyResponse(const request& req, status code);

private:
    std::shared_ptr<notes::Store> store_;
    config::NotesConfig notes_;
    Cors cors_;

    string_response dispatch(const request& req) const;

    string_response handleNotes(const request& req, const QueryParams& params) const;
    string_response handleNote(const request& req, const std::string& idSegment) const;
    string_response handleSeed(const request& req, const QueryParams& params) const;
    string_response handleReset(const request& req) const;

    string_response listNotes(const request& req, const QueryParams& params) const;
    string_response createNote(const request& req) const;
    string_response getNote(const request& req, unsigned int id) const;
    string_response updateNote(const request& req, unsigned int id) const;
    string_response deleteNote(const request& req, unsigned int id) const;

    static string_response makeMethodNotAllowed(const request& req, const std::string& allow);
};

}
