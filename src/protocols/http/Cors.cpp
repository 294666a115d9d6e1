#include "protocols/http/Cors.hpp"
#include "log/Registry.hpp"

using namespace nb::protocols::http;
using namespace nb::log;

Cors::Cors(const std::vector<std::string>& allowedOrigins)
    : allowedOrigins_(allowedOrigins.begin(), allowedOrigins.end()) {}

bool Cors::isAllowed(const std::string_view origin) const {
    return !origin.empty() && allowedOrigins_.contains(std::string(origin));
}

bool Cors::isPreflight(const request& req) {
    return req.method() == verb::options
        && req.find(field::origin) != req.end()
        && req.find(field::access_control_request_method) != req.end();
}

string_response Cors::preflight(const request& req) const {
    const auto origin = to_std(req[field::origin]);

    if (!isAllowed(origin)) {
        Registry::http()->warn("[Cors] Rejected preflight from origin {}", std::string(origin));
        string_response res{status::bad_request, req.version()};
        res.set(field::content_type, "text/plain");
        res.body() = "Disallowed CORS origin";
        res.prepare_payload();
        res.keep_alive(req.keep_alive());
        return res;
    }

    string_response res{status::ok, req.version()};
    res.set(field::access_control_allow_origin, std::string(origin));
    res.set(field::access_control_allow_credentials, "true");
    res.set(field::access_control_allow_methods, std::string(ALLOWED_METHODS));
    res.set(field::access_control_max_age, std::to_string(MAX_AGE_SECONDS));
    if (const auto headers = to_std(req[field::access_control_request_headers]); !headers.empty())
        res.set(field::access_control_allow_headers, std::string(headers));
    res.set(field::vary, "Origin");
    res.set(field::content_type, "text/plain");
    res.body() = "OK";
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

void Cors::apply(const request& req, string_response& res) const {
    const auto origin = to_std(req[field::origin]);
    if (!isAllowed(origin)) return;

    res.set(field::access_control_allow_origin, std::string(origin));
    res.set(field::access_control_allow_credentials, "true");
    res.set(field::vary, "Origin");
}
