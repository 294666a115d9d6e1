#pragma once

#include "protocols/http/types.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace nb::protocols::http {

/**
 * Origin allow-list for browser clients.
 *
 * Allowed origins are echoed back with credentials enabled; requests from any
 * other origin get no CORS headers at all, and their preflights are refused.
 */
class Cors {
public:
    static constexpr std::string_view ALLOWED_METHODS = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";
    static constexpr unsigned int MAX_AGE_SECONDS = 600;

    explicit Cors(const std::vector<std::string>& allowedOrigins);

    [[nodiscard]] bool isAllowed(std::string_view origin) const;

    // OPTIONS carrying both Origin and Access-Control-Request-Method.
    [[nodiscard]] static bool isPreflight(const request& req);

    [[nodiscard]] string_response preflight(const request& req) const;

    // Adds the simple-request headers when the request origin is allowed.
    void apply(const request& req, string_response& res) const;

private:
    std::unordered_set<std::string> allowedOrigins_;
};

}
