#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace nb::protocols::http {

using QueryParams = std::unordered_map<std::string, std::string>;

struct Target {
    std::string path;
    QueryParams params;
};

// Splits "/notes/3?q=a%20b" into its decoded path and query parameters.
// A single trailing slash is dropped from the path (except for "/").
Target parseTarget(std::string_view target);

QueryParams parseQueryParams(std::string_view query);

std::string urlDecode(std::string_view value);

// Strict base-10 integer; rejects signs other than '-', whitespace and overflow.
std::optional<long long> parseInteger(std::string_view value);

}
