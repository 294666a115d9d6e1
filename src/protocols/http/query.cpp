#include "protocols/http/query.hpp"

#include <charconv>
#include <stdexcept>

namespace nb::protocols::http {

namespace {

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

std::string urlDecode(const std::string_view value) {
    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%') {
            if (i + 2 >= value.size()) throw std::invalid_argument("Invalid percent-encoding in URL");
            const int hi = hexValue(value[i + 1]);
            const int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) throw std::invalid_argument("Invalid percent-encoding in URL");
            result += static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        else if (value[i] == '+') result += ' ';
        else result += value[i];
    }

    return result;
}

QueryParams parseQueryParams(const std::string_view query) {
    QueryParams params;

    size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string_view::npos) end = query.size();

        if (const auto pair = query.substr(start, end - start); !pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string_view::npos) params[urlDecode(pair)] = "";
            else params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
        }

        start = end + 1;
    }

    return params;
}

Target parseTarget(const std::string_view target) {
    Target out;

    const auto pos = target.find('?');
    out.path = urlDecode(target.substr(0, pos));
    if (pos != std::string_view::npos) out.params = parseQueryParams(target.substr(pos + 1));

    if (out.path.size() > 1 && out.path.ends_with('/')) out.path.pop_back();
    return out;
}

std::optional<long long> parseInteger(const std::string_view value) {
    if (value.empty()) return std::nullopt;

    long long out = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

}
