#pragma once

#include <boost/beast/core/string.hpp>
#include <boost/beast/http.hpp>
#include <string_view>

namespace nb::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;

template<class Body>
using response = boost::beast::http::response<Body>;

using string_body = boost::beast::http::string_body;
using string_response = response<string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

inline std::string_view to_std(const boost::beast::string_view s) { return {s.data(), s.size()}; }

}
