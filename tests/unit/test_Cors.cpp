#include <gtest/gtest.h>
#include "protocols/http/Cors.hpp"

using namespace nb::protocols::http;

class CorsTest : public ::testing::Test {
protected:
    Cors cors{{"http://localhost", "http://localhost:3000"}};

    static request preflightRequest(const std::string& origin, const std::string& headers = "") {
        request req{verb::options, "/notes", 11};
        req.set(field::origin, origin);
        req.set(field::access_control_request_method, "PUT");
        if (!headers.empty()) req.set(field::access_control_request_headers, headers);
        return req;
    }
};

TEST_F(CorsTest, AllowListIsExact) {
    EXPECT_TRUE(cors.isAllowed("http://localhost"));
    EXPECT_TRUE(cors.isAllowed("http://localhost:3000"));
    EXPECT_FALSE(cors.isAllowed("http://localhost:8080"));
    EXPECT_FALSE(cors.isAllowed("https://localhost"));
    EXPECT_FALSE(cors.isAllowed(""));
}

TEST_F(CorsTest, DetectsPreflight) {
    EXPECT_TRUE(Cors::isPreflight(preflightRequest("http://localhost")));

    request plainOptions{verb::options, "/notes", 11};
    plainOptions.set(field::origin, "http://localhost");
    EXPECT_FALSE(Cors::isPreflight(plainOptions));

    request get{verb::get, "/notes", 11};
    get.set(field::origin, "http://localhost");
    get.set(field::access_control_request_method, "GET");
    EXPECT_FALSE(Cors::isPreflight(get));
}

TEST_F(CorsTest, PreflightFromAllowedOrigin) {
    const auto res = cors.preflight(preflightRequest("http://localhost", "content-type, x-trace"));
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_EQ(to_std(res[field::access_control_allow_origin]), "http://localhost");
    EXPECT_EQ(to_std(res[field::access_control_allow_credentials]), "true");
    EXPECT_EQ(to_std(res[field::access_control_allow_methods]), Cors::ALLOWED_METHODS);
    EXPECT_EQ(to_std(res[field::access_control_allow_headers]), "content-type, x-trace");
    EXPECT_EQ(to_std(res[field::access_control_max_age]), "600");
    EXPECT_EQ(to_std(res[field::vary]), "Origin");
}

TEST_F(CorsTest, PreflightFromOtherOriginIsRefused) {
    const auto res = cors.preflight(preflightRequest("http://evil.example"));
    EXPECT_EQ(res.result(), status::bad_request);
    EXPECT_EQ(res.body(), "Disallowed CORS origin");
    EXPECT_TRUE(res.find(field::access_control_allow_origin) == res.end());
}

TEST_F(CorsTest, ApplyOnlyTouchesAllowedOrigins) {
    request req{verb::get, "/notes", 11};
    req.set(field::origin, "http://localhost:3000");
    string_response res{status::ok, 11};
    cors.apply(req, res);
    EXPECT_EQ(to_std(res[field::access_control_allow_origin]), "http://localhost:3000");

    request noOrigin{verb::get, "/notes", 11};
    string_response untouched{status::ok, 11};
    cors.apply(noOrigin, untouched);
    EXPECT_TRUE(untouched.find(field::access_control_allow_origin) == untouched.end());
}
