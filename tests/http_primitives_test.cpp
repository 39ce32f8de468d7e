#include <gtest/gtest.h>

#include <variant>

#include "myhttp/enums.hpp"
#include "myhttp/headers.hpp"
#include "myhttp/msgs.hpp"

using namespace ShelfHttpd;

// NOLINTNEXTLINE
TEST(http_enums, verbs_parse_case_insensitively) {
    EXPECT_EQ(Http::verb_name_to_enum("GET").value(), Http::Verb::http_get);
    EXPECT_EQ(Http::verb_name_to_enum("get").value(), Http::Verb::http_get);
    EXPECT_EQ(Http::verb_name_to_enum("pOsT").value(), Http::Verb::http_post);
    EXPECT_EQ(Http::verb_name_to_enum("delete").value(), Http::Verb::http_delete);
    EXPECT_EQ(Http::verb_name_to_enum("Connect").value(), Http::Verb::http_connect);
}

// NOLINTNEXTLINE
TEST(http_enums, unknown_verb_is_invalid) {
    auto verb = Http::verb_name_to_enum("BREW");

    ASSERT_FALSE(verb.has_value());
    EXPECT_EQ(verb.error().kind, Core::ErrorKind::invalid);
    EXPECT_NE(verb.error().message.find("BREW"), std::string::npos);
}

// NOLINTNEXTLINE
TEST(http_enums, verb_display_is_uppercase) {
    EXPECT_EQ(Http::verb_enum_to_name(Http::Verb::http_get), "GET");
    EXPECT_EQ(Http::verb_enum_to_name(Http::Verb::http_options), "OPTIONS");
}

// NOLINTNEXTLINE
TEST(http_enums, statuses) {
    EXPECT_EQ(Http::status_enum_to_code(Http::Status::http_ok), "200");
    EXPECT_EQ(Http::status_enum_to_name(Http::Status::http_ok), "OK");
    EXPECT_EQ(Http::status_enum_to_code(Http::Status::http_see_other), "303");
    EXPECT_EQ(Http::status_enum_to_name(Http::Status::http_see_other), "See Other");
    EXPECT_EQ(Http::status_enum_to_code(Http::Status::http_forbidden), "403");
    EXPECT_EQ(Http::status_enum_to_name(Http::Status::http_forbidden), "Forbidden");
    EXPECT_EQ(Http::status_enum_to_code(Http::Status::http_not_found), "404");
    EXPECT_EQ(Http::status_enum_to_name(Http::Status::http_not_found), "Not Found");
    EXPECT_EQ(Http::status_enum_to_code(Http::Status::http_server_error), "500");
    EXPECT_EQ(Http::status_enum_to_name(Http::Status::http_server_error), "Internal Server Error");
}

// NOLINTNEXTLINE
TEST(http_headers, header_case) {
    EXPECT_EQ(Http::to_header_case("content-length"), "Content-Length");
    EXPECT_EQ(Http::to_header_case("cONTENT-tYPE"), "Content-Type");
    EXPECT_EQ(Http::to_header_case("HOST"), "Host");
    EXPECT_EQ(Http::to_header_case("x--y"), "X--Y");
    EXPECT_EQ(Http::to_header_case(""), "");
}

// NOLINTNEXTLINE
TEST(http_msgs, builder_defaults) {
    auto res = Http::ResponseBuilder {}.build();

    EXPECT_EQ(res.version, "HTTP/1.1");
    EXPECT_EQ(res.http_status, Http::Status::http_ok);
    EXPECT_TRUE(std::holds_alternative<Http::EmptyBody>(res.body));
    EXPECT_TRUE(res.headers.empty());
}

// NOLINTNEXTLINE
TEST(http_msgs, builder_sets_fields) {
    auto res = Http::ResponseBuilder {}
        .status(Http::Status::http_see_other)
        .header("Location", "/")
        .body(Http::TextBody {"hello"})
        .build();

    EXPECT_EQ(res.http_status, Http::Status::http_see_other);
    EXPECT_EQ(res.headers.at("Location"), "/");
    ASSERT_TRUE(std::holds_alternative<Http::TextBody>(res.body));
    EXPECT_EQ(std::get<Http::TextBody>(res.body).text, "hello");
}

// NOLINTNEXTLINE
TEST(http_msgs, request_header_lookup) {
    Http::Request req {};
    req.headers.emplace("Content-Type", "text/plain");

    ASSERT_NE(req.header("Content-Type"), nullptr);
    EXPECT_EQ(*req.header("Content-Type"), "text/plain");
    EXPECT_EQ(req.header("Content-Length"), nullptr);
}
