#include <gtest/gtest.h>
#include "notes/Validation.hpp"

#include <nlohmann/json.hpp>

using namespace nb::notes;
using namespace nb::notes::model;
using json = nlohmann::json;

namespace {

const ValidationError& errorOf(const auto& result) {
    return std::get<ValidationError>(result);
}

bool hasField(const ValidationError& err, const std::string& field) {
    for (const auto& e : err.errors)
        if (e.field == field) return true;
    return false;
}

}

TEST(ValidateCreate, AcceptsMinimalBody) {
    const auto result = validateCreate(json{{"title", "Hello"}, {"content", "World"}});
    ASSERT_TRUE(std::holds_alternative<NoteDraft>(result));
    const auto& d = std::get<NoteDraft>(result);
    EXPECT_EQ(d.title, "Hello");
    EXPECT_EQ(d.content, "World");
    EXPECT_TRUE(d.tags.empty());
}

TEST(ValidateCreate, AcceptsEmptyContentAndNullTags) {
    const auto result = validateCreate(json{{"title", "T"}, {"content", ""}, {"tags", nullptr}});
    ASSERT_TRUE(std::holds_alternative<NoteDraft>(result));
    EXPECT_TRUE(std::get<NoteDraft>(result).tags.empty());
}

TEST(ValidateCreate, KeepsTags) {
    const auto result = validateCreate(json{{"title", "T"}, {"content", "c"}, {"tags", {"a", "b"}}});
    ASSERT_TRUE(std::holds_alternative<NoteDraft>(result));
    EXPECT_EQ(std::get<NoteDraft>(result).tags, (std::vector<std::string>{"a", "b"}));
}

TEST(ValidateCreate, MissingFieldsAreAllReported) {
    const auto result = validateCreate(json::object());
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    const auto& err = errorOf(result);
    EXPECT_EQ(err.errors.size(), 2u);
    EXPECT_TRUE(hasField(err, "title"));
    EXPECT_TRUE(hasField(err, "content"));
}

TEST(ValidateCreate, RejectsEmptyTitle) {
    const auto result = validateCreate(json{{"title", ""}, {"content", "x"}});
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_TRUE(hasField(errorOf(result), "title"));
}

TEST(ValidateCreate, TitleLengthCountsCodePoints) {
    // 200 two-byte characters is still a valid title
    std::string title;
    for (int i = 0; i < 200; ++i) title += "\xC3\xA9";
    EXPECT_TRUE(std::holds_alternative<NoteDraft>(validateCreate(json{{"title", title}, {"content", ""}})));

    title += "e";
    const auto result = validateCreate(json{{"title", title}, {"content", ""}});
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_TRUE(hasField(errorOf(result), "title"));
}

TEST(ValidateCreate, HonorsConfiguredTitleLimit) {
    const auto result = validateCreate(json{{"title", "abcdef"}, {"content", ""}}, 5);
    EXPECT_TRUE(std::holds_alternative<ValidationError>(result));
}

TEST(ValidateCreate, RejectsWrongTypes) {
    const auto result = validateCreate(json{{"title", 5}, {"content", true}, {"tags", {"ok", 3}}});
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    const auto& err = errorOf(result);
    EXPECT_EQ(err.errors.size(), 3u);
    EXPECT_TRUE(hasField(err, "tags"));
}

TEST(ValidateCreate, RejectsNonObjectBody) {
    const auto result = validateCreate(json::array({1, 2}));
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_TRUE(hasField(errorOf(result), "body"));
}

TEST(ValidatePatch, EmptyObjectIsAnEmptyPatch) {
    const auto result = validatePatch(json::object());
    ASSERT_TRUE(std::holds_alternative<NotePatch>(result));
    EXPECT_TRUE(std::get<NotePatch>(result).empty());
}

TEST(ValidatePatch, NullMembersAreAbsent) {
    const auto result = validatePatch(json{{"title", nullptr}, {"content", "new"}});
    ASSERT_TRUE(std::holds_alternative<NotePatch>(result));
    const auto& p = std::get<NotePatch>(result);
    EXPECT_FALSE(p.title.has_value());
    ASSERT_TRUE(p.content.has_value());
    EXPECT_EQ(*p.content, "new");
}

TEST(ValidatePatch, RejectsEmptyTitle) {
    const auto result = validatePatch(json{{"title", ""}});
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_TRUE(hasField(errorOf(result), "title"));
}

TEST(ValidatePatch, EmptyTagListIsKept) {
    const auto result = validatePatch(json{{"tags", json::array()}});
    ASSERT_TRUE(std::holds_alternative<NotePatch>(result));
    const auto& p = std::get<NotePatch>(result);
    ASSERT_TRUE(p.tags.has_value());
    EXPECT_TRUE(p.tags->empty());
}

TEST(ValidationErrorJson, SerializesWithDetailAndErrors) {
    const ValidationError err{{{"title", "field required"}}};
    const json j = err;
    EXPECT_EQ(j.at("detail"), "Validation failed");
    ASSERT_EQ(j.at("errors").size(), 1u);
    EXPECT_EQ(j.at("errors")[0].at("field"), "title");
    EXPECT_EQ(j.at("errors")[0].at("message"), "field required");
    EXPECT_EQ(err.message(), "title: field required");
}
