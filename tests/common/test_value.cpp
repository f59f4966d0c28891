/**
 * @file test_value.cpp
 * @brief Value model and JSON conversion tests
 */

#include "tfmigrate/common.hpp"
#include "tfmigrate/value.hpp"

#include <filesystem>
#include <system_error>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace tfmigrate::test {

namespace {

namespace fs = std::filesystem;

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

}  // namespace

TEST(ValueTest, JsonObjectKeepsMemberOrder)
{
    auto json = nlohmann::ordered_json::parse(R"({"zeta": 1, "alpha": "a", "mid": [true, null]})");
    Value value = from_json(json);

    const Object* object = value.as_object();
    ASSERT_NE(object, nullptr);
    ASSERT_EQ(object->size(), 3U);
    EXPECT_EQ((*object)[0].key, "zeta");
    EXPECT_EQ((*object)[1].key, "alpha");
    EXPECT_EQ((*object)[2].key, "mid");
    EXPECT_EQ((*object)[2].value, Value(List{Value(true), Value()}));
}

TEST(ValueTest, IntegralNumbersConvertBackToIntegers)
{
    EXPECT_TRUE(to_json(Value(3)).is_number_integer());
    EXPECT_EQ(to_json(Value(3)), 3);
    EXPECT_TRUE(to_json(Value(2.5)).is_number_float());
    EXPECT_EQ(to_json(Value(Expression{.text = "var.x"})), "var.x");
    EXPECT_TRUE(to_json(Value()).is_null());
}

TEST(ValueTest, NullAttributesAreNotPresent)
{
    auto attributes = attributes_from_json(
        nlohmann::ordered_json::parse(R"({"match": null, "precedence": 10, "name": "x"})"));

    EXPECT_NE(find_attribute(attributes, "match"), nullptr);
    EXPECT_FALSE(is_present(attributes, "match"));
    EXPECT_TRUE(is_present(attributes, "precedence"));
    EXPECT_FALSE(is_present(attributes, "missing"));
    EXPECT_EQ(string_attribute(attributes, "name"), "x");
    EXPECT_EQ(string_attribute(attributes, "precedence"), std::nullopt);
}

TEST(ValueTest, EqualityIsStructural)
{
    Value lhs(Object{Member{.key = "address", .value = Value("10.0.0.0/8")}});
    Value rhs(Object{Member{.key = "address", .value = Value("10.0.0.0/8")}});
    Value other(Object{Member{.key = "host", .value = Value("10.0.0.0/8")}});

    EXPECT_EQ(lhs, rhs);
    EXPECT_NE(lhs, other);
    EXPECT_NE(Value("1"), Value(1));
    EXPECT_NE(Value("var.x"), Value(Expression{.text = "var.x"}));
}

TEST(ValueTest, FindMemberReturnsFirstMatch)
{
    Object object{Member{.key = "a", .value = Value(1)}, Member{.key = "b", .value = Value(2)}};
    ASSERT_NE(find_member(object, "b"), nullptr);
    EXPECT_EQ(*find_member(object, "b"), Value(2));
    EXPECT_EQ(find_member(object, "c"), nullptr);
}

TEST(TextTest, TrimAndIdentifiers)
{
    EXPECT_EQ(common::trim("  a b \n"), "a b");
    EXPECT_EQ(common::trim(" \t\n"), "");
    EXPECT_TRUE(common::is_identifier("cloudflare_split_tunnel"));
    EXPECT_TRUE(common::is_identifier("my-name_2"));
    EXPECT_FALSE(common::is_identifier("2abc"));
    EXPECT_FALSE(common::is_identifier("a.b"));
    EXPECT_FALSE(common::is_identifier(""));
}

TEST(TextTest, SplitLinesDropsTerminators)
{
    auto lines = common::split_lines("a\r\nb\n\nc\n");
    ASSERT_EQ(lines.size(), 4U);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");
}

TEST(TextTest, FilesRoundTripBytes)
{
    TempDir dir("tfmigrate_test_text");
    auto path = dir.path() / "main.tf";
    std::string text = "resource \"a\" \"b\" {\r\n}\n";

    ASSERT_TRUE(common::write_text_file(path, text));
    auto read = common::read_text_file(path);
    ASSERT_TRUE(read);
    EXPECT_EQ(*read, text);
}

TEST(TextTest, MissingFileIsIOError)
{
    auto read = common::read_text_file("/nonexistent/tfmigrate/main.tf");
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, "IOError");
}

}  // namespace tfmigrate::test
