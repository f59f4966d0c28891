/**
 * @file test_hcl_write.cpp
 * @brief Editing operations and canonical rendering of modified blocks
 */

#include "tfmigrate/hcl.hpp"

#include <string>

#include <gtest/gtest.h>

namespace tfmigrate::hcl::test {

namespace {

[[nodiscard]] File parse_file(std::string_view text)
{
    auto parsed = parse(text, "main.tf");
    EXPECT_TRUE(parsed) << (parsed ? "" : parsed.error().message);
    if (!parsed) {
        return File("main.tf");
    }
    return std::move(*parsed);
}

}  // namespace

TEST(HclWriteTest, ModifiedBodyIsRealigned)
{
    File file = parse_file(R"(resource "a" "b" {
  name = "x" # keep
  enabled = true
  nested {
    y = 1
  }
}
)");
    Block* block = file.find_resource("a", "b");
    ASSERT_NE(block, nullptr);
    block->body().set_attribute_value("precedence", Value(901));

    EXPECT_EQ(write(file),
              "resource \"a\" \"b\" {\n"
              "  name       = \"x\" # keep\n"
              "  enabled    = true\n"
              "  precedence = 901\n"
              "  nested {\n"
              "    y = 1\n"
              "  }\n"
              "}\n");
}

TEST(HclWriteTest, MultiLineValuesBreakTheAlignmentRun)
{
    File file = parse_file("resource \"a\" \"b\" {\n  account_id = \"abc\"\n}\n");
    Block* block = file.find_resource("a", "b");
    ASSERT_NE(block, nullptr);

    Object entry{Member{.key = "address", .value = Value("10.0.0.0/8")}};
    block->body().set_attribute_value("include", Value(List{Value(std::move(entry))}));

    EXPECT_EQ(write(file),
              "resource \"a\" \"b\" {\n"
              "  account_id = \"abc\"\n"
              "  include = [\n"
              "    {\n"
              "      address = \"10.0.0.0/8\"\n"
              "    },\n"
              "  ]\n"
              "}\n");
}

TEST(HclWriteTest, AttributeIsAddedBeforeNestedBlocks)
{
    File file = parse_file("resource \"a\" \"b\" {\n  inner {\n  }\n}\n");
    file.find_resource("a", "b")->body().set_attribute("count", "2");
    EXPECT_EQ(write(file), "resource \"a\" \"b\" {\n  count = 2\n  inner {\n  }\n}\n");
}

TEST(HclWriteTest, EmptySingleLineBlockExpands)
{
    File file = parse_file("variable \"x\" {}\n");
    auto blocks = file.body().blocks();
    ASSERT_EQ(blocks.size(), 1U);
    blocks[0]->body().set_attribute_value("default", Value(1));
    EXPECT_EQ(write(file), "variable \"x\" {\n  default = 1\n}\n");
}

TEST(HclWriteTest, RemoveAttributes)
{
    File file = parse_file("resource \"a\" \"b\" {\n  mode = \"warp\"\n  port = 1234\n}\n");
    Body& body = file.find_resource("a", "b")->body();

    EXPECT_TRUE(body.remove_attribute("port"));
    EXPECT_FALSE(body.remove_attribute("port"));

    EXPECT_EQ(write(file), "resource \"a\" \"b\" {\n  mode = \"warp\"\n}\n");
}

TEST(HclWriteTest, RemovingMissingAttributeKeepsSource)
{
    File file = parse_file("resource \"a\" \"b\" {\n  x  = 1\n  y = 2\n}\n");
    Body& body = file.find_resource("a", "b")->body();
    EXPECT_FALSE(body.remove_attribute("z"));
    EXPECT_FALSE(file.find_resource("a", "b")->modified());
    EXPECT_EQ(write(file), "resource \"a\" \"b\" {\n  x  = 1\n  y = 2\n}\n");
}

TEST(HclWriteTest, RelabeledBlockKeepsItsBodyText)
{
    File file = parse_file("resource \"old\" \"b\" {\n  x  = 1 # c\n}\n");
    Block* block = file.find_resource("old", "b");
    ASSERT_NE(block, nullptr);
    block->set_label(0, "new");

    EXPECT_EQ(write(file), "resource \"new\" \"b\" {\n  x  = 1 # c\n}\n");
    EXPECT_EQ(file.find_resource("old", "b"), nullptr);
    EXPECT_NE(file.find_resource("new", "b"), nullptr);
}

TEST(HclWriteTest, RemovingABlockDropsTheDoubledBlankLine)
{
    constexpr std::string_view kThree =
        "resource \"a\" \"one\" {\n}\n\nresource \"a\" \"two\" {\n}\n\nresource \"a\" \"three\" {\n}\n";

    File middle = parse_file(kThree);
    EXPECT_TRUE(middle.body().remove_block(middle.find_resource("a", "two")));
    EXPECT_EQ(write(middle), "resource \"a\" \"one\" {\n}\n\nresource \"a\" \"three\" {\n}\n");

    File last = parse_file(kThree);
    EXPECT_TRUE(last.body().remove_block(last.find_resource("a", "three")));
    EXPECT_EQ(write(last), "resource \"a\" \"one\" {\n}\n\nresource \"a\" \"two\" {\n}\n");

    EXPECT_FALSE(last.body().remove_block(nullptr));
}

TEST(HclWriteTest, AppendedTriviaStartsOnItsOwnLine)
{
    File file = parse_file("resource \"a\" \"b\" {\n}");
    file.body().append_trivia("# note\n");
    EXPECT_EQ(write(file), "resource \"a\" \"b\" {\n}\n# note\n");
}

TEST(HclWriteTest, WriteBlockUsesSourceUntilModified)
{
    File file = parse_file("resource \"a\" \"b\" {\n  x   = 1\n}\n");
    Block* block = file.find_resource("a", "b");
    EXPECT_EQ(write_block(*block), "resource \"a\" \"b\" {\n  x   = 1\n}\n");

    block->body().set_attribute("x", "2");
    EXPECT_EQ(write_block(*block), "resource \"a\" \"b\" {\n  x = 2\n}\n");
}

TEST(HclRenderTest, QuoteEscapes)
{
    EXPECT_EQ(quote("plain"), "\"plain\"");
    EXPECT_EQ(quote("a\"b\\c\nd\te"), R"("a\"b\\c\nd\te")");
    EXPECT_EQ(quote("${x} %{y} $z"), R"("$${x} %%{y} $z")");
    EXPECT_EQ(quote(std::string_view("\x01", 1)), R"("\u0001")");
}

TEST(HclRenderTest, Scalars)
{
    EXPECT_EQ(render_value(Value()), "null");
    EXPECT_EQ(render_value(Value(true)), "true");
    EXPECT_EQ(render_value(Value(900)), "900");
    EXPECT_EQ(render_value(Value(-3)), "-3");
    EXPECT_EQ(render_value(Value(1.5)), "1.5");
    EXPECT_EQ(render_value(Value(Expression{.text = "var.x"})), "var.x");
    EXPECT_EQ(render_value(Value(List{})), "[]");
    EXPECT_EQ(render_value(Value(Object{})), "{}");
}

TEST(HclRenderTest, ObjectKeysAlignAndQuoteWhenNeeded)
{
    Value object(Object{Member{.key = "a", .value = Value(1)},
                        Member{.key = "with space", .value = Value(true)}});
    EXPECT_EQ(render_value(object, 0),
              "{\n"
              "  a            = 1\n"
              "  \"with space\" = true\n"
              "}");
}

}  // namespace tfmigrate::hcl::test
