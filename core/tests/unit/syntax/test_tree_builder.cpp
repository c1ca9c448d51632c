// test_tree_builder.cpp - Unit tests for level-based tree building
//
#include <gtest/gtest.h>

#include <functional>
#include <optional>
#include <string_view>

#include "gedcom/basic/diagnostic.hpp"
#include "gedcom/syntax/line_scanner.hpp"
#include "gedcom/syntax/tree_builder.hpp"

using gedcom::DiagnosticBag;
using gedcom::syntax::LineScanner;
using gedcom::syntax::ParseForest;
using gedcom::syntax::TreeBuilder;

namespace
{

std::optional<ParseForest> build(std::string_view src, DiagnosticBag & diags)
{
  LineScanner scanner(src, diags);
  auto lines = scanner.scan_all();
  if (!lines) return std::nullopt;
  TreeBuilder builder(diags);
  return builder.build(*lines);
}

}  // namespace

TEST(SyntaxTreeBuilder, NestsByLevel)
{
  DiagnosticBag diags;
  const auto forest = build(
    "0 @I1@ INDI\n"
    "1 BIRT\n"
    "2 DATE 1 JAN 1900\n"
    "2 PLAC Boston\n"
    "1 SEX M\n"
    "0 TRLR\n",
    diags);
  ASSERT_TRUE(forest.has_value());
  ASSERT_EQ(forest->size(), 2U);

  const auto & indi = *(*forest)[0];
  EXPECT_EQ(indi.pointer, "@I1@");
  ASSERT_EQ(indi.children.size(), 2U);
  EXPECT_EQ(indi.children[0]->tag, "BIRT");
  ASSERT_EQ(indi.children[0]->children.size(), 2U);
  EXPECT_EQ(indi.children[0]->children[0]->value, "1 JAN 1900");
  EXPECT_EQ(indi.children[0]->children[1]->tag, "PLAC");
  EXPECT_EQ(indi.children[1]->tag, "SEX");

  EXPECT_EQ((*forest)[1]->tag, "TRLR");
}

TEST(SyntaxTreeBuilder, ChildLevelIsParentPlusOne)
{
  DiagnosticBag diags;
  const auto forest = build("0 A\n1 B\n2 C\n3 D\n1 E\n2 F\n0 G\n", diags);
  ASSERT_TRUE(forest.has_value());

  std::function<void(const gedcom::syntax::ParseNode &)> check =
    [&](const gedcom::syntax::ParseNode & node) {
      for (const auto & child : node.children) {
        EXPECT_EQ(child->level, node.level + 1);
        check(*child);
      }
    };
  for (const auto & root : *forest) {
    EXPECT_EQ(root->level, 0U);
    check(*root);
  }
}

TEST(SyntaxTreeBuilder, RejectsLevelSkip)
{
  DiagnosticBag diags;
  const auto forest = build("0 @I1@ INDI\n1 BIRT\n3 DATE 1900\n", diags);
  EXPECT_FALSE(forest.has_value());

  const auto * diag = diags.find_code(gedcom::diag_code::k_level_skip);
  ASSERT_NE(diag, nullptr);
  EXPECT_EQ(diag->message, "level jumps from 1 to 3");
  EXPECT_EQ(diag->primary_range().get_begin().get_offset(), 19U);
  EXPECT_TRUE(diag->help_message.has_value());
}

TEST(SyntaxTreeBuilder, RejectsFirstLineAboveLevelZero)
{
  DiagnosticBag diags;
  const auto forest = build("1 NAME orphan\n0 TRLR\n", diags);
  EXPECT_FALSE(forest.has_value());

  const auto * diag = diags.find_code(gedcom::diag_code::k_level_skip);
  ASSERT_NE(diag, nullptr);
  EXPECT_EQ(diag->message, "first record must be at level 0, found level 1");
}

TEST(SyntaxTreeBuilder, EmptyInputGivesEmptyForest)
{
  DiagnosticBag diags;
  const auto forest = build("", diags);
  ASSERT_TRUE(forest.has_value());
  EXPECT_TRUE(forest->empty());
  EXPECT_TRUE(diags.empty());
}
