// test_continuation.cpp - Unit tests for CONT/CONC merging
//
#include <gtest/gtest.h>

#include <optional>
#include <string_view>

#include "gedcom/basic/diagnostic.hpp"
#include "gedcom/syntax/continuation.hpp"
#include "gedcom/syntax/line_scanner.hpp"
#include "gedcom/syntax/tree_builder.hpp"

using gedcom::DiagnosticBag;
using gedcom::syntax::ParseForest;
using gedcom::syntax::ParseNode;

namespace
{

std::optional<ParseForest> build_and_merge(std::string_view src, DiagnosticBag & diags)
{
  gedcom::syntax::LineScanner scanner(src, diags);
  auto lines = scanner.scan_all();
  if (!lines) return std::nullopt;
  gedcom::syntax::TreeBuilder builder(diags);
  auto forest = builder.build(*lines);
  if (!forest) return std::nullopt;
  if (!gedcom::syntax::merge_continuations(*forest, diags)) return std::nullopt;
  return forest;
}

bool contains_continuation(const ParseNode & node)
{
  for (const auto & child : node.children) {
    if (gedcom::syntax::is_continuation_tag(child->tag) || contains_continuation(*child)) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST(SyntaxContinuation, ContJoinsWithNewlineConcJoinsDirectly)
{
  DiagnosticBag diags;
  const auto forest = build_and_merge(
    "0 @N1@ NOTE First line\n"
    "1 CONT second line\n"
    "1 CONC  continued\n"
    "1 CONT\n"
    "1 CONT last\n",
    diags);
  ASSERT_TRUE(forest.has_value());
  ASSERT_EQ(forest->size(), 1U);

  const auto & note = *(*forest)[0];
  EXPECT_EQ(note.value, "First line\nsecond line continued\n\nlast");
  EXPECT_TRUE(note.children.empty());
}

TEST(SyntaxContinuation, KeepsRealChildrenInOrder)
{
  DiagnosticBag diags;
  const auto forest = build_and_merge(
    "0 @S1@ SOUR\n"
    "1 TITL A long\n"
    "2 CONC  title\n"
    "1 AUTH Someone\n"
    "1 TEXT abc\n"
    "2 CONT def\n",
    diags);
  ASSERT_TRUE(forest.has_value());

  const auto & source = *(*forest)[0];
  ASSERT_EQ(source.children.size(), 3U);
  EXPECT_EQ(source.children[0]->tag, "TITL");
  EXPECT_EQ(source.children[0]->value, "A long title");
  EXPECT_EQ(source.children[1]->tag, "AUTH");
  EXPECT_EQ(source.children[2]->value, "abc\ndef");
  EXPECT_FALSE(contains_continuation(source));
}

TEST(SyntaxContinuation, NestedContinuationsMergeIntoTheirLineFirst)
{
  DiagnosticBag diags;
  const auto forest = build_and_merge(
    "0 NOTE a\n"
    "1 CONT b\n"
    "2 CONC c\n"
    "1 CONC d\n",
    diags);
  ASSERT_TRUE(forest.has_value());
  EXPECT_EQ((*forest)[0]->value, "a\nbcd");
}

TEST(SyntaxContinuation, MergingTwiceIsNoOp)
{
  DiagnosticBag diags;
  auto forest = build_and_merge(
    "0 @I1@ INDI\n"
    "1 NOTE x\n"
    "2 CONT y\n"
    "1 NAME John /Smith/\n",
    diags);
  ASSERT_TRUE(forest.has_value());

  ASSERT_TRUE(gedcom::syntax::merge_continuations(*forest, diags));
  EXPECT_TRUE(diags.empty());

  const auto & indi = *(*forest)[0];
  ASSERT_EQ(indi.children.size(), 2U);
  EXPECT_EQ(indi.children[0]->value, "x\ny");
  EXPECT_EQ(indi.children[1]->value, "John /Smith/");
}

TEST(SyntaxContinuation, RejectsTopLevelContinuation)
{
  DiagnosticBag diags;
  EXPECT_FALSE(build_and_merge("0 HEAD\n0 CONT stray\n", diags).has_value());
  EXPECT_NE(diags.find_code(gedcom::diag_code::k_orphan_continuation), nullptr);
}

TEST(SyntaxContinuation, RejectsContinuationWithSubRecords)
{
  DiagnosticBag diags;
  EXPECT_FALSE(build_and_merge("0 NOTE a\n1 CONT b\n2 DATE 1900\n", diags).has_value());

  const auto * diag = diags.find_code(gedcom::diag_code::k_continuation_children);
  ASSERT_NE(diag, nullptr);
  ASSERT_EQ(diag->labels.size(), 2U);
  EXPECT_EQ(diag->labels[1].style, gedcom::LabelStyle::Secondary);
}
