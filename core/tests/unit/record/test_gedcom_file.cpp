// test_gedcom_file.cpp - Unit tests for GedcomFile mutation and equality
//
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "gedcom/basic/casting.hpp"
#include "gedcom/record/gedcom_file.hpp"
#include "gedcom/record/structural_equal.hpp"
#include "gedcom/syntax/frontend.hpp"
#include "gedcom/test_support/parse_helpers.hpp"

namespace gedcom
{

TEST(GedcomFileMutation, CreateRecordsWithFreshIds)
{
  auto file = parse_text(
    "0 @I2@ INDI\n"
    "0 @F1@ FAM\n");

  Individual * first = file->create_individual();
  EXPECT_EQ(first->id(), "@I1@");
  EXPECT_EQ(first->level, 0U);

  // Individuals and families draw from one counter
  Family * family = file->create_family();
  EXPECT_EQ(family->id(), "@F2@");

  Individual * second = file->create_individual();
  EXPECT_EQ(second->id(), "@I3@");

  EXPECT_EQ(file->find("@I1@"), first);
  EXPECT_EQ(file->find("@F2@"), family);
  EXPECT_EQ(file->individuals().size(), 3U);
  EXPECT_EQ(file->roots().back(), second);
}

TEST(GedcomFileMutation, FreshIdsSkipTakenOnes)
{
  auto file = parse_text(
    "0 @I1@ INDI\n"
    "0 @I2@ INDI\n");
  EXPECT_EQ(file->create_individual()->id(), "@I3@");
  EXPECT_EQ(file->create_family()->id(), "@F4@");
}

TEST(GedcomFileMutation, BuildFromEmpty)
{
  GedcomFile file;
  Individual * person = file.create_individual();
  Record * name = file.append_child(*person, "NAME", "Ada /Byron/");
  Record * birth = file.append_child(*person, "BIRT");
  file.append_child(*birth, "DATE", "10 DEC 1815");

  EXPECT_EQ(name->level, 1U);
  EXPECT_TRUE(isa<Birth>(birth));
  EXPECT_TRUE(birth->get_range().is_invalid());
  EXPECT_EQ(person->name()->surname, "Byron");
  EXPECT_EQ(person->birth().value()->date().value(), "10 DEC 1815");

  Family * family = file.create_family();
  EXPECT_EQ(family->id(), "@F2@");
  file.append_child(*family, "WIFE", person->id());
  EXPECT_EQ(family->wife(file.index()).value(), person);

  EXPECT_EQ(
    file.serialize(),
    "0 @I1@ INDI\n"
    "1 NAME Ada /Byron/\n"
    "1 BIRT\n"
    "2 DATE 10 DEC 1815\n"
    "0 @F2@ FAM\n"
    "1 WIFE @I1@\n");
}

TEST(GedcomFileMutation, SetValueAndSex)
{
  auto file = parse_text(
    "0 @I1@ INDI\n"
    "1 NAME Old /Name/\n"
    "1 SEX M\n"
    "0 @I2@ INDI\n");

  auto * p1 = file->index().lookup_as<Individual>("@I1@");
  auto * p2 = file->index().lookup_as<Individual>("@I2@");
  ASSERT_NE(p1, nullptr);
  ASSERT_NE(p2, nullptr);

  Record * name = file->find("@I1@")->children()[0];
  file->set_value(*name, "New /Name/");
  EXPECT_EQ(p1->name()->given, "New");

  auto * mutable_p1 = dyn_cast<Individual>(file->find("@I1@"));
  auto * mutable_p2 = dyn_cast<Individual>(file->find("@I2@"));
  EXPECT_TRUE(file->set_sex(*mutable_p1, "f"));
  EXPECT_TRUE(p1->is_female());
  EXPECT_EQ(p1->children_with("SEX").size(), 1U);

  EXPECT_TRUE(file->set_sex(*mutable_p2, "M"));
  EXPECT_EQ(p2->sex().value(), "M");

  EXPECT_FALSE(file->set_sex(*mutable_p2, "X"));
  EXPECT_FALSE(file->set_sex(*mutable_p2, "male"));
  EXPECT_EQ(p2->sex().value(), "M");
}

TEST(GedcomFileMutation, EnsureHeaderTrailer)
{
  auto file = parse_text("0 @I1@ INDI\n");
  HeaderOptions header;
  header.source = "test-suite";
  file->ensure_header_trailer(header);

  EXPECT_EQ(
    file->serialize(),
    "0 HEAD\n"
    "1 SOUR test-suite\n"
    "1 CHAR UTF-8\n"
    "1 GEDC\n"
    "2 VERS 5.5\n"
    "2 FORM LINEAGE-LINKED\n"
    "0 @I1@ INDI\n"
    "0 TRLR\n");

  // Already present: nothing changes
  file->ensure_header_trailer(header);
  EXPECT_EQ(file->roots().size(), 3U);
}

TEST(GedcomFileMutation, EnsureHeaderTrailerKeepsExistingHeader)
{
  auto file = parse_text("0 HEAD\n1 SOUR PAF\n0 @I1@ INDI\n");
  file->ensure_header_trailer();
  ASSERT_EQ(file->roots().size(), 3U);
  EXPECT_EQ(file->roots().front()->child("SOUR")->value, "PAF");
  EXPECT_EQ(file->roots().back()->tag, "TRLR");

  GedcomFile empty;
  empty.ensure_header_trailer();
  EXPECT_EQ(empty.roots().size(), 2U);
}

TEST(GedcomFileEquality, ComparesStructureNotLevelsOrRanges)
{
  auto a = parse_text("0 @I1@ INDI\n1 NAME A /B/\n");
  auto b = parse_text("\n\n0 @I1@ INDI\r\n  1 NAME A /B/\r\n");
  EXPECT_TRUE(structurally_equal(*a, *b));

  auto c = parse_text("0 @I1@ INDI\n1 NAME A /C/\n");
  EXPECT_FALSE(structurally_equal(*a, *c));

  auto d = parse_text("0 @I1@ INDI\n1 NAME A /B/\n1 SEX M\n");
  EXPECT_FALSE(structurally_equal(*a, *d));

  auto e = parse_text("0 @I2@ INDI\n1 NAME A /B/\n");
  EXPECT_FALSE(structurally_equal(*a, *e));
}

}  // namespace gedcom
