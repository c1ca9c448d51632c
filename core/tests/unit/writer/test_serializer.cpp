// test_serializer.cpp - Unit tests for GEDCOM text output
//
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "gedcom/record/structural_equal.hpp"
#include "gedcom/syntax/frontend.hpp"
#include "gedcom/test_support/parse_helpers.hpp"
#include "gedcom/writer/serializer.hpp"

namespace gedcom
{

namespace
{

std::string read_fixture(const std::string & name)
{
  std::ifstream in(std::string(GEDCOM_TEST_DATA_DIR) + "/" + name, std::ios::binary);
  EXPECT_TRUE(in.is_open()) << name;
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

size_t count_lines_with(const std::string & text, const std::string & needle)
{
  size_t count = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + 1)) {
    ++count;
  }
  return count;
}

}  // namespace

TEST(WriterSerializer, SampleFileIsByteIdentical)
{
  const std::string text = read_fixture("sample.ged");
  auto unit = test_support::parse(text);
  ASSERT_TRUE(unit.ok());
  EXPECT_EQ(unit.diags.warnings().size(), 1U);  // CHAR MACINTOSH

  EXPECT_EQ(unit.file->serialize(), text);
}

TEST(WriterSerializer, SampleFileAccessors)
{
  auto file = parse_text(read_fixture("sample.ged"));
  const XrefIndex & index = file->index();

  const auto * bobby = index.lookup_as<Individual>("@I3@");
  ASSERT_NE(bobby, nullptr);
  EXPECT_EQ(bobby->name()->given, "Bobby Jo");
  EXPECT_EQ(bobby->father(index).value()->id(), "@I1@");
  EXPECT_EQ(bobby->mother(index).value()->id(), "@I2@");
  EXPECT_EQ(file->individuals().size(), 3U);
  EXPECT_EQ(file->families().size(), 1U);
}

TEST(WriterSerializer, RoundTripIsStructurallyEqual)
{
  auto original = parse_text(
    "0 HEAD\n"
    "1 CHAR UTF-8\n"
    "0 @I1@ INDI\n"
    "1 NAME  Spaced  /Name/ \n"
    "1 NOTE line one\n"
    "2 CONT line two\n"
    "2 CONC  joined\n"
    "2 CONT\n"
    "2 CONT last\n"
    "1 _CUSTOM vendor data\n"
    "2 _SUB x\n"
    "0 TRLR\n");

  auto reparsed = test_support::reparse(*original);
  ASSERT_NE(reparsed, nullptr);
  EXPECT_TRUE(structurally_equal(*original, *reparsed));

  const auto * person = reparsed->index().lookup_as<Individual>("@I1@");
  EXPECT_EQ(person->note(reparsed->index()).value(), "line one\nline two joined\n\nlast");
  EXPECT_EQ(person->child("NAME")->value, " Spaced  /Name/ ");
}

TEST(WriterSerializer, EmbeddedNewlinesBecomeContLines)
{
  GedcomFile file;
  Individual * person = file.create_individual();
  file.append_child(*person, "NOTE", "a\nb\n\nc");
  file.append_child(*person, "SEX", "M");

  EXPECT_EQ(
    file.serialize(),
    "0 @I1@ INDI\n"
    "1 NOTE a\n"
    "2 CONT b\n"
    "2 CONT\n"
    "2 CONT c\n"
    "1 SEX M\n");
}

TEST(WriterSerializer, LongValueWrapsIntoConc)
{
  std::string long_value;
  for (int i = 0; i < 30; ++i) {
    long_value += "0123456789";
  }
  ASSERT_EQ(long_value.size(), 300U);

  GedcomFile file;
  Individual * person = file.create_individual();
  file.append_child(*person, "NOTE", long_value);

  const std::string text = file.serialize();
  EXPECT_EQ(count_lines_with(text, "2 CONC "), 1U);
  EXPECT_NE(text.find("1 NOTE " + long_value.substr(0, 248) + "\n"), std::string::npos);
  EXPECT_NE(text.find("2 CONC " + long_value.substr(248) + "\n"), std::string::npos);

  auto reparsed = parse_text(text);
  const auto * again = reparsed->index().lookup_as<Individual>("@I1@");
  EXPECT_EQ(again->note(reparsed->index()).value(), long_value);
}

TEST(WriterSerializer, NarrowWrapWidth)
{
  GedcomFile file;
  Individual * person = file.create_individual();
  file.append_child(*person, "NOTE", "abcdefghijklmnopqrstuvwxyz\nshort");

  WriterOptions options;
  options.max_value_length = 10;
  EXPECT_EQ(
    file.serialize(options),
    "0 @I1@ INDI\n"
    "1 NOTE abcdefghij\n"
    "2 CONC klmnopqrst\n"
    "2 CONC uvwxyz\n"
    "2 CONT short\n");

  // Widths below the minimum are raised to it
  options.max_value_length = 1;
  EXPECT_NE(file.serialize(options).find("1 NOTE abcdefgh\n"), std::string::npos);
}

TEST(WriterSerializer, ChunksNeverSplitUtf8Sequences)
{
  // "é" is two bytes, "€" three
  const std::string text = "abcdefg\xC3\xA9xyz\xE2\x82\xAC";
  const auto chunks = split_utf8_chunks(text, 8);
  ASSERT_EQ(chunks.size(), 2U);
  EXPECT_EQ(chunks[0], "abcdefg");
  EXPECT_EQ(chunks[1], "\xC3\xA9xyz\xE2\x82\xAC");

  const auto euro = split_utf8_chunks("\xE2\x82\xAC\xE2\x82\xAC\xE2\x82\xAC", 8);
  ASSERT_EQ(euro.size(), 2U);
  EXPECT_EQ(euro[0].size(), 6U);
  EXPECT_EQ(euro[1].size(), 3U);

  const auto empty = split_utf8_chunks("", 8);
  ASSERT_EQ(empty.size(), 1U);
  EXPECT_TRUE(empty[0].empty());
}

TEST(WriterSerializer, ChunksNeverEndInCarriageReturn)
{
  const std::string text = std::string(7, 'a') + "\r" + "bcd";
  const auto chunks = split_utf8_chunks(text, 8);
  ASSERT_EQ(chunks.size(), 2U);
  EXPECT_EQ(chunks[0], "aaaaaaa");
  EXPECT_EQ(chunks[1], "\rbcd");

  // Nothing but CR: cut at the limit
  const auto only_cr = split_utf8_chunks(std::string(10, '\r'), 8);
  ASSERT_EQ(only_cr.size(), 2U);
  EXPECT_EQ(only_cr[0].size(), 8U);
}

TEST(WriterSerializer, CarriageReturnAtWrapPointRoundTrips)
{
  const std::string value = std::string(247, 'a') + "\r" + std::string(20, 'b');
  auto original = parse_text("0 @I1@ INDI\n1 NOTE " + value + "\n");
  ASSERT_EQ(original->index().lookup_as<Individual>("@I1@")->note(original->index()).value(), value);

  const std::string text = original->serialize();
  EXPECT_NE(text.find("1 NOTE " + std::string(247, 'a') + "\n"), std::string::npos);

  auto reparsed = parse_text(text);
  EXPECT_TRUE(structurally_equal(*original, *reparsed));
  EXPECT_EQ(reparsed->index().lookup_as<Individual>("@I1@")->note(reparsed->index()).value(), value);
}

TEST(WriterSerializer, TrailingCarriageReturnsAreTerminator)
{
  auto original = parse_text("0 @I1@ INDI\r\r\n1 NOTE a\r\r\n");
  EXPECT_EQ(original->index().lookup_as<Individual>("@I1@")->note(original->index()).value(), "a");

  const std::string text = original->serialize();
  EXPECT_EQ(text, "0 @I1@ INDI\n1 NOTE a\n");
  EXPECT_TRUE(structurally_equal(*original, *parse_text(text)));
}

TEST(WriterSerializer, DeepestLevelIsNotWrapped)
{
  std::string long_value;
  for (int i = 0; i < 30; ++i) {
    long_value += "0123456789";
  }

  std::string input = "0 HEAD\n";
  for (int level = 1; level < 99; ++level) {
    input += std::to_string(level) + " _X\n";
  }
  input += "99 _X " + long_value + "\n";

  auto original = parse_text(input);
  const std::string text = original->serialize();
  EXPECT_EQ(text, input);
  EXPECT_EQ(text.find("100 "), std::string::npos);
  EXPECT_TRUE(structurally_equal(*original, *parse_text(text)));
}

TEST(WriterSerializer, NewlineAtDeepestLevelIsRejected)
{
  GedcomFile file;
  Record * parent = file.create_individual();
  for (int level = 1; level < 99; ++level) {
    parent = file.append_child(*parent, "_X");
  }
  Record * deepest = file.append_child(*parent, "_X", "one");
  EXPECT_NO_THROW((void)file.serialize());

  file.set_value(*deepest, "one\ntwo");
  EXPECT_THROW((void)file.serialize(), SerializeError);

  file.set_value(*deepest, "one");
  file.append_child(*deepest, "_Y");
  EXPECT_THROW((void)file.serialize(), SerializeError);
}

TEST(WriterSerializer, CrlfLineEndings)
{
  auto file = parse_text("0 HEAD\n1 NOTE a\n2 CONT b\n0 TRLR\n");
  WriterOptions options;
  options.line_ending = LineEnding::CrLf;

  const std::string text = file->serialize(options);
  EXPECT_EQ(text, "0 HEAD\r\n1 NOTE a\r\n2 CONT b\r\n0 TRLR\r\n");
  EXPECT_TRUE(structurally_equal(*file, *parse_text(text)));
}

TEST(WriterSerializer, EmptyFileSerializesToNothing)
{
  const GedcomFile file;
  EXPECT_EQ(file.serialize(), "");
}

}  // namespace gedcom
