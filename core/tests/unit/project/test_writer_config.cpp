// test_writer_config.cpp - Unit tests for gedcom.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "gedcom/project/writer_config.hpp"

namespace fs = std::filesystem;

namespace gedcom
{

class WriterConfigTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() /
            ("gedcom_config_test_" +
             std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(root_);
    fs::create_directories(root_ / "family" / "branch");
  }

  void TearDown() override { fs::remove_all(root_); }

  void write(const fs::path & path, const std::string & content)
  {
    std::ofstream out(path);
    out << content;
  }

  fs::path root_;
};

TEST_F(WriterConfigTest, DefaultsForEmptyDocument)
{
  const auto result = parse_writer_config("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.writer.max_value_length, k_default_max_value_length);
  EXPECT_EQ(result.config.writer.line_ending, LineEnding::Lf);
  EXPECT_FALSE(result.config.ensure_header);
  EXPECT_EQ(result.config.header.source, "gedcom-core");
  EXPECT_EQ(result.config.header.charset, "UTF-8");
}

TEST_F(WriterConfigTest, ParsesAllKeys)
{
  const auto result = parse_writer_config(
    "writer:\n"
    "  max_value_length: 120\n"
    "  line_ending: crlf\n"
    "  ensure_header: true\n"
    "header:\n"
    "  source: my-tool\n"
    "  charset: UTF-8\n"
    "unknown: ignored\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.writer.max_value_length, 120U);
  EXPECT_EQ(result.config.writer.line_ending, LineEnding::CrLf);
  EXPECT_TRUE(result.config.ensure_header);
  EXPECT_EQ(result.config.header.source, "my-tool");
}

TEST_F(WriterConfigTest, RejectsInvalidValues)
{
  auto result = parse_writer_config("writer:\n  max_value_length: 4\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("max_value_length"), std::string::npos);

  result = parse_writer_config("writer:\n  line_ending: cr\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("line_ending"), std::string::npos);

  result = parse_writer_config("writer: 3\n");
  EXPECT_FALSE(result.success);

  result = parse_writer_config("header:\n  source: \"\"\n");
  EXPECT_FALSE(result.success);

  result = parse_writer_config("- a\n- b\n");
  EXPECT_FALSE(result.success);
}

TEST_F(WriterConfigTest, ReportsYamlErrors)
{
  auto result = parse_writer_config("writer: [unclosed\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);

  result = parse_writer_config("writer:\n  max_value_length: lots\n");
  EXPECT_FALSE(result.success);
}

TEST_F(WriterConfigTest, LoadsFromFile)
{
  const fs::path path = root_ / k_writer_config_file_name;
  write(path, "writer:\n  max_value_length: 80\n");

  const auto result = load_writer_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.writer.max_value_length, 80U);
}

TEST_F(WriterConfigTest, MissingFile)
{
  const auto result = load_writer_config(root_ / "nope.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST_F(WriterConfigTest, FindSearchesUpward)
{
  write(root_ / k_writer_config_file_name, "writer: {}\n");
  write(root_ / "family" / "branch" / "tree.ged", "0 HEAD\n");

  const auto from_dir = find_writer_config(root_ / "family" / "branch");
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(*from_dir, fs::absolute(root_) / k_writer_config_file_name);

  const auto from_file = find_writer_config(root_ / "family" / "branch" / "tree.ged");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(*from_file, *from_dir);
}

}  // namespace gedcom
