#include <gtest/gtest.h>

#include "type/error.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
TEST(ParseTest, IdList) {
  auto ids = parse::ParseIdList({"3", "1", "20"});
  ASSERT_EQ(ids.size(), 3u);
  EXPECT_EQ(ids[0], 3u);
  EXPECT_EQ(ids[2], 20u);

  EXPECT_THROW(parse::ParseIdList({}), ArchiverError);
  EXPECT_THROW(parse::ParseIdList({"1", "x"}), ArchiverError);
  EXPECT_THROW(parse::ParseIdList({"-1"}), ArchiverError);
  EXPECT_THROW(parse::ParseIdList({"4", "4"}), ArchiverError);
}

TEST(ParseTest, IdRejectsOverflowAndSigns) {
  EXPECT_EQ(parse::ParseId("4294967295").value_or(0), 4294967295u);
  EXPECT_FALSE(parse::ParseId("4294967296").has_value());
  EXPECT_FALSE(parse::ParseId("+1").has_value());
  EXPECT_FALSE(parse::ParseId("").has_value());
  EXPECT_EQ(parse::ParseId("007").value_or(0), 7u);
}

TEST(ParseTest, TrimStripsWhitespaceOnly) {
  EXPECT_EQ(parse::Trim("  /tmp/x \t\r\n"), "/tmp/x");
  EXPECT_EQ(parse::Trim("a b"), "a b");
  EXPECT_EQ(parse::Trim(" \n\t "), "");
  EXPECT_EQ(parse::Trim(""), "");
}

TEST(ParseTest, LogRangeAll) {
  for (const auto* text : {"", "all", "ALL", "*", "a"}) {
    EXPECT_EQ(parse::ParseLogRange(text).mode_, LogRangeMode::ALL) << text;
  }
}

TEST(ParseTest, LogRangeMonths) {
  auto single = parse::ParseLogRange("202603");
  EXPECT_EQ(single.mode_, LogRangeMode::MONTH);
  EXPECT_EQ(single.from_, "202603");
  EXPECT_EQ(single.to_, "202603");

  auto span = parse::ParseLogRange("202511-202602");
  EXPECT_EQ(span.mode_, LogRangeMode::MONTH);
  EXPECT_EQ(span.from_, "202511");
  EXPECT_EQ(span.to_, "202602");
}

TEST(ParseTest, LogRangeRejectsBadInput) {
  try {
    parse::ParseLogRange("202613");
    FAIL() << "Expected ArchiverError";
  } catch (const ArchiverError& e) {
    EXPECT_EQ(e.Code(), ErrorCode::INVALID_ARGUMENT);
  }
  EXPECT_THROW(parse::ParseLogRange("202600"), ArchiverError);
  EXPECT_THROW(parse::ParseLogRange("202603-202601"), ArchiverError);
  EXPECT_THROW(parse::ParseLogRange("2026-03"), ArchiverError);
  EXPECT_THROW(parse::ParseLogRange("202601-202602-202603"), ArchiverError);
  EXPECT_THROW(parse::ParseLogRange("last"), ArchiverError);
}

TEST(ParseTest, VaultReference) {
  auto by_id = parse::ParseVaultReference("12");
  EXPECT_EQ(by_id.id_.value_or(0), 12u);
  EXPECT_FALSE(by_id.name_.has_value());

  auto by_name = parse::ParseVaultReference("photos");
  EXPECT_FALSE(by_name.id_.has_value());
  EXPECT_EQ(by_name.name_.value_or(""), "photos");
}
}  // namespace archiver
