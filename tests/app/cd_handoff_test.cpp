#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "app/cd_handoff.hpp"
#include "archive_test_fixation.hpp"
#include "type/error.hpp"

namespace archiver {
class CdHandoffTests : public ArchiveServiceTests {
 protected:
  void TearDown() override {
    unsetenv(cd::kHandoffFileEnv);
    ArchiveServiceTests::TearDown();
  }
};

TEST_F(CdHandoffTests, FormatCdLine) {
  auto slot = workspace_ / "a" / ".." / "slot";
  EXPECT_EQ(cd::FormatCdLine(slot, false),
            std::string("__ARCHIVER_CD__:") + (workspace_ / "slot").string());
  EXPECT_EQ(cd::FormatCdLine(slot, true), (workspace_ / "slot").string());

  std::ostringstream out;
  cd::EmitCd(out, slot, false);
  EXPECT_EQ(out.str(), cd::FormatCdLine(slot, false) + "\n");
}

TEST_F(CdHandoffTests, HandoffSkippedWithoutVariable) {
  EXPECT_FALSE(cd::WriteCwdHandoff(workspace_));
  setenv(cd::kHandoffFileEnv, "   ", 1);
  EXPECT_FALSE(cd::WriteCwdHandoff(workspace_));
}

TEST_F(CdHandoffTests, HandoffWritesSlotPath) {
  auto id     = PutOne(MakeFile("here.txt"));
  auto target = Archives()->ResolveCdTarget(std::to_string(id));
  auto file   = workspace_ / "handoff.txt";
  setenv(cd::kHandoffFileEnv, (" " + file.string() + "\n").c_str(), 1);

  EXPECT_TRUE(cd::WriteCwdHandoff(target.slot_path_));
  EXPECT_EQ(ReadText(file), target.slot_path_.string() + "\n");
}

TEST_F(CdHandoffTests, HandoffFailureIsReported) {
  setenv(cd::kHandoffFileEnv, (workspace_ / "missing" / "handoff.txt").c_str(), 1);
  EXPECT_THROW(cd::WriteCwdHandoff(workspace_), ArchiverError);
}
}  // namespace archiver
