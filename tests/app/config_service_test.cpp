#include <gtest/gtest.h>

#include <filesystem>
#include <map>

#include "app/config_service.hpp"
#include "archive_test_fixation.hpp"
#include "type/error.hpp"

namespace archiver {
class ConfigServiceTests : public ArchiveServiceTests {
 protected:
  auto Config() const -> std::shared_ptr<ConfigService> { return context_->GetConfigService(); }
};

TEST_F(ConfigServiceTests, DefaultsAfterInit) {
  auto config = Config()->GetConfig();
  EXPECT_EQ(config.current_vault_id_, 0u);
  EXPECT_TRUE(config.update_check_);
  EXPECT_TRUE(config.style_);
  EXPECT_EQ(config.vault_item_separator_, "::");
  EXPECT_TRUE(config.alias_map_.empty());
}

TEST_F(ConfigServiceTests, SettersPersistToDisk) {
  Config()->SetUpdateCheck(false);
  Config()->SetStyle(false);
  Config()->SetVaultItemSeparator("/");
  Config()->UpdateLastCheck("2026-01-02 03:04:05");

  auto reloaded = Store()->LoadConfig(true);
  EXPECT_FALSE(reloaded.update_check_);
  EXPECT_FALSE(reloaded.style_);
  EXPECT_EQ(reloaded.vault_item_separator_, "/");
  EXPECT_EQ(reloaded.last_update_check_, "2026-01-02 03:04:05");

  auto text = ReadText(Store()->Tree().config_file_);
  EXPECT_EQ(text.rfind("//", 0), 0u);
  EXPECT_NE(text.find("\"updateCheck\": \"off\""), std::string::npos);
}

TEST_F(ConfigServiceTests, EmptySeparatorIsRejected) {
  EXPECT_THROW(Config()->SetVaultItemSeparator(""), ArchiverError);
  EXPECT_EQ(Config()->GetConfig().vault_item_separator_, "::");
}

TEST_F(ConfigServiceTests, AliasesAreNormalized) {
  auto config = Config()->AddAlias("ws", workspace_ / "sub" / ".." / "");
  EXPECT_EQ(config.alias_map_.at("ws"), workspace_.string());
  EXPECT_THROW(Config()->AddAlias("  ", workspace_), ArchiverError);

  config = Config()->RemoveAlias("ws");
  EXPECT_TRUE(config.alias_map_.empty());
  EXPECT_TRUE(Store()->LoadConfig(true).alias_map_.empty());
}

TEST_F(ConfigServiceTests, RenderPathWithAliasPrefersLongestMatch) {
  std::map<std::string, std::string> aliases = {{"home", "/home/user"},
                                                {"proj", "/home/user/projects"}};

  EXPECT_EQ(ConfigService::RenderPathWithAlias("/home/user", aliases), "home");
  EXPECT_EQ(ConfigService::RenderPathWithAlias("/home/user/notes.txt", aliases),
            "home/notes.txt");
  EXPECT_EQ(ConfigService::RenderPathWithAlias("/home/user/projects/app/src", aliases),
            "proj/app/src");
  EXPECT_EQ(ConfigService::RenderPathWithAlias("/home/username", aliases), "/home/username");
  EXPECT_EQ(ConfigService::RenderPathWithAlias("/tmp/x", {}), "/tmp/x");
}
}  // namespace archiver
