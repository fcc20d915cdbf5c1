#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "storage/defaults.hpp"
#include "storage/metadata_store.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/fs/fs_util.hpp"

namespace archiver {
class MetadataStoreTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;

  void                  SetUp() override {
    TimeProvider::Refresh();
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = fsutil::Normalize(std::filesystem::temp_directory_path()) / "archiver_tests" /
            (std::string(info->test_suite_name()) + "_" + info->name());
    std::filesystem::remove_all(root_);
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  void WriteText(const std::filesystem::path& file, const std::string& text) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::out | std::ios::trunc);
    out << text;
  }

  static auto ReadText(const std::filesystem::path& path) -> std::string {
    std::ifstream      in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
  }
};

TEST_F(MetadataStoreTests, InitCreatesLayout) {
  MetadataStore store(root_);
  store.Init();

  const auto& tree = store.Tree();
  EXPECT_TRUE(std::filesystem::is_directory(tree.logs_dir_));
  EXPECT_TRUE(std::filesystem::is_directory(store.VaultDir(defaults::kDefaultVaultId)));
  EXPECT_TRUE(std::filesystem::exists(tree.config_file_));
  EXPECT_TRUE(std::filesystem::exists(tree.auto_incr_file_));
  EXPECT_TRUE(std::filesystem::exists(tree.list_file_));
  EXPECT_TRUE(std::filesystem::exists(tree.vaults_file_));
  EXPECT_EQ(tree.LogFile("202603"), tree.logs_dir_ / "202603.jsonl");
}

TEST_F(MetadataStoreTests, InitIsIdempotent) {
  {
    MetadataStore store(root_);
    store.Init();
    auto config                  = store.LoadConfig();
    config.vault_item_separator_ = "|";
    store.SaveConfig(config);
    store.NextAutoIncrement(CounterKind::ARCHIVE);
  }

  MetadataStore again(root_);
  again.Init();
  EXPECT_EQ(again.LoadConfig().vault_item_separator_, "|");
  EXPECT_EQ(again.LoadAutoIncr().Current(CounterKind::ARCHIVE), 1u);
}

TEST_F(MetadataStoreTests, CommentedConfigIsAccepted) {
  WriteText(root_ / "config.jsonc",
            "// hand edited\n{\n  \"currentVaultId\": 0, /* inline */\n  \"style\": \"off\"\n}\n");
  MetadataStore store(root_);
  store.Init();

  auto config = store.LoadConfig();
  EXPECT_FALSE(config.style_);
  EXPECT_TRUE(config.update_check_);
  EXPECT_EQ(config.vault_item_separator_, "::");
}

TEST_F(MetadataStoreTests, CurrentVaultWithoutDirectoryFallsBack) {
  WriteText(root_ / "config.jsonc", "{\"currentVaultId\": 4}");
  MetadataStore store(root_);
  store.Init();
  EXPECT_EQ(store.LoadConfig().current_vault_id_, defaults::kDefaultVaultId);
  EXPECT_EQ(MetadataStore(root_).LoadConfig().current_vault_id_, defaults::kDefaultVaultId);
}

TEST_F(MetadataStoreTests, CountersAreSanitized) {
  WriteText(root_ / "auto-incr.jsonc", "{\"archiveId\": -3, \"vaultId\": 2.5, \"logId\": \"7\"}");
  MetadataStore store(root_);
  store.Init();

  auto vars = store.LoadAutoIncr();
  EXPECT_EQ(vars.Current(CounterKind::ARCHIVE), 0u);
  EXPECT_EQ(vars.Current(CounterKind::VAULT), 0u);
  EXPECT_EQ(vars.Current(CounterKind::LOG), 7u);

  EXPECT_EQ(store.NextAutoIncrement(CounterKind::LOG), 8u);
  EXPECT_EQ(MetadataStore(root_).LoadAutoIncr().Current(CounterKind::LOG), 8u);
}

TEST_F(MetadataStoreTests, BrokenJsonLinesAreSkipped) {
  WriteText(root_ / "list.jsonl",
            "{\"id\": 2, \"vaultId\": 0, \"item\": \"b\", \"directory\": \"/tmp\", "
            "\"status\": \"Archived\", \"isDirectory\": 0}\n"
            "{not json\n"
            "\n"
            "{\"id\": 0, \"item\": \"zero\"}\n"
            "{\"id\": 1, \"vaultId\": 0, \"item\": \"a\", \"directory\": \"/tmp\", "
            "\"status\": \"Restored\", \"isDirectory\": true}\n");
  MetadataStore store(root_);
  store.Init();

  auto entries = store.LoadListEntries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].id_, 1u);
  EXPECT_EQ(entries[0].status_, ArchiveStatus::RESTORED);
  EXPECT_TRUE(entries[0].is_directory_);
  EXPECT_EQ(entries[1].item_, "b");
  EXPECT_TRUE(entries[1].IsArchived());
}

TEST_F(MetadataStoreTests, AppendAndSaveKeepIdOrder) {
  MetadataStore store(root_);
  store.Init();

  ArchiveEntry later;
  later.id_   = 5;
  later.item_ = "later";
  ArchiveEntry earlier;
  earlier.id_   = 3;
  earlier.item_ = "earlier";
  store.AppendListEntry(later);
  store.AppendListEntry(earlier);

  auto cached = store.LoadListEntries();
  ASSERT_EQ(cached.size(), 2u);
  EXPECT_EQ(cached[0].id_, 3u);

  store.SaveListEntries(cached);
  auto text = ReadText(store.Tree().list_file_);
  EXPECT_LT(text.find("\"earlier\""), text.find("\"later\""));
}

TEST_F(MetadataStoreTests, VaultsNeverPersistTheDefault) {
  MetadataStore store(root_);
  store.Init();

  Vault implicit = defaults::DefaultVault();
  Vault named;
  named.id_   = 1;
  named.name_ = "named";
  store.SaveVaults({implicit, named});

  auto stored = store.LoadVaults(true);
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].name_, "named");

  auto all = store.GetVaults();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].name_, defaults::kDefaultVaultName);
  EXPECT_EQ(all[0].status_, VaultStatus::PROTECTED);
  EXPECT_EQ(store.GetVaults({.include_removed_ = false, .with_default_ = false}).size(), 1u);
}

TEST_F(MetadataStoreTests, ResolveVaultByIdNameOrCurrent) {
  MetadataStore store(root_);
  store.Init();

  Vault active;
  active.id_   = 1;
  active.name_ = "active";
  Vault removed;
  removed.id_     = 2;
  removed.name_   = "gone";
  removed.status_ = VaultStatus::REMOVED;
  store.SaveVaults({active, removed});

  EXPECT_EQ(store.ResolveVault(std::optional<std::string>("1"))->name_, "active");
  EXPECT_EQ(store.ResolveVault(std::optional<std::string>("active"))->id_, 1u);
  EXPECT_EQ(store.ResolveVault(std::optional<std::string>("@"))->id_, 0u);
  EXPECT_EQ(store.ResolveVault(std::nullopt)->id_, 0u);
  EXPECT_EQ(store.ResolveVault(std::optional<std::string>(" "))->id_, 0u);
  EXPECT_FALSE(store.ResolveVault(std::nullopt, {.fallback_current_ = false}).has_value());

  EXPECT_FALSE(store.ResolveVault(std::optional<std::string>("gone")).has_value());
  EXPECT_TRUE(store.ResolveVault(2u, {.include_removed_ = true}).has_value());
  EXPECT_FALSE(store.ResolveVault(9u).has_value());
}

TEST_F(MetadataStoreTests, StorageLocationNeedsRealSlotAndObject) {
  MetadataStore store(root_);
  store.Init();

  ArchiveEntry entry;
  entry.id_   = 4;
  entry.item_ = "doc.txt";
  EXPECT_FALSE(store.ResolveArchiveStorageLocation(entry).has_value());

  std::filesystem::create_directories(store.ArchivePath(0, 4));
  EXPECT_FALSE(store.ResolveArchiveStorageLocation(entry).has_value());

  WriteText(store.ArchiveObjectPath(0, 4, "doc.txt"), "content");
  auto location = store.ResolveArchiveStorageLocation(entry);
  ASSERT_TRUE(location.has_value());
  EXPECT_EQ(location->slot_path_, store.ArchivePath(0, 4));
  EXPECT_EQ(location->object_path_, store.ArchivePath(0, 4) / "doc.txt");
}

TEST_F(MetadataStoreTests, LogEntriesAreMergedAcrossMonths) {
  WriteText(root_ / "logs" / "202602.jsonl",
            "{\"id\": 3, \"operedAt\": \"2026-02-01 00:00:00\", \"level\": \"INFO\", "
            "\"oper\": {\"main\": \"put\"}, \"message\": \"\"}\n");
  WriteText(root_ / "logs" / "202601.jsonl",
            "{\"id\": 1, \"operedAt\": \"2026-01-01 00:00:00\", \"level\": \"WARN\", "
            "\"oper\": {\"main\": \"cd\"}, \"message\": \"\"}\n"
            "garbage\n");
  WriteText(root_ / "logs" / "notes.txt", "{\"id\": 2}\n");
  MetadataStore store(root_);
  store.Init();

  auto logs = store.LoadLogEntries();
  ASSERT_EQ(logs.size(), 2u);
  EXPECT_EQ(logs[0].id_, 1u);
  EXPECT_EQ(logs[0].level_, LogLevel::WARN);
  EXPECT_EQ(logs[1].oper_.main_, "put");
}
}  // namespace archiver
