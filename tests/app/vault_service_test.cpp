#include <gtest/gtest.h>

#include <filesystem>

#include "app/vault_service.hpp"
#include "archive_test_fixation.hpp"
#include "storage/defaults.hpp"
#include "type/error.hpp"

namespace archiver {
class VaultServiceTests : public ArchiveServiceTests {};

TEST_F(VaultServiceTests, CreateAllocatesIdAndDirectory) {
  auto result = Vaults()->Create({.name_ = "  photos ", .remark_ = "raw files"});
  EXPECT_FALSE(result.recovered_);
  EXPECT_EQ(result.vault_.id_, 1u);
  EXPECT_EQ(result.vault_.name_, "photos");
  EXPECT_EQ(result.vault_.remark_, "raw files");
  EXPECT_EQ(result.vault_.status_, VaultStatus::VALID);
  EXPECT_TRUE(std::filesystem::is_directory(Store()->VaultDir(result.vault_.id_)));
  EXPECT_EQ(Store()->LoadConfig(true).current_vault_id_, defaults::kDefaultVaultId);

  auto stored = Store()->LoadVaults(true);
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].name_, "photos");
}

TEST_F(VaultServiceTests, CreateValidatesName) {
  EXPECT_THROW(Vaults()->Create({.name_ = "   "}), ArchiverError);
  EXPECT_THROW(Vaults()->Create({.name_ = "@"}), ArchiverError);
  Vaults()->Create({.name_ = "twice"});
  try {
    Vaults()->Create({.name_ = "twice"});
    FAIL() << "Expected ArchiverError";
  } catch (const ArchiverError& e) {
    EXPECT_EQ(e.Code(), ErrorCode::ALREADY_EXISTS);
  }
}

TEST_F(VaultServiceTests, CreateOverRemovedNameNeedsRecovery) {
  auto first = Vaults()->Create({.name_ = "again"}).vault_;
  Vaults()->Remove("again");

  try {
    Vaults()->Create({.name_ = "again"});
    FAIL() << "Expected ArchiverError";
  } catch (const ArchiverError& e) {
    EXPECT_EQ(e.Code(), ErrorCode::REMOVED_VAULT_EXISTS);
  }

  auto recovered = Vaults()->Create({.name_ = "again", .activate_ = true, .recover_removed_ = true});
  EXPECT_TRUE(recovered.recovered_);
  EXPECT_EQ(recovered.vault_.id_, first.id_);
  EXPECT_EQ(recovered.vault_.status_, VaultStatus::VALID);
  EXPECT_EQ(Store()->LoadConfig(true).current_vault_id_, first.id_);
}

TEST_F(VaultServiceTests, CreateWithActivateSwitchesCurrentVault) {
  auto vault = Vaults()->Create({.name_ = "active", .activate_ = true}).vault_;
  EXPECT_EQ(Store()->LoadConfig(true).current_vault_id_, vault.id_);
}

TEST_F(VaultServiceTests, RemoveRelocatesArchivedEntries) {
  auto vault    = Vaults()->Create({.name_ = "temp", .activate_ = true}).vault_;
  auto kept     = PutOne(MakeFile("kept.txt", "k"));
  auto restored = PutOne(MakeFile("back.txt"));
  Archives()->Restore({restored});

  auto result = Vaults()->Remove("temp");
  EXPECT_EQ(result.vault_.status_, VaultStatus::REMOVED);
  ASSERT_EQ(result.moved_archive_ids_.size(), 1u);
  EXPECT_EQ(result.moved_archive_ids_[0], kept);

  auto entries = Store()->LoadListEntries(true);
  EXPECT_EQ(entries[0].vault_id_, defaults::kDefaultVaultId);
  // Restored entries keep their vault reference
  EXPECT_EQ(entries[1].vault_id_, vault.id_);
  EXPECT_EQ(ReadText(Store()->ArchiveObjectPath(defaults::kDefaultVaultId, kept, "kept.txt")),
            "k");
  EXPECT_EQ(Store()->LoadConfig(true).current_vault_id_, defaults::kDefaultVaultId);
  EXPECT_EQ(Store()->LoadVaults(true)[0].status_, VaultStatus::REMOVED);
}

TEST_F(VaultServiceTests, RemoveRejectsDefaultAndRemoved) {
  EXPECT_THROW(Vaults()->Remove("@"), ArchiverError);
  EXPECT_THROW(Vaults()->Remove("0"), ArchiverError);
  EXPECT_THROW(Vaults()->Remove("missing"), ArchiverError);

  Vaults()->Create({.name_ = "short"});
  Vaults()->Remove("short");
  EXPECT_THROW(Vaults()->Remove("short"), ArchiverError);
}

TEST_F(VaultServiceTests, RemoveIsAbortedWhenDefaultSlotIsTaken) {
  auto vault = Vaults()->Create({.name_ = "clash"}).vault_;
  auto id    = PutOne(MakeFile("clash.txt"), {.vault_ = "clash"});
  std::filesystem::create_directories(Store()->ArchivePath(defaults::kDefaultVaultId, id));

  EXPECT_THROW(Vaults()->Remove("clash"), ArchiverError);
  EXPECT_TRUE(std::filesystem::exists(Store()->ArchivePath(vault.id_, id)));
  EXPECT_EQ(Store()->LoadVaults(true)[0].status_, VaultStatus::VALID);
}

TEST_F(VaultServiceTests, RecoverRestoresValidState) {
  auto vault = Vaults()->Create({.name_ = "phoenix"}).vault_;
  Vaults()->Remove("phoenix");
  std::filesystem::remove_all(Store()->VaultDir(vault.id_));

  auto recovered = Vaults()->Recover(std::to_string(vault.id_));
  EXPECT_EQ(recovered.status_, VaultStatus::VALID);
  EXPECT_TRUE(std::filesystem::is_directory(Store()->VaultDir(vault.id_)));
  EXPECT_THROW(Vaults()->Recover("phoenix"), ArchiverError);
  EXPECT_THROW(Vaults()->Recover("nobody"), ArchiverError);
}

TEST_F(VaultServiceTests, RenameChecksStateAndCollisions) {
  Vaults()->Create({.name_ = "alpha"});
  Vaults()->Create({.name_ = "beta"});

  auto renamed = Vaults()->Rename("alpha", " gamma ");
  EXPECT_EQ(renamed.name_, "gamma");
  EXPECT_TRUE(Store()->ResolveVault(std::optional<std::string>("gamma")).has_value());

  EXPECT_THROW(Vaults()->Rename("gamma", "beta"), ArchiverError);
  EXPECT_THROW(Vaults()->Rename("gamma", "@"), ArchiverError);
  EXPECT_THROW(Vaults()->Rename("gamma", ""), ArchiverError);
  EXPECT_THROW(Vaults()->Rename("@", "home"), ArchiverError);

  Vaults()->Remove("beta");
  EXPECT_THROW(Vaults()->Rename("beta", "delta"), ArchiverError);
}

TEST_F(VaultServiceTests, UseSetsCurrentVault) {
  auto vault = Vaults()->Create({.name_ = "desk"}).vault_;
  Vaults()->Use("desk");
  EXPECT_EQ(Store()->LoadConfig(true).current_vault_id_, vault.id_);
  Vaults()->Use("@");
  EXPECT_EQ(Store()->LoadConfig(true).current_vault_id_, defaults::kDefaultVaultId);

  EXPECT_THROW(Vaults()->Use("unknown"), ArchiverError);
  Vaults()->Remove("desk");
  EXPECT_THROW(Vaults()->Use("desk"), ArchiverError);
}

TEST_F(VaultServiceTests, ListPutsDefaultVaultFirst) {
  Vaults()->Create({.name_ = "one"});
  Vaults()->Create({.name_ = "two"});
  Vaults()->Remove("one");

  auto active = Vaults()->List(false);
  ASSERT_EQ(active.size(), 2u);
  EXPECT_EQ(active[0].name_, "@");
  EXPECT_EQ(active[0].status_, VaultStatus::PROTECTED);
  EXPECT_EQ(active[1].name_, "two");

  EXPECT_EQ(Vaults()->List(true).size(), 3u);
}

TEST_F(VaultServiceTests, ListArchivedIdsInVaultReadsSlots) {
  auto a = PutOne(MakeFile("a.txt"));
  auto b = PutOne(MakeFile("b.txt"));
  std::filesystem::create_directories(Store()->VaultDir(defaults::kDefaultVaultId) / "notes");

  auto ids = Vaults()->ListArchivedIdsInVault(defaults::kDefaultVaultId);
  ASSERT_EQ(ids.size(), 2u);
  EXPECT_EQ(ids[0], a);
  EXPECT_EQ(ids[1], b);
  EXPECT_TRUE(Vaults()->ListArchivedIdsInVault(42).empty());
}

TEST_F(VaultServiceTests, ResolveVaultForReadIncludesRemoved) {
  Vaults()->Create({.name_ = "past"});
  Vaults()->Remove("past");
  EXPECT_FALSE(Vaults()->ResolveVaultForRead(std::nullopt).has_value());
  auto found = Vaults()->ResolveVaultForRead("past");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->status_, VaultStatus::REMOVED);
}

TEST_F(VaultServiceTests, OperationsAreAudited) {
  Vaults()->Create({.name_ = "audit"});
  Vaults()->Use("audit");
  auto logs = Store()->LoadLogEntries();
  ASSERT_EQ(logs.size(), 2u);
  EXPECT_EQ(logs[0].oper_.main_, "vault");
  EXPECT_EQ(logs[0].oper_.sub_, "create");
  EXPECT_EQ(logs[1].oper_.sub_, "use");
  EXPECT_EQ(logs[1].links_.vault_id_.value_or(0), 1u);
}
}  // namespace archiver
