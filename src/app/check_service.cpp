//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "app/check_service.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <set>
#include <unordered_map>
#include <utility>

#include "storage/defaults.hpp"
#include "utils/fs/fs_util.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
namespace {
template <typename T>
auto FindDuplicates(const std::vector<T>& values) -> std::vector<T> {
  std::set<T> seen;
  std::set<T> duplicated;
  for (const auto& value : values) {
    if (!seen.insert(value).second) {
      duplicated.insert(value);
    }
  }
  return {duplicated.begin(), duplicated.end()};
}

void PushIssue(CheckReport& report, CheckIssueLevel level, const char* code,
               std::string message) {
  report.issues_.push_back({level, code, std::move(message)});
}

auto IsDirectoryNoFollow(const store_path_t& path) -> std::optional<bool> {
  auto status = fsutil::SafeLstat(path);
  if (!status.has_value()) {
    return std::nullopt;
  }
  return std::filesystem::is_directory(status.value());
}
}  // namespace

auto CheckIssueLevelToString(CheckIssueLevel level) -> const char* {
  return level == CheckIssueLevel::ERROR ? "ERROR" : "WARN";
}

auto CheckReport::HasErrors() const -> bool { return Count(CheckIssueLevel::ERROR) > 0; }

auto CheckReport::Count(CheckIssueLevel level) const -> size_t {
  return static_cast<size_t>(std::count_if(issues_.begin(), issues_.end(),
                                           [&](const CheckIssue& i) { return i.level_ == level; }));
}

auto CheckReport::HasIssue(const std::string& code) const -> bool {
  return std::any_of(issues_.begin(), issues_.end(),
                     [&](const CheckIssue& issue) { return issue.code_ == code; });
}

auto CheckService::Run() -> CheckReport {
  CheckReport report;
  CheckRequiredPaths(report);

  auto config  = store_->LoadConfig(true);
  auto vars    = store_->LoadAutoIncr(true);
  auto entries = store_->LoadListEntries(true);
  store_->LoadVaults(true);
  auto vaults = store_->GetVaults({.include_removed_ = true, .with_default_ = true});

  CheckCurrentVault(report, config.current_vault_id_, vaults);
  CheckListIds(report, entries, vars.Current(CounterKind::ARCHIVE));
  CheckVaultIds(report, vaults, vars.Current(CounterKind::VAULT));
  CheckListConsistency(report, entries, vaults);
  CheckVaultDirectories(report, entries, vaults);
  CheckLogs(report, vars.Current(CounterKind::LOG));

  report.info_.push_back(fmt::format("Checked {} archive entries.", entries.size()));
  report.info_.push_back(fmt::format("Checked {} vaults.", vaults.size()));
  return report;
}

void CheckService::CheckRequiredPaths(CheckReport& report) const {
  const auto&               tree     = store_->Tree();
  std::vector<store_path_t> required = {tree.root_,
                                        tree.logs_dir_,
                                        tree.vaults_dir_,
                                        tree.config_file_,
                                        tree.auto_incr_file_,
                                        tree.list_file_,
                                        tree.vaults_file_,
                                        store_->VaultDir(defaults::kDefaultVaultId)};
  for (const auto& path : required) {
    if (!fsutil::PathAccessible(path)) {
      PushIssue(report, CheckIssueLevel::ERROR, "MISSING_PATH",
                fmt::format("Required path is missing: {}", path.string()));
    }
  }
}

void CheckService::CheckCurrentVault(CheckReport& report, vault_id_t current_vault_id,
                                     const std::vector<Vault>& vaults) const {
  auto found = std::any_of(vaults.begin(), vaults.end(), [&](const Vault& vault) {
    return vault.id_ == current_vault_id && !vault.IsRemoved();
  });
  if (!found) {
    PushIssue(report, CheckIssueLevel::ERROR, "INVALID_CURRENT_VAULT",
              fmt::format("Current vault {} does not exist or is removed.", current_vault_id));
  }
}

void CheckService::CheckListIds(CheckReport& report, const std::vector<ArchiveEntry>& entries,
                                archive_id_t auto_incr) const {
  std::vector<archive_id_t> ids;
  for (const auto& entry : entries) {
    ids.push_back(entry.id_);
  }

  auto duplicates = FindDuplicates(ids);
  if (!duplicates.empty()) {
    PushIssue(report, CheckIssueLevel::ERROR, "DUPLICATE_ARCHIVE_ID",
              fmt::format("Duplicate archive ids: {}", fmt::join(duplicates, ", ")));
  }

  archive_id_t max_id = ids.empty() ? 0 : *std::max_element(ids.begin(), ids.end());
  if (auto_incr < max_id) {
    PushIssue(report, CheckIssueLevel::ERROR, "ARCHIVE_AUTO_INCR_TOO_SMALL",
              fmt::format("archiveId counter {} is below the largest archive id {}.", auto_incr,
                          max_id));
  }
}

void CheckService::CheckVaultIds(CheckReport& report, const std::vector<Vault>& vaults,
                                 vault_id_t auto_incr) const {
  std::vector<vault_id_t>  ids;
  std::vector<std::string> names;
  for (const auto& vault : vaults) {
    if (vault.id_ == defaults::kDefaultVaultId) {
      continue;
    }
    ids.push_back(vault.id_);
    names.push_back(vault.name_);
  }

  auto duplicated_ids = FindDuplicates(ids);
  if (!duplicated_ids.empty()) {
    PushIssue(report, CheckIssueLevel::ERROR, "DUPLICATE_VAULT_ID",
              fmt::format("Duplicate vault ids: {}", fmt::join(duplicated_ids, ", ")));
  }

  auto duplicated_names = FindDuplicates(names);
  if (!duplicated_names.empty()) {
    PushIssue(report, CheckIssueLevel::ERROR, "DUPLICATE_VAULT_NAME",
              fmt::format("Duplicate vault names: {}", fmt::join(duplicated_names, ", ")));
  }

  vault_id_t max_id = ids.empty() ? 0 : *std::max_element(ids.begin(), ids.end());
  if (auto_incr < max_id) {
    PushIssue(report, CheckIssueLevel::ERROR, "VAULT_AUTO_INCR_TOO_SMALL",
              fmt::format("vaultId counter {} is below the largest vault id {}.", auto_incr,
                          max_id));
  }
}

void CheckService::CheckListConsistency(CheckReport&                     report,
                                        const std::vector<ArchiveEntry>& entries,
                                        const std::vector<Vault>&        vaults) const {
  std::set<vault_id_t> known;
  for (const auto& vault : vaults) {
    known.insert(vault.id_);
  }

  for (const auto& entry : entries) {
    if (!known.contains(entry.vault_id_)) {
      PushIssue(report, CheckIssueLevel::ERROR, "UNKNOWN_VAULT_REFERENCE",
                fmt::format("Archive id {} references unknown vault {}.", entry.id_,
                            entry.vault_id_));
      continue;
    }

    auto archive_path = store_->ArchivePath(entry.vault_id_, entry.id_);
    auto restore_path = entry.OriginalPath();

    if (entry.IsArchived()) {
      auto location = store_->ResolveArchiveStorageLocation(entry);
      if (!location.has_value()) {
        PushIssue(report, CheckIssueLevel::ERROR, "MISSING_ARCHIVE_OBJECT",
                  fmt::format("Archive id {} has no object at {}.", entry.id_,
                              archive_path.string()));
      } else {
        auto actual_is_dir = IsDirectoryNoFollow(location->object_path_);
        if (actual_is_dir.has_value() && actual_is_dir.value() != entry.is_directory_) {
          PushIssue(report, CheckIssueLevel::ERROR, "TYPE_MISMATCH_ARCHIVED",
                    fmt::format("Archive id {} expected directory={} but found directory={}.",
                                entry.id_, entry.is_directory_, actual_is_dir.value()));
        }
      }

      if (fsutil::PathAccessible(restore_path)) {
        PushIssue(report, CheckIssueLevel::WARN, "RESTORE_TARGET_ALREADY_EXISTS",
                  fmt::format("Archive id {} would restore onto an existing path: {}", entry.id_,
                              restore_path.string()));
      }
      continue;
    }

    if (fsutil::PathAccessible(archive_path)) {
      PushIssue(report, CheckIssueLevel::WARN, "RESTORED_BUT_ARCHIVE_EXISTS",
                fmt::format("Archive id {} is restored but its slot still exists: {}", entry.id_,
                            archive_path.string()));
    }

    if (fsutil::PathAccessible(restore_path)) {
      auto actual_is_dir = IsDirectoryNoFollow(restore_path);
      if (actual_is_dir.has_value() && actual_is_dir.value() != entry.is_directory_) {
        PushIssue(report, CheckIssueLevel::WARN, "TYPE_MISMATCH_RESTORED",
                  fmt::format("Restored archive id {} expected directory={} but found "
                              "directory={}.",
                              entry.id_, entry.is_directory_, actual_is_dir.value()));
      }
    } else {
      PushIssue(report, CheckIssueLevel::WARN, "RESTORED_TARGET_MISSING",
                fmt::format("Restored archive id {} is missing at {}", entry.id_,
                            restore_path.string()));
    }
  }
}

void CheckService::CheckVaultDirectories(CheckReport&                     report,
                                         const std::vector<ArchiveEntry>& entries,
                                         const std::vector<Vault>&        vaults) const {
  std::set<vault_id_t> known;
  for (const auto& vault : vaults) {
    known.insert(vault.id_);
  }
  std::set<std::pair<vault_id_t, archive_id_t>> expected;
  for (const auto& entry : entries) {
    if (entry.IsArchived()) {
      expected.emplace(entry.vault_id_, entry.id_);
    }
  }

  const auto& vaults_dir = store_->Tree().vaults_dir_;
  for (const auto& dir_name : fsutil::ListDirectories(vaults_dir)) {
    auto vault_id = parse::ParseId(dir_name);
    if (!vault_id.has_value()) {
      PushIssue(report, CheckIssueLevel::WARN, "NON_NUMERIC_VAULT_DIR",
                fmt::format("Unexpected directory in vaults: {}",
                            (vaults_dir / dir_name).string()));
      continue;
    }
    if (!known.contains(vault_id.value())) {
      PushIssue(report, CheckIssueLevel::WARN, "ORPHAN_VAULT_DIR",
                fmt::format("Vault directory without a vault record: {}",
                            (vaults_dir / dir_name).string()));
    }

    for (const auto& child : fsutil::ListChildren(vaults_dir / dir_name)) {
      auto archive_id = parse::ParseId(child.name_);
      if (!archive_id.has_value()) {
        PushIssue(report, CheckIssueLevel::WARN, "NON_NUMERIC_ARCHIVE_OBJECT",
                  fmt::format("Unexpected entry {} in vault {}.", child.name_, vault_id.value()));
        continue;
      }
      if (!child.is_directory_) {
        PushIssue(report, CheckIssueLevel::ERROR, "INVALID_ARCHIVE_SLOT",
                  fmt::format("Slot {} in vault {} is not a directory.", child.name_,
                              vault_id.value()));
        continue;
      }
      if (!expected.contains({vault_id.value(), archive_id.value()})) {
        PushIssue(report, CheckIssueLevel::WARN, "ORPHAN_ARCHIVE_OBJECT",
                  fmt::format("Slot {}/{} has no archived entry.", vault_id.value(),
                              archive_id.value()));
      }
    }
  }

  for (const auto& vault : vaults) {
    if (vault.IsRemoved()) {
      continue;
    }
    auto dir = store_->VaultDir(vault.id_);
    if (!fsutil::PathAccessible(dir)) {
      PushIssue(report, CheckIssueLevel::ERROR, "MISSING_VAULT_DIR",
                fmt::format("Vault {} has no directory at {}", vault.Label(), dir.string()));
    }
  }
}

void CheckService::CheckLogs(CheckReport& report, log_id_t auto_incr) const {
  std::vector<log_id_t> ids;
  for (const auto& log : store_->LoadLogEntries()) {
    ids.push_back(log.id_);
  }

  auto duplicates = FindDuplicates(ids);
  if (!duplicates.empty()) {
    PushIssue(report, CheckIssueLevel::ERROR, "DUPLICATE_LOG_ID",
              fmt::format("Duplicate log ids: {}", fmt::join(duplicates, ", ")));
  }

  log_id_t max_id = ids.empty() ? 0 : *std::max_element(ids.begin(), ids.end());
  if (auto_incr < max_id) {
    PushIssue(report, CheckIssueLevel::ERROR, "LOG_AUTO_INCR_TOO_SMALL",
              fmt::format("logId counter {} is below the largest log id {}.", auto_incr,
                          max_id));
  }
}
};  // namespace archiver
