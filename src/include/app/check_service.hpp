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

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "storage/metadata_store.hpp"
#include "storage/model/archive_entry.hpp"
#include "storage/model/vault.hpp"

namespace archiver {
enum class CheckIssueLevel : uint8_t { WARN = 0, ERROR };

auto CheckIssueLevelToString(CheckIssueLevel level) -> const char*;

struct CheckIssue {
  CheckIssueLevel level_ = CheckIssueLevel::WARN;
  // Stable machine readable code, e.g. "ORPHAN_ARCHIVE_OBJECT"
  std::string     code_{};
  std::string     message_{};
};

struct CheckReport {
  std::vector<CheckIssue>  issues_{};
  std::vector<std::string> info_{};

  // Warnings never make a report fail
  auto                     HasErrors() const -> bool;
  auto                     Count(CheckIssueLevel level) const -> size_t;
  auto                     HasIssue(const std::string& code) const -> bool;
};

/**
 * @brief Read-only audit of metadata against the filesystem. Nothing is repaired.
 */
class CheckService {
 public:
  explicit CheckService(std::shared_ptr<MetadataStore> store) : store_(std::move(store)) {}

  auto Run() -> CheckReport;

 private:
  void CheckRequiredPaths(CheckReport& report) const;
  void CheckCurrentVault(CheckReport& report, vault_id_t current_vault_id,
                         const std::vector<Vault>& vaults) const;
  void CheckListIds(CheckReport& report, const std::vector<ArchiveEntry>& entries,
                    archive_id_t auto_incr) const;
  void CheckVaultIds(CheckReport& report, const std::vector<Vault>& vaults,
                     vault_id_t auto_incr) const;
  void CheckListConsistency(CheckReport& report, const std::vector<ArchiveEntry>& entries,
                            const std::vector<Vault>& vaults) const;
  void CheckVaultDirectories(CheckReport& report, const std::vector<ArchiveEntry>& entries,
                             const std::vector<Vault>& vaults) const;
  void CheckLogs(CheckReport& report, log_id_t auto_incr) const;

  std::shared_ptr<MetadataStore> store_;
};
};  // namespace archiver
