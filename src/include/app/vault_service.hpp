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

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/audit_logger.hpp"
#include "app/config_service.hpp"
#include "storage/metadata_store.hpp"
#include "storage/model/vault.hpp"
#include "type/type.hpp"

namespace archiver {
struct CreateVaultOptions {
  std::string                name_{};
  std::optional<std::string> remark_{};
  // Make the vault current once created
  bool                       activate_        = false;
  // Reactivate a removed vault of the same name instead of failing
  bool                       recover_removed_ = false;
};

struct CreateVaultResult {
  Vault vault_{};
  bool  recovered_ = false;
};

struct RemoveVaultResult {
  Vault                     vault_{};
  std::vector<archive_id_t> moved_archive_ids_{};
};

class VaultService {
 public:
  virtual ~VaultService() = default;

  virtual auto Create(const CreateVaultOptions& options) -> CreateVaultResult          = 0;
  /**
   * @brief Relocate every archived entry of the vault into the default vault, then mark
   *        the vault removed. Nothing moves unless every entry can be relocated.
   */
  virtual auto Remove(const std::string& reference) -> RemoveVaultResult                = 0;
  virtual auto Recover(const std::string& reference) -> Vault                           = 0;
  virtual auto Rename(const std::string& reference, const std::string& new_name) -> Vault = 0;
  virtual auto Use(const std::string& reference) -> Vault                               = 0;
  // Default vault first, then valid vaults (or every vault with include_all)
  virtual auto List(bool include_all) -> std::vector<Vault>                             = 0;
  virtual auto ListArchivedIdsInVault(vault_id_t vault_id) -> std::vector<archive_id_t> = 0;
  virtual auto ResolveVaultForRead(const std::optional<std::string>& reference)
      -> std::optional<Vault>                                                           = 0;
};

class VaultServiceImpl final : public VaultService {
 public:
  VaultServiceImpl(std::shared_ptr<MetadataStore> store, std::shared_ptr<ConfigService> config,
                   std::shared_ptr<AuditLogger> logger)
      : store_(std::move(store)), config_(std::move(config)), logger_(std::move(logger)) {}

  auto Create(const CreateVaultOptions& options) -> CreateVaultResult override;
  auto Remove(const std::string& reference) -> RemoveVaultResult override;
  auto Recover(const std::string& reference) -> Vault override;
  auto Rename(const std::string& reference, const std::string& new_name) -> Vault override;
  auto Use(const std::string& reference) -> Vault override;
  auto List(bool include_all) -> std::vector<Vault> override;
  auto ListArchivedIdsInVault(vault_id_t vault_id) -> std::vector<archive_id_t> override;
  auto ResolveVaultForRead(const std::optional<std::string>& reference)
      -> std::optional<Vault> override;

 private:
  void ValidateMoveToDefault(const std::vector<ArchiveEntry>& entries) const;

  std::shared_ptr<MetadataStore> store_;
  std::shared_ptr<ConfigService> config_;
  std::shared_ptr<AuditLogger>   logger_;
};
};  // namespace archiver
