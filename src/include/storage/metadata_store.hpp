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
#include <optional>
#include <string>
#include <vector>

#include "storage/archiver_paths.hpp"
#include "storage/mapper/jsonl_mapper.hpp"
#include "storage/model/archive_entry.hpp"
#include "storage/model/archiver_config.hpp"
#include "storage/model/auto_incr.hpp"
#include "storage/model/log_entry.hpp"
#include "storage/model/vault.hpp"
#include "type/type.hpp"

namespace archiver {
struct GetVaultsOptions {
  bool include_removed_ = false;
  bool with_default_    = true;
};

struct ResolveVaultOptions {
  bool include_removed_  = false;
  // An absent reference resolves to config.currentVaultId
  bool fallback_current_ = true;
};

struct StorageLocation {
  store_path_t slot_path_;
  store_path_t object_path_;
};

/**
 * @brief Owner of every metadata file under one store root. Each record set is cached
 *        after its first load; every save rewrites the file and replaces the cache.
 *
 *        One process is assumed to own the store at a time. There is no file lock, two
 *        concurrent writers can lose each other's updates.
 */
class MetadataStore {
 private:
  ArchiverTree                             _tree;
  ArchiveEntryMapper                       _list_mapper;
  VaultMapper                              _vault_mapper;

  std::optional<ArchiverConfig>            _config_cache;
  std::optional<AutoIncrVars>              _auto_incr_cache;
  std::optional<std::vector<ArchiveEntry>> _list_cache;
  std::optional<std::vector<Vault>>        _vault_cache;

 public:
  explicit MetadataStore(const store_path_t& root);
  MetadataStore();

  /**
   * @brief Create the directory skeleton and seed missing files. Safe to call repeatedly.
   *        A current vault whose directory has disappeared is reset to the default vault.
   */
  void Init();

  auto Tree() const -> const ArchiverTree& { return _tree; }

  auto LoadConfig(bool force_refresh = false) -> ArchiverConfig;
  void SaveConfig(const ArchiverConfig& config);

  auto LoadAutoIncr(bool force_refresh = false) -> AutoIncrVars;
  void SaveAutoIncr(const AutoIncrVars& vars);
  // Bump one counter and persist it before returning the new id
  auto NextAutoIncrement(CounterKind kind) -> uint32_t;

  auto LoadListEntries(bool force_refresh = false) -> std::vector<ArchiveEntry>;
  void SaveListEntries(const std::vector<ArchiveEntry>& entries);
  void AppendListEntry(const ArchiveEntry& entry);

  // Records of vaults.jsonl, the implicit default vault is not among them
  auto LoadVaults(bool force_refresh = false) -> std::vector<Vault>;
  void SaveVaults(const std::vector<Vault>& vaults);
  auto GetVaults(const GetVaultsOptions& options = {}) -> std::vector<Vault>;

  // Every record of logs/*.jsonl ordered by id. Not cached, the audit trail only grows.
  auto LoadLogEntries() const -> std::vector<LogEntry>;

  /**
   * @brief Find a vault by digit-only id text or by name
   *
   * @param ref std::nullopt or blank falls back to the current vault when opted in
   * @param options
   * @return std::optional<Vault>
   */
  auto ResolveVault(const std::optional<std::string>& ref, const ResolveVaultOptions& options = {})
      -> std::optional<Vault>;
  auto ResolveVault(vault_id_t id, const ResolveVaultOptions& options = {})
      -> std::optional<Vault>;

  auto VaultDir(vault_id_t vault_id) const -> store_path_t;
  auto ArchivePath(vault_id_t vault_id, archive_id_t archive_id) const -> store_path_t;
  auto ArchiveObjectPath(vault_id_t vault_id, archive_id_t archive_id,
                         const std::string& item) const -> store_path_t;
  /**
   * @brief Locate the slot and object of an entry
   *
   * @return std::nullopt when the slot is not a real directory or holds no object
   *         named after the entry's item
   */
  auto ResolveArchiveStorageLocation(const ArchiveEntry& entry) const
      -> std::optional<StorageLocation>;
  void EnsureVaultDir(vault_id_t vault_id);
};
};  // namespace archiver
