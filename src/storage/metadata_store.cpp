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

#include "storage/metadata_store.hpp"

#include <algorithm>
#include <filesystem>
#include <string>

#include "storage/defaults.hpp"
#include "utils/fs/fs_util.hpp"
#include "utils/json/json_file.hpp"
#include "utils/log/logger.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
MetadataStore::MetadataStore(const store_path_t& root)
    : _tree(root), _list_mapper(_tree.list_file_), _vault_mapper(_tree.vaults_file_) {}

MetadataStore::MetadataStore() : MetadataStore(ArchiverTree::DefaultRoot()) {}

void MetadataStore::Init() {
  fsutil::EnsureDir(_tree.root_);
  fsutil::EnsureDir(_tree.logs_dir_);
  fsutil::EnsureDir(_tree.vaults_dir_);
  fsutil::EnsureDir(VaultDir(defaults::kDefaultVaultId));

  jsonfile::EnsureJsoncFileWithTemplate(_tree.config_file_, defaults::kConfigTemplate);
  jsonfile::EnsureJsoncFileWithTemplate(_tree.auto_incr_file_, defaults::kAutoIncrTemplate);
  fsutil::EnsureFile(_tree.list_file_);
  fsutil::EnsureFile(_tree.vaults_file_);

  auto config = LoadConfig();
  if (config.current_vault_id_ == defaults::kDefaultVaultId ||
      fsutil::PathAccessible(VaultDir(config.current_vault_id_))) {
    return;
  }
  logging::Get()->warn("Current vault {} has no directory, falling back to the default vault",
                       config.current_vault_id_);
  config.current_vault_id_ = defaults::kDefaultVaultId;
  SaveConfig(config);
}

auto MetadataStore::LoadConfig(bool force_refresh) -> ArchiverConfig {
  if (_config_cache.has_value() && !force_refresh) {
    return _config_cache.value();
  }
  auto           fallback = defaults::DefaultConfig();
  auto           loaded   = jsonfile::ReadJsoncFile(_tree.config_file_, fallback.ToJSON());
  ArchiverConfig config;
  config.FromJSON(loaded);
  _config_cache = config;
  return config;
}

void MetadataStore::SaveConfig(const ArchiverConfig& config) {
  // Round trip through the reader so that an out-of-range value never reaches the disk
  ArchiverConfig sanitized;
  sanitized.FromJSON(config.ToJSON());
  jsonfile::WriteJsonFile(_tree.config_file_, sanitized.ToJSON(),
                          jsonfile::LeadingComment(defaults::kConfigTemplate));
  _config_cache = sanitized;
}

auto MetadataStore::LoadAutoIncr(bool force_refresh) -> AutoIncrVars {
  if (_auto_incr_cache.has_value() && !force_refresh) {
    return _auto_incr_cache.value();
  }
  auto         fallback = defaults::DefaultAutoIncr();
  auto         loaded   = jsonfile::ReadJsoncFile(_tree.auto_incr_file_, fallback.ToJSON());
  AutoIncrVars vars;
  vars.FromJSON(loaded);
  _auto_incr_cache = vars;
  return vars;
}

void MetadataStore::SaveAutoIncr(const AutoIncrVars& vars) {
  jsonfile::WriteJsonFile(_tree.auto_incr_file_, vars.ToJSON(),
                          jsonfile::LeadingComment(defaults::kAutoIncrTemplate));
  _auto_incr_cache = vars;
}

auto MetadataStore::NextAutoIncrement(CounterKind kind) -> uint32_t {
  auto vars = LoadAutoIncr();
  auto next = vars.Next(kind);
  SaveAutoIncr(vars);
  return next;
}

auto MetadataStore::LoadListEntries(bool force_refresh) -> std::vector<ArchiveEntry> {
  if (_list_cache.has_value() && !force_refresh) {
    return _list_cache.value();
  }
  _list_cache = _list_mapper.Select();
  return _list_cache.value();
}

void MetadataStore::SaveListEntries(const std::vector<ArchiveEntry>& entries) {
  std::vector<ArchiveEntry> sorted = entries;
  ArchiveEntryMapper::SortById(sorted);
  _list_mapper.Replace(sorted);
  _list_cache = std::move(sorted);
}

void MetadataStore::AppendListEntry(const ArchiveEntry& entry) {
  auto entries = LoadListEntries();
  // Sanitize exactly as a later load would
  ArchiveEntry sanitized;
  sanitized.FromJSON(entry.ToJSON());
  _list_mapper.Insert(sanitized);
  entries.push_back(sanitized);
  ArchiveEntryMapper::SortById(entries);
  _list_cache = std::move(entries);
}

auto MetadataStore::LoadVaults(bool force_refresh) -> std::vector<Vault> {
  if (_vault_cache.has_value() && !force_refresh) {
    return _vault_cache.value();
  }
  _vault_cache = _vault_mapper.Select();
  return _vault_cache.value();
}

void MetadataStore::SaveVaults(const std::vector<Vault>& vaults) {
  std::vector<Vault> normalized;
  for (const auto& vault : vaults) {
    if (VaultMapper::Accept(vault)) {
      normalized.push_back(vault);
    }
  }
  VaultMapper::SortById(normalized);
  _vault_mapper.Replace(normalized);
  _vault_cache = std::move(normalized);
}

auto MetadataStore::GetVaults(const GetVaultsOptions& options) -> std::vector<Vault> {
  std::vector<Vault> result;
  if (options.with_default_) {
    result.push_back(defaults::DefaultVault());
  }
  for (auto& vault : LoadVaults()) {
    if (options.include_removed_ || vault.status_ == VaultStatus::VALID) {
      result.push_back(std::move(vault));
    }
  }
  return result;
}

auto MetadataStore::LoadLogEntries() const -> std::vector<LogEntry> {
  std::vector<LogEntry> logs;
  for (const auto& child : fsutil::ListChildren(_tree.logs_dir_)) {
    if (child.is_directory_ || store_path_t(child.name_).extension() != ".jsonl") {
      continue;
    }
    auto records = LogEntryMapper(_tree.logs_dir_ / child.name_).Select();
    logs.insert(logs.end(), records.begin(), records.end());
  }
  LogEntryMapper::SortById(logs);
  return logs;
}

auto MetadataStore::ResolveVault(const std::optional<std::string>& ref,
                                 const ResolveVaultOptions& options) -> std::optional<Vault> {
  bool blank = !ref.has_value() || ref->find_first_not_of(" \t") == std::string::npos;
  if (blank) {
    if (!options.fallback_current_) {
      return std::nullopt;
    }
    return ResolveVault(LoadConfig().current_vault_id_, options);
  }

  auto id = parse::ParseId(ref.value());
  if (id.has_value()) {
    return ResolveVault(id.value(), options);
  }

  auto vaults = GetVaults({.include_removed_ = true, .with_default_ = true});
  auto it     = std::find_if(vaults.begin(), vaults.end(),
                             [&](const Vault& vault) { return vault.name_ == ref.value(); });
  if (it == vaults.end() || (!options.include_removed_ && it->IsRemoved())) {
    return std::nullopt;
  }
  return *it;
}

auto MetadataStore::ResolveVault(vault_id_t id, const ResolveVaultOptions& options)
    -> std::optional<Vault> {
  auto vaults = GetVaults({.include_removed_ = true, .with_default_ = true});
  auto it     = std::find_if(vaults.begin(), vaults.end(),
                             [&](const Vault& vault) { return vault.id_ == id; });
  if (it == vaults.end() || (!options.include_removed_ && it->IsRemoved())) {
    return std::nullopt;
  }
  return *it;
}

auto MetadataStore::VaultDir(vault_id_t vault_id) const -> store_path_t {
  return _tree.vaults_dir_ / std::to_string(vault_id);
}

auto MetadataStore::ArchivePath(vault_id_t vault_id, archive_id_t archive_id) const
    -> store_path_t {
  return VaultDir(vault_id) / std::to_string(archive_id);
}

auto MetadataStore::ArchiveObjectPath(vault_id_t vault_id, archive_id_t archive_id,
                                      const std::string& item) const -> store_path_t {
  return ArchivePath(vault_id, archive_id) / item;
}

auto MetadataStore::ResolveArchiveStorageLocation(const ArchiveEntry& entry) const
    -> std::optional<StorageLocation> {
  if (entry.item_.empty()) {
    return std::nullopt;
  }
  auto slot_path   = ArchivePath(entry.vault_id_, entry.id_);
  auto slot_status = fsutil::SafeLstat(slot_path);
  if (!slot_status.has_value() || !std::filesystem::is_directory(slot_status.value())) {
    return std::nullopt;
  }

  auto object_path = slot_path / entry.item_;
  if (!fsutil::SafeLstat(object_path).has_value()) {
    return std::nullopt;
  }
  return StorageLocation{slot_path, object_path};
}

void MetadataStore::EnsureVaultDir(vault_id_t vault_id) { fsutil::EnsureDir(VaultDir(vault_id)); }
};  // namespace archiver
