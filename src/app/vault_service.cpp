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

#include "app/vault_service.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "storage/defaults.hpp"
#include "type/error.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/fs/fs_util.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
namespace {
auto VaultOperation(const char* sub, std::vector<std::string> args) -> Operation {
  Operation operation;
  operation.main_   = "vault";
  operation.sub_    = sub;
  operation.args_   = std::move(args);
  operation.source_ = OperationSource::USER;
  return operation;
}

void ValidateNewName(const std::string& name) {
  if (name.empty()) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "Vault name cannot be empty.");
  }
  if (name == defaults::kDefaultVaultName) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT,
                        fmt::format("Vault name {} is reserved.", defaults::kDefaultVaultName));
  }
}

// Lookup among the records of vaults.jsonl by exact name or id text
auto FindStored(std::vector<Vault>& vaults, const std::string& reference) -> Vault* {
  auto it = std::find_if(vaults.begin(), vaults.end(), [&](const Vault& vault) {
    return vault.name_ == reference || std::to_string(vault.id_) == reference;
  });
  return it == vaults.end() ? nullptr : &(*it);
}
}  // namespace

auto VaultServiceImpl::Create(const CreateVaultOptions& options) -> CreateVaultResult {
  auto name = parse::Trim(options.name_);
  ValidateNewName(name);

  auto vaults     = store_->LoadVaults();
  auto duplicated = std::find_if(vaults.begin(), vaults.end(),
                                 [&](const Vault& vault) { return vault.name_ == name; });

  if (duplicated != vaults.end() && !duplicated->IsRemoved()) {
    throw ArchiverError(ErrorCode::ALREADY_EXISTS, fmt::format("Vault {} already exists.", name));
  }

  if (duplicated != vaults.end()) {
    if (!options.recover_removed_) {
      throw ArchiverError(ErrorCode::REMOVED_VAULT_EXISTS,
                          fmt::format("A removed vault named {} exists. Recover it instead.",
                                      name));
    }
    duplicated->status_ = VaultStatus::VALID;
    auto recovered      = *duplicated;
    store_->EnsureVaultDir(recovered.id_);
    store_->SaveVaults(vaults);
    if (options.activate_) {
      config_->SetCurrentVault(recovered.id_);
    }
    logger_->Log(LogLevel::INFO, VaultOperation("create", {name}),
                 fmt::format("Recovered removed vault {}", recovered.Label()),
                 {.vault_id_ = recovered.id_});
    return {recovered, true};
  }

  Vault vault;
  vault.id_         = store_->NextAutoIncrement(CounterKind::VAULT);
  vault.name_       = name;
  vault.remark_     = options.remark_.value_or("");
  vault.created_at_ = TimeProvider::NowString();
  vault.status_     = VaultStatus::VALID;

  vaults.push_back(vault);
  store_->SaveVaults(vaults);
  store_->EnsureVaultDir(vault.id_);
  if (options.activate_) {
    config_->SetCurrentVault(vault.id_);
  }

  logger_->Log(LogLevel::INFO, VaultOperation("create", {name}),
               fmt::format("Created vault {}", vault.Label()), {.vault_id_ = vault.id_});
  return {vault, false};
}

void VaultServiceImpl::ValidateMoveToDefault(const std::vector<ArchiveEntry>& entries) const {
  for (const auto& entry : entries) {
    auto from = store_->ArchivePath(entry.vault_id_, entry.id_);
    auto to   = store_->ArchivePath(defaults::kDefaultVaultId, entry.id_);
    if (!fsutil::PathAccessible(from)) {
      throw ArchiverError(ErrorCode::NOT_FOUND,
                          fmt::format("Archived object is missing: {}", from.string()));
    }
    if (fsutil::SafeLstat(to).has_value()) {
      throw ArchiverError(
          ErrorCode::ALREADY_EXISTS,
          fmt::format("Default vault already contains archive id {}.", entry.id_));
    }
  }
}

auto VaultServiceImpl::Remove(const std::string& reference) -> RemoveVaultResult {
  auto vault =
      store_->ResolveVault(reference, {.include_removed_ = true, .fallback_current_ = false});
  if (!vault.has_value()) {
    throw ArchiverError(ErrorCode::NOT_FOUND, fmt::format("Vault not found: {}", reference));
  }
  if (vault->id_ == defaults::kDefaultVaultId || vault->status_ == VaultStatus::PROTECTED) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT, "Default vault cannot be removed.");
  }
  if (vault->IsRemoved()) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT,
                        fmt::format("Vault {} is already removed.", vault->name_));
  }

  auto                      entries = store_->LoadListEntries();
  std::vector<ArchiveEntry> archived;
  for (const auto& entry : entries) {
    if (entry.vault_id_ == vault->id_ && entry.IsArchived()) {
      archived.push_back(entry);
    }
  }

  store_->EnsureVaultDir(defaults::kDefaultVaultId);
  ValidateMoveToDefault(archived);

  auto                      operation = VaultOperation("remove", {reference});
  std::vector<archive_id_t> moved;
  try {
    for (auto& entry : entries) {
      if (entry.vault_id_ != vault->id_ || !entry.IsArchived()) {
        continue;
      }
      fsutil::Rename(store_->ArchivePath(vault->id_, entry.id_),
                     store_->ArchivePath(defaults::kDefaultVaultId, entry.id_));
      entry.vault_id_ = defaults::kDefaultVaultId;
      moved.push_back(entry.id_);
    }
  } catch (const ArchiverError& e) {
    // Keep the metadata in step with the slots that already moved
    if (!moved.empty()) {
      store_->SaveListEntries(entries);
    }
    logger_->Log(LogLevel::ERROR, operation,
                 fmt::format("Failed to remove vault {}: {}", vault->Label(), e.what()),
                 {.vault_id_ = vault->id_});
    throw;
  }

  auto vaults = store_->LoadVaults();
  auto target = FindStored(vaults, std::to_string(vault->id_));
  if (target == nullptr) {
    throw ArchiverError(ErrorCode::NOT_FOUND,
                        fmt::format("Vault not found while saving: {}", vault->id_));
  }
  target->status_ = VaultStatus::REMOVED;
  auto removed    = *target;

  store_->SaveListEntries(entries);
  store_->SaveVaults(vaults);

  auto config = store_->LoadConfig();
  if (config.current_vault_id_ == removed.id_) {
    config_->SetCurrentVault(defaults::kDefaultVaultId);
  }

  logger_->Log(LogLevel::INFO, operation,
               fmt::format("Removed vault {}, {} archive(s) moved to the default vault",
                           removed.Label(), moved.size()),
               {.vault_id_ = removed.id_});
  return {removed, moved};
}

auto VaultServiceImpl::Recover(const std::string& reference) -> Vault {
  auto vaults = store_->LoadVaults();
  auto vault  = FindStored(vaults, reference);
  if (vault == nullptr) {
    throw ArchiverError(ErrorCode::NOT_FOUND, fmt::format("Vault not found: {}", reference));
  }
  if (!vault->IsRemoved()) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT,
                        fmt::format("Vault {} is not removed.", vault->name_));
  }

  vault->status_ = VaultStatus::VALID;
  auto recovered = *vault;
  store_->EnsureVaultDir(recovered.id_);
  store_->SaveVaults(vaults);

  logger_->Log(LogLevel::INFO, VaultOperation("recover", {reference}),
               fmt::format("Recovered vault {}", recovered.Label()),
               {.vault_id_ = recovered.id_});
  return recovered;
}

auto VaultServiceImpl::Rename(const std::string& reference, const std::string& new_name)
    -> Vault {
  auto name = parse::Trim(new_name);
  ValidateNewName(name);

  if (reference == defaults::kDefaultVaultName ||
      reference == std::to_string(defaults::kDefaultVaultId)) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT, "Default vault cannot be renamed.");
  }

  auto vaults = store_->LoadVaults();
  auto target = FindStored(vaults, reference);
  if (target == nullptr) {
    throw ArchiverError(ErrorCode::NOT_FOUND, fmt::format("Vault not found: {}", reference));
  }
  if (target->status_ != VaultStatus::VALID) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT,
                        fmt::format("Vault {} is not in valid state.", target->name_));
  }

  auto conflict = std::find_if(vaults.begin(), vaults.end(), [&](const Vault& vault) {
    return vault.name_ == name && vault.id_ != target->id_;
  });
  if (conflict != vaults.end()) {
    throw ArchiverError(ErrorCode::ALREADY_EXISTS,
                        fmt::format("Vault name {} already exists.", name));
  }

  auto old_name = target->name_;
  target->name_ = name;
  auto renamed  = *target;
  store_->SaveVaults(vaults);

  logger_->Log(LogLevel::INFO, VaultOperation("rename", {reference, name}),
               fmt::format("Renamed vault {} to {}", old_name, renamed.Label()),
               {.vault_id_ = renamed.id_});
  return renamed;
}

auto VaultServiceImpl::Use(const std::string& reference) -> Vault {
  auto vault =
      store_->ResolveVault(reference, {.include_removed_ = true, .fallback_current_ = false});
  if (!vault.has_value()) {
    throw ArchiverError(ErrorCode::NOT_FOUND, fmt::format("Vault not found: {}", reference));
  }
  if (vault->IsRemoved()) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT,
                        fmt::format("Vault {} is removed.", vault->name_));
  }

  config_->SetCurrentVault(vault->id_);
  logger_->Log(LogLevel::INFO, VaultOperation("use", {reference}),
               fmt::format("Switched to vault {}", vault->Label()), {.vault_id_ = vault->id_});
  return vault.value();
}

auto VaultServiceImpl::List(bool include_all) -> std::vector<Vault> {
  return store_->GetVaults({.include_removed_ = include_all, .with_default_ = true});
}

auto VaultServiceImpl::ListArchivedIdsInVault(vault_id_t vault_id) -> std::vector<archive_id_t> {
  std::vector<archive_id_t> ids;
  for (const auto& child : fsutil::ListChildren(store_->VaultDir(vault_id))) {
    auto id = parse::ParseId(child.name_);
    if (id.has_value()) {
      ids.push_back(id.value());
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

auto VaultServiceImpl::ResolveVaultForRead(const std::optional<std::string>& reference)
    -> std::optional<Vault> {
  if (!reference.has_value()) {
    return std::nullopt;
  }
  return store_->ResolveVault(reference,
                              {.include_removed_ = true, .fallback_current_ = false});
}
};  // namespace archiver
