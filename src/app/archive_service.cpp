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

#include "app/archive_service.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <unordered_map>

#include "type/error.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/fs/fs_util.hpp"
#include "utils/log/logger.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
namespace {
auto Occupied(const store_path_t& path) -> bool {
  return fsutil::SafeLstat(path).has_value();
}

auto IdOperation(const char* main, archive_id_t id) -> Operation {
  Operation operation;
  operation.main_   = main;
  operation.args_   = {std::to_string(id)};
  operation.source_ = OperationSource::USER;
  return operation;
}

auto IndexById(std::vector<ArchiveEntry>& entries)
    -> std::unordered_map<archive_id_t, ArchiveEntry*> {
  std::unordered_map<archive_id_t, ArchiveEntry*> index;
  for (auto& entry : entries) {
    index.emplace(entry.id_, &entry);
  }
  return index;
}
}  // namespace

auto ArchiveServiceImpl::ResolveTargetVault(const std::optional<std::string>& reference)
    -> Vault {
  auto vault = store_->ResolveVault(
      reference, {.include_removed_ = true, .fallback_current_ = true});
  if (!vault.has_value()) {
    if (reference.has_value() && !parse::Trim(reference.value()).empty()) {
      throw ArchiverError(ErrorCode::NOT_FOUND,
                          fmt::format("Vault not found: {}", reference.value()));
    }
    throw ArchiverError(ErrorCode::STATE_CONFLICT, "The current vault is invalid.");
  }
  if (vault->IsRemoved()) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT,
                        fmt::format("Vault {} is removed.", vault->name_));
  }
  return vault.value();
}

auto ArchiveServiceImpl::PreValidatePutItems(const std::vector<std::string>& items)
    -> std::vector<PreparedItem> {
  std::vector<PreparedItem> prepared;
  std::set<store_path_t>    seen;
  auto                      root_canonical = fsutil::SafeRealPath(store_->Tree().root_);

  for (const auto& item : items) {
    auto resolved = fsutil::Normalize(item);
    auto status   = fsutil::SafeLstat(resolved);
    if (!status.has_value()) {
      throw ArchiverError(ErrorCode::NOT_FOUND, fmt::format("Path does not exist: {}", item));
    }

    auto canonical = fsutil::SafeRealPath(resolved);
    if (fsutil::IsParentOrSamePath(canonical, root_canonical) ||
        fsutil::IsSubPath(root_canonical, canonical)) {
      throw ArchiverError(ErrorCode::FORBIDDEN_PATH,
                          fmt::format("Path is inside the archiver store or contains it: {}",
                                      item));
    }

    if (!seen.insert(canonical).second) {
      throw ArchiverError(ErrorCode::INVALID_ARGUMENT,
                          fmt::format("Duplicate input path: {}", item));
    }

    prepared.push_back(
        {item, resolved, canonical, std::filesystem::is_directory(status.value())});
  }
  return prepared;
}

void ArchiveServiceImpl::PreValidatePutSlots(vault_id_t vault_id, size_t count) {
  auto vars = store_->LoadAutoIncr();
  for (size_t offset = 1; offset <= count; ++offset) {
    auto predicted = vars.Predict(CounterKind::ARCHIVE, static_cast<uint32_t>(offset));
    auto slot      = store_->ArchivePath(vault_id, predicted);
    if (Occupied(slot)) {
      throw ArchiverError(ErrorCode::ALREADY_EXISTS,
                          fmt::format("Archive slot is already occupied: {}", slot.string()));
    }
  }
}

auto ArchiveServiceImpl::Put(const std::vector<std::string>& items, const PutOptions& options)
    -> BatchResult {
  if (items.empty()) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "At least one item is required.");
  }

  auto vault = ResolveTargetVault(options.vault_);
  store_->EnsureVaultDir(vault.id_);

  auto prepared = PreValidatePutItems(items);
  PreValidatePutSlots(vault.id_, prepared.size());

  BatchResult result;
  for (const auto& item : prepared) {
    auto         archive_id = store_->NextAutoIncrement(CounterKind::ARCHIVE);
    auto         slot_path  = store_->ArchivePath(vault.id_, archive_id);

    ArchiveEntry entry;
    entry.id_           = archive_id;
    entry.vault_id_     = vault.id_;
    entry.item_         = item.resolved_path_.filename().string();
    entry.directory_    = item.resolved_path_.parent_path().string();
    entry.status_       = ArchiveStatus::ARCHIVED;
    entry.is_directory_ = item.is_directory_;
    entry.archived_at_  = TimeProvider::NowString();
    entry.message_      = options.message_.value_or("");
    entry.remark_       = options.remark_.value_or("");

    Operation operation;
    operation.main_ = "put";
    operation.args_ = {item.input_};
    if (options.vault_.has_value()) {
      operation.opts_["vault"] = options.vault_.value();
    } else {
      operation.opts_["vault"] = vault.id_;
    }
    operation.source_ = options.source_;

    try {
      fsutil::DirectoryGuard slot_guard(slot_path, fsutil::DirectoryGuard::Mode::CREATE_NEW);
      fsutil::Rename(item.resolved_path_,
                     store_->ArchiveObjectPath(vault.id_, archive_id, entry.item_));
      slot_guard.Commit();
      store_->AppendListEntry(entry);
    } catch (const std::exception& e) {
      logger_->Log(LogLevel::ERROR, operation,
                   fmt::format("Failed to archive {}: {}", item.input_, e.what()));
      result.failed_.push_back({archive_id, item.input_, false, e.what()});
      continue;
    }

    logger_->Log(LogLevel::INFO, operation, fmt::format("Archived {}", item.input_),
                 {archive_id, vault.id_});
    result.ok_.push_back(
        {archive_id, item.input_, true, fmt::format("Archived to vault {}", vault.Label())});
  }
  return result;
}

auto ArchiveServiceImpl::Restore(const std::vector<archive_id_t>& ids) -> BatchResult {
  if (ids.empty()) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "At least one id is required.");
  }

  auto entries = store_->LoadListEntries();
  auto index   = IndexById(entries);

  for (auto id : ids) {
    auto it = index.find(id);
    if (it == index.end()) {
      throw ArchiverError(ErrorCode::NOT_FOUND, fmt::format("Archive id {} does not exist.", id));
    }
    if (!it->second->IsArchived()) {
      throw ArchiverError(ErrorCode::STATE_CONFLICT,
                          fmt::format("Archive id {} is already restored.", id));
    }
  }

  BatchResult result;
  bool        changed = false;
  // Keep the metadata in step with the objects that already moved
  try {
    for (auto id : ids) {
      auto& entry       = *index.at(id);
      auto  operation   = IdOperation("restore", id);
      auto  target_path = entry.OriginalPath();

      try {
        auto location = store_->ResolveArchiveStorageLocation(entry);
        if (!location.has_value()) {
          throw ArchiverError(ErrorCode::NOT_FOUND,
                              fmt::format("Archived object is missing: {}",
                                          store_->ArchivePath(entry.vault_id_, id).string()));
        }
        if (Occupied(target_path)) {
          throw ArchiverError(
              ErrorCode::ALREADY_EXISTS,
              fmt::format("Restore target already exists: {}", target_path.string()));
        }

        fsutil::EnsureDir(entry.directory_);
        fsutil::Rename(location->object_path_, target_path);
        entry.status_ = ArchiveStatus::RESTORED;
        changed       = true;

        try {
          fsutil::RemoveEmptyDirectory(location->slot_path_);
        } catch (const ArchiverError& e) {
          // The object is already back, the leftover slot is reported by the checker
          logging::Get()->warn("Archive {} restored but its slot was kept: {}", id, e.what());
        }
      } catch (const std::exception& e) {
        logger_->Log(LogLevel::ERROR, operation,
                     fmt::format("Failed to restore archive {}: {}", id, e.what()),
                     {id, entry.vault_id_});
        result.failed_.push_back({id, std::to_string(id), false, e.what()});
        continue;
      }

      logger_->Log(LogLevel::INFO, operation, fmt::format("Restored archive {}", id),
                   {id, entry.vault_id_});
      result.ok_.push_back(
          {id, std::to_string(id), true, fmt::format("Restored to {}", target_path.string())});
    }
  } catch (const std::exception&) {
    if (changed) {
      store_->SaveListEntries(entries);
    }
    throw;
  }

  if (changed) {
    store_->SaveListEntries(entries);
  }
  return result;
}

auto ArchiveServiceImpl::Move(const std::vector<archive_id_t>& ids, const std::string& to_vault)
    -> BatchResult {
  if (ids.empty()) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "At least one id is required.");
  }

  auto target_vault =
      store_->ResolveVault(to_vault, {.include_removed_ = false, .fallback_current_ = false});
  if (!target_vault.has_value()) {
    throw ArchiverError(ErrorCode::NOT_FOUND,
                        fmt::format("Target vault not found: {}", to_vault));
  }

  auto                                                entries = store_->LoadListEntries();
  auto                                                index   = IndexById(entries);
  std::unordered_map<archive_id_t, StorageLocation> locations;

  for (auto id : ids) {
    auto it = index.find(id);
    if (it == index.end()) {
      throw ArchiverError(ErrorCode::NOT_FOUND, fmt::format("Archive id {} does not exist.", id));
    }
    const auto& entry = *it->second;
    if (!entry.IsArchived()) {
      throw ArchiverError(ErrorCode::STATE_CONFLICT,
                          fmt::format("Archive id {} is restored and cannot be moved.", id));
    }
    if (entry.vault_id_ == target_vault->id_) {
      throw ArchiverError(ErrorCode::STATE_CONFLICT,
                          fmt::format("Archive id {} is already in vault {}.", id,
                                      target_vault->name_));
    }

    auto location = store_->ResolveArchiveStorageLocation(entry);
    if (!location.has_value()) {
      throw ArchiverError(ErrorCode::NOT_FOUND,
                          fmt::format("Archived object is missing: {}",
                                      store_->ArchivePath(entry.vault_id_, id).string()));
    }
    auto target_slot = store_->ArchivePath(target_vault->id_, id);
    if (Occupied(target_slot)) {
      throw ArchiverError(ErrorCode::ALREADY_EXISTS,
                          fmt::format("Target slot already exists: {}", target_slot.string()));
    }
    locations.emplace(id, location.value());
  }

  fsutil::DirectoryGuard vault_guard(store_->VaultDir(target_vault->id_),
                                     fsutil::DirectoryGuard::Mode::CREATE_IF_MISSING);

  BatchResult result;
  bool        changed = false;
  // Keep the metadata in step with the objects that already moved
  try {
    for (auto id : ids) {
      auto& entry         = *index.at(id);
      auto  from_vault_id = entry.vault_id_;
      auto  operation     = IdOperation("move", id);
      operation.opts_["to"] = target_vault->id_;

      try {
        fsutil::Rename(locations.at(id).slot_path_, store_->ArchivePath(target_vault->id_, id));
        entry.vault_id_ = target_vault->id_;
        changed         = true;
        vault_guard.Commit();
      } catch (const std::exception& e) {
        logger_->Log(LogLevel::ERROR, operation,
                     fmt::format("Failed to move archive {}: {}", id, e.what()),
                     {id, from_vault_id});
        result.failed_.push_back({id, std::to_string(id), false, e.what()});
        continue;
      }

      logger_->Log(LogLevel::INFO, operation,
                   fmt::format("Moved archive {} from vault {} to vault {}", id, from_vault_id,
                               target_vault->id_),
                   {id, target_vault->id_});
      result.ok_.push_back({id, std::to_string(id), true,
                            fmt::format("Moved to vault {}", target_vault->Label())});
    }
  } catch (const std::exception&) {
    if (changed) {
      store_->SaveListEntries(entries);
    }
    throw;
  }

  if (changed) {
    store_->SaveListEntries(entries);
  }
  return result;
}

auto ArchiveServiceImpl::ResolveCdTarget(const std::string& target) -> ArchiveCdTarget {
  auto trimmed = parse::Trim(target);
  if (trimmed.empty()) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "Target cannot be empty.");
  }

  std::optional<std::string> vault_ref;
  std::string                id_text = trimmed;
  auto                       slash   = trimmed.rfind('/');
  if (slash != std::string::npos) {
    vault_ref = parse::Trim(trimmed.substr(0, slash));
    id_text   = parse::Trim(trimmed.substr(slash + 1));
    if (vault_ref->empty()) {
      throw ArchiverError(ErrorCode::INVALID_ARGUMENT,
                          fmt::format("Invalid target {}: the vault part is empty", target));
    }
  }

  auto archive_id = parse::ParseId(id_text);
  if (!archive_id.has_value()) {
    throw ArchiverError(
        ErrorCode::INVALID_ARGUMENT,
        fmt::format("Invalid target {}: expected <archive id> or <vault>/<archive id>", target));
  }

  auto entries = store_->LoadListEntries();
  auto it      = std::find_if(entries.begin(), entries.end(),
                              [&](const ArchiveEntry& entry) { return entry.id_ == *archive_id; });
  if (it == entries.end()) {
    throw ArchiverError(ErrorCode::NOT_FOUND,
                        fmt::format("Archive id {} does not exist.", *archive_id));
  }
  const auto& entry = *it;
  if (!entry.IsArchived()) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT,
                        fmt::format("Archive id {} is restored and has no slot.", *archive_id));
  }

  if (vault_ref.has_value()) {
    auto requested =
        store_->ResolveVault(vault_ref, {.include_removed_ = true, .fallback_current_ = false});
    if (!requested.has_value()) {
      throw ArchiverError(ErrorCode::NOT_FOUND,
                          fmt::format("Vault not found: {}", vault_ref.value()));
    }
    if (requested->id_ != entry.vault_id_) {
      throw ArchiverError(ErrorCode::STATE_CONFLICT,
                          fmt::format("Archive id {} is in vault {}, not in vault {}.",
                                      *archive_id, entry.vault_id_, requested->id_));
    }
  }

  auto vault =
      store_->ResolveVault(entry.vault_id_, {.include_removed_ = true, .fallback_current_ = false});
  if (!vault.has_value()) {
    throw ArchiverError(ErrorCode::NOT_FOUND,
                        fmt::format("Vault {} of archive id {} does not exist.", entry.vault_id_,
                                    *archive_id));
  }

  auto location = store_->ResolveArchiveStorageLocation(entry);
  if (!location.has_value()) {
    throw ArchiverError(ErrorCode::NOT_FOUND,
                        fmt::format("Archive slot is missing or invalid: {}",
                                    store_->ArchivePath(entry.vault_id_, entry.id_).string()));
  }

  auto operation  = IdOperation("cd", *archive_id);
  operation.args_ = {trimmed};
  logger_->Log(LogLevel::INFO, operation,
               fmt::format("Resolved slot of archive {}", *archive_id),
               {*archive_id, entry.vault_id_});

  return {vault.value(), *archive_id, location->slot_path_};
}

auto ArchiveServiceImpl::ListEntries(const ListOptions& options) -> std::vector<ArchiveEntry> {
  auto                      entries = store_->LoadListEntries();

  std::optional<vault_id_t> vault_filter;
  if (options.vault_.has_value()) {
    auto vault = store_->ResolveVault(options.vault_,
                                      {.include_removed_ = true, .fallback_current_ = false});
    if (!vault.has_value()) {
      throw ArchiverError(ErrorCode::NOT_FOUND,
                          fmt::format("Vault not found: {}", options.vault_.value()));
    }
    vault_filter = vault->id_;
  }

  std::vector<ArchiveEntry> filtered;
  for (auto& entry : entries) {
    if (!options.all_) {
      auto wanted = options.restored_ ? ArchiveStatus::RESTORED : ArchiveStatus::ARCHIVED;
      if (entry.status_ != wanted) {
        continue;
      }
    }
    if (vault_filter.has_value() && entry.vault_id_ != vault_filter.value()) {
      continue;
    }
    filtered.push_back(std::move(entry));
  }
  ArchiveEntryMapper::SortById(filtered);
  return filtered;
}

auto ArchiveServiceImpl::DecorateEntries(const std::vector<ArchiveEntry>& entries)
    -> std::vector<DecoratedEntry> {
  std::unordered_map<vault_id_t, Vault> vaults;
  for (auto& vault : store_->GetVaults({.include_removed_ = true, .with_default_ = true})) {
    vaults.emplace(vault.id_, vault);
  }

  std::vector<DecoratedEntry> decorated;
  decorated.reserve(entries.size());
  for (const auto& entry : entries) {
    auto it         = vaults.find(entry.vault_id_);
    auto vault_name = it != vaults.end() ? it->second.Label()
                                         : fmt::format("unknown({})", entry.vault_id_);
    decorated.push_back({entry, vault_name, entry.OriginalPath().string()});
  }
  return decorated;
}
};  // namespace archiver
