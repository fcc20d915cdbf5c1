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
#include "storage/metadata_store.hpp"
#include "storage/model/archive_entry.hpp"
#include "storage/model/log_entry.hpp"
#include "storage/model/vault.hpp"
#include "type/type.hpp"

namespace archiver {
struct BatchResultItem {
  std::optional<archive_id_t> id_{};
  std::string                 input_{};
  bool                        success_ = false;
  std::string                 message_{};
};

struct BatchResult {
  std::vector<BatchResultItem> ok_{};
  std::vector<BatchResultItem> failed_{};
};

struct PutOptions {
  // Name or id, the current vault when absent
  std::optional<std::string> vault_{};
  std::optional<std::string> message_{};
  std::optional<std::string> remark_{};
  OperationSource            source_ = OperationSource::USER;
};

struct ListOptions {
  bool                       restored_ = false;
  bool                       all_      = false;
  std::optional<std::string> vault_{};
};

struct ArchiveCdTarget {
  Vault        vault_{};
  archive_id_t archive_id_ = 0;
  store_path_t slot_path_{};
};

struct DecoratedEntry {
  ArchiveEntry entry_{};
  // "name(id)", or "unknown(id)" for a dangling vault reference
  std::string  vault_name_{};
  std::string  display_path_{};
};

class ArchiveService {
 public:
  virtual ~ArchiveService() = default;

  /**
   * @brief Move files or directories into fresh slots of a vault. Inputs are validated as a
   *        whole before anything moves; afterwards one failing item does not stop the rest.
   */
  virtual auto Put(const std::vector<std::string>& items, const PutOptions& options = {})
      -> BatchResult                                                                  = 0;
  virtual auto Restore(const std::vector<archive_id_t>& ids) -> BatchResult        = 0;
  virtual auto Move(const std::vector<archive_id_t>& ids, const std::string& to_vault)
      -> BatchResult                                                                  = 0;
  // "<id>" or "<vault>/<id>"
  virtual auto ResolveCdTarget(const std::string& target) -> ArchiveCdTarget         = 0;
  virtual auto ListEntries(const ListOptions& options = {}) -> std::vector<ArchiveEntry> = 0;
  virtual auto DecorateEntries(const std::vector<ArchiveEntry>& entries)
      -> std::vector<DecoratedEntry>                                                  = 0;
};

class ArchiveServiceImpl final : public ArchiveService {
 public:
  ArchiveServiceImpl(std::shared_ptr<MetadataStore> store, std::shared_ptr<AuditLogger> logger)
      : store_(std::move(store)), logger_(std::move(logger)) {}

  auto Put(const std::vector<std::string>& items, const PutOptions& options = {})
      -> BatchResult override;
  auto Restore(const std::vector<archive_id_t>& ids) -> BatchResult override;
  auto Move(const std::vector<archive_id_t>& ids, const std::string& to_vault)
      -> BatchResult override;
  auto ResolveCdTarget(const std::string& target) -> ArchiveCdTarget override;
  auto ListEntries(const ListOptions& options = {}) -> std::vector<ArchiveEntry> override;
  auto DecorateEntries(const std::vector<ArchiveEntry>& entries)
      -> std::vector<DecoratedEntry> override;

 private:
  struct PreparedItem {
    std::string  input_;
    store_path_t resolved_path_;
    store_path_t canonical_path_;
    bool         is_directory_ = false;
  };

  auto ResolveTargetVault(const std::optional<std::string>& reference) -> Vault;
  auto PreValidatePutItems(const std::vector<std::string>& items) -> std::vector<PreparedItem>;
  void PreValidatePutSlots(vault_id_t vault_id, size_t count);

  std::shared_ptr<MetadataStore> store_;
  std::shared_ptr<AuditLogger>   logger_;
};
};  // namespace archiver
