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

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "storage/defaults.hpp"
#include "storage/metadata_store.hpp"
#include "storage/model/archive_entry.hpp"
#include "storage/model/log_entry.hpp"
#include "storage/model/vault.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
struct LogDetail {
  LogEntry                    log_{};
  std::optional<ArchiveEntry> archive_{};
  std::optional<Vault>        vault_{};
};

/**
 * @brief Read side of the audit trail
 */
class LogService {
 public:
  explicit LogService(std::shared_ptr<MetadataStore> store) : store_(std::move(store)) {}

  auto GetLogs(const LogRange& range, size_t tail_count = defaults::kLogTail)
      -> std::vector<LogEntry>;
  auto GetLogById(log_id_t log_id) -> std::optional<LogDetail>;

 private:
  std::shared_ptr<MetadataStore> store_;
};
};  // namespace archiver
