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
#include <string>

#include "storage/metadata_store.hpp"
#include "storage/model/log_entry.hpp"

namespace archiver {
/**
 * @brief Append-only writer of the audit trail. Each call allocates the next log id and
 *        appends one record to logs/<YYYYMM>.jsonl of the current month.
 */
class AuditLogger {
 public:
  explicit AuditLogger(std::shared_ptr<MetadataStore> store) : store_(std::move(store)) {}

  /**
   * @brief Write one record. Failures to persist the counter or the record propagate.
   *
   * @param level
   * @param operation
   * @param message
   * @param links optional archive/vault back references
   * @return LogEntry the record as written
   */
  auto Log(LogLevel level, const Operation& operation, const std::string& message,
           const LogLinks& links = {}) -> LogEntry;

 private:
  std::shared_ptr<MetadataStore> store_;
};
};  // namespace archiver
