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

#include "app/audit_logger.hpp"

#include "storage/mapper/jsonl_mapper.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/fs/fs_util.hpp"

namespace archiver {
auto AuditLogger::Log(LogLevel level, const Operation& operation, const std::string& message,
                      const LogLinks& links) -> LogEntry {
  LogEntry entry;
  entry.id_        = store_->NextAutoIncrement(CounterKind::LOG);
  auto now         = TimeProvider::Now();
  entry.opered_at_ = TimeProvider::TimePointToString(now);
  entry.level_     = level;
  entry.oper_      = operation;
  entry.message_   = message;
  entry.links_     = links;

  const auto& tree = store_->Tree();
  fsutil::EnsureDir(tree.logs_dir_);
  LogEntryMapper mapper(tree.LogFile(TimeProvider::TimePointToPeriod(now)));
  mapper.Insert(entry);
  return entry;
}
};  // namespace archiver
