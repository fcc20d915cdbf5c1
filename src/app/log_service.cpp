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

#include "app/log_service.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace archiver {
namespace {
// "2026-03-14 09:26:53" -> "202603"
auto MonthOf(const LogEntry& entry) -> std::string {
  std::string digits;
  for (char c : entry.opered_at_) {
    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      digits.push_back(c);
    } else if (c != '-' && c != ':' && c != ' ' && c != 'T') {
      break;
    }
  }
  return digits.substr(0, std::min<size_t>(digits.size(), 6));
}
}  // namespace

auto LogService::GetLogs(const LogRange& range, size_t tail_count) -> std::vector<LogEntry> {
  auto logs = store_->LoadLogEntries();

  switch (range.mode_) {
    case LogRangeMode::ALL:
      return logs;
    case LogRangeMode::TAIL: {
      if (logs.size() <= tail_count) {
        return logs;
      }
      return {logs.end() - static_cast<std::ptrdiff_t>(tail_count), logs.end()};
    }
    case LogRangeMode::MONTH:
      break;
  }

  std::vector<LogEntry> filtered;
  for (auto& log : logs) {
    auto month = MonthOf(log);
    if (month.size() == 6 && month >= range.from_ && month <= range.to_) {
      filtered.push_back(std::move(log));
    }
  }
  return filtered;
}

auto LogService::GetLogById(log_id_t log_id) -> std::optional<LogDetail> {
  auto logs = store_->LoadLogEntries();
  auto it   = std::find_if(logs.begin(), logs.end(),
                           [&](const LogEntry& entry) { return entry.id_ == log_id; });
  if (it == logs.end()) {
    return std::nullopt;
  }

  LogDetail detail;
  detail.log_ = *it;

  if (it->links_.archive_id_.has_value()) {
    auto entries = store_->LoadListEntries();
    auto entry   = std::find_if(entries.begin(), entries.end(), [&](const ArchiveEntry& e) {
      return e.id_ == it->links_.archive_id_.value();
    });
    if (entry != entries.end()) {
      detail.archive_ = *entry;
    }
  }

  if (it->links_.vault_id_.has_value()) {
    auto vaults = store_->GetVaults({.include_removed_ = true, .with_default_ = true});
    auto vault  = std::find_if(vaults.begin(), vaults.end(), [&](const Vault& v) {
      return v.id_ == it->links_.vault_id_.value();
    });
    if (vault != vaults.end()) {
      detail.vault_ = *vault;
    }
  }
  return detail;
}
};  // namespace archiver
