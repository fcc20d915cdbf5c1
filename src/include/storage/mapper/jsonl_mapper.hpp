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

#include <algorithm>
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>

#include "storage/model/archive_entry.hpp"
#include "storage/model/log_entry.hpp"
#include "storage/model/vault.hpp"
#include "type/type.hpp"
#include "utils/json/json_file.hpp"

namespace archiver {
/**
 * @brief Maps a record type onto a newline-delimited JSON file. Derived supplies
 *        Accept(record), which filters rows after sanitizing, and IdOf(record).
 */
template <typename Derived, typename Record, typename ID>
class JsonLinesMapper {
 protected:
  store_path_t _file;

 public:
  explicit JsonLinesMapper(store_path_t file) : _file(std::move(file)) {}

  auto File() const -> const store_path_t& { return _file; }

  /**
   * @brief Read every accepted record of the file, ordered by id
   *
   * @return std::vector<Record>
   */
  auto Select() const -> std::vector<Record> {
    std::vector<Record> records;
    for (const auto& row : jsonfile::ReadJsonLinesFile(_file)) {
      Record record;
      record.FromJSON(row);
      if (Derived::Accept(record)) {
        records.push_back(std::move(record));
      }
    }
    SortById(records);
    return records;
  }

  /**
   * @brief Rewrite the whole file with the given records
   *
   * @param records
   */
  void Replace(const std::vector<Record>& records) const {
    std::vector<nlohmann::json> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
      rows.push_back(record.ToJSON());
    }
    jsonfile::WriteJsonLinesFile(_file, rows);
  }

  void Insert(const Record& record) const { jsonfile::AppendJsonLine(_file, record.ToJSON()); }

  static void SortById(std::vector<Record>& records) {
    std::stable_sort(records.begin(), records.end(), [](const Record& a, const Record& b) {
      return Derived::IdOf(a) < Derived::IdOf(b);
    });
  }
};

class ArchiveEntryMapper
    : public JsonLinesMapper<ArchiveEntryMapper, ArchiveEntry, archive_id_t> {
 public:
  using JsonLinesMapper::JsonLinesMapper;
  static auto Accept(const ArchiveEntry& entry) -> bool { return entry.id_ > 0; }
  static auto IdOf(const ArchiveEntry& entry) -> archive_id_t { return entry.id_; }
};

class VaultMapper : public JsonLinesMapper<VaultMapper, Vault, vault_id_t> {
 public:
  using JsonLinesMapper::JsonLinesMapper;
  // Vault 0 is implicit and never read back from disk
  static auto Accept(const Vault& vault) -> bool { return vault.id_ > 0; }
  static auto IdOf(const Vault& vault) -> vault_id_t { return vault.id_; }
};

class LogEntryMapper : public JsonLinesMapper<LogEntryMapper, LogEntry, log_id_t> {
 public:
  using JsonLinesMapper::JsonLinesMapper;
  // A record without a usable id cannot be addressed or checked
  static auto Accept(const LogEntry& entry) -> bool { return entry.id_ > 0; }
  static auto IdOf(const LogEntry& entry) -> log_id_t { return entry.id_; }
};
};  // namespace archiver
