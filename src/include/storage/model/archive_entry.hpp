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
#include <nlohmann/json.hpp>
#include <string>

#include "type/type.hpp"

namespace archiver {
enum class ArchiveStatus : uint8_t { ARCHIVED = 0, RESTORED };

auto ArchiveStatusToString(ArchiveStatus status) -> const char*;

/**
 * @brief One line of list.jsonl. While ARCHIVED the object lives at
 *        vaults/<vault_id_>/<id_>/<item_>; while RESTORED it is back at directory_/item_.
 */
struct ArchiveEntry {
  archive_id_t  id_       = 0;
  vault_id_t    vault_id_ = 0;
  std::string   item_{};
  // Absolute parent directory of the original location
  std::string   directory_{};
  ArchiveStatus status_       = ArchiveStatus::ARCHIVED;
  bool          is_directory_ = false;
  std::string   archived_at_{};
  std::string   message_{};
  std::string   remark_{};

  auto          IsArchived() const -> bool { return status_ == ArchiveStatus::ARCHIVED; }
  auto          OriginalPath() const -> store_path_t {
    return store_path_t(directory_) / item_;
  }

  auto ToJSON() const -> nlohmann::json;
  // Lenient: wrong-typed fields fall back to defaults, a missing or invalid id becomes 0
  void FromJSON(const nlohmann::json& j);
};
};  // namespace archiver
