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

#include "storage/model/archive_entry.hpp"

#include "utils/json/json_field.hpp"

namespace archiver {
auto ArchiveStatusToString(ArchiveStatus status) -> const char* {
  switch (status) {
    case ArchiveStatus::ARCHIVED:
      return "Archived";
    case ArchiveStatus::RESTORED:
      return "Restored";
  }
  return "Archived";
}

auto ArchiveEntry::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]          = id_;
  j["vaultId"]     = vault_id_;
  j["item"]        = item_;
  j["directory"]   = directory_;
  j["status"]      = ArchiveStatusToString(status_);
  j["isDirectory"] = is_directory_ ? 1 : 0;
  j["archivedAt"]  = archived_at_;
  j["message"]     = message_;
  j["remark"]      = remark_;
  return j;
}

void ArchiveEntry::FromJSON(const nlohmann::json& j) {
  id_        = jsonfield::ReadUInt(j, "id").value_or(0);
  vault_id_  = jsonfield::ReadUInt(j, "vaultId").value_or(0);
  item_      = jsonfield::ReadString(j, "item");
  directory_ = jsonfield::ReadString(j, "directory");
  status_ = jsonfield::ReadString(j, "status") == "Restored" ? ArchiveStatus::RESTORED
                                                             : ArchiveStatus::ARCHIVED;
  is_directory_ = false;
  if (j.is_object() && j.contains("isDirectory")) {
    const auto& flag = j.at("isDirectory");
    is_directory_    = (flag.is_boolean() && flag.get<bool>()) ||
                    (flag.is_number() && flag.get<double>() == 1.0);
  }
  archived_at_ = jsonfield::ReadString(j, "archivedAt");
  message_     = jsonfield::ReadString(j, "message");
  remark_      = jsonfield::ReadString(j, "remark");
}
};  // namespace archiver
