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

#include "storage/model/vault.hpp"

#include <fmt/format.h>

#include "utils/json/json_field.hpp"

namespace archiver {
auto VaultStatusToString(VaultStatus status) -> const char* {
  switch (status) {
    case VaultStatus::VALID:
      return "Valid";
    case VaultStatus::REMOVED:
      return "Removed";
    case VaultStatus::PROTECTED:
      return "Protected";
  }
  return "Valid";
}

auto Vault::Label() const -> std::string { return fmt::format("{}({})", name_, id_); }

auto Vault::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]        = id_;
  j["name"]      = name_;
  j["remark"]    = remark_;
  j["createdAt"] = created_at_;
  j["status"]    = VaultStatusToString(status_);
  return j;
}

void Vault::FromJSON(const nlohmann::json& j) {
  id_         = jsonfield::ReadUInt(j, "id").value_or(0);
  name_       = jsonfield::ReadString(j, "name");
  remark_     = jsonfield::ReadString(j, "remark");
  created_at_ = jsonfield::ReadString(j, "createdAt");

  auto status = jsonfield::ReadString(j, "status");
  if (status == "Removed") {
    status_ = VaultStatus::REMOVED;
  } else if (status == "Protected") {
    status_ = VaultStatus::PROTECTED;
  } else {
    status_ = VaultStatus::VALID;
  }
}
};  // namespace archiver
