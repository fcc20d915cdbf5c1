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
// PROTECTED is reserved for the implicit default vault
enum class VaultStatus : uint8_t { VALID = 0, REMOVED, PROTECTED };

auto VaultStatusToString(VaultStatus status) -> const char*;

struct Vault {
  vault_id_t  id_ = 0;
  std::string name_{};
  std::string remark_{};
  std::string created_at_{};
  VaultStatus status_ = VaultStatus::VALID;

  auto        IsRemoved() const -> bool { return status_ == VaultStatus::REMOVED; }
  // "name(id)", the form used wherever a vault is shown next to an entry
  auto        Label() const -> std::string;

  auto        ToJSON() const -> nlohmann::json;
  void        FromJSON(const nlohmann::json& j);
};
};  // namespace archiver
