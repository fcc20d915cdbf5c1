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

#include "storage/model/archiver_config.hpp"

#include "utils/json/json_field.hpp"

namespace archiver {
auto ArchiverConfig::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["currentVaultId"]     = current_vault_id_;
  j["updateCheck"]        = update_check_ ? "on" : "off";
  j["lastUpdateCheck"]    = last_update_check_;
  j["aliasMap"]           = nlohmann::json::object();
  for (const auto& [alias, path] : alias_map_) {
    j["aliasMap"][alias] = path;
  }
  j["vaultItemSeparator"] = vault_item_separator_;
  j["style"]              = style_ ? "on" : "off";
  return j;
}

void ArchiverConfig::FromJSON(const nlohmann::json& j) {
  ArchiverConfig defaults;
  current_vault_id_  = jsonfield::ReadUInt(j, "currentVaultId").value_or(defaults.current_vault_id_);
  update_check_      = jsonfield::ReadSwitch(j, "updateCheck");
  last_update_check_ = jsonfield::ReadString(j, "lastUpdateCheck");

  alias_map_.clear();
  if (j.is_object() && j.contains("aliasMap") && j.at("aliasMap").is_object()) {
    for (const auto& [alias, path] : j.at("aliasMap").items()) {
      if (path.is_string()) {
        alias_map_[alias] = path.get<std::string>();
      }
    }
  }

  vault_item_separator_ = jsonfield::ReadString(j, "vaultItemSeparator");
  if (vault_item_separator_.empty()) {
    vault_item_separator_ = defaults.vault_item_separator_;
  }
  style_ = jsonfield::ReadSwitch(j, "style");
}
};  // namespace archiver
