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

#include <map>
#include <nlohmann/json.hpp>
#include <string>

#include "type/type.hpp"

namespace archiver {
/**
 * @brief Contents of config.jsonc. Every field has a default, so a missing or partially
 *        written document still yields a usable configuration.
 */
struct ArchiverConfig {
  vault_id_t                         current_vault_id_ = 0;
  bool                               update_check_     = true;
  std::string                        last_update_check_{};
  // alias -> absolute path
  std::map<std::string, std::string> alias_map_{};
  std::string                        vault_item_separator_ = "::";
  bool                               style_                = true;

  auto                               ToJSON() const -> nlohmann::json;
  void                               FromJSON(const nlohmann::json& j);
};
};  // namespace archiver
