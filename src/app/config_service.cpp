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

#include "app/config_service.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "type/error.hpp"
#include "utils/fs/fs_util.hpp"

namespace archiver {
auto ConfigService::GetConfig() -> ArchiverConfig { return store_->LoadConfig(); }

auto ConfigService::SetUpdateCheck(bool enabled) -> ArchiverConfig {
  auto config          = store_->LoadConfig();
  config.update_check_ = enabled;
  store_->SaveConfig(config);
  return config;
}

auto ConfigService::SetVaultItemSeparator(const std::string& separator) -> ArchiverConfig {
  if (separator.empty()) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "Vault item separator cannot be empty.");
  }
  auto config                  = store_->LoadConfig();
  config.vault_item_separator_ = separator;
  store_->SaveConfig(config);
  return config;
}

auto ConfigService::SetStyle(bool enabled) -> ArchiverConfig {
  auto config   = store_->LoadConfig();
  config.style_ = enabled;
  store_->SaveConfig(config);
  return config;
}

auto ConfigService::SetCurrentVault(vault_id_t vault_id) -> ArchiverConfig {
  auto config              = store_->LoadConfig();
  config.current_vault_id_ = vault_id;
  store_->SaveConfig(config);
  return config;
}

auto ConfigService::AddAlias(const std::string& alias, const store_path_t& target)
    -> ArchiverConfig {
  if (alias.find_first_not_of(" \t") == std::string::npos) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "Alias cannot be empty.");
  }
  auto config              = store_->LoadConfig();
  config.alias_map_[alias] = fsutil::Normalize(target).string();
  store_->SaveConfig(config);
  return config;
}

auto ConfigService::RemoveAlias(const std::string& alias) -> ArchiverConfig {
  auto config = store_->LoadConfig();
  config.alias_map_.erase(alias);
  store_->SaveConfig(config);
  return config;
}

void ConfigService::UpdateLastCheck(const std::string& timestamp) {
  auto config               = store_->LoadConfig();
  config.last_update_check_ = timestamp;
  store_->SaveConfig(config);
}

auto ConfigService::RenderPathWithAlias(const store_path_t&                       raw_path,
                                        const std::map<std::string, std::string>& alias_map)
    -> std::string {
  auto full = fsutil::Normalize(raw_path);

  std::vector<std::pair<std::string, store_path_t>> candidates;
  for (const auto& [alias, mapped] : alias_map) {
    candidates.emplace_back(alias, fsutil::Normalize(mapped));
  }
  std::stable_sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
    return a.second.native().size() > b.second.native().size();
  });

  for (const auto& [alias, mapped] : candidates) {
    if (full == mapped) {
      return alias;
    }
    if (fsutil::IsSubPath(mapped, full)) {
      return (store_path_t(alias) / full.lexically_relative(mapped)).string();
    }
  }
  return full.string();
}
};  // namespace archiver
