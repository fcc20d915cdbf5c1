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
#include <memory>
#include <string>

#include "storage/metadata_store.hpp"
#include "storage/model/archiver_config.hpp"
#include "type/type.hpp"

namespace archiver {
/**
 * @brief Setting changes on config.jsonc. Every setter rewrites the document and returns
 *        the configuration as saved.
 */
class ConfigService {
 public:
  explicit ConfigService(std::shared_ptr<MetadataStore> store) : store_(std::move(store)) {}

  auto GetConfig() -> ArchiverConfig;

  auto SetUpdateCheck(bool enabled) -> ArchiverConfig;
  auto SetVaultItemSeparator(const std::string& separator) -> ArchiverConfig;
  auto SetStyle(bool enabled) -> ArchiverConfig;
  auto SetCurrentVault(vault_id_t vault_id) -> ArchiverConfig;
  // The target is stored as an absolute, normalized path
  auto AddAlias(const std::string& alias, const store_path_t& target) -> ArchiverConfig;
  auto RemoveAlias(const std::string& alias) -> ArchiverConfig;
  void UpdateLastCheck(const std::string& timestamp);

  /**
   * @brief Shorten a path with the alias whose mapped path is its longest ancestor.
   *        An exact match renders as the alias alone, a descendant as alias/relative,
   *        anything else as the absolute path.
   */
  static auto RenderPathWithAlias(const store_path_t&                       raw_path,
                                  const std::map<std::string, std::string>& alias_map)
      -> std::string;

 private:
  std::shared_ptr<MetadataStore> store_;
};
};  // namespace archiver
