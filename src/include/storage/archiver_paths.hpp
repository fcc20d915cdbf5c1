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

#include <string>

#include "type/type.hpp"

namespace archiver {
/**
 * @brief Fixed layout of a store root:
 *
 *   <root>/config.jsonc
 *   <root>/auto-incr.jsonc
 *   <root>/list.jsonl
 *   <root>/vaults.jsonl
 *   <root>/logs/<YYYYMM>.jsonl
 *   <root>/vaults/<vault id>/<archive id>/<item>
 */
struct ArchiverTree {
  store_path_t root_;
  store_path_t logs_dir_;
  store_path_t vaults_dir_;
  store_path_t config_file_;
  store_path_t auto_incr_file_;
  store_path_t list_file_;
  store_path_t vaults_file_;

  explicit ArchiverTree(const store_path_t& root);

  auto LogFile(const std::string& period) const -> store_path_t;

  /**
   * @brief $ARCHIVER_HOME when set and non-blank, otherwise $HOME/.archiver
   *
   * @return store_path_t
   */
  static auto DefaultRoot() -> store_path_t;
};
};  // namespace archiver
