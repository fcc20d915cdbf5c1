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

#include "storage/archiver_paths.hpp"

#include <cstdlib>

#include "type/error.hpp"
#include "utils/fs/fs_util.hpp"

namespace archiver {
namespace {
auto ReadEnv(const char* name) -> std::string {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return "";
  }
  std::string text(value);
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return "";
  }
  return text;
}
}  // namespace

ArchiverTree::ArchiverTree(const store_path_t& root)
    : root_(fsutil::Normalize(root)),
      logs_dir_(root_ / "logs"),
      vaults_dir_(root_ / "vaults"),
      config_file_(root_ / "config.jsonc"),
      auto_incr_file_(root_ / "auto-incr.jsonc"),
      list_file_(root_ / "list.jsonl"),
      vaults_file_(root_ / "vaults.jsonl") {}

auto ArchiverTree::LogFile(const std::string& period) const -> store_path_t {
  return logs_dir_ / (period + ".jsonl");
}

auto ArchiverTree::DefaultRoot() -> store_path_t {
  auto home_override = ReadEnv("ARCHIVER_HOME");
  if (!home_override.empty()) {
    return store_path_t(home_override);
  }
  auto home = ReadEnv("HOME");
  if (home.empty()) {
    throw ArchiverError(ErrorCode::NOT_FOUND,
                        "Cannot locate the store root: neither ARCHIVER_HOME nor HOME is set");
  }
  return store_path_t(home) / ".archiver";
}
};  // namespace archiver
