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

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace archiver {
namespace fsutil {
auto Normalize(const store_path_t& raw_path) -> store_path_t;

// True when the path resolves to something (symlinks are followed, broken links are not)
auto PathAccessible(const store_path_t& path) -> bool;
// lstat: std::nullopt when nothing exists at path, throws on any other failure
auto SafeLstat(const store_path_t& path) -> std::optional<std::filesystem::file_status>;
// realpath, or the lexically normalized absolute path when it cannot be resolved
auto SafeRealPath(const store_path_t& path) -> store_path_t;

auto IsSamePath(const store_path_t& a, const store_path_t& b) -> bool;
// Strict: a path is not a sub path of itself
auto IsSubPath(const store_path_t& parent, const store_path_t& child) -> bool;
auto IsParentOrSamePath(const store_path_t& candidate_parent, const store_path_t& target) -> bool;

void EnsureDir(const store_path_t& dir);
void EnsureFile(const store_path_t& file);
struct DirChild {
  std::string name_;
  // Symlinks report their own type, never the target's
  bool        is_directory_ = false;
};

// Direct children sorted by name, empty when the directory is missing
auto ListChildren(const store_path_t& dir) -> std::vector<DirChild>;
auto ListDirectories(const store_path_t& dir) -> std::vector<std::string>;

void Rename(const store_path_t& from, const store_path_t& to);
/**
 * @brief Remove an empty directory
 *
 * @return false if nothing was there, throws if the directory is not empty
 */
auto RemoveEmptyDirectory(const store_path_t& dir) -> bool;

auto IsDigits(const std::string& text) -> bool;

/**
 * @brief Compensating action for "create a directory, then move something into it".
 *        The guarded directory is removed again on destruction unless Commit() was
 *        called, and only if this guard created it and it is still empty.
 */
class DirectoryGuard {
 public:
  enum class Mode {
    CREATE_NEW,     // the directory must not exist yet
    CREATE_IF_MISSING
  };

  DirectoryGuard(store_path_t dir, Mode mode);
  ~DirectoryGuard();

  DirectoryGuard(const DirectoryGuard&)                    = delete;
  auto operator=(const DirectoryGuard&) -> DirectoryGuard& = delete;

  void Commit() { committed_ = true; }
  auto Created() const -> bool { return created_; }
  auto Path() const -> const store_path_t& { return dir_; }

 private:
  store_path_t dir_;
  bool         created_   = false;
  bool         committed_ = false;
};
};  // namespace fsutil
};  // namespace archiver
