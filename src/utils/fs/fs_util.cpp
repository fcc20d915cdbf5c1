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

#include "utils/fs/fs_util.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>

#include "type/error.hpp"
#include "utils/log/logger.hpp"

namespace archiver {
namespace fsutil {
auto Normalize(const store_path_t& raw_path) -> store_path_t {
  auto normalized = std::filesystem::absolute(raw_path).lexically_normal();
  // "/a/b/" keeps an empty trailing element, which would break element-wise comparison
  if (!normalized.has_filename() && normalized != normalized.root_path()) {
    normalized = normalized.parent_path();
  }
  return normalized;
}

auto PathAccessible(const store_path_t& path) -> bool {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

auto SafeLstat(const store_path_t& path) -> std::optional<std::filesystem::file_status> {
  std::error_code ec;
  auto            status = std::filesystem::symlink_status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return std::nullopt;
  }
  if (ec) {
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Cannot stat {}: {}", path.string(), ec.message()));
  }
  return status;
}

auto SafeRealPath(const store_path_t& path) -> store_path_t {
  std::error_code ec;
  auto            canonical = std::filesystem::canonical(path, ec);
  if (ec) {
    return Normalize(path);
  }
  return canonical;
}

auto IsSamePath(const store_path_t& a, const store_path_t& b) -> bool {
  return Normalize(a) == Normalize(b);
}

auto IsSubPath(const store_path_t& parent, const store_path_t& child) -> bool {
  auto base   = Normalize(parent);
  auto target = Normalize(child);
  if (base == target) {
    return false;
  }
  auto mismatch = std::mismatch(base.begin(), base.end(), target.begin(), target.end());
  return mismatch.first == base.end();
}

auto IsParentOrSamePath(const store_path_t& candidate_parent, const store_path_t& target)
    -> bool {
  return IsSamePath(candidate_parent, target) || IsSubPath(candidate_parent, target);
}

void EnsureDir(const store_path_t& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Cannot create directory {}: {}", dir.string(), ec.message()));
  }
}

void EnsureFile(const store_path_t& file) {
  if (file.has_parent_path()) {
    EnsureDir(file.parent_path());
  }
  if (PathAccessible(file)) {
    return;
  }
  std::ofstream out(file);
  if (!out.is_open()) {
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Cannot create file {}", file.string()));
  }
}

auto ListChildren(const store_path_t& dir) -> std::vector<DirChild> {
  std::vector<DirChild>               children;
  std::error_code                     ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return children;
    }
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Cannot list directory {}: {}", dir.string(), ec.message()));
  }
  for (const auto& entry : it) {
    std::error_code type_ec;
    auto            status = entry.symlink_status(type_ec);
    children.push_back({entry.path().filename().string(),
                        !type_ec && std::filesystem::is_directory(status)});
  }
  std::sort(children.begin(), children.end(),
            [](const DirChild& a, const DirChild& b) { return a.name_ < b.name_; });
  return children;
}

auto ListDirectories(const store_path_t& dir) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& child : ListChildren(dir)) {
    if (child.is_directory_) {
      names.push_back(child.name_);
    }
  }
  return names;
}

void Rename(const store_path_t& from, const store_path_t& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    throw ArchiverError(ErrorCode::IO_FAILED, fmt::format("Cannot move {} to {}: {}",
                                                          from.string(), to.string(),
                                                          ec.message()));
  }
}

auto RemoveEmptyDirectory(const store_path_t& dir) -> bool {
  std::error_code ec;
  bool            removed = std::filesystem::remove(dir, ec);
  if (ec) {
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Cannot remove directory {}: {}", dir.string(), ec.message()));
  }
  return removed;
}

auto IsDigits(const std::string& text) -> bool {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

DirectoryGuard::DirectoryGuard(store_path_t dir, Mode mode) : dir_(std::move(dir)) {
  std::error_code ec;
  if (SafeLstat(dir_).has_value()) {
    if (mode == Mode::CREATE_NEW) {
      throw ArchiverError(ErrorCode::ALREADY_EXISTS,
                          fmt::format("Archive slot already exists: {}", dir_.string()));
    }
    return;
  }
  created_ = std::filesystem::create_directory(dir_, ec);
  if (ec) {
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Cannot create directory {}: {}", dir_.string(), ec.message()));
  }
}

DirectoryGuard::~DirectoryGuard() {
  if (!created_ || committed_) {
    return;
  }
  std::error_code ec;
  // remove() only deletes an empty directory; anything left inside stays for the checker
  std::filesystem::remove(dir_, ec);
  if (ec) {
    logging::Get()->warn("Rollback could not remove {}: {}", dir_.string(), ec.message());
  }
}
};  // namespace fsutil
};  // namespace archiver
