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

#include "app/cd_handoff.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <fstream>

#include "type/error.hpp"
#include "utils/fs/fs_util.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
namespace cd {
auto FormatCdLine(const store_path_t& slot_path, bool print_only) -> std::string {
  auto absolute = fsutil::Normalize(slot_path).string();
  if (print_only) {
    return absolute;
  }
  return std::string(kCdMarker) + absolute;
}

void EmitCd(std::ostream& out, const store_path_t& slot_path, bool print_only) {
  out << FormatCdLine(slot_path, print_only) << '\n';
}

auto WriteCwdHandoff(const store_path_t& slot_path) -> bool {
  const char* target = std::getenv(kHandoffFileEnv);
  if (target == nullptr) {
    return false;
  }
  auto file = parse::Trim(target);
  if (file.empty()) {
    return false;
  }

  std::ofstream out(file, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Cannot write the cwd hand-off file {}", file));
  }
  out << fsutil::Normalize(slot_path).string() << '\n';
  if (!out.good()) {
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Cannot write the cwd hand-off file {}", file));
  }
  return true;
}
};  // namespace cd
};  // namespace archiver
