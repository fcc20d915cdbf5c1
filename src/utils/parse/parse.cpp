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

#include "utils/parse/parse.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_set>

#include "type/error.hpp"
#include "utils/fs/fs_util.hpp"

namespace archiver {
namespace parse {
namespace {
auto IsYearMonth(const std::string& text) -> bool {
  if (text.size() != 6 || !fsutil::IsDigits(text)) {
    return false;
  }
  int month = std::stoi(text.substr(4, 2));
  return month >= 1 && month <= 12;
}
}  // namespace

auto ParseId(const std::string& text) -> std::optional<uint32_t> {
  if (!fsutil::IsDigits(text)) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (char c : text) {
    value = value * 10 + static_cast<uint64_t>(c - '0');
    if (value > std::numeric_limits<uint32_t>::max()) {
      return std::nullopt;
    }
  }
  return static_cast<uint32_t>(value);
}

auto Trim(const std::string& text) -> std::string {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

auto ParseIdList(const std::vector<std::string>& values) -> std::vector<archive_id_t> {
  if (values.empty()) {
    throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "At least one id is required.");
  }

  std::vector<archive_id_t>        ids;
  std::unordered_set<archive_id_t> seen;
  for (const auto& value : values) {
    auto id = ParseId(value);
    if (!id.has_value()) {
      throw ArchiverError(ErrorCode::INVALID_ARGUMENT, fmt::format("Invalid id: {}", value));
    }
    if (!seen.insert(id.value()).second) {
      throw ArchiverError(ErrorCode::INVALID_ARGUMENT, "Duplicate ids are not allowed.");
    }
    ids.push_back(id.value());
  }
  return ids;
}

auto ParseLogRange(const std::string& range) -> LogRange {
  if (range.empty()) {
    return {LogRangeMode::ALL, "", ""};
  }

  std::string lowered = range;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "all" || lowered == "*" || lowered == "a") {
    return {LogRangeMode::ALL, "", ""};
  }

  if (range.size() == 6 && fsutil::IsDigits(range)) {
    if (!IsYearMonth(range)) {
      throw ArchiverError(ErrorCode::INVALID_ARGUMENT,
                          fmt::format("Invalid month range: {}", range));
    }
    return {LogRangeMode::MONTH, range, range};
  }

  auto dash = range.find('-');
  if (dash != std::string::npos && range.find('-', dash + 1) == std::string::npos) {
    auto from = range.substr(0, dash);
    auto to   = range.substr(dash + 1);
    if (from.size() == 6 && to.size() == 6 && fsutil::IsDigits(from) && fsutil::IsDigits(to)) {
      if (!IsYearMonth(from) || !IsYearMonth(to)) {
        throw ArchiverError(ErrorCode::INVALID_ARGUMENT, fmt::format("Invalid range: {}", range));
      }
      if (from > to) {
        throw ArchiverError(ErrorCode::INVALID_ARGUMENT,
                            fmt::format("Range start is after range end: {}", range));
      }
      return {LogRangeMode::MONTH, from, to};
    }
  }

  throw ArchiverError(ErrorCode::INVALID_ARGUMENT,
                      fmt::format("Invalid range format: {} (use YYYYMM or YYYYMM-YYYYMM)", range));
}

auto ParseVaultReference(const std::string& value) -> VaultReference {
  VaultReference ref;
  auto           id = ParseId(value);
  if (id.has_value()) {
    ref.id_ = id;
  } else {
    ref.name_ = value;
  }
  return ref;
}
};  // namespace parse
};  // namespace archiver
