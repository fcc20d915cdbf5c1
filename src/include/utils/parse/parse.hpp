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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace archiver {
enum class LogRangeMode : uint8_t { TAIL = 0, ALL, MONTH };

struct LogRange {
  LogRangeMode mode_ = LogRangeMode::TAIL;
  // Inclusive YYYYMM bounds, only meaningful for MONTH
  std::string  from_{};
  std::string  to_{};
};

struct VaultReference {
  std::optional<vault_id_t>  id_{};
  std::optional<std::string> name_{};
};

namespace parse {
auto ParseIdList(const std::vector<std::string>& values) -> std::vector<archive_id_t>;
auto ParseLogRange(const std::string& range) -> LogRange;
auto ParseVaultReference(const std::string& value) -> VaultReference;
// Digit-only text to a 32-bit id, std::nullopt on anything else (including overflow)
auto ParseId(const std::string& text) -> std::optional<uint32_t>;
// Strips spaces, tabs and line breaks from both ends
auto Trim(const std::string& text) -> std::string;
};  // namespace parse
};  // namespace archiver
