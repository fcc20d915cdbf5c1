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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace archiver {
enum class LogLevel : uint8_t { INFO = 0, WARN, ERROR, FATAL };
// Serialized as "u", "s" and "t"
enum class OperationSource : uint8_t { USER = 0, SYSTEM, TEST };

auto LogLevelToString(LogLevel level) -> const char*;
auto OperationSourceToString(OperationSource source) -> const char*;

/**
 * @brief The command an audit record describes
 */
struct Operation {
  std::string                    main_{};
  std::optional<std::string>     sub_{};
  std::vector<std::string>       args_{};
  // Flat object of string, number or boolean values
  nlohmann::json                 opts_ = nlohmann::json::object();
  std::optional<OperationSource> source_{};

  auto                           ToJSON() const -> nlohmann::json;
  void                           FromJSON(const nlohmann::json& j);
};

// Back references stored on an audit record
struct LogLinks {
  std::optional<archive_id_t> archive_id_{};
  std::optional<vault_id_t>   vault_id_{};
};

/**
 * @brief One line of logs/<YYYYMM>.jsonl. Records are append-only.
 */
struct LogEntry {
  log_id_t    id_ = 0;
  std::string opered_at_{};
  LogLevel    level_ = LogLevel::INFO;
  Operation   oper_{};
  std::string message_{};
  LogLinks    links_{};

  auto        ToJSON() const -> nlohmann::json;
  void        FromJSON(const nlohmann::json& j);
};
};  // namespace archiver
