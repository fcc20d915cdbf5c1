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

#include "type/type.hpp"
#include "utils/id/id_generator.hpp"

namespace archiver {
enum class CounterKind : uint8_t { ARCHIVE = 0, VAULT, LOG };

auto CounterKindToString(CounterKind kind) -> const char*;

/**
 * @brief The three persisted counters of auto-incr.jsonc. Each holds the last id issued.
 */
class AutoIncrVars {
 private:
  IncrID::IDGenerator<archive_id_t> _archive_id;
  IncrID::IDGenerator<vault_id_t>   _vault_id;
  IncrID::IDGenerator<log_id_t>     _log_id;

  auto Generator(CounterKind kind) -> IncrID::IDGenerator<uint32_t>&;
  auto Generator(CounterKind kind) const -> const IncrID::IDGenerator<uint32_t>&;

 public:
  AutoIncrVars() = default;

  // Throws STATE_CONFLICT once the counter has reached the largest 32-bit id
  auto Next(CounterKind kind) -> uint32_t;
  auto Current(CounterKind kind) const -> uint32_t { return Generator(kind).GetCurrentID(); }
  auto Predict(CounterKind kind, uint32_t offset) const -> uint32_t {
    return Generator(kind).PredictID(offset);
  }
  void Set(CounterKind kind, uint32_t value) { Generator(kind).SetStartID(value); }

  auto ToJSON() const -> nlohmann::json;
  // Negative, fractional or wrong-typed counters reset to 0
  void FromJSON(const nlohmann::json& j);
};
};  // namespace archiver
