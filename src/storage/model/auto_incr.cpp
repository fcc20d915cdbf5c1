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

#include "storage/model/auto_incr.hpp"

#include <fmt/format.h>

#include <limits>

#include "type/error.hpp"
#include "utils/json/json_field.hpp"

namespace archiver {
auto CounterKindToString(CounterKind kind) -> const char* {
  switch (kind) {
    case CounterKind::ARCHIVE:
      return "archiveId";
    case CounterKind::VAULT:
      return "vaultId";
    case CounterKind::LOG:
      return "logId";
  }
  return "archiveId";
}

auto AutoIncrVars::Generator(CounterKind kind) -> IncrID::IDGenerator<uint32_t>& {
  switch (kind) {
    case CounterKind::VAULT:
      return _vault_id;
    case CounterKind::LOG:
      return _log_id;
    case CounterKind::ARCHIVE:
    default:
      return _archive_id;
  }
}

auto AutoIncrVars::Generator(CounterKind kind) const -> const IncrID::IDGenerator<uint32_t>& {
  return const_cast<AutoIncrVars*>(this)->Generator(kind);
}

auto AutoIncrVars::Next(CounterKind kind) -> uint32_t {
  auto& generator = Generator(kind);
  if (generator.GetCurrentID() == std::numeric_limits<uint32_t>::max()) {
    throw ArchiverError(ErrorCode::STATE_CONFLICT,
                        fmt::format("The {} counter is exhausted.", CounterKindToString(kind)));
  }
  return generator.GenerateID();
}

auto AutoIncrVars::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  for (auto kind : {CounterKind::ARCHIVE, CounterKind::VAULT, CounterKind::LOG}) {
    j[CounterKindToString(kind)] = Current(kind);
  }
  return j;
}

void AutoIncrVars::FromJSON(const nlohmann::json& j) {
  for (auto kind : {CounterKind::ARCHIVE, CounterKind::VAULT, CounterKind::LOG}) {
    Set(kind, jsonfield::ReadUInt(j, CounterKindToString(kind)).value_or(0));
  }
}
};  // namespace archiver
