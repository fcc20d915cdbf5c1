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

#include "utils/json/json_field.hpp"

#include <cmath>
#include <limits>

#include "utils/parse/parse.hpp"

namespace archiver {
namespace jsonfield {
auto ReadString(const nlohmann::json& j, const char* key, const std::string& fallback)
    -> std::string {
  if (!j.is_object() || !j.contains(key)) {
    return fallback;
  }
  const auto& value = j.at(key);
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number() || value.is_boolean()) {
    return value.dump();
  }
  return fallback;
}

auto ReadUInt(const nlohmann::json& j, const char* key) -> std::optional<uint32_t> {
  if (!j.is_object() || !j.contains(key)) {
    return std::nullopt;
  }
  const auto& value = j.at(key);
  constexpr auto kMax = std::numeric_limits<uint32_t>::max();
  if (value.is_number_unsigned()) {
    auto raw = value.get<uint64_t>();
    return raw <= kMax ? std::optional<uint32_t>(static_cast<uint32_t>(raw)) : std::nullopt;
  }
  if (value.is_number_integer()) {
    auto raw = value.get<int64_t>();
    if (raw < 0 || static_cast<uint64_t>(raw) > kMax) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(raw);
  }
  if (value.is_number_float()) {
    auto raw = value.get<double>();
    if (raw < 0 || raw > static_cast<double>(kMax) || std::floor(raw) != raw) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(raw);
  }
  if (value.is_string()) {
    return parse::ParseId(value.get<std::string>());
  }
  return std::nullopt;
}

auto ReadSwitch(const nlohmann::json& j, const char* key) -> bool {
  return ReadString(j, key, "on") != "off";
}
};  // namespace jsonfield
};  // namespace archiver
