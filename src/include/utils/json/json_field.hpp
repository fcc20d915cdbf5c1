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

namespace archiver {
namespace jsonfield {
// Lenient readers for hand-editable records. Each returns std::nullopt (or the fallback)
// when the key is absent or holds the wrong type.
auto ReadString(const nlohmann::json& j, const char* key, const std::string& fallback = "")
    -> std::string;
/**
 * @brief Read a non-negative 32-bit integer. Integral floats and digit-only strings are
 *        accepted, negative or fractional values are not.
 */
auto ReadUInt(const nlohmann::json& j, const char* key) -> std::optional<uint32_t>;
// "on"/"off" switch, anything other than "off" counts as on
auto ReadSwitch(const nlohmann::json& j, const char* key) -> bool;
};  // namespace jsonfield
};  // namespace archiver
