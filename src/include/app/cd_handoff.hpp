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

#include <ostream>
#include <string>

#include "type/type.hpp"

namespace archiver {
namespace cd {
// Prefix a shell wrapper looks for on stdout
inline constexpr const char* kCdMarker       = "__ARCHIVER_CD__:";
inline constexpr const char* kHandoffFileEnv = "ARV_CWD_HANDOFF_FILE";

auto FormatCdLine(const store_path_t& slot_path, bool print_only) -> std::string;
void EmitCd(std::ostream& out, const store_path_t& slot_path, bool print_only);
/**
 * @brief Write "<slot path>\n" to the file named by ARV_CWD_HANDOFF_FILE
 *
 * @return false when the variable is unset or blank, nothing is written then
 */
auto WriteCwdHandoff(const store_path_t& slot_path) -> bool;
};  // namespace cd
};  // namespace archiver
