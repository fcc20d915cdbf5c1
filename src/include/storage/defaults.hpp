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

#include <cstddef>

#include "storage/model/archiver_config.hpp"
#include "storage/model/auto_incr.hpp"
#include "storage/model/vault.hpp"
#include "type/type.hpp"

namespace archiver {
// Reported to the update checker
inline constexpr const char* kVersion = "0.1.0";

namespace defaults {
inline constexpr vault_id_t  kDefaultVaultId   = 0;
inline constexpr const char* kDefaultVaultName = "@";
// Number of records shown by a log query without a range
inline constexpr size_t      kLogTail          = 15;

// Seed documents written by Init(), comments included
extern const char* const     kConfigTemplate;
extern const char* const     kAutoIncrTemplate;

auto                         DefaultVault() -> Vault;
auto                         DefaultConfig() -> ArchiverConfig;
auto                         DefaultAutoIncr() -> AutoIncrVars;
};  // namespace defaults
};  // namespace archiver
