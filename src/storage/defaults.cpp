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

#include "storage/defaults.hpp"

#include "utils/json/json_file.hpp"

namespace archiver {
namespace defaults {
const char* const kConfigTemplate = R"(// archiver configuration
// currentVaultId     : vault used when a command names none (0 is the default vault "@")
// updateCheck        : "on" | "off"
// lastUpdateCheck    : time of the last update check, maintained by the tool
// aliasMap           : alias -> absolute path, used when paths are displayed
// vaultItemSeparator : separator between vault and item in displayed references
// style              : "on" | "off", colored output
{
  "currentVaultId": 0,
  "updateCheck": "on",
  "lastUpdateCheck": "",
  "aliasMap": {},
  "vaultItemSeparator": "::",
  "style": "on"
}
)";

const char* const kAutoIncrTemplate = R"(// Last issued ids. Maintained by the tool, do not lower these values by hand.
{
  "archiveId": 0,
  "vaultId": 0,
  "logId": 0
}
)";

auto DefaultVault() -> Vault {
  Vault vault;
  vault.id_         = kDefaultVaultId;
  vault.name_       = kDefaultVaultName;
  vault.remark_     = "Default vault";
  vault.created_at_ = "system";
  vault.status_     = VaultStatus::PROTECTED;
  return vault;
}

auto DefaultConfig() -> ArchiverConfig {
  ArchiverConfig config;
  config.FromJSON(jsonfile::ParseJsoncText(kConfigTemplate, "config.default.jsonc"));
  return config;
}

auto DefaultAutoIncr() -> AutoIncrVars {
  AutoIncrVars vars;
  vars.FromJSON(jsonfile::ParseJsoncText(kAutoIncrTemplate, "auto-incr.default.jsonc"));
  return vars;
}
};  // namespace defaults
};  // namespace archiver
