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

#include "app/command_context.hpp"

#include "storage/defaults.hpp"
#include "utils/log/logger.hpp"

namespace archiver {
CommandContext::CommandContext(const store_path_t& root)
    : store_(std::make_shared<MetadataStore>(root)) {
  Wire();
}

CommandContext::CommandContext() : store_(std::make_shared<MetadataStore>()) { Wire(); }

void CommandContext::Wire() {
  store_->Init();
  logging::Get()->debug("Store ready at {}", store_->Tree().root_.string());

  audit_logger_    = std::make_shared<AuditLogger>(store_);
  config_service_  = std::make_shared<ConfigService>(store_);
  archive_service_ = std::make_shared<ArchiveServiceImpl>(store_, audit_logger_);
  vault_service_   = std::make_shared<VaultServiceImpl>(store_, config_service_, audit_logger_);
  log_service_     = std::make_shared<LogService>(store_);
  check_service_   = std::make_shared<CheckService>(store_);
}

auto CommandContext::GetVersion() const -> std::string { return kVersion; }
};  // namespace archiver
