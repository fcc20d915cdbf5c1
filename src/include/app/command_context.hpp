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

#include <memory>
#include <string>

#include "app/archive_service.hpp"
#include "app/audit_logger.hpp"
#include "app/check_service.hpp"
#include "app/config_service.hpp"
#include "app/log_service.hpp"
#include "app/vault_service.hpp"
#include "storage/metadata_store.hpp"
#include "type/type.hpp"

namespace archiver {
/**
 * @brief Everything one command invocation needs, wired around a single MetadataStore.
 *        The store is initialized before any service is handed out.
 */
class CommandContext {
 public:
  explicit CommandContext(const store_path_t& root);
  // Store root from ARCHIVER_HOME or $HOME/.archiver
  CommandContext();

  auto GetStore() const -> std::shared_ptr<MetadataStore> { return store_; }
  auto GetAuditLogger() const -> std::shared_ptr<AuditLogger> { return audit_logger_; }
  auto GetConfigService() const -> std::shared_ptr<ConfigService> { return config_service_; }
  auto GetArchiveService() const -> std::shared_ptr<ArchiveService> { return archive_service_; }
  auto GetVaultService() const -> std::shared_ptr<VaultService> { return vault_service_; }
  auto GetLogService() const -> std::shared_ptr<LogService> { return log_service_; }
  auto GetCheckService() const -> std::shared_ptr<CheckService> { return check_service_; }
  auto GetVersion() const -> std::string;

 private:
  void Wire();

  std::shared_ptr<MetadataStore>  store_;
  std::shared_ptr<AuditLogger>    audit_logger_;
  std::shared_ptr<ConfigService>  config_service_;
  std::shared_ptr<ArchiveService> archive_service_;
  std::shared_ptr<VaultService>   vault_service_;
  std::shared_ptr<LogService>     log_service_;
  std::shared_ptr<CheckService>   check_service_;
};
};  // namespace archiver
