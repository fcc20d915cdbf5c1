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

#include "storage/model/log_entry.hpp"

#include "utils/json/json_field.hpp"

namespace archiver {
auto LogLevelToString(LogLevel level) -> const char* {
  switch (level) {
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
  }
  return "INFO";
}

auto OperationSourceToString(OperationSource source) -> const char* {
  switch (source) {
    case OperationSource::USER:
      return "u";
    case OperationSource::SYSTEM:
      return "s";
    case OperationSource::TEST:
      return "t";
  }
  return "u";
}

auto Operation::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["main"] = main_;
  if (sub_.has_value()) {
    j["sub"] = sub_.value();
  }
  if (!args_.empty()) {
    j["args"] = args_;
  }
  if (opts_.is_object() && !opts_.empty()) {
    j["opts"] = opts_;
  }
  if (source_.has_value()) {
    j["source"] = OperationSourceToString(source_.value());
  }
  return j;
}

void Operation::FromJSON(const nlohmann::json& j) {
  main_ = jsonfield::ReadString(j, "main");
  sub_.reset();
  if (j.is_object() && j.contains("sub") && j.at("sub").is_string()) {
    sub_ = j.at("sub").get<std::string>();
  }

  args_.clear();
  if (j.is_object() && j.contains("args") && j.at("args").is_array()) {
    for (const auto& arg : j.at("args")) {
      if (arg.is_string()) {
        args_.push_back(arg.get<std::string>());
      }
    }
  }

  opts_ = nlohmann::json::object();
  if (j.is_object() && j.contains("opts") && j.at("opts").is_object()) {
    for (const auto& [key, value] : j.at("opts").items()) {
      if (value.is_string() || value.is_number() || value.is_boolean()) {
        opts_[key] = value;
      }
    }
  }

  auto source = jsonfield::ReadString(j, "source");
  if (source == "u") {
    source_ = OperationSource::USER;
  } else if (source == "s") {
    source_ = OperationSource::SYSTEM;
  } else if (source == "t") {
    source_ = OperationSource::TEST;
  } else {
    source_.reset();
  }
}

auto LogEntry::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]       = id_;
  j["operedAt"] = opered_at_;
  j["level"]    = LogLevelToString(level_);
  j["oper"]     = oper_.ToJSON();
  j["message"]  = message_;
  if (links_.archive_id_.has_value()) {
    j["archiveIds"] = links_.archive_id_.value();
  }
  if (links_.vault_id_.has_value()) {
    j["vaultIds"] = links_.vault_id_.value();
  }
  return j;
}

void LogEntry::FromJSON(const nlohmann::json& j) {
  id_        = jsonfield::ReadUInt(j, "id").value_or(0);
  opered_at_ = jsonfield::ReadString(j, "operedAt");

  auto level = jsonfield::ReadString(j, "level");
  if (level == "WARN") {
    level_ = LogLevel::WARN;
  } else if (level == "ERROR") {
    level_ = LogLevel::ERROR;
  } else if (level == "FATAL") {
    level_ = LogLevel::FATAL;
  } else {
    level_ = LogLevel::INFO;
  }

  oper_ = Operation{};
  if (j.is_object() && j.contains("oper")) {
    oper_.FromJSON(j.at("oper"));
  }
  message_           = jsonfield::ReadString(j, "message");
  links_.archive_id_ = jsonfield::ReadUInt(j, "archiveIds");
  links_.vault_id_   = jsonfield::ReadUInt(j, "vaultIds");
}
};  // namespace archiver
