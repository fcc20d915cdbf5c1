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

#include "utils/log/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <mutex>
#include <string>

namespace archiver {
namespace logging {
namespace {
constexpr const char* kLoggerName = "archiver";

auto LevelFromEnv() -> spdlog::level::level_enum {
  const char* raw = std::getenv("ARCHIVER_LOG_LEVEL");
  if (raw == nullptr || *raw == '\0') {
    return spdlog::level::warn;
  }
  // from_str maps unknown names to "off", which would hide real failures
  auto level = spdlog::level::from_str(raw);
  if (level == spdlog::level::off && std::string(raw) != "off") {
    return spdlog::level::warn;
  }
  return level;
}
}  // namespace

auto Get() -> std::shared_ptr<spdlog::logger> {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() {
    if (spdlog::get(kLoggerName) != nullptr) {
      return;
    }
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(LevelFromEnv());
  });
  return spdlog::get(kLoggerName);
}
};  // namespace logging
};  // namespace archiver
