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
#include <stdexcept>
#include <string>

namespace archiver {
enum class ErrorCode : uint8_t {
  UNKNOWN = 0,
  INVALID_ARGUMENT,
  NOT_FOUND,
  ALREADY_EXISTS,
  STATE_CONFLICT,
  // Create was refused because a removed vault owns the name; callers may offer recovery
  REMOVED_VAULT_EXISTS,
  FORBIDDEN_PATH,
  IO_FAILED,
  PARSE_FAILED
};

auto ErrorCodeToString(ErrorCode code) -> const char*;

class ArchiverError : public std::runtime_error {
 public:
  ArchiverError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  auto Code() const -> ErrorCode { return code_; }

 private:
  ErrorCode code_;
};
};  // namespace archiver
