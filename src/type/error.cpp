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

#include "type/error.hpp"

namespace archiver {
auto ErrorCodeToString(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case ErrorCode::NOT_FOUND:
      return "NOT_FOUND";
    case ErrorCode::ALREADY_EXISTS:
      return "ALREADY_EXISTS";
    case ErrorCode::STATE_CONFLICT:
      return "STATE_CONFLICT";
    case ErrorCode::REMOVED_VAULT_EXISTS:
      return "REMOVED_VAULT_EXISTS";
    case ErrorCode::FORBIDDEN_PATH:
      return "FORBIDDEN_PATH";
    case ErrorCode::IO_FAILED:
      return "IO_FAILED";
    case ErrorCode::PARSE_FAILED:
      return "PARSE_FAILED";
    case ErrorCode::UNKNOWN:
      break;
  }
  return "UNKNOWN";
}
};  // namespace archiver
