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

#include <atomic>
#include <chrono>
#include <string>

namespace archiver {
class TimeProvider {
 private:
  static std::atomic<std::chrono::system_clock::time_point> _cached_sys_time;
  static std::atomic<std::chrono::steady_clock::time_point> _cached_steady_time;

 public:
  static void Refresh();
  static auto Now() -> std::chrono::system_clock::time_point;

  /**
   * @brief Local wall-clock time as "YYYY-MM-DD HH:MM:SS", used for archivedAt,
   *        createdAt and operedAt.
   */
  static auto TimePointToString(const std::chrono::system_clock::time_point& tp) -> std::string;
  /**
   * @brief Local "YYYYMM" period, used to pick logs/<period>.jsonl.
   */
  static auto TimePointToPeriod(const std::chrono::system_clock::time_point& tp) -> std::string;

  static auto NowString() -> std::string { return TimePointToString(Now()); }
  static auto NowPeriod() -> std::string { return TimePointToPeriod(Now()); }
};
}  // namespace archiver
