/*
 * @file        archiver/src/include/type/type.hpp
 * @brief       collection of wrapper types
 * @author      Yurun Zi
 * @date        2026-01-12
 * @license     Apache-2.0
 *
 * @copyright   Copyright (c) 2026 Yurun Zi
 */

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
#include <filesystem>

namespace archiver {

// Physical locations inside and outside the store
#define store_path_t std::filesystem::path

// Used in list.jsonl and the slot layout
#define archive_id_t uint32_t

// Used in vaults.jsonl, vault 0 is the default vault
#define vault_id_t   uint32_t

// Used in logs/<period>.jsonl
#define log_id_t     uint32_t

};  // namespace archiver
