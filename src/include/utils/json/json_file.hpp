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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace archiver {
namespace jsonfile {
auto ReadFileIfExists(const store_path_t& file) -> std::optional<std::string>;

/**
 * @brief Parse a JSON document that may carry // and block comments
 *
 * @param content
 * @param file used in the error message only
 * @return nlohmann::json
 */
auto ParseJsoncText(const std::string& content, const store_path_t& file) -> nlohmann::json;
// Missing or blank file yields the fallback
auto ReadJsoncFile(const store_path_t& file, const nlohmann::json& fallback) -> nlohmann::json;

// The leading comment block of a template is kept when the document is rewritten
auto LeadingComment(const std::string& template_raw) -> std::string;
void WriteJsonFile(const store_path_t& file, const nlohmann::json& value,
                   const std::string& leading_comment = "");
void EnsureJsoncFileWithTemplate(const store_path_t& file, const std::string& template_raw);

/**
 * @brief Read a newline-delimited JSON file. Blank lines are ignored; a line that does not
 *        parse (hand edit, interrupted append) is skipped with a warning.
 */
auto ReadJsonLinesFile(const store_path_t& file) -> std::vector<nlohmann::json>;
void WriteJsonLinesFile(const store_path_t& file, const std::vector<nlohmann::json>& rows);
void AppendJsonLine(const store_path_t& file, const nlohmann::json& row);
};  // namespace jsonfile
};  // namespace archiver
