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

#include "utils/json/json_file.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "type/error.hpp"
#include "utils/log/logger.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
namespace jsonfile {
namespace {
auto IsBlank(const std::string& text) -> bool {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

void WriteText(const store_path_t& file, const std::string& text, std::ios::openmode mode) {
  std::ofstream out(file, mode);
  if (!out.is_open()) {
    throw ArchiverError(ErrorCode::IO_FAILED,
                        fmt::format("Failed to open {} for writing", file.string()));
  }
  out << text;
  out.flush();
  if (!out.good()) {
    throw ArchiverError(ErrorCode::IO_FAILED, fmt::format("Failed to write {}", file.string()));
  }
}
}  // namespace

auto ReadFileIfExists(const store_path_t& file) -> std::optional<std::string> {
  std::ifstream in(file);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

auto ParseJsoncText(const std::string& content, const store_path_t& file) -> nlohmann::json {
  try {
    return nlohmann::json::parse(content, nullptr, true, true);
  } catch (const nlohmann::json::parse_error& e) {
    throw ArchiverError(ErrorCode::PARSE_FAILED,
                        fmt::format("Cannot parse JSONC file {}: {}", file.string(), e.what()));
  }
}

auto ReadJsoncFile(const store_path_t& file, const nlohmann::json& fallback) -> nlohmann::json {
  auto content = ReadFileIfExists(file);
  if (!content.has_value() || IsBlank(content.value())) {
    return fallback;
  }
  return ParseJsoncText(content.value(), file);
}

auto LeadingComment(const std::string& template_raw) -> std::string {
  std::istringstream in(template_raw);
  std::string        line;
  std::string        comment;
  while (std::getline(in, line)) {
    auto trimmed = parse::Trim(line);
    if (trimmed.rfind("//", 0) != 0) {
      break;
    }
    comment += line + "\n";
  }
  return comment;
}

void WriteJsonFile(const store_path_t& file, const nlohmann::json& value,
                   const std::string& leading_comment) {
  WriteText(file, leading_comment + value.dump(2) + "\n", std::ios::out | std::ios::trunc);
}

void EnsureJsoncFileWithTemplate(const store_path_t& file, const std::string& template_raw) {
  if (ReadFileIfExists(file).has_value()) {
    return;
  }
  auto text = template_raw;
  if (text.empty() || text.back() != '\n') {
    text += "\n";
  }
  WriteText(file, text, std::ios::out | std::ios::trunc);
}

auto ReadJsonLinesFile(const store_path_t& file) -> std::vector<nlohmann::json> {
  std::vector<nlohmann::json> rows;
  std::ifstream               in(file);
  if (!in.is_open()) {
    return rows;
  }

  std::string line;
  size_t      line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto trimmed = parse::Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    try {
      rows.push_back(nlohmann::json::parse(trimmed));
    } catch (const nlohmann::json::parse_error& e) {
      logging::Get()->warn("Skipping invalid JSONL line {} in {}: {}", line_no, file.string(),
                           e.what());
    }
  }
  return rows;
}

void WriteJsonLinesFile(const store_path_t& file, const std::vector<nlohmann::json>& rows) {
  std::string content;
  for (const auto& row : rows) {
    content += row.dump() + "\n";
  }
  WriteText(file, content, std::ios::out | std::ios::trunc);
}

void AppendJsonLine(const store_path_t& file, const nlohmann::json& row) {
  WriteText(file, row.dump() + "\n", std::ios::out | std::ios::app);
}
};  // namespace jsonfile
};  // namespace archiver
