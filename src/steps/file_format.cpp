// Copyright 2026 Rossi Sun
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <stepline/steps/file_format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace sl {
namespace steps {

namespace {

constexpr std::array<std::pair<FileFormat, const char*>, 7> kFormats = {{
    {FileFormat::JSON, "json"},
    {FileFormat::CSV, "csv"},
    {FileFormat::PARQUET, "parquet"},
    {FileFormat::AVRO, "avro"},
    {FileFormat::ORC, "orc"},
    {FileFormat::TEXT, "text"},
    {FileFormat::BINARYFILE, "binaryfile"},
}};

}  // namespace

std::string FileFormatToString(FileFormat format) {
  for (const auto& [value, name] : kFormats) {
    if (value == format) {
      return name;
    }
  }
  return "unknown";
}

Result<FileFormat> ParseFileFormat(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& [value, candidate] : kFormats) {
    if (lowered == candidate) {
      return value;
    }
  }
  std::string accepted;
  for (const auto& [value, candidate] : kFormats) {
    accepted += accepted.empty() ? "" : ", ";
    accepted += candidate;
  }
  return Status::Invalid("unsupported file format '", name, "', expected one of: ",
                         accepted);
}

}  // namespace steps
}  // namespace sl
