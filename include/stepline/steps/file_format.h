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

#pragma once

#include <string>
#include <string_view>

#include <stepline/result.h>

namespace sl {
namespace steps {

enum class FileFormat {
  JSON,
  CSV,
  PARQUET,
  AVRO,
  ORC,
  TEXT,
  BINARYFILE,
};

/// @brief Lower-case name, e.g. `csv`.
std::string FileFormatToString(FileFormat format);

/// @brief Case-insensitive parse. `Invalid` listing the accepted names otherwise.
Result<FileFormat> ParseFileFormat(std::string_view name);

}  // namespace steps
}  // namespace sl
