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

#include <memory>
#include <string>

#include <stepline/step.h>
#include <stepline/steps/file_format.h>

namespace arrow {
class Table;
}  // namespace arrow

namespace sl {
namespace steps {

/// @brief Serves a table held in memory. Outputs `table` and `num_rows`.
class InMemoryReader : public Step {
 public:
  InMemoryReader(std::string name, std::shared_ptr<arrow::Table> table,
                 std::shared_ptr<const Context> context = nullptr);

  bool IsIdempotent() const override { return true; }
  std::string Description() const override;

 protected:
  Requirements Declare() const override;
  Status CheckConfig(const Context& ctx) const override;
  Result<Output> DoExecute(const Context& ctx, const Output& input,
                           const ExecContext& exec) override;

 private:
  std::shared_ptr<arrow::Table> table_;
};

/// @brief Reads a file into a table.
///
/// Configuration under `<scope>`:
/// - `location` (string): file to read.
/// - `format` (string, case-insensitive): `csv` or `json`. The remaining formats parse
///   but are rejected at validation.
/// - `options` (mapping, optional): `delimiter`, `skip_rows`, `quoting` and `header`
///   for CSV; `newlines_in_values` for JSON.
///
/// Outputs `table`, `location` and `num_rows`.
class FileReader : public Step {
 public:
  FileReader(std::string name, std::string scope,
             std::shared_ptr<const Context> context = nullptr);

  const std::string& Scope() const noexcept { return scope_; }

  bool IsIdempotent() const override { return true; }
  std::string Description() const override;

 protected:
  Requirements Declare() const override;
  Status CheckConfig(const Context& ctx) const override;
  Result<Output> DoExecute(const Context& ctx, const Output& input,
                           const ExecContext& exec) override;

 private:
  struct Settings {
    std::string location;
    FileFormat format;
    Mapping options;
  };

  Result<Settings> ReadSettings(const Context& ctx) const;

  std::string scope_;
};

}  // namespace steps
}  // namespace sl
