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

namespace arrow {
class Table;
}  // namespace arrow

namespace sl {
namespace steps {

/// @brief Writes the input `table` as CSV.
///
/// Configuration under `<scope>`: `path` (string) and `include_header` (bool, optional,
/// default true). An existing file is truncated. Outputs `rows_written` and `path`.
class CsvFileWriter : public Step {
 public:
  CsvFileWriter(std::string name, std::string scope,
                std::shared_ptr<const Context> context = nullptr);

  const std::string& Scope() const noexcept { return scope_; }

  std::string Description() const override;

 protected:
  Requirements Declare() const override;
  Status CheckConfig(const Context& ctx) const override;
  Result<Output> DoExecute(const Context& ctx, const Output& input,
                           const ExecContext& exec) override;

 private:
  std::string scope_;
};

/// @brief Keeps the input `table` for inspection. Outputs `rows_written`.
class TableCollector : public Step {
 public:
  explicit TableCollector(std::string name, std::shared_ptr<const Context> context = nullptr);

  /// @brief Table received by the last successful execution, null before that.
  const std::shared_ptr<arrow::Table>& Collected() const noexcept { return collected_; }

 protected:
  Requirements Declare() const override;
  Result<Output> DoExecute(const Context& ctx, const Output& input,
                           const ExecContext& exec) override;

 private:
  std::shared_ptr<arrow::Table> collected_;
};

}  // namespace steps
}  // namespace sl
