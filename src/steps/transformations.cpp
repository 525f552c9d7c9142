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

#include <stepline/steps/transformations.h>

#include <arrow/table.h>

#include <utility>

namespace sl {
namespace steps {

SelectColumns::SelectColumns(std::string name, std::vector<std::string> columns,
                             std::shared_ptr<const Context> context)
    : Step(std::move(name), StepRole::TRANSFORMATION, std::move(context)),
      columns_(std::move(columns)) {}

std::string SelectColumns::Description() const {
  std::string description = "Select";
  for (const auto& column : columns_) {
    description += " " + column;
  }
  return description;
}

Requirements SelectColumns::Declare() const { return {}; }

Status SelectColumns::CheckConfig(const Context&) const {
  if (columns_.empty()) {
    return ValidationFailure("at least one column must be selected");
  }
  return Status::OK();
}

Result<Output> SelectColumns::DoExecute(const Context&, const Output& input,
                                        const ExecContext&) {
  ARROW_ASSIGN_OR_RAISE(auto table, input.GetTable());
  std::vector<int> indices;
  indices.reserve(columns_.size());
  for (const auto& column : columns_) {
    int index = table->schema()->GetFieldIndex(column);
    if (index < 0) {
      return Status::KeyError("column '", column, "' not found in ",
                              table->schema()->ToString());
    }
    indices.push_back(index);
  }
  ARROW_ASSIGN_OR_RAISE(auto selected, table->SelectColumns(indices));
  Output output;
  output.Set(kTableField, std::move(selected));
  return output;
}

RenameColumns::RenameColumns(std::string name, std::map<std::string, std::string> renames,
                             std::shared_ptr<const Context> context)
    : Step(std::move(name), StepRole::TRANSFORMATION, std::move(context)),
      renames_(std::move(renames)) {}

std::string RenameColumns::Description() const {
  std::string description = "Rename";
  for (const auto& [from, to] : renames_) {
    description += " " + from + "->" + to;
  }
  return description;
}

Requirements RenameColumns::Declare() const { return {}; }

Result<Output> RenameColumns::DoExecute(const Context&, const Output& input,
                                        const ExecContext&) {
  ARROW_ASSIGN_OR_RAISE(auto table, input.GetTable());
  for (const auto& [from, to] : renames_) {
    if (table->schema()->GetFieldIndex(from) < 0) {
      return Status::KeyError("column '", from, "' not found in ",
                              table->schema()->ToString());
    }
  }
  std::vector<std::string> names = table->ColumnNames();
  for (auto& name : names) {
    auto it = renames_.find(name);
    if (it != renames_.end()) {
      name = it->second;
    }
  }
  ARROW_ASSIGN_OR_RAISE(auto renamed, table->RenameColumns(names));
  Output output;
  output.Set(kTableField, std::move(renamed));
  return output;
}

}  // namespace steps
}  // namespace sl
