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

#include <stepline/steps/writers.h>

#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <arrow/table.h>

#include <cstdint>
#include <utility>

namespace sl {
namespace steps {

CsvFileWriter::CsvFileWriter(std::string name, std::string scope,
                             std::shared_ptr<const Context> context)
    : Step(std::move(name), StepRole::WRITER, std::move(context)), scope_(std::move(scope)) {}

std::string CsvFileWriter::Description() const {
  return "Writes CSV to the path configured under '" + JoinPath(scope_, "path") + "'";
}

Requirements CsvFileWriter::Declare() const {
  Requirements requirements;
  requirements.config.push_back({JoinPath(scope_, "path"), ValueKind::STRING});
  requirements.output.push_back({"rows_written", ValueKind::INT64});
  requirements.output.push_back({"path", ValueKind::STRING});
  return requirements;
}

Status CsvFileWriter::CheckConfig(const Context& ctx) const {
  ARROW_ASSIGN_OR_RAISE(auto path, ctx.ResolveString(JoinPath(scope_, "path")));
  if (path.empty()) {
    return ValidationFailure("path must not be empty");
  }
  auto include_header = ctx.Get(JoinPath(scope_, "include_header"), true);
  if (include_header.Kind() != ValueKind::BOOL) {
    return ValidationFailure("include_header must be a bool, got " +
                             ValueKindToString(include_header.Kind()));
  }
  return Status::OK();
}

Result<Output> CsvFileWriter::DoExecute(const Context& ctx, const Output& input,
                                        const ExecContext&) {
  ARROW_ASSIGN_OR_RAISE(auto table, input.GetTable());
  ARROW_ASSIGN_OR_RAISE(auto path, ctx.ResolveString(JoinPath(scope_, "path")));
  ARROW_ASSIGN_OR_RAISE(auto include_header,
                        ctx.Get(JoinPath(scope_, "include_header"), true).AsBool());

  auto options = ::arrow::csv::WriteOptions::Defaults();
  options.include_header = include_header;
  ARROW_ASSIGN_OR_RAISE(auto sink, ::arrow::io::FileOutputStream::Open(path));
  ARROW_RETURN_NOT_OK(::arrow::csv::WriteCSV(*table, options, sink.get()));
  ARROW_RETURN_NOT_OK(sink->Close());
  Log().Debug("Wrote file", {{"path", path}, {"rows", std::to_string(table->num_rows())}});

  Output output;
  output.Set("rows_written", static_cast<std::int64_t>(table->num_rows())).Set("path", path);
  return output;
}

TableCollector::TableCollector(std::string name, std::shared_ptr<const Context> context)
    : Step(std::move(name), StepRole::WRITER, std::move(context)) {}

Requirements TableCollector::Declare() const {
  Requirements requirements;
  requirements.output.push_back({"rows_written", ValueKind::INT64});
  return requirements;
}

Result<Output> TableCollector::DoExecute(const Context&, const Output& input,
                                         const ExecContext&) {
  ARROW_ASSIGN_OR_RAISE(collected_, input.GetTable());
  Output output;
  output.Set("rows_written", static_cast<std::int64_t>(collected_->num_rows()));
  return output;
}

}  // namespace steps
}  // namespace sl
