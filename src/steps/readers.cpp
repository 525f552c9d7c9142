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

#include <stepline/steps/readers.h>

#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <arrow/json/api.h>
#include <arrow/table.h>

#include <cstdint>
#include <limits>
#include <utility>

namespace sl {
namespace steps {

namespace {

Status ApplyCsvOptions(const Mapping& options, ::arrow::csv::ReadOptions* read_options,
                       ::arrow::csv::ParseOptions* parse_options) {
  for (const auto& [key, value] : options) {
    if (key == "delimiter") {
      ARROW_ASSIGN_OR_RAISE(auto delimiter, value.AsString());
      if (delimiter.size() != 1) {
        return Status::Invalid("csv option 'delimiter' must be a single character, got '",
                               delimiter, "'");
      }
      parse_options->delimiter = delimiter[0];
    } else if (key == "skip_rows") {
      ARROW_ASSIGN_OR_RAISE(auto skip_rows, value.AsInt64());
      if (skip_rows < 0 || skip_rows > std::numeric_limits<int32_t>::max()) {
        return Status::Invalid("csv option 'skip_rows' must be between 0 and ",
                               std::numeric_limits<int32_t>::max(), ", got ", skip_rows);
      }
      read_options->skip_rows = static_cast<int32_t>(skip_rows);
    } else if (key == "quoting") {
      ARROW_ASSIGN_OR_RAISE(parse_options->quoting, value.AsBool());
    } else if (key == "header") {
      ARROW_ASSIGN_OR_RAISE(auto header, value.AsBool());
      read_options->autogenerate_column_names = !header;
    } else {
      return Status::Invalid("unknown csv option '", key, "'");
    }
  }
  return Status::OK();
}

Status ApplyJsonOptions(const Mapping& options, ::arrow::json::ParseOptions* parse_options) {
  for (const auto& [key, value] : options) {
    if (key == "newlines_in_values") {
      ARROW_ASSIGN_OR_RAISE(parse_options->newlines_in_values, value.AsBool());
    } else {
      return Status::Invalid("unknown json option '", key, "'");
    }
  }
  return Status::OK();
}

Result<std::shared_ptr<::arrow::Table>> ReadCsv(const std::string& location,
                                                const Mapping& options,
                                                const ExecContext& exec) {
  auto read_options = ::arrow::csv::ReadOptions::Defaults();
  auto parse_options = ::arrow::csv::ParseOptions::Defaults();
  auto convert_options = ::arrow::csv::ConvertOptions::Defaults();
  ARROW_RETURN_NOT_OK(ApplyCsvOptions(options, &read_options, &parse_options));

  ARROW_ASSIGN_OR_RAISE(auto file, ::arrow::io::ReadableFile::Open(location));
  ::arrow::io::IOContext io_context(::arrow::default_memory_pool(), exec.stop_token);
  ARROW_ASSIGN_OR_RAISE(auto reader,
                        ::arrow::csv::TableReader::Make(io_context, file, read_options,
                                                        parse_options, convert_options));
  return reader->Read();
}

Result<std::shared_ptr<::arrow::Table>> ReadJson(const std::string& location,
                                                 const Mapping& options) {
  auto read_options = ::arrow::json::ReadOptions::Defaults();
  auto parse_options = ::arrow::json::ParseOptions::Defaults();
  ARROW_RETURN_NOT_OK(ApplyJsonOptions(options, &parse_options));

  ARROW_ASSIGN_OR_RAISE(auto file, ::arrow::io::ReadableFile::Open(location));
  ARROW_ASSIGN_OR_RAISE(auto reader,
                        ::arrow::json::TableReader::Make(::arrow::default_memory_pool(),
                                                         file, read_options, parse_options));
  return reader->Read();
}

}  // namespace

InMemoryReader::InMemoryReader(std::string name, std::shared_ptr<arrow::Table> table,
                               std::shared_ptr<const Context> context)
    : Step(std::move(name), StepRole::READER, std::move(context)), table_(std::move(table)) {}

std::string InMemoryReader::Description() const {
  if (table_ == nullptr) {
    return "In-memory table (unset)";
  }
  return "In-memory table of " + std::to_string(table_->num_rows()) + " rows";
}

Requirements InMemoryReader::Declare() const {
  Requirements requirements;
  requirements.output.push_back({"num_rows", ValueKind::INT64});
  return requirements;
}

Status InMemoryReader::CheckConfig(const Context&) const {
  if (table_ == nullptr) {
    return ValidationFailure("no table to serve");
  }
  return Status::OK();
}

Result<Output> InMemoryReader::DoExecute(const Context&, const Output&, const ExecContext&) {
  Output output;
  output.Set(kTableField, table_).Set("num_rows", static_cast<std::int64_t>(table_->num_rows()));
  return output;
}

FileReader::FileReader(std::string name, std::string scope,
                       std::shared_ptr<const Context> context)
    : Step(std::move(name), StepRole::READER, std::move(context)), scope_(std::move(scope)) {}

std::string FileReader::Description() const {
  return "Reads the file configured under '" + JoinPath(scope_, "location") + "'";
}

Requirements FileReader::Declare() const {
  Requirements requirements;
  requirements.config.push_back({JoinPath(scope_, "location"), ValueKind::STRING});
  requirements.config.push_back({JoinPath(scope_, "format"), ValueKind::STRING});
  requirements.output.push_back({"location", ValueKind::STRING});
  requirements.output.push_back({"num_rows", ValueKind::INT64});
  return requirements;
}

Result<FileReader::Settings> FileReader::ReadSettings(const Context& ctx) const {
  Settings settings;
  ARROW_ASSIGN_OR_RAISE(settings.location, ctx.ResolveString(JoinPath(scope_, "location")));
  ARROW_ASSIGN_OR_RAISE(auto format, ctx.ResolveString(JoinPath(scope_, "format")));
  ARROW_ASSIGN_OR_RAISE(settings.format, ParseFileFormat(format));
  auto options = ctx.Get(JoinPath(scope_, "options"));
  if (!options.IsNone()) {
    if (!options.IsMapping()) {
      return Status::Invalid("'", JoinPath(scope_, "options"), "' must be a mapping, got ",
                             ValueKindToString(options.Kind()));
    }
    settings.options = options.GetMapping();
  }
  return settings;
}

Status FileReader::CheckConfig(const Context& ctx) const {
  ARROW_ASSIGN_OR_RAISE(auto settings, ReadSettings(ctx));
  if (settings.location.empty()) {
    return ValidationFailure("location must not be empty");
  }
  switch (settings.format) {
    case FileFormat::CSV: {
      auto read_options = ::arrow::csv::ReadOptions::Defaults();
      auto parse_options = ::arrow::csv::ParseOptions::Defaults();
      return ApplyCsvOptions(settings.options, &read_options, &parse_options);
    }
    case FileFormat::JSON: {
      auto parse_options = ::arrow::json::ParseOptions::Defaults();
      return ApplyJsonOptions(settings.options, &parse_options);
    }
    default:
      return ValidationFailure("format '" + FileFormatToString(settings.format) +
                               "' is not supported by this reader");
  }
}

Result<Output> FileReader::DoExecute(const Context& ctx, const Output&,
                                     const ExecContext& exec) {
  ARROW_ASSIGN_OR_RAISE(auto settings, ReadSettings(ctx));
  std::shared_ptr<::arrow::Table> table;
  if (settings.format == FileFormat::CSV) {
    ARROW_ASSIGN_OR_RAISE(table, ReadCsv(settings.location, settings.options, exec));
  } else {
    ARROW_ASSIGN_OR_RAISE(table, ReadJson(settings.location, settings.options));
  }
  Log().Debug("Read file", {{"location", settings.location},
                            {"format", FileFormatToString(settings.format)},
                            {"rows", std::to_string(table->num_rows())}});

  Output output;
  output.Set(kTableField, table)
      .Set("location", settings.location)
      .Set("num_rows", static_cast<std::int64_t>(table->num_rows()));
  return output;
}

}  // namespace steps
}  // namespace sl
