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

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <stepline/stepline.h>
#include <stepline/steps/readers.h>
#include <stepline/steps/transformations.h>
#include <stepline/steps/writers.h>

namespace {

constexpr const char* kUsage =
    "usage: stepline_etl_example <job.yaml>\n"
    "\n"
    "job.yaml:\n"
    "  source:\n"
    "    location: /data/people.csv\n"
    "    format: csv\n"
    "    options: {delimiter: \",\"}\n"
    "  columns: [id, name]      # optional\n"
    "  sink:\n"
    "    path: /data/people_out.csv\n"
    "\n"
    "Environment variables prefixed with STEPLINE_ override the file, e.g.\n"
    "STEPLINE_SINK__PATH=/tmp/out.csv.\n";

sl::Result<std::vector<std::string>> SelectedColumns(const sl::Context& ctx) {
  std::vector<std::string> columns;
  auto value = ctx.Get("columns");
  if (value.IsNone()) {
    return columns;
  }
  if (!value.IsSequence()) {
    return sl::Status::Invalid("'columns' must be a list of column names");
  }
  for (const auto& column : value.GetSequence()) {
    ARROW_ASSIGN_OR_RAISE(auto name, column.AsString());
    columns.push_back(std::move(name));
  }
  return columns;
}

sl::Result<sl::Output> RunJob(const std::string& job_path) {
  ARROW_ASSIGN_OR_RAISE(auto file, sl::ContextFromYamlFile(job_path));
  auto ctx = sl::Context::FromSources({file, sl::ContextFromEnvironment("STEPLINE_")});

  ARROW_ASSIGN_OR_RAISE(auto columns, SelectedColumns(ctx));
  std::vector<std::shared_ptr<sl::Step>> transformations;
  if (!columns.empty()) {
    transformations.push_back(
        std::make_shared<sl::steps::SelectColumns>("select", std::move(columns)));
  }

  ARROW_ASSIGN_OR_RAISE(
      auto task, sl::EtlTask::Make("etl", std::make_shared<sl::steps::FileReader>("extract", "source"),
                                   std::move(transformations),
                                   std::make_shared<sl::steps::CsvFileWriter>("load", "sink")));
  ARROW_RETURN_NOT_OK(task->ValidateAll(ctx));
  return task->Execute(ctx);
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << kUsage;
    return 2;
  }

  auto result = RunJob(argv[1]);
  if (!result.ok()) {
    std::cerr << "ETL job failed\n" << sl::FormatErrorChain(result.status()) << "\n";
    return 1;
  }

  const auto& output = result.ValueOrDie();
  for (const auto& entry : output.Trace()) {
    std::cout << entry.position << ". " << entry.name << " " << entry.output.ToString() << "\n";
  }
  std::cout << "rows_written=" << output.Get("rows_written").ValueOrDie().ToString()
            << " path=" << output.Get("path").ValueOrDie().ToString() << "\n";
  return 0;
}
