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

#include <stepline/etl_task.h>

#include <utility>

namespace sl {

namespace {

Status CheckSlot(const std::string& task, const std::shared_ptr<Step>& unit,
                 StepRole expected, const std::string& slot) {
  if (unit == nullptr) {
    return Status::Invalid("EtlTask '", task, "': ", slot, " must not be null");
  }
  if (unit->Role() != expected) {
    return Status::Invalid("EtlTask '", task, "': ", slot, " '", unit->Name(),
                           "' has role ", StepRoleToString(unit->Role()), ", expected ",
                           StepRoleToString(expected));
  }
  return Status::OK();
}

}  // namespace

EtlTask::EtlTask(std::string name, std::vector<std::shared_ptr<Step>> children,
                 std::shared_ptr<const Context> context)
    : Task(std::move(name), std::move(children),
           TaskOptions{OutputPolicy::MERGE_ALL, /*record_trace=*/true},
           std::move(context)) {}

Result<std::shared_ptr<EtlTask>> EtlTask::Make(
    std::string name, std::shared_ptr<Step> reader,
    std::vector<std::shared_ptr<Step>> transformations, std::shared_ptr<Step> writer,
    std::shared_ptr<const Context> context) {
  ARROW_RETURN_NOT_OK(CheckSlot(name, reader, StepRole::READER, "reader"));
  for (const auto& transformation : transformations) {
    ARROW_RETURN_NOT_OK(
        CheckSlot(name, transformation, StepRole::TRANSFORMATION, "transformation"));
  }
  ARROW_RETURN_NOT_OK(CheckSlot(name, writer, StepRole::WRITER, "writer"));

  std::vector<std::shared_ptr<Step>> children;
  children.reserve(transformations.size() + 2);
  children.push_back(std::move(reader));
  for (auto& transformation : transformations) {
    children.push_back(std::move(transformation));
  }
  children.push_back(std::move(writer));
  return std::shared_ptr<EtlTask>(
      new EtlTask(std::move(name), std::move(children), std::move(context)));
}

}  // namespace sl
