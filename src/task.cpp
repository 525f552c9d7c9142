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

#include <stepline/task.h>

#include <stepline/errors.h>

#include <utility>

namespace sl {

namespace {

std::string PositionOf(std::size_t position, std::size_t total) {
  return std::to_string(position) + "/" + std::to_string(total);
}

}  // namespace

Task::Task(std::string name, TaskOptions options, std::shared_ptr<const Context> context)
    : Step(std::move(name), StepRole::GENERIC, std::move(context)), options_(options) {}

Task::Task(std::string name, std::vector<std::shared_ptr<Step>> children,
           TaskOptions options, std::shared_ptr<const Context> context)
    : Task(std::move(name), options, std::move(context)) {
  children_.reserve(children.size());
  for (auto& unit : children) {
    Status st = Add(std::move(unit));
    if (construction_status_.ok()) {
      construction_status_ = std::move(st);
    }
  }
}

Task::Task(std::string name, std::vector<Child> children, TaskOptions options,
           std::shared_ptr<const Context> context)
    : Task(std::move(name), options, std::move(context)) {
  children_.reserve(children.size());
  for (auto& child : children) {
    Status st = Add(std::move(child));
    if (construction_status_.ok()) {
      construction_status_ = std::move(st);
    }
  }
}

Status Task::Add(std::shared_ptr<Step> unit) {
  return Add(Child{std::move(unit), std::nullopt, {}});
}

Status Task::Add(Child child) {
  if (State() != StepState::CONSTRUCTED) {
    return Status::Invalid("Task '", Name(),
                           "': children are fixed once the task has been validated or "
                           "executed");
  }
  if (child.unit == nullptr) {
    return Status::Invalid("Task '", Name(), "': child must not be null");
  }
  if (child.unit.get() == this) {
    return Status::Invalid("Task '", Name(), "': a task cannot contain itself");
  }
  if (auto* nested = dynamic_cast<const Task*>(child.unit.get());
      nested != nullptr && nested->Reaches(this)) {
    return Status::Invalid("Task '", Name(), "': child '", nested->Name(),
                           "' already contains this task");
  }
  children_.push_back(std::move(child));
  return Status::OK();
}

bool Task::Reaches(const Step* unit) const {
  if (unit == this) {
    return true;
  }
  for (const auto& child : children_) {
    if (child.unit.get() == unit) {
      return true;
    }
    if (auto* nested = dynamic_cast<const Task*>(child.unit.get());
        nested != nullptr && nested->Reaches(unit)) {
      return true;
    }
  }
  return false;
}

ExecutionTrace Task::LastTrace() const {
  std::lock_guard<std::mutex> lock(trace_mutex_);
  return last_trace_;
}

void Task::SetLastTrace(ExecutionTrace trace) {
  std::lock_guard<std::mutex> lock(trace_mutex_);
  last_trace_ = std::move(trace);
}

bool Task::IsIdempotent() const {
  for (const auto& child : children_) {
    if (!child.unit->IsIdempotent()) {
      return false;
    }
  }
  return true;
}

std::string Task::Description() const {
  std::string description = "Task of " + std::to_string(children_.size()) + " children:";
  for (std::size_t i = 0; i < children_.size(); ++i) {
    description += (i == 0 ? " " : " -> ") + children_[i].unit->Name();
  }
  return description;
}

Requirements Task::Declare() const { return {}; }

Status Task::CheckConfig(const Context&) const { return construction_status_; }

Result<Context> Task::ChildContext(const Context& ctx, const Child& child) const {
  if (!child.scope.has_value() && child.overrides.empty()) {
    return ctx;
  }
  Context derived = ctx;
  if (child.scope.has_value()) {
    ARROW_ASSIGN_OR_RAISE(derived, ctx.Scoped(*child.scope));
  }
  if (!child.overrides.empty()) {
    derived = derived.WithOverrides(child.overrides);
  }
  return derived;
}

Output Task::Assemble(const std::vector<Output>& outputs, const Output& input) const {
  if (outputs.empty()) {
    return input;
  }
  if (options_.output_policy == OutputPolicy::LAST_WINS) {
    return outputs.back();
  }
  Output merged;
  for (const auto& output : outputs) {
    merged = merged.MergedWith(output);
  }
  return merged;
}

Status Task::ValidateAll(const Context& ctx) {
  if (!construction_status_.ok()) {
    return ValidationFailure(construction_status_.message());
  }
  for (std::size_t i = 0; i < children_.size(); ++i) {
    const auto& child = children_[i];
    const std::size_t position = i + 1;
    auto child_ctx = ChildContext(ctx, child);
    Status st = child_ctx.status();
    if (st.ok()) {
      st = child.unit->Validate(*child_ctx);
    }
    if (st.ok()) {
      if (auto* nested = dynamic_cast<Task*>(child.unit.get())) {
        st = nested->ValidateAll(*child_ctx);
      }
    }
    if (!st.ok()) {
      return CompositionError(Name(), child.unit->Name(), position, {}, {}, std::move(st));
    }
  }
  return Status::OK();
}

Result<Output> Task::DoExecute(const Context& ctx, const Output& input,
                               const ExecContext& exec) {
  SetLastTrace({});

  const std::size_t total = children_.size();
  Output artifact = input;
  std::vector<Output> outputs;
  outputs.reserve(total);
  std::vector<std::string> completed;
  ExecutionTrace trace;

  for (std::size_t i = 0; i < total; ++i) {
    const auto& child = children_[i];
    const auto& child_name = child.unit->Name();
    const std::size_t position = i + 1;

    auto fail = [&](Status cause) {
      SetLastTrace(trace);
      Log().Error("Child failed", {{"task", Name()},
                                   {"child", child_name},
                                   {"position", PositionOf(position, total)},
                                   {"error", cause.message()}});
      return CompositionError(Name(), child_name, position, completed,
                              options_.record_trace ? trace : ExecutionTrace{},
                              std::move(cause));
    };

    if (exec.stop_token.IsStopRequested()) {
      SetLastTrace(trace);
      Log().Warning("Task cancelled", {{"task", Name()},
                                       {"position", PositionOf(position, total)}});
      return CancelledError(Name(), position, completed);
    }

    auto child_ctx = ChildContext(ctx, child);
    if (!child_ctx.ok()) {
      return fail(child_ctx.status());
    }

    Log().Debug("Running child", {{"task", Name()},
                                  {"child", child_name},
                                  {"position", PositionOf(position, total)}});

    if (Status st = child.unit->Validate(*child_ctx); !st.ok()) {
      return fail(std::move(st));
    }
    auto result = child.unit->Execute(*child_ctx, artifact, exec);
    if (!result.ok()) {
      return fail(result.status());
    }

    Output output = std::move(result).ValueOrDie();
    artifact = artifact.MergedWith(output);
    completed.push_back(child_name);
    if (options_.record_trace) {
      trace.push_back(TraceEntry{child_name, position, output});
    }
    outputs.push_back(std::move(output));
  }

  SetLastTrace(trace);
  Output output = Assemble(outputs, input);
  if (options_.record_trace) {
    output.SetTrace(std::move(trace));
  }
  return output;
}

}  // namespace sl
