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

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <stepline/context.h>
#include <stepline/output.h>
#include <stepline/result.h>
#include <stepline/step.h>

namespace sl {

/// @brief How a task assembles its output from its children's outputs.
///
/// - `LAST_WINS`: the last child's output.
/// - `MERGE_ALL`: the union of every child's output fields, later children winning.
enum class OutputPolicy {
  LAST_WINS,
  MERGE_ALL,
};

struct TaskOptions {
  OutputPolicy output_policy = OutputPolicy::LAST_WINS;
  /// @brief Attach the per-child outputs to the task output and keep them in
  /// `LastTrace()` and in composition errors.
  bool record_trace = true;
};

/// @brief Ordered composition of steps that is itself a step.
///
/// Children run strictly sequentially in the order they were added. For each child the
/// task:
/// 1. checks the cancellation token (`CancelledError` naming the next position),
/// 2. derives the child's context (optional `scope`, then `overrides`),
/// 3. validates the child, then executes it with the current working artifact.
///
/// The working artifact starts as the task's input. Each child's output is overlaid onto
/// it (later fields win) before the next child runs, so a field produced by child i is
/// visible to child i+1 and later.
///
/// The first failure aborts the run. It is returned as a `CompositionError` naming the
/// child, its 1-based position and the children completed before it; later children are
/// not invoked and side effects of completed children are not compensated. Because a
/// `Task` is a `Step`, nesting produces a chain of composition errors whose deepest
/// entry identifies the failing leaf.
///
/// Children passed to a constructor go through the same checks as `Add`; a rejected
/// child is not kept and makes every `Validate`/`Execute` of the task fail with
/// `Invalid`. A task may not reach itself through its children.
///
/// Apart from that a task declares no configuration of its own; `Validate` therefore
/// succeeds without descending into children. `ValidateAll` performs a recursive dry run.
///
/// An empty task returns its input unchanged.
class Task : public Step {
 public:
  struct Child {
    std::shared_ptr<Step> unit;
    /// @brief Narrow the task's context to this namespace for the child.
    std::optional<std::string> scope;
    /// @brief Highest-precedence values layered over the (scoped) context.
    Mapping overrides;
  };

  explicit Task(std::string name, TaskOptions options = {},
                std::shared_ptr<const Context> context = nullptr);

  Task(std::string name, std::vector<std::shared_ptr<Step>> children,
       TaskOptions options = {}, std::shared_ptr<const Context> context = nullptr);

  Task(std::string name, std::vector<Child> children, TaskOptions options = {},
       std::shared_ptr<const Context> context = nullptr);

  /// @brief Append a child. Only allowed before the task is first validated or executed.
  ///
  /// `Invalid` for a null unit and for a unit whose subtree contains this task.
  Status Add(std::shared_ptr<Step> unit);
  Status Add(Child child);

  std::size_t NumChildren() const noexcept { return children_.size(); }
  const Child& GetChild(std::size_t index) const { return children_.at(index); }
  const TaskOptions& Options() const noexcept { return options_; }

  /// @brief Per-child outputs of the most recent run, including a failed one.
  ExecutionTrace LastTrace() const;

  /// @brief Whether `unit` is this task or appears anywhere below it.
  bool Reaches(const Step* unit) const;

  /// @brief Idempotent iff every child is.
  bool IsIdempotent() const override;

  std::string Description() const override;

  /// @brief Validate every child recursively, in order, without executing anything.
  Status ValidateAll(const Context& ctx);

 protected:
  Requirements Declare() const override;
  Status CheckConfig(const Context& ctx) const override;

  Result<Output> DoExecute(const Context& ctx, const Output& input,
                           const ExecContext& exec) override;

 private:
  Result<Context> ChildContext(const Context& ctx, const Child& child) const;
  Output Assemble(const std::vector<Output>& outputs, const Output& input) const;
  void SetLastTrace(ExecutionTrace trace);

  std::vector<Child> children_;
  TaskOptions options_;
  // First child rejected at construction.
  Status construction_status_;

  mutable std::mutex trace_mutex_;
  ExecutionTrace last_trace_;
};

}  // namespace sl
