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

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <arrow/util/cancel.h>

#include <stepline/context.h>
#include <stepline/logging.h>
#include <stepline/output.h>
#include <stepline/result.h>

namespace sl {

/// @brief Capability tag of a step.
///
/// A role is not a class hierarchy: it only composes implicit requirements on top of
/// what the step declares itself.
/// - `READER`: outputs a `table` field.
/// - `TRANSFORMATION`: requires an input `table` field and outputs a `table` field.
/// - `WRITER`: requires an input `table` field.
enum class StepRole {
  GENERIC,
  READER,
  TRANSFORMATION,
  WRITER,
};

std::string StepRoleToString(StepRole role);

/// @brief Lifecycle of a step.
///
/// `CONSTRUCTED -> VALIDATED -> EXECUTING -> SUCCEEDED | FAILED`, and
/// `CONSTRUCTED -> FAILED` when validation fails. A finished step may be validated and
/// executed again.
enum class StepState {
  CONSTRUCTED,
  VALIDATED,
  EXECUTING,
  SUCCEEDED,
  FAILED,
};

std::string StepStateToString(StepState state);

/// @brief A context path a step needs, with the kind it accepts.
struct ConfigRequirement {
  std::string path;
  ValueKind kind = ValueKind::ANY;
};

/// @brief Everything a step declares about itself.
struct Requirements {
  std::vector<ConfigRequirement> config;
  /// @brief Fields the input artifact must carry.
  std::vector<FieldSpec> input;
  /// @brief Fields the produced output must carry.
  OutputSchema output;
};

/// @brief Per-run execution controls.
struct ExecContext {
  /// @brief Cancellation signal, observed before each unit starts.
  ::arrow::StopToken stop_token = ::arrow::StopToken::Unstoppable();
};

/// @brief Atomic unit of work.
///
/// A step declares its requirements, validates them against a `Context` without
/// running domain logic, and executes to produce a schema-conformant `Output`.
///
/// Public entry points are non-virtual and enforce the contract; subclasses implement
/// the `Declare`/`CheckConfig`/`DoExecute` hooks:
///
/// - `Validate(ctx)`: every declared config path resolves with an accepted kind
///   (`ConfigResolutionError` otherwise), then `CheckConfig` runs (`ValidationError`).
/// - `Execute(ctx, input, exec)`: validates when not already validated, checks the
///   declared input fields (`ValidationError`), runs `DoExecute`, and checks the output
///   against the declared schema. Untyped failures (and thrown exceptions) from
///   `DoExecute` become `ExecutionError`s carrying the step's identity.
///
/// Side effects performed by `DoExecute` are never rolled back. Results of those side
/// effects (row counts, written paths) belong in the returned `Output`.
///
/// The bookkeeping of the base class (state, remembered validation) is safe to touch
/// from concurrent runs; whether `DoExecute` is depends on the subclass, so a step
/// instance is treated as a single execution lane by `runner::AsyncRunner`. Contexts are
/// read-only and may be shared freely.
class Step {
 public:
  /// @param name identity used in diagnostics and as the logger name
  /// @param role capability tag, see `StepRole`
  /// @param context context bound for `Run()`; null means `DefaultContext()`
  explicit Step(std::string name, StepRole role = StepRole::GENERIC,
                std::shared_ptr<const Context> context = nullptr);
  virtual ~Step() = default;

  Step(const Step&) = delete;
  Step& operator=(const Step&) = delete;

  const std::string& Name() const noexcept { return name_; }
  StepRole Role() const noexcept { return role_; }
  StepState State() const noexcept { return state_.load(); }
  const Context& BoundContext() const noexcept { return *context_; }

  /// @brief Declared requirements, including the role's implicit ones. Evaluated once.
  const Requirements& GetRequirements() const;

  /// @brief Whether re-executing with the same context and input is safe and yields an
  /// identical output. Not enforced by the framework.
  virtual bool IsIdempotent() const { return false; }

  virtual std::string Description() const { return {}; }

  Status Validate(const Context& ctx);

  Result<Output> Execute(const Context& ctx, const Output& input = {},
                         const ExecContext& exec = {});

  /// @brief Validate and execute against the bound context.
  Result<Output> Run(const Output& input = {}, const ExecContext& exec = {});

 protected:
  virtual Requirements Declare() const = 0;

  /// @brief Step-specific preconditions on already-resolved configuration.
  ///
  /// Failures are reported with `ValidationFailure`; untyped statuses are wrapped as
  /// validation errors.
  virtual Status CheckConfig(const Context& ctx) const;

  virtual Result<Output> DoExecute(const Context& ctx, const Output& input,
                                   const ExecContext& exec) = 0;

  /// @brief `ValidationError` identifying this step.
  Status ValidationFailure(const std::string& message) const;

  const Logger& Log() const noexcept { return *logger_; }

 private:
  Status CheckRequirements(const Context& ctx) const;
  Status RunValidation(const Context& ctx);
  /// @brief Whether the remembered validation covers `ctx`. Forgets it either way.
  bool ConsumeValidation(const Context& ctx);
  Status CheckInput(const Output& input) const;
  Result<Output> InvokeDoExecute(const Context& ctx, const Output& input,
                                 const ExecContext& exec);

  std::string name_;
  StepRole role_;
  std::shared_ptr<const Context> context_;
  std::shared_ptr<const Logger> logger_;
  std::atomic<StepState> state_{StepState::CONSTRUCTED};

  std::mutex validation_mutex_;
  // Context the last successful validation ran against.
  std::optional<Context> validated_;

  mutable std::once_flag requirements_once_;
  mutable Requirements requirements_;
};

}  // namespace sl
