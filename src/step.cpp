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

#include <stepline/step.h>

#include <stepline/errors.h>

#include <exception>
#include <utility>

namespace sl {

namespace {

void AddRoleRequirements(StepRole role, Requirements* requirements) {
  const FieldSpec table_field{kTableField, ValueKind::TABLE};
  switch (role) {
    case StepRole::GENERIC:
      break;
    case StepRole::READER:
      requirements->output.push_back(table_field);
      break;
    case StepRole::TRANSFORMATION:
      requirements->input.push_back(table_field);
      requirements->output.push_back(table_field);
      break;
    case StepRole::WRITER:
      requirements->input.push_back(table_field);
      break;
  }
}

}  // namespace

std::string StepRoleToString(StepRole role) {
  switch (role) {
    case StepRole::GENERIC:
      return "GENERIC";
    case StepRole::READER:
      return "READER";
    case StepRole::TRANSFORMATION:
      return "TRANSFORMATION";
    case StepRole::WRITER:
      return "WRITER";
  }
  return "UNKNOWN";
}

std::string StepStateToString(StepState state) {
  switch (state) {
    case StepState::CONSTRUCTED:
      return "CONSTRUCTED";
    case StepState::VALIDATED:
      return "VALIDATED";
    case StepState::EXECUTING:
      return "EXECUTING";
    case StepState::SUCCEEDED:
      return "SUCCEEDED";
    case StepState::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

Step::Step(std::string name, StepRole role, std::shared_ptr<const Context> context)
    : name_(std::move(name)),
      role_(role),
      context_(context != nullptr ? std::move(context) : DefaultContext()),
      logger_(GetLogger(name_)) {}

const Requirements& Step::GetRequirements() const {
  std::call_once(requirements_once_, [this]() {
    requirements_ = Declare();
    AddRoleRequirements(role_, &requirements_);
  });
  return requirements_;
}

Status Step::CheckConfig(const Context&) const { return Status::OK(); }

Status Step::ValidationFailure(const std::string& message) const {
  return ValidationError(name_, message);
}

Status Step::CheckRequirements(const Context& ctx) const {
  for (const auto& requirement : GetRequirements().config) {
    auto resolved = ctx.Resolve(requirement.path);
    if (!resolved.ok()) {
      const auto& st = resolved.status();
      auto detail = GetDetail<ConfigResolutionDetail>(st);
      if (detail == nullptr) {
        return ValidationFailure("required config path '" + requirement.path +
                                 "' is malformed: " + st.message());
      }
      return ConfigResolutionError(st.code(),
                                   "Step '" + name_ + "' requires " + st.message(),
                                   detail->Path(), detail->StoppedAt(), name_);
    }
    const auto& value = resolved.ValueOrDie();
    if (!Accepts(requirement.kind, value)) {
      return ConfigResolutionError(
          StatusCode::TypeError,
          "Step '" + name_ + "' requires config path '" + requirement.path + "' to be " +
              ValueKindToString(requirement.kind) + ", got " +
              ValueKindToString(value.Kind()),
          requirement.path, requirement.path, name_);
    }
  }
  return Status::OK();
}

Status Step::CheckInput(const Output& input) const {
  for (const auto& spec : GetRequirements().input) {
    Status st = input.Validate({spec});
    if (!st.ok()) {
      return ValidationFailure("input " + st.message());
    }
  }
  return Status::OK();
}

Status Step::RunValidation(const Context& ctx) {
  Status st = CheckRequirements(ctx);
  if (st.ok()) {
    st = CheckConfig(ctx);
    if (!st.ok() && !IsFrameworkError(st)) {
      st = ValidationFailure(st.message());
    }
  }
  if (!st.ok()) {
    state_ = StepState::FAILED;
    {
      std::lock_guard<std::mutex> lock(validation_mutex_);
      validated_.reset();
    }
    logger_->Warning("Validation failed", {{"step", name_}, {"error", st.message()}});
    return st;
  }
  state_ = StepState::VALIDATED;
  return Status::OK();
}

bool Step::ConsumeValidation(const Context& ctx) {
  std::lock_guard<std::mutex> lock(validation_mutex_);
  bool covered = validated_.has_value() && validated_->SharesRoot(ctx);
  validated_.reset();
  return covered;
}

Status Step::Validate(const Context& ctx) {
  ARROW_RETURN_NOT_OK(RunValidation(ctx));
  std::lock_guard<std::mutex> lock(validation_mutex_);
  validated_ = ctx;
  return Status::OK();
}

Result<Output> Step::InvokeDoExecute(const Context& ctx, const Output& input,
                                     const ExecContext& exec) {
  try {
    return DoExecute(ctx, input, exec);
  } catch (const std::exception& e) {
    return Status::UnknownError("unhandled exception: ", e.what());
  }
}

Result<Output> Step::Execute(const Context& ctx, const Output& input,
                             const ExecContext& exec) {
  if (exec.stop_token.IsStopRequested()) {
    state_ = StepState::FAILED;
    return CancelledError(name_, /*next_position=*/0, {});
  }
  if (!ConsumeValidation(ctx)) {
    ARROW_RETURN_NOT_OK(RunValidation(ctx));
  }
  if (Status st = CheckInput(input); !st.ok()) {
    state_ = StepState::FAILED;
    logger_->Warning("Input rejected", {{"step", name_}, {"error", st.message()}});
    return st;
  }

  state_ = StepState::EXECUTING;
  logger_->Info("Start running step",
                {{"step", name_}, {"role", StepRoleToString(role_)}});

  auto result = InvokeDoExecute(ctx, input, exec);
  if (!result.ok()) {
    state_ = StepState::FAILED;
    Status st = result.status();
    if (st.IsCancelled() && !IsFrameworkError(st)) {
      st = CancelledError(name_, /*next_position=*/0, {});
    } else if (!IsFrameworkError(st)) {
      st = ExecutionError(name_, std::move(st));
    }
    logger_->Error("Step failed", {{"step", name_}, {"error", st.message()}});
    return st;
  }

  Output output = std::move(result).ValueOrDie();
  if (Status st = output.Validate(GetRequirements().output); !st.ok()) {
    state_ = StepState::FAILED;
    auto error = ExecutionError(name_, st.WithMessage("output does not conform to the "
                                                      "declared schema: ",
                                                      st.message()));
    logger_->Error("Step failed", {{"step", name_}, {"error", error.message()}});
    return error;
  }

  state_ = StepState::SUCCEEDED;
  logger_->Info("Step completed", {{"step", name_}, {"fields", std::to_string(output.Size())}});
  return output;
}

Result<Output> Step::Run(const Output& input, const ExecContext& exec) {
  return Execute(*context_, input, exec);
}

}  // namespace sl
