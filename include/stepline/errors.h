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

/// @file errors.h
///
/// @brief Error taxonomy of stepline.
///
/// Errors are ordinary `arrow::Status` values. The kind of failure and the identity of
/// the failing unit travel as an `arrow::StatusDetail`:
///
/// | kind              | status code                | detail                    |
/// |-------------------|----------------------------|---------------------------|
/// | config resolution | `KeyError` / `TypeError`   | `ConfigResolutionDetail`  |
/// | validation        | `Invalid`                  | `ValidationDetail`        |
/// | execution         | `ExecutionError`           | `ExecutionDetail`         |
/// | composition       | code of the wrapped error  | `CompositionDetail`       |
/// | cancellation      | `Cancelled`                | `CancelledDetail`         |
///
/// A composition error keeps the code of the child error it wraps, so the top-level
/// status code alone tells configuration problems from domain failures and from
/// cancellation. The detail chain (`CauseOf`) leads down to the originating leaf.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/status.h>

#include <stepline/output.h>
#include <stepline/result.h>

namespace sl {

enum class ErrorKind {
  NONE,
  CONFIG_RESOLUTION,
  VALIDATION,
  EXECUTION,
  COMPOSITION,
  CANCELLED,
  /// @brief A failure carrying no stepline detail (typically a domain cause).
  OTHER,
};

std::string ErrorKindToString(ErrorKind kind);

/// @brief A required context path is absent or of the wrong kind.
class ConfigResolutionDetail : public ::arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "stepline::ConfigResolutionDetail";

  ConfigResolutionDetail(std::string path, std::string stopped_at, std::string step = {})
      : path_(std::move(path)), stopped_at_(std::move(stopped_at)), step_(std::move(step)) {}

  const char* type_id() const override { return kTypeId; }
  std::string ToString() const override;

  /// @brief Full dotted path that was requested.
  const std::string& Path() const noexcept { return path_; }
  /// @brief Namespace at which resolution stopped (`<root>` for the top level).
  const std::string& StoppedAt() const noexcept { return stopped_at_; }
  /// @brief Step that declared the requirement. Empty for a bare context lookup.
  const std::string& Step() const noexcept { return step_; }

 private:
  std::string path_;
  std::string stopped_at_;
  std::string step_;
};

/// @brief A step's own precondition on its configuration or input failed.
class ValidationDetail : public ::arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "stepline::ValidationDetail";

  explicit ValidationDetail(std::string step) : step_(std::move(step)) {}

  const char* type_id() const override { return kTypeId; }
  std::string ToString() const override;

  const std::string& Step() const noexcept { return step_; }

 private:
  std::string step_;
};

/// @brief Domain logic of a step failed during execution.
class ExecutionDetail : public ::arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "stepline::ExecutionDetail";

  ExecutionDetail(std::string step, Status cause)
      : step_(std::move(step)), cause_(std::move(cause)) {}

  const char* type_id() const override { return kTypeId; }
  std::string ToString() const override;

  const std::string& Step() const noexcept { return step_; }
  const Status& Cause() const noexcept { return cause_; }

 private:
  std::string step_;
  Status cause_;
};

/// @brief A task-level wrapping of a child failure.
class CompositionDetail : public ::arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "stepline::CompositionDetail";

  CompositionDetail(std::string task, std::string child, std::size_t position,
                    std::vector<std::string> completed, ExecutionTrace trace, Status cause)
      : task_(std::move(task)),
        child_(std::move(child)),
        position_(position),
        completed_(std::move(completed)),
        trace_(std::move(trace)),
        cause_(std::move(cause)) {}

  const char* type_id() const override { return kTypeId; }
  std::string ToString() const override;

  const std::string& Task() const noexcept { return task_; }
  const std::string& Child() const noexcept { return child_; }
  /// @brief 1-based position of the failing child.
  std::size_t Position() const noexcept { return position_; }
  /// @brief Names of the children that completed before the failure, in order.
  const std::vector<std::string>& Completed() const noexcept { return completed_; }
  /// @brief Outputs of the completed children (empty if the task does not record).
  const ExecutionTrace& Trace() const noexcept { return trace_; }
  const Status& Cause() const noexcept { return cause_; }

 private:
  std::string task_;
  std::string child_;
  std::size_t position_;
  std::vector<std::string> completed_;
  ExecutionTrace trace_;
  Status cause_;
};

/// @brief Execution was aborted by an external cancellation signal.
class CancelledDetail : public ::arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "stepline::CancelledDetail";

  CancelledDetail(std::string unit, std::size_t next_position,
                  std::vector<std::string> completed)
      : unit_(std::move(unit)),
        next_position_(next_position),
        completed_(std::move(completed)) {}

  const char* type_id() const override { return kTypeId; }
  std::string ToString() const override;

  const std::string& Unit() const noexcept { return unit_; }
  /// @brief 1-based position of the child that was not started (0 for a leaf step).
  std::size_t NextPosition() const noexcept { return next_position_; }
  const std::vector<std::string>& Completed() const noexcept { return completed_; }

 private:
  std::string unit_;
  std::size_t next_position_;
  std::vector<std::string> completed_;
};

/// @name Constructors for each error kind.
/// @{
Status ConfigResolutionError(StatusCode code, std::string message, std::string path,
                             std::string stopped_at, std::string step = {});
Status ValidationError(const std::string& step, const std::string& message);
Status ExecutionError(const std::string& step, Status cause);
Status CompositionError(const std::string& task, const std::string& child,
                        std::size_t position, std::vector<std::string> completed,
                        ExecutionTrace trace, Status cause);
Status CancelledError(const std::string& unit, std::size_t next_position,
                      std::vector<std::string> completed);
/// @}

/// @brief Classify a status by its stepline detail.
ErrorKind GetErrorKind(const Status& status);

/// @brief Whether the status already carries a stepline detail.
inline bool IsFrameworkError(const Status& status) {
  auto kind = GetErrorKind(status);
  return kind != ErrorKind::NONE && kind != ErrorKind::OTHER;
}

/// @brief Typed access to the detail of `status`, or null if it carries another detail.
template <class Detail>
std::shared_ptr<Detail> GetDetail(const Status& status) {
  if (status.ok() || status.detail() == nullptr ||
      std::string(status.detail()->type_id()) != Detail::kTypeId) {
    return nullptr;
  }
  return std::static_pointer_cast<Detail>(status.detail());
}

/// @brief The wrapped status one level down (`OK` if the status wraps nothing).
Status CauseOf(const Status& status);

/// @brief The deepest status of the chain.
///
/// For an execution failure this is the domain status the step returned; for
/// configuration, validation and cancellation failures it is that error itself.
Status RootCause(const Status& status);

/// @brief One level of an error chain.
struct ErrorFrame {
  ErrorKind kind = ErrorKind::NONE;
  /// @brief Failing step (or task) at this level. Empty for a plain domain cause.
  std::string unit;
  /// @brief For composition frames: 1-based position of the failing child.
  std::optional<std::size_t> position;
  std::string message;
};

/// @brief Walk an error chain, outermost frame first.
std::vector<ErrorFrame> UnwindErrors(const Status& status);

/// @brief Identity of the unit the failure originated in (the deepest named frame).
std::optional<std::string> FailingUnit(const Status& status);

/// @brief Multi-line human-readable rendering of an error chain.
std::string FormatErrorChain(const Status& status);

}  // namespace sl
