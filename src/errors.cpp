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

#include <stepline/errors.h>

#include <sstream>
#include <utility>

namespace sl {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
  std::ostringstream os;
  os << '[';
  for (std::size_t i = 0; i < names.size(); ++i) {
    os << (i == 0 ? "" : ", ") << names[i];
  }
  os << ']';
  return os.str();
}

}  // namespace

std::string ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "NONE";
    case ErrorKind::CONFIG_RESOLUTION:
      return "CONFIG_RESOLUTION";
    case ErrorKind::VALIDATION:
      return "VALIDATION";
    case ErrorKind::EXECUTION:
      return "EXECUTION";
    case ErrorKind::COMPOSITION:
      return "COMPOSITION";
    case ErrorKind::CANCELLED:
      return "CANCELLED";
    case ErrorKind::OTHER:
      return "OTHER";
  }
  return "UNKNOWN";
}

std::string ConfigResolutionDetail::ToString() const {
  std::string out = "config path '" + path_ + "' stopped at '" + stopped_at_ + "'";
  if (!step_.empty()) {
    out += " (required by step '" + step_ + "')";
  }
  return out;
}

std::string ValidationDetail::ToString() const {
  return "validation failed in step '" + step_ + "'";
}

std::string ExecutionDetail::ToString() const {
  return "execution failed in step '" + step_ + "': " + cause_.ToString();
}

std::string CompositionDetail::ToString() const {
  return "task '" + task_ + "' failed at child '" + child_ + "' (position " +
         std::to_string(position_) + "), completed " + JoinNames(completed_);
}

std::string CancelledDetail::ToString() const {
  return "'" + unit_ + "' cancelled before position " + std::to_string(next_position_) +
         ", completed " + JoinNames(completed_);
}

Status ConfigResolutionError(StatusCode code, std::string message, std::string path,
                             std::string stopped_at, std::string step) {
  return Status(code, std::move(message),
                std::make_shared<ConfigResolutionDetail>(
                    std::move(path), std::move(stopped_at), std::move(step)));
}

Status ValidationError(const std::string& step, const std::string& message) {
  return Status(StatusCode::Invalid, "Step '" + step + "': " + message,
                std::make_shared<ValidationDetail>(step));
}

Status ExecutionError(const std::string& step, Status cause) {
  std::string message = "Step '" + step + "' failed: " + cause.message();
  return Status(StatusCode::ExecutionError, std::move(message),
                std::make_shared<ExecutionDetail>(step, std::move(cause)));
}

Status CompositionError(const std::string& task, const std::string& child,
                        std::size_t position, std::vector<std::string> completed,
                        ExecutionTrace trace, Status cause) {
  std::string message = "Task '" + task + "' failed at child '" + child + "' (" +
                        std::to_string(position) + "): " + cause.message();
  auto code = cause.code();
  return Status(code, std::move(message),
                std::make_shared<CompositionDetail>(task, child, position,
                                                    std::move(completed), std::move(trace),
                                                    std::move(cause)));
}

Status CancelledError(const std::string& unit, std::size_t next_position,
                      std::vector<std::string> completed) {
  std::string message = "'" + unit + "' cancelled";
  if (next_position > 0) {
    message += " before child " + std::to_string(next_position);
  }
  return Status(StatusCode::Cancelled, std::move(message),
                std::make_shared<CancelledDetail>(unit, next_position, std::move(completed)));
}

ErrorKind GetErrorKind(const Status& status) {
  if (status.ok()) {
    return ErrorKind::NONE;
  }
  const auto& detail = status.detail();
  if (detail == nullptr) {
    return ErrorKind::OTHER;
  }
  const std::string type_id = detail->type_id();
  if (type_id == ConfigResolutionDetail::kTypeId) {
    return ErrorKind::CONFIG_RESOLUTION;
  }
  if (type_id == ValidationDetail::kTypeId) {
    return ErrorKind::VALIDATION;
  }
  if (type_id == ExecutionDetail::kTypeId) {
    return ErrorKind::EXECUTION;
  }
  if (type_id == CompositionDetail::kTypeId) {
    return ErrorKind::COMPOSITION;
  }
  if (type_id == CancelledDetail::kTypeId) {
    return ErrorKind::CANCELLED;
  }
  return ErrorKind::OTHER;
}

Status CauseOf(const Status& status) {
  if (auto composition = GetDetail<CompositionDetail>(status)) {
    return composition->Cause();
  }
  if (auto execution = GetDetail<ExecutionDetail>(status)) {
    return execution->Cause();
  }
  return Status::OK();
}

Status RootCause(const Status& status) {
  Status current = status;
  while (true) {
    Status next = CauseOf(current);
    if (next.ok()) {
      return current;
    }
    current = std::move(next);
  }
}

std::vector<ErrorFrame> UnwindErrors(const Status& status) {
  std::vector<ErrorFrame> frames;
  Status current = status;
  while (!current.ok()) {
    ErrorFrame frame;
    frame.kind = GetErrorKind(current);
    frame.message = current.message();
    switch (frame.kind) {
      case ErrorKind::CONFIG_RESOLUTION:
        frame.unit = GetDetail<ConfigResolutionDetail>(current)->Step();
        break;
      case ErrorKind::VALIDATION:
        frame.unit = GetDetail<ValidationDetail>(current)->Step();
        break;
      case ErrorKind::EXECUTION:
        frame.unit = GetDetail<ExecutionDetail>(current)->Step();
        break;
      case ErrorKind::COMPOSITION: {
        auto composition = GetDetail<CompositionDetail>(current);
        frame.unit = composition->Task();
        frame.position = composition->Position();
        break;
      }
      case ErrorKind::CANCELLED:
        frame.unit = GetDetail<CancelledDetail>(current)->Unit();
        break;
      case ErrorKind::NONE:
      case ErrorKind::OTHER:
        break;
    }
    frames.push_back(std::move(frame));
    current = CauseOf(current);
  }
  return frames;
}

std::optional<std::string> FailingUnit(const Status& status) {
  auto frames = UnwindErrors(status);
  for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
    if (!it->unit.empty()) {
      return it->unit;
    }
  }
  return std::nullopt;
}

std::string FormatErrorChain(const Status& status) {
  if (status.ok()) {
    return "OK";
  }
  std::ostringstream os;
  os << status.CodeAsString();
  std::size_t depth = 0;
  for (const auto& frame : UnwindErrors(status)) {
    os << '\n' << std::string(2 * ++depth, ' ') << ErrorKindToString(frame.kind);
    if (!frame.unit.empty()) {
      os << " [" << frame.unit;
      if (frame.position.has_value()) {
        os << " @" << *frame.position;
      }
      os << ']';
    }
    os << ": " << frame.message;
  }
  return os.str();
}

}  // namespace sl
