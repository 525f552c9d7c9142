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

#include <stepline/runner/async_runner.h>

#include <stepline/task.h>

#include <folly/executors/CPUThreadPoolExecutor.h>

#include <exception>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace sl::runner {

namespace detail {

/// @brief Units currently executing, keyed by identity.
///
/// A submission holds its top-level unit and every unit nested below it, so two tasks
/// sharing a child never run that child concurrently.
class InFlightUnits {
 public:
  /// @brief Take all of `units`, or none of them if one is already held.
  bool Acquire(const std::vector<const Step*>& units) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto* unit : units) {
      if (units_.count(unit) > 0) {
        return false;
      }
    }
    units_.insert(units.begin(), units.end());
    return true;
  }

  void Release(const std::vector<const Step*>& units) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto* unit : units) {
      units_.erase(unit);
    }
  }

 private:
  std::mutex mutex_;
  std::unordered_set<const Step*> units_;
};

}  // namespace detail

namespace {

void CollectUnits(const Step* unit, std::unordered_set<const Step*>* seen,
                  std::vector<const Step*>* out) {
  if (!seen->insert(unit).second) {
    return;
  }
  out->push_back(unit);
  if (const auto* task = dynamic_cast<const Task*>(unit)) {
    for (std::size_t i = 0; i < task->NumChildren(); ++i) {
      CollectUnits(task->GetChild(i).unit.get(), seen, out);
    }
  }
}

std::vector<const Step*> UnitsOf(const Step* unit) {
  std::unordered_set<const Step*> seen;
  std::vector<const Step*> units;
  CollectUnits(unit, &seen, &units);
  return units;
}

class ReleaseGuard {
 public:
  ReleaseGuard(std::shared_ptr<detail::InFlightUnits> in_flight,
               std::vector<const Step*> units)
      : in_flight_(std::move(in_flight)), units_(std::move(units)) {}
  ~ReleaseGuard() { in_flight_->Release(units_); }

  ReleaseGuard(const ReleaseGuard&) = delete;
  ReleaseGuard& operator=(const ReleaseGuard&) = delete;

 private:
  std::shared_ptr<detail::InFlightUnits> in_flight_;
  std::vector<const Step*> units_;
};

}  // namespace

AsyncRunner::~AsyncRunner() = default;

AsyncRunner::AsyncRunner(std::size_t threads)
    : owned_executor_(std::make_unique<folly::CPUThreadPoolExecutor>(threads)),
      executor_(owned_executor_.get()),
      in_flight_(std::make_shared<detail::InFlightUnits>()) {}

AsyncRunner::AsyncRunner(folly::Executor* executor)
    : executor_(executor), in_flight_(std::make_shared<detail::InFlightUnits>()) {}

AsyncRunner::RunHandle AsyncRunner::Submit(std::shared_ptr<Step> unit, Context context,
                                           Output input, ExecContext exec) {
  if (unit == nullptr) {
    return RunHandle{{}, folly::makeSemiFuture(Result<Output>(
                             Status::Invalid("AsyncRunner: unit must not be null")))};
  }
  std::string name = unit->Name();
  auto units = UnitsOf(unit.get());
  if (!in_flight_->Acquire(units)) {
    return RunHandle{name, folly::makeSemiFuture(Result<Output>(Status::Invalid(
                               "AsyncRunner: unit '", name,
                               "' or one of its children is already running")))};
  }

  auto logger = GetLogger("stepline.runner");
  logger->Debug("Submitting unit", {{"unit", name}});
  auto future =
      folly::via(executor_)
          .thenValue([in_flight = in_flight_, units = std::move(units),
                      unit = std::move(unit), context = std::move(context),
                      input = std::move(input),
                      exec = std::move(exec)](auto&&) -> Result<Output> {
            ReleaseGuard guard(in_flight, units);
            return unit->Execute(context, input, exec);
          })
          .semi();
  return RunHandle{std::move(name), std::move(future)};
}

Result<Output> AsyncRunner::Wait(RunHandle& handle) const {
  try {
    return std::move(handle.future).get();
  } catch (const std::exception& e) {
    return Status::UnknownError("AsyncRunner: unit '", handle.unit, "' did not complete: ",
                                e.what());
  }
}

std::vector<Result<Output>> AsyncRunner::RunAll(std::vector<Submission> submissions) {
  std::vector<RunHandle> handles;
  handles.reserve(submissions.size());
  for (auto& submission : submissions) {
    handles.push_back(Submit(std::move(submission.unit), std::move(submission.context),
                             std::move(submission.input), std::move(submission.exec)));
  }
  std::vector<Result<Output>> results;
  results.reserve(handles.size());
  for (auto& handle : handles) {
    results.push_back(Wait(handle));
  }
  return results;
}

}  // namespace sl::runner
