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

#include <folly/Executor.h>
#include <folly/futures/Future.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <stepline/context.h>
#include <stepline/output.h>
#include <stepline/result.h>
#include <stepline/step.h>

namespace folly {
class CPUThreadPoolExecutor;
}  // namespace folly

namespace sl::runner {

namespace detail {
class InFlightUnits;
}  // namespace detail

/// @brief Runs independent top-level units (steps or tasks) concurrently on a Folly CPU
/// pool.
///
/// Every submission carries its own context, input and execution controls; nothing is
/// shared between submissions except the (read-only) contexts the caller passes in. A
/// unit instance is a single execution lane: submitting a unit that is still in flight,
/// or a task that shares a child with one in flight, fails with `Invalid` instead of
/// running that unit twice.
class AsyncRunner {
 public:
  /// @brief Construct and own a CPU thread pool.
  explicit AsyncRunner(std::size_t threads = 1);

  /// @brief Bind to an externally managed Folly executor.
  explicit AsyncRunner(folly::Executor* executor);

  ~AsyncRunner();

  AsyncRunner(const AsyncRunner&) = delete;
  AsyncRunner& operator=(const AsyncRunner&) = delete;

  struct Submission {
    std::shared_ptr<Step> unit;
    Context context;
    Output input;
    ExecContext exec;
  };

  /// @brief Handle returned by `Submit` for later waiting.
  struct RunHandle {
    std::string unit;
    folly::SemiFuture<Result<Output>> future;
  };

  /// @brief Schedule `unit->Execute(context, input, exec)` on the pool.
  RunHandle Submit(std::shared_ptr<Step> unit, Context context, Output input = {},
                   ExecContext exec = {});

  /// @brief Wait for a submitted unit and return its result.
  Result<Output> Wait(RunHandle& handle) const;

  /// @brief Submit a batch and wait for all of it. Results are in submission order.
  std::vector<Result<Output>> RunAll(std::vector<Submission> submissions);

 private:
  std::unique_ptr<folly::CPUThreadPoolExecutor> owned_executor_;
  folly::Executor* executor_;
  std::shared_ptr<detail::InFlightUnits> in_flight_;
};

}  // namespace sl::runner
