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
#include <string>
#include <utility>
#include <vector>

#include <stepline/result.h>
#include <stepline/value.h>

namespace sl {

/// @brief Name of the dataset field populated by readers/transformations and consumed
/// by transformations/writers.
inline constexpr const char* kTableField = "table";

/// @brief One declared field of a step's output (or required input).
struct FieldSpec {
  std::string name;
  ValueKind kind = ValueKind::ANY;
  /// @brief Optional fields may be absent or `NONE`.
  bool optional = false;
};

using OutputSchema = std::vector<FieldSpec>;

struct TraceEntry;

/// @brief Per-child outputs recorded by a `Task` run, in execution order.
using ExecutionTrace = std::vector<TraceEntry>;

/// @brief Named-field result record produced by a step execution.
///
/// An `Output` is also the working artifact threaded between the children of a `Task`:
/// child i's output is overlaid onto the artifact handed to child i+1.
///
/// The field set is open; conformance to a step's declared schema is checked by
/// `Validate(schema)` after the step runs.
class Output {
 public:
  Output() = default;

  /// @brief Set (or overwrite) a field.
  Output& Set(std::string name, Value value);

  bool Has(const std::string& name) const;

  /// @brief `KeyError` if the field is absent.
  Result<Value> Get(const std::string& name) const;

  /// @brief `KeyError` if absent, `TypeError` if the field is not a table.
  Result<std::shared_ptr<arrow::Table>> GetTable(const std::string& name = kTableField) const;

  const Mapping& Fields() const noexcept { return fields_; }
  std::size_t Size() const noexcept { return fields_.size(); }
  bool Empty() const noexcept { return fields_.empty(); }

  /// @brief Copy of this output overlaid by `later` (fields of `later` win). The trace of
  /// `later` is kept when it has one.
  Output MergedWith(const Output& later) const;

  /// @brief Check every declared field is present and kind-conformant.
  ///
  /// Returns `KeyError` for a missing field and `TypeError` for a kind mismatch.
  Status Validate(const OutputSchema& schema) const;

  /// @brief Execution trace attached by a `Task`. Empty when none was recorded.
  const ExecutionTrace& Trace() const;
  bool HasTrace() const noexcept { return trace_ != nullptr; }
  void SetTrace(ExecutionTrace trace);

  /// @brief Field-wise equality. The trace is not compared.
  bool Equals(const Output& other) const;
  bool operator==(const Output& other) const { return Equals(other); }

  std::string ToString() const;

 private:
  Mapping fields_;
  std::shared_ptr<const ExecutionTrace> trace_;
};

/// @brief One completed child of a `Task` run.
struct TraceEntry {
  std::string name;
  /// @brief 1-based position of the child within its task.
  std::size_t position = 0;
  Output output;
};

}  // namespace sl
