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

#include <cassert>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <stepline/result.h>

namespace arrow {
class Table;
}  // namespace arrow

namespace sl {

class Value;

/// @brief Ordered list of values.
using Sequence = std::vector<Value>;

/// @brief Namespace of uniquely-keyed values. Keys iterate in sorted order.
using Mapping = std::map<std::string, Value>;

/// @brief Kind tag of a `Value`.
///
/// `ANY` never describes a stored value. It is only used by requirement and output
/// field specs to accept every kind.
enum class ValueKind {
  NONE,
  BOOL,
  INT64,
  DOUBLE,
  STRING,
  SEQUENCE,
  MAPPING,
  TABLE,
  ANY,
};

std::string ValueKindToString(ValueKind kind);

/// @brief Immutable tagged value stored in a `Context` or an `Output`.
///
/// Sequences and mappings are held through shared immutable storage: copying a `Value`
/// is cheap and never exposes mutable state to another holder. Tables are held by
/// `std::shared_ptr<arrow::Table>` (Arrow tables are immutable).
class Value {
 public:
  Value() = default;
  Value(bool v) : repr_(std::in_place_type<bool>, v) {}
  Value(int v) : repr_(std::in_place_type<std::int64_t>, v) {}
  Value(std::int64_t v) : repr_(std::in_place_type<std::int64_t>, v) {}
  Value(double v) : repr_(std::in_place_type<double>, v) {}
  Value(const char* v) : repr_(std::in_place_type<std::string>, v) {}
  Value(std::string v) : repr_(std::in_place_type<std::string>, std::move(v)) {}
  Value(Sequence v);
  Value(Mapping v);
  Value(std::shared_ptr<arrow::Table> v) : repr_(std::move(v)) {}

  ValueKind Kind() const noexcept;

  bool IsNone() const noexcept { return Kind() == ValueKind::NONE; }
  bool IsMapping() const noexcept { return Kind() == ValueKind::MAPPING; }
  bool IsSequence() const noexcept { return Kind() == ValueKind::SEQUENCE; }

  Result<bool> AsBool() const;
  Result<std::int64_t> AsInt64() const;
  /// @brief Numeric view. `INT64` values are widened.
  Result<double> AsDouble() const;
  Result<std::string> AsString() const;
  Result<std::shared_ptr<arrow::Table>> AsTable() const;

  const Sequence& GetSequence() const {
    assert(IsSequence());
    return *std::get<std::shared_ptr<const Sequence>>(repr_);
  }

  const Mapping& GetMapping() const {
    assert(IsMapping());
    return *std::get<std::shared_ptr<const Mapping>>(repr_);
  }

  /// @brief Deep equality. Tables compare by content.
  bool Equals(const Value& other) const;

  bool operator==(const Value& other) const { return Equals(other); }

  std::string ToString() const;

 private:
  std::variant<std::monostate, bool, std::int64_t, double, std::string,
               std::shared_ptr<const Sequence>, std::shared_ptr<const Mapping>,
               std::shared_ptr<arrow::Table>>
      repr_;
};

/// @brief Whether `value` is acceptable where a field of kind `expected` is declared.
///
/// `ANY` accepts everything, `DOUBLE` also accepts `INT64`, every other kind must match
/// exactly.
bool Accepts(ValueKind expected, const Value& value);

}  // namespace sl
