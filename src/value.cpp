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

#include <stepline/value.h>

#include <arrow/table.h>

#include <sstream>

namespace sl {

namespace {

Status KindMismatch(ValueKind expected, ValueKind actual) {
  return Status::TypeError("expected ", ValueKindToString(expected), " value, got ",
                           ValueKindToString(actual));
}

}  // namespace

std::string ValueKindToString(ValueKind kind) {
  switch (kind) {
    case ValueKind::NONE:
      return "NONE";
    case ValueKind::BOOL:
      return "BOOL";
    case ValueKind::INT64:
      return "INT64";
    case ValueKind::DOUBLE:
      return "DOUBLE";
    case ValueKind::STRING:
      return "STRING";
    case ValueKind::SEQUENCE:
      return "SEQUENCE";
    case ValueKind::MAPPING:
      return "MAPPING";
    case ValueKind::TABLE:
      return "TABLE";
    case ValueKind::ANY:
      return "ANY";
  }
  return "UNKNOWN";
}

Value::Value(Sequence v) : repr_(std::make_shared<const Sequence>(std::move(v))) {}

Value::Value(Mapping v) : repr_(std::make_shared<const Mapping>(std::move(v))) {}

ValueKind Value::Kind() const noexcept {
  switch (repr_.index()) {
    case 0:
      return ValueKind::NONE;
    case 1:
      return ValueKind::BOOL;
    case 2:
      return ValueKind::INT64;
    case 3:
      return ValueKind::DOUBLE;
    case 4:
      return ValueKind::STRING;
    case 5:
      return ValueKind::SEQUENCE;
    case 6:
      return ValueKind::MAPPING;
    case 7:
      return ValueKind::TABLE;
  }
  return ValueKind::NONE;
}

Result<bool> Value::AsBool() const {
  if (const auto* v = std::get_if<bool>(&repr_)) {
    return *v;
  }
  return KindMismatch(ValueKind::BOOL, Kind());
}

Result<std::int64_t> Value::AsInt64() const {
  if (const auto* v = std::get_if<std::int64_t>(&repr_)) {
    return *v;
  }
  return KindMismatch(ValueKind::INT64, Kind());
}

Result<double> Value::AsDouble() const {
  if (const auto* v = std::get_if<double>(&repr_)) {
    return *v;
  }
  if (const auto* v = std::get_if<std::int64_t>(&repr_)) {
    return static_cast<double>(*v);
  }
  return KindMismatch(ValueKind::DOUBLE, Kind());
}

Result<std::string> Value::AsString() const {
  if (const auto* v = std::get_if<std::string>(&repr_)) {
    return *v;
  }
  return KindMismatch(ValueKind::STRING, Kind());
}

Result<std::shared_ptr<arrow::Table>> Value::AsTable() const {
  if (const auto* v = std::get_if<std::shared_ptr<arrow::Table>>(&repr_)) {
    if (*v == nullptr) {
      return Status::Invalid("table value is null");
    }
    return *v;
  }
  return KindMismatch(ValueKind::TABLE, Kind());
}

bool Value::Equals(const Value& other) const {
  if (Kind() != other.Kind()) {
    return false;
  }
  switch (Kind()) {
    case ValueKind::NONE:
      return true;
    case ValueKind::BOOL:
      return std::get<bool>(repr_) == std::get<bool>(other.repr_);
    case ValueKind::INT64:
      return std::get<std::int64_t>(repr_) == std::get<std::int64_t>(other.repr_);
    case ValueKind::DOUBLE:
      return std::get<double>(repr_) == std::get<double>(other.repr_);
    case ValueKind::STRING:
      return std::get<std::string>(repr_) == std::get<std::string>(other.repr_);
    case ValueKind::SEQUENCE: {
      const auto& lhs = GetSequence();
      const auto& rhs = other.GetSequence();
      if (lhs.size() != rhs.size()) {
        return false;
      }
      for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!lhs[i].Equals(rhs[i])) {
          return false;
        }
      }
      return true;
    }
    case ValueKind::MAPPING: {
      const auto& lhs = GetMapping();
      const auto& rhs = other.GetMapping();
      if (lhs.size() != rhs.size()) {
        return false;
      }
      for (auto l = lhs.begin(), r = rhs.begin(); l != lhs.end(); ++l, ++r) {
        if (l->first != r->first || !l->second.Equals(r->second)) {
          return false;
        }
      }
      return true;
    }
    case ValueKind::TABLE: {
      const auto& lhs = std::get<std::shared_ptr<arrow::Table>>(repr_);
      const auto& rhs = std::get<std::shared_ptr<arrow::Table>>(other.repr_);
      if (lhs == nullptr || rhs == nullptr) {
        return lhs == rhs;
      }
      return lhs->Equals(*rhs);
    }
    case ValueKind::ANY:
      break;
  }
  return false;
}

std::string Value::ToString() const {
  std::ostringstream os;
  switch (Kind()) {
    case ValueKind::NONE:
      os << "null";
      break;
    case ValueKind::BOOL:
      os << (std::get<bool>(repr_) ? "true" : "false");
      break;
    case ValueKind::INT64:
      os << std::get<std::int64_t>(repr_);
      break;
    case ValueKind::DOUBLE:
      os << std::get<double>(repr_);
      break;
    case ValueKind::STRING:
      os << '"' << std::get<std::string>(repr_) << '"';
      break;
    case ValueKind::SEQUENCE: {
      os << '[';
      bool first = true;
      for (const auto& item : GetSequence()) {
        os << (first ? "" : ", ") << item.ToString();
        first = false;
      }
      os << ']';
      break;
    }
    case ValueKind::MAPPING: {
      os << '{';
      bool first = true;
      for (const auto& [key, item] : GetMapping()) {
        os << (first ? "" : ", ") << key << ": " << item.ToString();
        first = false;
      }
      os << '}';
      break;
    }
    case ValueKind::TABLE: {
      const auto& table = std::get<std::shared_ptr<arrow::Table>>(repr_);
      if (table == nullptr) {
        os << "table(null)";
      } else {
        os << "table(rows=" << table->num_rows() << ", schema={"
           << table->schema()->ToString(/*show_metadata=*/false) << "})";
      }
      break;
    }
    case ValueKind::ANY:
      os << "any";
      break;
  }
  return os.str();
}

bool Accepts(ValueKind expected, const Value& value) {
  if (expected == ValueKind::ANY) {
    return true;
  }
  if (expected == ValueKind::DOUBLE && value.Kind() == ValueKind::INT64) {
    return true;
  }
  return value.Kind() == expected;
}

}  // namespace sl
