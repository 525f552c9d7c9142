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

#include <stepline/output.h>

#include <sstream>

namespace sl {

Output& Output::Set(std::string name, Value value) {
  fields_.insert_or_assign(std::move(name), std::move(value));
  return *this;
}

bool Output::Has(const std::string& name) const { return fields_.count(name) > 0; }

Result<Value> Output::Get(const std::string& name) const {
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    return Status::KeyError("output field '", name, "' is not present");
  }
  return it->second;
}

Result<std::shared_ptr<arrow::Table>> Output::GetTable(const std::string& name) const {
  ARROW_ASSIGN_OR_RAISE(auto value, Get(name));
  auto table = value.AsTable();
  if (!table.ok()) {
    return table.status().WithMessage("output field '", name,
                                      "': ", table.status().message());
  }
  return table;
}

Output Output::MergedWith(const Output& later) const {
  Output merged = *this;
  for (const auto& [name, value] : later.fields_) {
    merged.fields_.insert_or_assign(name, value);
  }
  if (later.trace_ != nullptr) {
    merged.trace_ = later.trace_;
  }
  return merged;
}

Status Output::Validate(const OutputSchema& schema) const {
  for (const auto& spec : schema) {
    auto it = fields_.find(spec.name);
    if (it == fields_.end() || it->second.IsNone()) {
      if (spec.optional) {
        continue;
      }
      return Status::KeyError("declared output field '", spec.name, "' is missing");
    }
    if (!Accepts(spec.kind, it->second)) {
      return Status::TypeError("declared output field '", spec.name, "' expects ",
                               ValueKindToString(spec.kind), ", got ",
                               ValueKindToString(it->second.Kind()));
    }
  }
  return Status::OK();
}

const ExecutionTrace& Output::Trace() const {
  static const ExecutionTrace kEmpty;
  return trace_ != nullptr ? *trace_ : kEmpty;
}

void Output::SetTrace(ExecutionTrace trace) {
  trace_ = std::make_shared<const ExecutionTrace>(std::move(trace));
}

bool Output::Equals(const Output& other) const {
  if (fields_.size() != other.fields_.size()) {
    return false;
  }
  for (auto l = fields_.begin(), r = other.fields_.begin(); l != fields_.end(); ++l, ++r) {
    if (l->first != r->first || !l->second.Equals(r->second)) {
      return false;
    }
  }
  return true;
}

std::string Output::ToString() const {
  std::ostringstream os;
  os << "Output{";
  bool first = true;
  for (const auto& [name, value] : fields_) {
    os << (first ? "" : ", ") << name << "=" << value.ToString();
    first = false;
  }
  os << '}';
  return os.str();
}

}  // namespace sl
