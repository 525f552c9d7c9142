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

#include <stepline/context.h>

#include <stepline/errors.h>

#include <mutex>
#include <utility>

namespace sl {

namespace {

constexpr const char* kRootNamespace = "<root>";

std::string JoinSegments(const std::vector<std::string>& segments, std::size_t count) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) {
      out += '.';
    }
    out += segments[i];
  }
  return out;
}

Value SetAtPath(const Mapping& base, const std::vector<std::string>& segments,
                std::size_t index, Value value) {
  Mapping copy = base;
  if (index + 1 == segments.size()) {
    copy.insert_or_assign(segments[index], std::move(value));
    return Value(std::move(copy));
  }
  static const Mapping kEmpty;
  auto it = copy.find(segments[index]);
  const Mapping& child =
      (it != copy.end() && it->second.IsMapping()) ? it->second.GetMapping() : kEmpty;
  auto nested = SetAtPath(child, segments, index + 1, std::move(value));
  copy.insert_or_assign(segments[index], std::move(nested));
  return Value(std::move(copy));
}

void FlattenInto(const Mapping& mapping, const std::string& prefix,
                 std::map<std::string, Value>* out) {
  for (const auto& [key, value] : mapping) {
    std::string path = prefix.empty() ? key : prefix + "." + key;
    if (value.IsMapping()) {
      FlattenInto(value.GetMapping(), path, out);
    } else {
      out->emplace(std::move(path), value);
    }
  }
}

}  // namespace

Result<std::vector<std::string>> SplitPath(std::string_view path) {
  if (path.empty()) {
    return Status::Invalid("context path must not be empty");
  }
  std::vector<std::string> segments;
  std::size_t begin = 0;
  while (true) {
    auto end = path.find('.', begin);
    auto segment = path.substr(begin, end == std::string_view::npos ? end : end - begin);
    if (segment.empty()) {
      return Status::Invalid("context path '", path, "' has an empty segment");
    }
    segments.emplace_back(segment);
    if (end == std::string_view::npos) {
      break;
    }
    begin = end + 1;
  }
  return segments;
}

std::string JoinPath(std::string_view prefix, std::string_view key) {
  std::string path(prefix);
  if (!path.empty()) {
    path += '.';
  }
  path.append(key);
  return path;
}

Mapping MergeMappings(const Mapping& base, const Mapping& overlay) {
  Mapping merged = base;
  for (const auto& [key, value] : overlay) {
    auto it = merged.find(key);
    if (it != merged.end() && it->second.IsMapping() && value.IsMapping()) {
      it->second = Value(MergeMappings(it->second.GetMapping(), value.GetMapping()));
    } else {
      merged.insert_or_assign(key, value);
    }
  }
  return merged;
}

Context::Context() : root_(std::make_shared<const Mapping>()) {}

Context::Context(Mapping root) : root_(std::make_shared<const Mapping>(std::move(root))) {}

Context Context::FromSources(const std::vector<Context>& sources) {
  Context merged;
  for (const auto& source : sources) {
    merged = merged.Merge(source);
  }
  return merged;
}

Result<Context> Context::FromValue(const Value& value) {
  if (!value.IsMapping()) {
    return Status::TypeError("context root must be a MAPPING, got ",
                             ValueKindToString(value.Kind()));
  }
  return Context(value.GetMapping());
}

Result<Value> Context::Resolve(std::string_view path) const {
  ARROW_ASSIGN_OR_RAISE(auto segments, SplitPath(path));
  const Mapping* current = root_.get();
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const std::string stopped_at = i == 0 ? kRootNamespace : JoinSegments(segments, i);
    auto it = current->find(segments[i]);
    if (it == current->end()) {
      return ConfigResolutionError(StatusCode::KeyError,
                                   "context path '" + std::string(path) +
                                       "' not found: no key '" + segments[i] +
                                       "' in namespace '" + stopped_at + "'",
                                   std::string(path), stopped_at);
    }
    if (i + 1 == segments.size()) {
      return it->second;
    }
    if (!it->second.IsMapping()) {
      const std::string scalar = JoinSegments(segments, i + 1);
      return ConfigResolutionError(StatusCode::KeyError,
                                   "context path '" + std::string(path) +
                                       "' not found: '" + scalar + "' is a " +
                                       ValueKindToString(it->second.Kind()) +
                                       ", not a namespace",
                                   std::string(path), scalar);
    }
    current = &it->second.GetMapping();
  }
  return Status::Invalid("context path '", path, "' could not be resolved");
}

Result<std::string> Context::ResolveString(std::string_view path) const {
  ARROW_ASSIGN_OR_RAISE(auto value, Resolve(path));
  return value.AsString();
}

Result<std::int64_t> Context::ResolveInt64(std::string_view path) const {
  ARROW_ASSIGN_OR_RAISE(auto value, Resolve(path));
  return value.AsInt64();
}

Result<double> Context::ResolveDouble(std::string_view path) const {
  ARROW_ASSIGN_OR_RAISE(auto value, Resolve(path));
  return value.AsDouble();
}

Result<bool> Context::ResolveBool(std::string_view path) const {
  ARROW_ASSIGN_OR_RAISE(auto value, Resolve(path));
  return value.AsBool();
}

Value Context::Get(std::string_view path, Value fallback) const {
  auto resolved = Resolve(path);
  if (!resolved.ok()) {
    return fallback;
  }
  return std::move(resolved).ValueOrDie();
}

Context Context::Merge(const Context& other) const {
  if (other.Empty()) {
    return *this;
  }
  if (Empty()) {
    return other;
  }
  return Context(MergeMappings(*root_, *other.root_));
}

Context Context::WithOverrides(const Mapping& overrides) const {
  return Merge(Context(overrides));
}

Result<Context> Context::With(std::string_view path, Value value) const {
  ARROW_ASSIGN_OR_RAISE(auto segments, SplitPath(path));
  auto root = SetAtPath(*root_, segments, 0, std::move(value));
  return Context(root.GetMapping());
}

Result<Context> Context::Scoped(std::string_view path) const {
  ARROW_ASSIGN_OR_RAISE(auto value, Resolve(path));
  if (!value.IsMapping()) {
    return ConfigResolutionError(StatusCode::TypeError,
                                 "context path '" + std::string(path) + "' is a " +
                                     ValueKindToString(value.Kind()) +
                                     ", not a namespace",
                                 std::string(path), std::string(path));
  }
  return Context(value.GetMapping());
}

std::map<std::string, Value> Context::Flatten() const {
  std::map<std::string, Value> out;
  FlattenInto(*root_, std::string(), &out);
  return out;
}

std::vector<std::string> Context::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(root_->size());
  for (const auto& entry : *root_) {
    keys.push_back(entry.first);
  }
  return keys;
}

bool Context::Equals(const Context& other) const {
  return SharesRoot(other) || AsValue().Equals(other.AsValue());
}

std::string Context::ToString() const { return "Context" + AsValue().ToString(); }

namespace {

struct DefaultContextHolder {
  std::mutex mutex;
  std::shared_ptr<const Context> context;
  bool frozen = false;
};

DefaultContextHolder& GetDefaultContextHolder() {
  static DefaultContextHolder holder;
  return holder;
}

}  // namespace

std::shared_ptr<const Context> DefaultContext() {
  auto& holder = GetDefaultContextHolder();
  std::lock_guard<std::mutex> lock(holder.mutex);
  if (holder.context == nullptr) {
    holder.context = std::make_shared<const Context>();
  }
  holder.frozen = true;
  return holder.context;
}

Status InitDefaultContext(Context context) {
  auto& holder = GetDefaultContextHolder();
  std::lock_guard<std::mutex> lock(holder.mutex);
  if (holder.frozen) {
    return Status::AlreadyExists(
        "default context is already in use and can no longer be replaced");
  }
  holder.context = std::make_shared<const Context>(std::move(context));
  holder.frozen = true;
  return Status::OK();
}

}  // namespace sl
