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

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <stepline/result.h>
#include <stepline/value.h>

namespace sl {

/// @brief Split a dotted path (`a.b.c`) into its segments.
///
/// An empty path or an empty segment is `Invalid`.
Result<std::vector<std::string>> SplitPath(std::string_view path);

/// @brief `prefix.key`, or `key` alone when `prefix` is empty.
std::string JoinPath(std::string_view prefix, std::string_view key);

/// @brief Hierarchical, mergeable configuration/environment container.
///
/// A `Context` is a tree of namespaces: each namespace maps unique string keys to
/// values, and a `MAPPING` value is a nested namespace. Values are looked up by dotted
/// path.
///
/// Contexts are immutable. Every "modifying" operation (`Merge`, `WithOverrides`,
/// `With`, `Scoped`) returns a new instance that shares unchanged subtrees with its
/// operands, so a context handed to a step can be read concurrently by independent
/// runs without synchronization.
///
/// Merge rule (later sources win):
/// - a key present only on one side is kept
/// - when both sides hold a namespace at the same key, the namespaces are merged
///   recursively
/// - otherwise (scalar vs scalar, namespace vs scalar) the later value replaces the
///   earlier one outright
class Context {
 public:
  /// @brief Empty context.
  Context();

  explicit Context(Mapping root);

  /// @brief Build a context from ordered sources, later sources taking precedence.
  static Context FromSources(const std::vector<Context>& sources);

  /// @brief Wrap a `MAPPING` value. Any other kind is a `TypeError`.
  static Result<Context> FromValue(const Value& value);

  const Mapping& Root() const noexcept { return *root_; }
  Value AsValue() const { return Value(*root_); }
  bool Empty() const noexcept { return root_->empty(); }

  /// @brief Dotted-path lookup.
  ///
  /// Fails with `KeyError` carrying a `ConfigResolutionDetail` (full path plus the
  /// namespace at which resolution stopped) if any segment is missing or a
  /// non-namespace value is traversed. A malformed path is `Invalid`.
  Result<Value> Resolve(std::string_view path) const;

  Result<std::string> ResolveString(std::string_view path) const;
  Result<std::int64_t> ResolveInt64(std::string_view path) const;
  Result<double> ResolveDouble(std::string_view path) const;
  Result<bool> ResolveBool(std::string_view path) const;

  bool Contains(std::string_view path) const { return Resolve(path).ok(); }

  /// @brief `Resolve(path)` or `fallback` if it does not resolve.
  Value Get(std::string_view path, Value fallback = Value()) const;

  /// @brief New context merging `other` over this one. Neither operand is modified.
  Context Merge(const Context& other) const;

  /// @brief `Merge` with `overrides` as the highest-precedence source.
  Context WithOverrides(const Mapping& overrides) const;
  Context WithOverrides(const Context& overrides) const { return Merge(overrides); }

  /// @brief New context with `value` set at `path`, creating intermediate namespaces.
  ///
  /// A non-namespace value in the way of `path` is replaced by a namespace.
  Result<Context> With(std::string_view path, Value value) const;

  /// @brief Narrowed context rooted at the namespace at `path`.
  Result<Context> Scoped(std::string_view path) const;

  /// @brief Leaf values keyed by their full dotted path. Empty namespaces are dropped.
  std::map<std::string, Value> Flatten() const;

  std::vector<std::string> Keys() const;

  /// @brief Whether both contexts are views of the same snapshot.
  bool SharesRoot(const Context& other) const noexcept { return root_ == other.root_; }

  bool Equals(const Context& other) const;
  bool operator==(const Context& other) const { return Equals(other); }

  std::string ToString() const;

 private:
  std::shared_ptr<const Mapping> root_;
};

/// @brief Merge two mappings per the context merge rule. Exposed for sources.
Mapping MergeMappings(const Mapping& base, const Mapping& overlay);

/// @brief Process-wide default context, used only when a step is given none.
///
/// The default is a single boot-time object. It is empty unless `InitDefaultContext` is
/// called before the first `DefaultContext()` access; after that first access (or after
/// one successful install) it is frozen for the lifetime of the process.
std::shared_ptr<const Context> DefaultContext();

/// @brief Install the default context. `AlreadyExists` once the default is frozen.
Status InitDefaultContext(Context context);

}  // namespace sl
