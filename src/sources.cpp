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

#include <stepline/sources.h>

#include <stepline/logging.h>

#include <yaml-cpp/yaml.h>

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <utility>
#include <vector>

namespace sl {

namespace {

bool IsNullScalar(const std::string& text) {
  return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

Value PlainScalar(const YAML::Node& node) {
  const std::string& text = node.Scalar();
  if (IsNullScalar(text)) {
    return Value();
  }
  std::int64_t i;
  if (YAML::convert<std::int64_t>::decode(node, i)) {
    return Value(i);
  }
  double d;
  if (YAML::convert<double>::decode(node, d)) {
    return Value(d);
  }
  bool b;
  if (YAML::convert<bool>::decode(node, b)) {
    return Value(b);
  }
  return Value(text);
}

Result<Value> FromNode(const YAML::Node& node, const std::string& where) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return Value();
    case YAML::NodeType::Scalar:
      // Quoted scalars carry the non-specific "!" tag.
      if (node.Tag() == "!") {
        return Value(node.Scalar());
      }
      return PlainScalar(node);
    case YAML::NodeType::Sequence: {
      Sequence items;
      items.reserve(node.size());
      for (std::size_t i = 0; i < node.size(); ++i) {
        ARROW_ASSIGN_OR_RAISE(auto item, FromNode(node[i], where + "[" + std::to_string(i) + "]"));
        items.push_back(std::move(item));
      }
      return Value(std::move(items));
    }
    case YAML::NodeType::Map: {
      Mapping entries;
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          return Status::Invalid("non-scalar key under '", where, "'");
        }
        const auto key = entry.first.Scalar();
        if (key.empty() || key.find('.') != std::string::npos) {
          return Status::Invalid("key '", key, "' under '", where,
                                 "' is not a valid path segment");
        }
        ARROW_ASSIGN_OR_RAISE(auto value, FromNode(entry.second, JoinPath(where, key)));
        if (!entries.emplace(key, std::move(value)).second) {
          return Status::Invalid("duplicate key '", key, "' under '", where, "'");
        }
      }
      return Value(std::move(entries));
    }
  }
  return Status::Invalid("unsupported YAML node under '", where, "'");
}

Result<Context> FromDocument(const YAML::Node& document) {
  if (!document.IsDefined() || document.IsNull()) {
    return Context();
  }
  if (!document.IsMap()) {
    return Status::Invalid("configuration document must be a mapping");
  }
  ARROW_ASSIGN_OR_RAISE(auto root, FromNode(document, ""));
  return Context::FromValue(root);
}

std::string FormatDouble(double v) {
  if (std::isnan(v)) {
    return ".nan";
  }
  if (std::isinf(v)) {
    return v > 0 ? ".inf" : "-.inf";
  }
  std::ostringstream out;
  out.precision(17);
  out << v;
  std::string text = out.str();
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

// A string that would read back as another kind must be quoted.
bool NeedsQuoting(const std::string& text) {
  return IsNullScalar(text) || PlainScalar(YAML::Node(text)).Kind() != ValueKind::STRING;
}

Status Emit(const Value& value, YAML::Emitter* out) {
  switch (value.Kind()) {
    case ValueKind::NONE:
      *out << YAML::Null;
      break;
    case ValueKind::BOOL:
      *out << *value.AsBool();
      break;
    case ValueKind::INT64:
      *out << *value.AsInt64();
      break;
    case ValueKind::DOUBLE:
      *out << FormatDouble(*value.AsDouble());
      break;
    case ValueKind::STRING: {
      const auto text = *value.AsString();
      if (NeedsQuoting(text)) {
        *out << YAML::DoubleQuoted;
      }
      *out << text;
      break;
    }
    case ValueKind::SEQUENCE:
      *out << YAML::BeginSeq;
      for (const auto& item : value.GetSequence()) {
        ARROW_RETURN_NOT_OK(Emit(item, out));
      }
      *out << YAML::EndSeq;
      break;
    case ValueKind::MAPPING:
      *out << YAML::BeginMap;
      for (const auto& [key, item] : value.GetMapping()) {
        *out << YAML::Key << key << YAML::Value;
        ARROW_RETURN_NOT_OK(Emit(item, out));
      }
      *out << YAML::EndMap;
      break;
    case ValueKind::TABLE:
    case ValueKind::ANY:
      return Status::Invalid("a ", ValueKindToString(value.Kind()),
                             " value cannot be serialized to YAML");
  }
  return Status::OK();
}

}  // namespace

Result<Context> ContextFromYaml(std::string_view text) {
  YAML::Node document;
  try {
    document = YAML::Load(std::string(text));
  } catch (const YAML::Exception& e) {
    return Status::Invalid("failed to parse YAML configuration: ", e.what());
  }
  return FromDocument(document);
}

Result<Context> ContextFromYamlFile(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::BadFile& e) {
    return Status::IOError("cannot read configuration file '", path, "': ", e.what());
  } catch (const YAML::Exception& e) {
    return Status::Invalid("failed to parse YAML configuration '", path, "': ", e.what());
  }
  auto context = FromDocument(document);
  if (!context.ok()) {
    return context.status().WithMessage("configuration file '", path,
                                        "': ", context.status().message());
  }
  GetLogger("stepline.sources")->Debug("Loaded configuration", {{"path", path}});
  return context;
}

Context ContextFromEnvironment(std::string_view prefix, const char* const* envp) {
  std::vector<std::pair<std::string, std::string>> entries;
  for (auto entry = envp; entry != nullptr && *entry != nullptr; ++entry) {
    std::string_view line(*entry);
    auto eq = line.find('=');
    if (eq == std::string_view::npos || line.substr(0, eq).rfind(prefix, 0) != 0) {
      continue;
    }
    std::string key(line.substr(prefix.size(), eq - prefix.size()));
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string path;
    for (std::size_t pos = 0;;) {
      auto sep = key.find("__", pos);
      path += key.substr(pos, sep == std::string::npos ? sep : sep - pos);
      if (sep == std::string::npos) {
        break;
      }
      path += '.';
      pos = sep + 2;
    }
    entries.emplace_back(std::move(path), std::string(line.substr(eq + 1)));
  }
  // Sorted so that a namespace always wins over a scalar of the same name.
  std::sort(entries.begin(), entries.end());

  Context context;
  for (auto& [path, value] : entries) {
    auto updated = context.With(path, Value(std::move(value)));
    if (!updated.ok()) {
      GetLogger("stepline.sources")
          ->Warning("Skipping environment entry", {{"path", path},
                                                   {"error", updated.status().message()}});
      continue;
    }
    context = std::move(updated).ValueOrDie();
  }
  return context;
}

Context ContextFromEnvironment(std::string_view prefix) {
  return ContextFromEnvironment(prefix, environ);
}

Result<std::string> ContextToYaml(const Context& context) {
  YAML::Emitter out;
  ARROW_RETURN_NOT_OK(Emit(context.AsValue(), &out));
  if (!out.good()) {
    return Status::Invalid("failed to emit YAML: ", out.GetLastError());
  }
  return std::string(out.c_str());
}

}  // namespace sl
