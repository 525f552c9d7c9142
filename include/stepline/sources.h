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

#include <string>
#include <string_view>

#include <stepline/context.h>
#include <stepline/result.h>

namespace sl {

/// @brief Context from a YAML (or JSON) document whose root is a mapping.
///
/// Plain scalars are typed as int64, double, bool, else string; quoted scalars stay
/// strings; `~`/`null` become `NONE`. An empty document is an empty context. Parse
/// failures and a non-mapping root are `Invalid`.
Result<Context> ContextFromYaml(std::string_view text);

/// @brief `ContextFromYaml` over a file. An unreadable file is an `IOError`.
Result<Context> ContextFromYamlFile(const std::string& path);

/// @brief Context from environment entries (`KEY=value`) starting with `prefix`.
///
/// The prefix is stripped, the rest lower-cased and `__` treated as a namespace
/// separator: with prefix `APP_`, `APP_DB__HOST=x` becomes `db.host: "x"`. Values are
/// strings. Entries whose remainder is not a valid path are skipped.
///
/// @param envp null-terminated array of entries
Context ContextFromEnvironment(std::string_view prefix, const char* const* envp);

/// @brief `ContextFromEnvironment` over the process environment.
Context ContextFromEnvironment(std::string_view prefix);

/// @brief YAML rendering that `ContextFromYaml` reads back to an equal context.
/// `TABLE` values cannot be serialized (`Invalid`).
Result<std::string> ContextToYaml(const Context& context);

}  // namespace sl
