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

#include <map>
#include <string>
#include <vector>

#include <stepline/step.h>

namespace sl {
namespace steps {

/// @brief Keeps the named columns of the input `table`, in the given order.
///
/// A column missing from the input fails execution with a `KeyError` cause.
class SelectColumns : public Step {
 public:
  SelectColumns(std::string name, std::vector<std::string> columns,
                std::shared_ptr<const Context> context = nullptr);

  bool IsIdempotent() const override { return true; }
  std::string Description() const override;

 protected:
  Requirements Declare() const override;
  Status CheckConfig(const Context& ctx) const override;
  Result<Output> DoExecute(const Context& ctx, const Output& input,
                           const ExecContext& exec) override;

 private:
  std::vector<std::string> columns_;
};

/// @brief Renames columns of the input `table` (old name to new name). Unmapped columns
/// keep their names.
class RenameColumns : public Step {
 public:
  RenameColumns(std::string name, std::map<std::string, std::string> renames,
                std::shared_ptr<const Context> context = nullptr);

  bool IsIdempotent() const override { return true; }
  std::string Description() const override;

 protected:
  Requirements Declare() const override;
  Result<Output> DoExecute(const Context& ctx, const Output& input,
                           const ExecContext& exec) override;

 private:
  std::map<std::string, std::string> renames_;
};

}  // namespace steps
}  // namespace sl
