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

#include <memory>
#include <string>
#include <vector>

#include <stepline/result.h>
#include <stepline/task.h>

namespace sl {

/// @brief Reader, then transformations, then writer.
///
/// The reader's `table` flows through each transformation into the writer. The output
/// is the union of every child's fields (`MERGE_ALL`), so writer statistics sit next to
/// the final table.
class EtlTask : public Task {
 public:
  /// @brief Role-checked construction. `Invalid` if a unit is null or does not carry the
  /// role of its slot.
  static Result<std::shared_ptr<EtlTask>> Make(
      std::string name, std::shared_ptr<Step> reader,
      std::vector<std::shared_ptr<Step>> transformations, std::shared_ptr<Step> writer,
      std::shared_ptr<const Context> context = nullptr);

  const Step& Reader() const { return *GetChild(0).unit; }
  const Step& Writer() const { return *GetChild(NumChildren() - 1).unit; }
  std::size_t NumTransformations() const noexcept { return NumChildren() - 2; }

 private:
  EtlTask(std::string name, std::vector<std::shared_ptr<Step>> children,
          std::shared_ptr<const Context> context);
};

}  // namespace sl
