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

/// @file result.h
///
/// @brief Status/Result transport used by stepline.
///
/// stepline does not define its own error transport. Every fallible API returns an
/// Arrow `Status` or `Result<T>`:
/// - `result.ok()`
/// - `result.status()`
/// - `result.ValueOrDie()`
///
/// Typed error information (which step failed, at which position, why) travels as an
/// `arrow::StatusDetail` attached to the status, see `stepline/errors.h`.

#include <arrow/result.h>
#include <arrow/status.h>

namespace sl {

using Status = ::arrow::Status;
using StatusCode = ::arrow::StatusCode;

template <class T>
using Result = ::arrow::Result<T>;

}  // namespace sl
