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

/// @file logging.h
///
/// @brief Named, leveled, structured loggers.
///
/// Loggers are thin handles over Arrow's logging facility (`arrow/util/logging.h`); the
/// backend decides formatting, thresholds and transport. stepline only guarantees that
/// `GetLogger(name)` is idempotent and cheap.

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sl {

enum class LogLevel {
  DEBUG,
  INFO,
  WARNING,
  ERROR,
};

std::string LogLevelToString(LogLevel level);

struct LogField {
  std::string key;
  std::string value;
};

using LogFields = std::vector<LogField>;

class Logger {
 public:
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& Name() const noexcept { return name_; }

  bool IsEnabled(LogLevel level) const;

  void Log(LogLevel level, std::string_view message, const LogFields& fields = {}) const;

  void Debug(std::string_view message, const LogFields& fields = {}) const {
    Log(LogLevel::DEBUG, message, fields);
  }
  void Info(std::string_view message, const LogFields& fields = {}) const {
    Log(LogLevel::INFO, message, fields);
  }
  void Warning(std::string_view message, const LogFields& fields = {}) const {
    Log(LogLevel::WARNING, message, fields);
  }
  void Error(std::string_view message, const LogFields& fields = {}) const {
    Log(LogLevel::ERROR, message, fields);
  }

  /// @brief Rendered line: `[name] message key=value ...`. Values containing spaces
  /// are quoted.
  std::string Format(std::string_view message, const LogFields& fields) const;

 private:
  std::string name_;
};

/// @brief Logger registered under `name`. Repeated calls return the same instance.
std::shared_ptr<const Logger> GetLogger(const std::string& name);

}  // namespace sl
