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

#include <stepline/logging.h>

#include <arrow/util/logging.h>

#include <mutex>
#include <unordered_map>

namespace sl {

namespace {

::arrow::util::ArrowLogLevel ToArrowLevel(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return ::arrow::util::ArrowLogLevel::ARROW_DEBUG;
    case LogLevel::INFO:
      return ::arrow::util::ArrowLogLevel::ARROW_INFO;
    case LogLevel::WARNING:
      return ::arrow::util::ArrowLogLevel::ARROW_WARNING;
    case LogLevel::ERROR:
      return ::arrow::util::ArrowLogLevel::ARROW_ERROR;
  }
  return ::arrow::util::ArrowLogLevel::ARROW_INFO;
}

class LoggerRegistry {
 public:
  std::shared_ptr<const Logger> Get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
      return it->second;
    }
    auto logger = std::make_shared<const Logger>(name);
    loggers_.emplace(name, logger);
    return logger;
  }

 private:
  std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const Logger>> loggers_;
};

LoggerRegistry& GetRegistry() {
  static LoggerRegistry registry;
  return registry;
}

}  // namespace

std::string LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
  }
  return "UNKNOWN";
}

bool Logger::IsEnabled(LogLevel level) const {
  return ::arrow::util::ArrowLog::IsLevelEnabled(ToArrowLevel(level));
}

void Logger::Log(LogLevel level, std::string_view message, const LogFields& fields) const {
  if (!IsEnabled(level)) {
    return;
  }
  ::arrow::util::ArrowLog(__FILE__, __LINE__, ToArrowLevel(level)) << Format(message, fields);
}

std::string Logger::Format(std::string_view message, const LogFields& fields) const {
  std::string line = "[" + name_ + "] ";
  line.append(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    if (field.value.find(' ') != std::string::npos) {
      line += '"' + field.value + '"';
    } else {
      line += field.value;
    }
  }
  return line;
}

std::shared_ptr<const Logger> GetLogger(const std::string& name) {
  return GetRegistry().Get(name);
}

}  // namespace sl
