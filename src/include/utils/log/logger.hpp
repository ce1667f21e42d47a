//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace reformat {
enum class LogLevel { INFO = 0, WARN = 1, ERROR = 2 };

/**
 * @brief Process-wide logger. Lines are formatted as
 * "<timestamp> [LEVEL] Component: message" and written to stderr, and to a log file
 * when one has been opened with Initialize().
 */
class Logger {
 public:
  static auto Instance() -> Logger&;

  auto        Initialize(const std::string& file_path) -> bool;
  void        Shutdown();

  void        SetMinLevel(LogLevel level);
  auto        GetMinLevel() -> LogLevel;
  void        SetConsoleOutput(bool enabled);

  void        Log(LogLevel level, std::string_view component, std::string_view message);
  void        Info(std::string_view component, std::string_view message);
  void        Warn(std::string_view component, std::string_view message);
  void        Error(std::string_view component, std::string_view message);

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

 private:
  Logger()  = default;
  ~Logger() = default;

  static auto   LevelToString(LogLevel level) -> std::string_view;
  static auto   CurrentTimestamp() -> std::string;

  std::mutex    mtx_;
  std::ofstream log_file_;
  LogLevel      min_level_       = LogLevel::INFO;
  bool          console_output_  = true;
};
};  // namespace reformat
