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

#include "utils/log/logger.hpp"

#include <chrono>
#include <format>
#include <iostream>

namespace reformat {
auto Logger::Instance() -> Logger& {
  static Logger instance;
  return instance;
}

auto Logger::Initialize(const std::string& file_path) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  if (log_file_.is_open()) {
    log_file_.close();
  }
  log_file_.open(file_path, std::ios::out | std::ios::app);
  if (!log_file_.is_open()) {
    std::cerr << "[ERROR] Logger: Failed to open log file " << file_path << std::endl;
    return false;
  }
  return true;
}

void Logger::Shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (log_file_.is_open()) {
    log_file_.flush();
    log_file_.close();
  }
}

void Logger::SetMinLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mtx_);
  min_level_ = level;
}

auto Logger::GetMinLevel() -> LogLevel {
  std::lock_guard<std::mutex> lock(mtx_);
  return min_level_;
}

void Logger::SetConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(mtx_);
  console_output_ = enabled;
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (static_cast<int>(level) < static_cast<int>(min_level_)) return;

  const auto line =
      std::format("{} [{}] {}: {}", CurrentTimestamp(), LevelToString(level), component, message);
  if (console_output_) {
    std::cerr << line << '\n';
  }
  if (log_file_.is_open()) {
    log_file_ << line << '\n';
    if (level == LogLevel::ERROR) log_file_.flush();
  }
}

void Logger::Info(std::string_view component, std::string_view message) {
  Log(LogLevel::INFO, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
  Log(LogLevel::WARN, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
  Log(LogLevel::ERROR, component, message);
}

auto Logger::LevelToString(LogLevel level) -> std::string_view {
  switch (level) {
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
  }
  return "UNKNOWN";
}

auto Logger::CurrentTimestamp() -> std::string {
  const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  return std::format("{:%Y-%m-%d %H:%M:%S}", now);
}
};  // namespace reformat
