// Copyright (c) Facebook, Inc. and its affiliates.
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

#include "logging.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace deep_cfr {

void set_log_level(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  spdlog::level::level_enum level;
  if (lower == "debug") {
    level = spdlog::level::debug;
  } else if (lower == "info") {
    level = spdlog::level::info;
  } else if (lower == "warning" || lower == "warn") {
    level = spdlog::level::warn;
  } else if (lower == "error") {
    level = spdlog::level::err;
  } else {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  spdlog::set_level(level);
}

void init_logging(const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!log_file.empty()) {
    try {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    } catch (const spdlog::spdlog_ex& e) {
      throw std::invalid_argument("Cannot open log file " + log_file + ": " +
                                  e.what());
    }
  }
  auto logger =
      std::make_shared<spdlog::logger>("deep_cfr", sinks.begin(), sinks.end());
  logger->set_level(spdlog::default_logger()->level());
  spdlog::set_default_logger(logger);
}

}  // namespace deep_cfr
