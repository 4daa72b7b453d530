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

#pragma once

#include <string>

namespace deep_cfr {

// Sets the level of spdlog's default logger from "debug", "info", "warning"
// ("warn") or "error", case insensitive. Throws std::invalid_argument
// otherwise.
void set_log_level(const std::string& name);

// Replaces the default logger with one writing to stdout and, unless
// `log_file` is empty, appending to `log_file`. The current level is kept.
// Throws std::invalid_argument if the file cannot be opened.
void init_logging(const std::string& log_file);

}  // namespace deep_cfr
