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

#include <chrono>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "checkpoint.h"
#include "errors.h"
#include "evaluation.h"
#include "logging.h"
#include "training_loop.h"

using namespace deep_cfr;

struct Timer {
  std::chrono::time_point<std::chrono::steady_clock> start =
      std::chrono::steady_clock::now();

  double tick() {
    const auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double> diff = end - start;
    return diff.count();
  }
};

int main(int argc, char* argv[]) {
  TrainingConfig cfg;
  std::string log_level = "info";
  std::string log_file = "deep_cfr.log";
  int64_t resume = -1;
  int eval_hands = 0;
  {
    for (int i = 1; i < argc; i++) {
      std::string arg = argv[i];
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return -1;
      }
      const std::string value = argv[++i];
      try {
        if (arg == "--iterations") {
          cfg.iterations = std::stoll(value);
        } else if (arg == "--batch_size") {
          cfg.batch_size = std::stoi(value);
        } else if (arg == "--save_interval") {
          cfg.save_interval = std::stoi(value);
        } else if (arg == "--sync_period") {
          cfg.sync_period = std::stoi(value);
        } else if (arg == "--update_period") {
          cfg.update_period = std::stoi(value);
        } else if (arg == "--epsilon_start") {
          cfg.epsilon_start = std::stod(value);
        } else if (arg == "--epsilon_min") {
          cfg.epsilon_min = std::stod(value);
        } else if (arg == "--epsilon_decay") {
          cfg.epsilon_decay = std::stod(value);
        } else if (arg == "--memory_capacity") {
          cfg.memory_capacity = std::stoll(value);
        } else if (arg == "--tau") {
          cfg.tau = std::stod(value);
        } else if (arg == "--lr") {
          cfg.learning_rate = std::stod(value);
        } else if (arg == "--training_player") {
          cfg.training_player = std::stoi(value);
        } else if (arg == "--seed") {
          cfg.seed = std::stoi(value);
        } else if (arg == "--checkpoint_dir") {
          cfg.checkpoint_dir = value;
        } else if (arg == "--device") {
          cfg.device = value;
        } else if (arg == "--log") {
          log_level = value;
        } else if (arg == "--log_file") {
          log_file = value;
        } else if (arg == "--resume") {
          resume = std::stoll(value);
        } else if (arg == "--eval_hands") {
          eval_hands = std::stoi(value);
        } else {
          std::cerr << "Unknown flag: " << arg << "\n";
          return -1;
        }
      } catch (const std::logic_error&) {
        std::cerr << "Bad value for " << arg << ": " << value << "\n";
        return -1;
      }
    }
  }

  try {
    init_logging(log_file);
    set_log_level(log_level);
    cfg.validate();
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return -1;
  }

  auto loop = build_training_loop(cfg);
  if (resume >= 0) {
    FileCheckpointer checkpointer(cfg.checkpoint_dir);
    try {
      loop->restore(checkpointer.load(resume));
    } catch (const CheckpointError& e) {
      spdlog::error("Cannot resume: {}", e.what());
      return -1;
    }
  }

  Timer t;
  const int64_t first = loop->iteration();
  try {
    const IterationStats stats = loop->train();
    const double secs = t.tick();
    spdlog::info("time={:.1f}s iterations={} per_second={:.1f} epsilon={:.4f}",
                 secs, stats.iteration - first,
                 (stats.iteration - first) / secs, stats.epsilon);
  } catch (const EnvironmentStateError& e) {
    spdlog::error("Environment failure: {}", e.what());
    return -1;
  }

  if (eval_hands > 0) {
    evaluate_against_random(loop->env().get(), *loop->encoder(),
                            loop->strategy_net().get(), eval_hands,
                            cfg.seed + 100);
  }
  return 0;
}
