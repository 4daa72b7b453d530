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

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "cfr_iteration.h"
#include "checkpoint.h"
#include "encoder.h"
#include "environment.h"
#include "net_interface.h"
#include "reservoir.h"
#include "samples.h"

namespace deep_cfr {

struct TrainingConfig {
  int64_t iterations = 10000;
  int batch_size = 512;
  // Cadences in iterations. 0 disables the corresponding action.
  int save_interval = 1000;
  int sync_period = 100;
  int update_period = 1;
  double epsilon_start = 0.15;
  double epsilon_min = 0.01;
  double epsilon_decay = 0.995;
  // Capacity of each of the two memories.
  int64_t memory_capacity = 1000000;
  double tau = 0.01;
  double learning_rate = 1e-4;
  std::vector<int64_t> hidden_sizes = {128, 64};
  int training_player = 0;
  int seed = 0;
  std::string checkpoint_dir = "checkpoints";
  std::string device = "cpu";

  // Throws std::invalid_argument on the first bad field.
  void validate() const;
};

struct IterationStats {
  int64_t iteration = 0;
  // Epsilon the iteration was played with.
  double epsilon = 0.0;
  double reward = 0.0;
  int num_decisions = 0;
  // The hand was abandoned and stored nothing.
  bool skipped = false;
  bool advantage_updated = false;
  bool strategy_updated = false;
  double advantage_loss = 0.0;
  double strategy_loss = 0.0;
  bool synced = false;
  bool checkpointed = false;
};

class TrainingLoop {
 public:
  // `checkpointer` may be null, in which case no checkpoints are written.
  TrainingLoop(const TrainingConfig& config,
               std::shared_ptr<IEnvironment> env,
               std::shared_ptr<const IStateEncoder> encoder,
               std::shared_ptr<IAdvantageEstimator> advantage_net,
               std::shared_ptr<IStrategyEstimator> strategy_net,
               std::shared_ptr<ICheckpointer> checkpointer);

  // Plays one iteration, then runs whatever update, sync and save is due and
  // decays epsilon. EnvironmentStateError propagates.
  IterationStats tick();

  // Ticks until the iteration budget is exhausted. Returns the stats of the
  // last tick.
  IterationStats train();

  // Loads parameters, optimizer state, iteration and epsilon. Throws
  // CheckpointError if the checkpoint does not match the networks.
  void restore(const Checkpoint& checkpoint);
  Checkpoint make_checkpoint() const;

  int64_t iteration() const { return iteration_; }
  double epsilon() const { return epsilon_; }
  const TrainingConfig& config() const { return config_; }

  const std::shared_ptr<IEnvironment>& env() const { return env_; }
  const std::shared_ptr<const IStateEncoder>& encoder() const {
    return encoder_;
  }
  const std::shared_ptr<IAdvantageEstimator>& advantage_net() const {
    return advantage_net_;
  }
  const std::shared_ptr<IStrategyEstimator>& strategy_net() const {
    return strategy_net_;
  }
  const ReservoirMemory<AdvantageSample>& advantage_memory() const {
    return *advantage_memory_;
  }
  const ReservoirMemory<StrategySample>& strategy_memory() const {
    return *strategy_memory_;
  }

 private:
  void update_networks(IterationStats* stats);
  void save_checkpoint(IterationStats* stats);

  const TrainingConfig config_;
  std::shared_ptr<IEnvironment> env_;
  std::shared_ptr<const IStateEncoder> encoder_;
  std::shared_ptr<IAdvantageEstimator> advantage_net_;
  std::shared_ptr<IStrategyEstimator> strategy_net_;
  std::shared_ptr<ICheckpointer> checkpointer_;
  std::shared_ptr<ReservoirMemory<AdvantageSample>> advantage_memory_;
  std::shared_ptr<ReservoirMemory<StrategySample>> strategy_memory_;
  CfrIterationDriver driver_;

  int64_t iteration_;
  double epsilon_;
};

// Heads-up hold'em with the hand-strength encoder, torch estimators and
// checkpoints under config.checkpoint_dir.
std::unique_ptr<TrainingLoop> build_training_loop(const TrainingConfig& config);

}  // namespace deep_cfr
