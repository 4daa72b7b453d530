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
#include <vector>

#include "action_selector.h"
#include "encoder.h"
#include "environment.h"
#include "net_interface.h"
#include "reservoir.h"
#include "samples.h"

namespace deep_cfr {

enum class IterationPhase {
  RESET,
  ENCODE,
  SELECT_ACTIONS,
  STEP_ENVIRONMENT,
  COMPUTE_REGRET,
  STORE_SAMPLES,
  DONE
};

const char* phase_name(IterationPhase phase);

struct IterationResult {
  Pair<double> rewards = {0.0, 0.0};
  int num_steps = 0;
  // Decision points of the training agent.
  int num_decisions = 0;
  int num_advantage_samples = 0;
  int num_strategy_samples = 0;
};

// Plays one hand against the average-strategy opponent and turns the
// training agent's decisions into advantage and strategy samples.
//
// Counterfactual values at a decision are the target-network advantages,
// with the sampled action's value corrected by the observed outcome:
//   v_i = b_i                          for i != sampled action a
//   v_a = b_a + (u - b_a) / xi_a
// where u is the training agent's terminal reward and xi_a the probability
// the epsilon-mixed policy had to pick a. The immediate regret is then
// r_i = v_i - sum_j sigma_j v_j under the regret-matched strategy sigma.
//
// Samples are written only when the hand reaches a terminal state. Any
// exception leaves both memories untouched.
class CfrIterationDriver {
 public:
  static constexpr int kMaxStepsPerHand = 1000;

  CfrIterationDriver(
      std::shared_ptr<IEnvironment> env,
      std::shared_ptr<const IStateEncoder> encoder,
      std::shared_ptr<IAdvantageEstimator> advantage_net,
      std::shared_ptr<IStrategyEstimator> strategy_net,
      std::shared_ptr<ReservoirMemory<AdvantageSample>> advantage_memory,
      std::shared_ptr<ReservoirMemory<StrategySample>> strategy_memory,
      int training_player, int seed);

  // Runs RESET -> ... -> DONE for one hand. `iteration` is the linear CFR
  // weight attached to every sample.
  IterationResult run(int64_t iteration, double epsilon);

  IterationPhase phase() const { return phase_; }
  int training_player() const { return training_player_; }

 private:
  struct PendingDecision {
    EncodedState state;
    LegalActionSet legal;
    TrainingDecision decision;
  };

  void check_legal(const LegalActionSet& legal) const;
  std::vector<double> compute_regrets(const PendingDecision& pending,
                                      double utility) const;

  std::shared_ptr<IEnvironment> env_;
  std::shared_ptr<const IStateEncoder> encoder_;
  std::shared_ptr<ReservoirMemory<AdvantageSample>> advantage_memory_;
  std::shared_ptr<ReservoirMemory<StrategySample>> strategy_memory_;
  const int training_player_;
  ActionSelector selector_;
  IterationPhase phase_;
};

}  // namespace deep_cfr
