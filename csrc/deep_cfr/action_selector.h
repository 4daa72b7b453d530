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

#include <memory>
#include <random>
#include <vector>

#include "environment.h"
#include "net_interface.h"
#include "regret_matching.h"

namespace deep_cfr {

struct TrainingDecision {
  Action action;
  // Index of `action` in the legal action set.
  int index;
  // Target-network advantages and their regret-matched strategy, aligned
  // with the legal action set.
  std::vector<double> advantages;
  std::vector<double> strategy;
  // Probability of `action` under the epsilon-mixed policy.
  double sampling_prob;
  bool explored;
};

class ActionSelector {
 public:
  ActionSelector(std::shared_ptr<IAdvantageEstimator> advantage_net,
                 std::shared_ptr<IStrategyEstimator> strategy_net, int seed);

  // Epsilon-greedy over the regret-matched advantages. Throws
  // NoLegalActionsError if `legal` is empty.
  TrainingDecision select_for_training_agent(const EncodedState& state,
                                             const LegalActionSet& legal,
                                             double epsilon);

  // Samples the average-strategy network, no exploration. Throws
  // NoLegalActionsError if `legal` is empty.
  Action select_for_opponent(const EncodedState& state,
                             const LegalActionSet& legal);

 private:
  double draw() { return uniform_(gen_); }

  std::shared_ptr<IAdvantageEstimator> advantage_net_;
  std::shared_ptr<IStrategyEstimator> strategy_net_;
  std::mt19937 gen_;
  std::uniform_real_distribution<double> uniform_;
};

}  // namespace deep_cfr
