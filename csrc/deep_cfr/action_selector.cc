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

#include "action_selector.h"

#include "errors.h"

namespace deep_cfr {

ActionSelector::ActionSelector(
    std::shared_ptr<IAdvantageEstimator> advantage_net,
    std::shared_ptr<IStrategyEstimator> strategy_net, int seed)
    : advantage_net_(std::move(advantage_net)),
      strategy_net_(std::move(strategy_net)),
      gen_(seed),
      uniform_(0.0, 1.0) {}

TrainingDecision ActionSelector::select_for_training_agent(
    const EncodedState& state, const LegalActionSet& legal, double epsilon) {
  if (legal.empty()) {
    throw NoLegalActionsError("Training agent has no legal actions");
  }
  TrainingDecision decision;
  decision.advantages = advantage_net_->evaluate(state, legal);
  decision.strategy = regret_matching(decision.advantages);
  // Draw order is fixed so that a seed fully determines the decision.
  const double explore_draw = draw();
  const double action_draw = draw();
  const ActionChoice choice =
      choose_action(decision.strategy, epsilon, explore_draw, action_draw);
  decision.index = choice.index;
  decision.action = legal[choice.index];
  decision.sampling_prob = choice.sampling_prob;
  decision.explored = choice.explored;
  return decision;
}

Action ActionSelector::select_for_opponent(const EncodedState& state,
                                           const LegalActionSet& legal) {
  if (legal.empty()) {
    throw NoLegalActionsError("Opponent has no legal actions");
  }
  const auto strategy = strategy_net_->evaluate(state, legal);
  return legal[sample_index(strategy, draw())];
}

}  // namespace deep_cfr
