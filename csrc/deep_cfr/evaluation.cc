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

#include "evaluation.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "cfr_iteration.h"
#include "errors.h"
#include "regret_matching.h"

namespace deep_cfr {

EvaluationResult evaluate_against_random(IEnvironment* env,
                                         const IStateEncoder& encoder,
                                         IStrategyEstimator* strategy,
                                         int num_hands, int seed) {
  if (num_hands <= 0) {
    throw std::invalid_argument("num_hands must be positive");
  }
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> uniform(0.0, 1.0);
  double sum = 0;
  double sum_sq = 0;
  for (int hand = 0; hand < num_hands; ++hand) {
    const int hero = hand % kNumPlayers;
    GameState state = env->reset();
    StepResult step;
    step.done = state.finished;
    for (int num_steps = 0; !step.done; ++num_steps) {
      if (num_steps >= CfrIterationDriver::kMaxStepsPerHand) {
        throw EnvironmentStateError("Evaluation hand did not terminate");
      }
      const int player = state.current_player;
      const auto legal = env->legal_actions(state, player);
      if (legal.empty()) {
        throw NoLegalActionsError("Player " + std::to_string(player) +
                                  " has no legal actions");
      }
      Action action;
      if (player == hero) {
        const auto probs =
            strategy->evaluate(encoder.encode(state, player), legal);
        action = legal[sample_index(probs, uniform(gen))];
      } else {
        action = legal[std::uniform_int_distribution<size_t>(
            0, legal.size() - 1)(gen)];
      }
      step = env->step(state, action);
      state = step.next_state;
    }
    const double reward = step.rewards[hero];
    sum += reward;
    sum_sq += reward * reward;
  }

  EvaluationResult result;
  result.num_hands = num_hands;
  result.mean = sum / num_hands;
  if (num_hands > 1) {
    const double var =
        (sum_sq - num_hands * result.mean * result.mean) / (num_hands - 1);
    result.stderr_mean = std::sqrt(std::max(var, 0.0) / num_hands);
  }
  spdlog::info("Against random over {} hands: {:.3f} +- {:.3f} chips/hand",
               num_hands, result.mean, result.stderr_mean);
  return result;
}

}  // namespace deep_cfr
