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

#include "regret_matching.h"

#include <math.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "errors.h"

namespace deep_cfr {

std::vector<double> regret_matching(const std::vector<double>& advantages) {
  if (advantages.empty()) {
    throw NoLegalActionsError("Regret matching over an empty action set");
  }
  std::vector<double> strategy(advantages.size());
  double denominator = 0;
  for (size_t i = 0; i < advantages.size(); ++i) {
    if (!std::isfinite(advantages[i])) {
      throw NumericInstabilityError("Non-finite advantage at action index " +
                                    std::to_string(i));
    }
    strategy[i] = std::max(advantages[i], 0.0);
    denominator += strategy[i];
  }
  if (denominator > 0) {
    for (double& p : strategy) p /= denominator;
  } else {
    std::fill(strategy.begin(), strategy.end(), 1.0 / strategy.size());
  }
  return strategy;
}

std::vector<float> to_full_strategy(const std::vector<double>& strategy,
                                    const LegalActionSet& legal,
                                    int num_actions) {
  if (strategy.size() != legal.size()) {
    throw std::invalid_argument("Strategy and legal action set sizes differ");
  }
  std::vector<float> full(num_actions, 0.0f);
  for (size_t i = 0; i < legal.size(); ++i) {
    if (legal[i] < 0 || legal[i] >= num_actions) {
      throw std::invalid_argument("Action out of range: " +
                                  std::to_string(legal[i]));
    }
    full[legal[i]] = strategy[i];
  }
  return full;
}

int sample_index(const std::vector<double>& probs, double draw) {
  if (probs.empty()) {
    throw NoLegalActionsError("Cannot sample from an empty distribution");
  }
  double total = 0;
  for (double p : probs) total += p;
  const double target = draw * total;
  double cumulative = 0;
  for (size_t i = 0; i < probs.size(); ++i) {
    cumulative += probs[i];
    if (target < cumulative) return i;
  }
  // Rounding: fall back to the last action with positive mass.
  for (size_t i = probs.size(); i-- > 0;) {
    if (probs[i] > 0) return i;
  }
  return probs.size() - 1;
}

ActionChoice choose_action(const std::vector<double>& strategy, double epsilon,
                           double explore_draw, double action_draw) {
  if (strategy.empty()) {
    throw NoLegalActionsError("No legal actions to choose from");
  }
  const int num_legal = strategy.size();
  ActionChoice choice;
  choice.explored = explore_draw < epsilon;
  if (choice.explored) {
    choice.index = std::min<int>(action_draw * num_legal, num_legal - 1);
  } else {
    choice.index = sample_index(strategy, action_draw);
  }
  choice.sampling_prob =
      epsilon / num_legal + (1.0 - epsilon) * strategy[choice.index];
  return choice;
}

}  // namespace deep_cfr
