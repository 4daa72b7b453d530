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

#include <vector>

#include "environment.h"

namespace deep_cfr {

// Regret matching: p_i = max(a_i, 0) / sum_j max(a_j, 0), or uniform if no
// entry is positive. `advantages` and the result are aligned with the legal
// action set. Throws NoLegalActionsError on empty input and
// NumericInstabilityError on non-finite input.
std::vector<double> regret_matching(const std::vector<double>& advantages);

// Scatters a strategy over `legal` into the full action space.
std::vector<float> to_full_strategy(const std::vector<double>& strategy,
                                    const LegalActionSet& legal,
                                    int num_actions);

// Inverse CDF sampling. `draw` is uniform in [0, 1).
int sample_index(const std::vector<double>& probs, double draw);

struct ActionChoice {
  // Index into the legal action set.
  int index;
  // Probability with which the epsilon-mixed policy picks `index`.
  double sampling_prob;
  bool explored;
};

// Epsilon-greedy decision: with `explore_draw < epsilon` picks uniformly
// among the legal actions, otherwise samples `strategy`. Both draws are
// uniform in [0, 1) and supplied by the caller, which keeps the decision
// reproducible.
ActionChoice choose_action(const std::vector<double>& strategy, double epsilon,
                           double explore_draw, double action_draw);

}  // namespace deep_cfr
