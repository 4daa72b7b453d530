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

#include "encoder.h"
#include "environment.h"
#include "net_interface.h"

namespace deep_cfr {

struct EvaluationResult {
  int num_hands = 0;
  // Chips won per hand by the strategy.
  double mean = 0.0;
  double stderr_mean = 0.0;
};

// Plays `num_hands` hands of the strategy network against a uniformly random
// legal agent, swapping seats every hand.
EvaluationResult evaluate_against_random(IEnvironment* env,
                                         const IStateEncoder& encoder,
                                         IStrategyEstimator* strategy,
                                         int num_hands, int seed);

}  // namespace deep_cfr
