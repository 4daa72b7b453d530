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

#include "encoder.h"
#include "environment.h"

namespace deep_cfr {

// Immediate regret of one action at one decision point of the training
// agent.
struct AdvantageSample {
  EncodedState state;
  Action action;
  float regret;
  // Iteration the sample was produced at (linear CFR weighting).
  float weight;
};

// Regret-matched strategy at one decision point of the training agent.
struct StrategySample {
  EncodedState state;
  // Indexed by action over the full action space; zero for illegal actions.
  std::vector<float> strategy;
  float weight;
};

}  // namespace deep_cfr
