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

#include <array>
#include <memory>
#include <vector>

#include "environment.h"
#include "hand_ranker.h"

namespace deep_cfr {

// Fixed-length feature vector describing a state from one player's view.
using EncodedState = std::vector<float>;

// Encoder collaborator.
class IStateEncoder {
 public:
  virtual ~IStateEncoder() = default;

  virtual EncodedState encode(const GameState& state, int player) const = 0;
  virtual int feature_size() const = 0;
};

// Features: [hand strength, pot / total chips, is button, street / 3].
class HandStrengthEncoder : public IStateEncoder {
 public:
  static constexpr int kFeatureSize = 4;

  HandStrengthEncoder(std::shared_ptr<const IHandRanker> ranker,
                      int total_chips);

  EncodedState encode(const GameState& state, int player) const override;
  int feature_size() const override { return kFeatureSize; }

  // Probability to beat a uniformly random opponent holding on the current
  // board, counting ties as half. Uses a heuristic table before the flop.
  double hand_strength(const std::array<Card, 2>& hole,
                       const std::vector<Card>& board) const;

  static double preflop_strength(const std::array<Card, 2>& hole);

 private:
  const std::shared_ptr<const IHandRanker> ranker_;
  const int total_chips_;
};

}  // namespace deep_cfr
