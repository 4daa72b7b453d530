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
#include <string>

#include "environment.h"
#include "hand_ranker.h"

namespace deep_cfr {

struct HoldemParams {
  int stack_size = 100;
  int small_blind = 1;
  int big_blind = 2;
};

// Heads-up no-limit hold'em with a discretized raise menu. The button posts
// the small blind and acts first preflop; the other player acts first on
// later streets. The button alternates every hand.
class HoldemEnvironment : public IEnvironment {
 public:
  static constexpr Action kActionFold = 0;
  static constexpr Action kActionCheckCall = 1;
  static constexpr Action kActionRaiseHalfPot = 2;
  static constexpr Action kActionRaisePot = 3;
  static constexpr Action kActionAllIn = 4;
  static constexpr int kNumActions = 5;

  HoldemEnvironment(std::shared_ptr<const IHandRanker> ranker, int seed,
                    const HoldemParams& params = HoldemParams());

  GameState reset() override;
  StepResult step(const GameState& state, Action action) override;
  LegalActionSet legal_actions(const GameState& state,
                               int player) const override;
  int num_actions() const override { return kNumActions; }
  std::string action_to_string(Action action) const override;

  std::string state_to_string(const GameState& state) const;
  const HoldemParams& params() const { return params_; }

 private:
  // Chips added to the bet (on top of the call) by a pot-fraction raise.
  int raise_size(const GameState& state, int player, Action action) const;
  void commit(GameState* state, int player, int amount) const;
  void finish_street(GameState* state) const;
  Pair<double> compute_rewards(const GameState& state) const;

  const std::shared_ptr<const IHandRanker> ranker_;
  const HoldemParams params_;
  int hand_number_;
  std::mt19937 gen_;
};

}  // namespace deep_cfr
