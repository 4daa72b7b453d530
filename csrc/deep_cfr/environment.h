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
#include <string>
#include <vector>

#include "cards.h"

namespace deep_cfr {

using Action = int;
// Ordered list of the actions valid at a state.
using LegalActionSet = std::vector<Action>;

template <class T>
using Pair = std::array<T, 2>;

constexpr int kNumPlayers = 2;

enum class Street { PREFLOP = 0, FLOP = 1, TURN = 2, RIVER = 3 };

// Full (public + private) state of one heads-up hand. Produced by the
// environment and treated as an opaque value by the training core, which
// only reads `current_player` and `finished`.
struct GameState {
  Pair<std::array<Card, 2>> hole_cards = {{{kInvalidCard, kInvalidCard},
                                           {kInvalidCard, kInvalidCard}}};
  // All five board cards are dealt at reset; only the first
  // `num_board_cards` are visible.
  std::array<Card, 5> board = {kInvalidCard, kInvalidCard, kInvalidCard,
                               kInvalidCard, kInvalidCard};
  int num_board_cards = 0;
  Street street = Street::PREFLOP;
  // Chips behind.
  Pair<int> stacks = {0, 0};
  // Chips committed on the current street.
  Pair<int> bets = {0, 0};
  // Chips committed in the whole hand.
  Pair<int> contributions = {0, 0};
  int button = 0;
  // -1 once the hand is finished.
  int current_player = 0;
  int num_street_actions = 0;
  int last_raise_size = 0;
  int folded_player = -1;
  bool finished = false;

  int pot() const { return contributions[0] + contributions[1]; }
  std::vector<Card> visible_board() const {
    return std::vector<Card>(board.begin(), board.begin() + num_board_cards);
  }
};

struct StepResult {
  GameState next_state;
  // Net chip result per player. Only non-zero once `done`.
  Pair<double> rewards = {0.0, 0.0};
  bool done = false;
};

// Environment collaborator. Turn based: each step applies the action of the
// single player to act. Implementations throw EnvironmentStateError on
// contract violations such as stepping a finished hand or an illegal action.
class IEnvironment {
 public:
  virtual ~IEnvironment() = default;

  virtual GameState reset() = 0;
  virtual StepResult step(const GameState& state, Action action) = 0;
  // Empty when `player` is not the one to act.
  virtual LegalActionSet legal_actions(const GameState& state,
                                       int player) const = 0;
  // Size of the action space all LegalActionSets are drawn from.
  virtual int num_actions() const = 0;

  virtual std::string action_to_string(Action action) const {
    return std::to_string(action);
  }
};

}  // namespace deep_cfr
