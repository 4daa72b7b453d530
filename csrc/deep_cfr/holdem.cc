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

#include "holdem.h"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include "errors.h"

namespace deep_cfr {

HoldemEnvironment::HoldemEnvironment(std::shared_ptr<const IHandRanker> ranker,
                                     int seed, const HoldemParams& params)
    : ranker_(std::move(ranker)), params_(params), hand_number_(0), gen_(seed) {
  if (ranker_ == nullptr) {
    throw std::invalid_argument("HoldemEnvironment requires a hand ranker");
  }
  if (params_.small_blind <= 0 || params_.big_blind < params_.small_blind ||
      params_.stack_size <= params_.big_blind) {
    throw std::invalid_argument(
        "Bad blinds/stack: need 0 < small_blind <= big_blind < stack_size");
  }
}

GameState HoldemEnvironment::reset() {
  std::array<Card, kNumCards> deck;
  std::iota(deck.begin(), deck.end(), 0);
  std::shuffle(deck.begin(), deck.end(), gen_);

  GameState state;
  state.button = hand_number_ % kNumPlayers;
  ++hand_number_;
  int next_card = 0;
  for (int player = 0; player < kNumPlayers; ++player) {
    for (auto& card : state.hole_cards[player]) {
      card = deck[next_card++];
    }
  }
  for (auto& card : state.board) {
    card = deck[next_card++];
  }
  state.stacks = {params_.stack_size, params_.stack_size};
  commit(&state, state.button, params_.small_blind);
  commit(&state, 1 - state.button, params_.big_blind);
  state.last_raise_size = params_.big_blind;
  state.current_player = state.button;
  return state;
}

int HoldemEnvironment::raise_size(const GameState& state, int player,
                                  Action action) const {
  const int to_call = state.bets[1 - player] - state.bets[player];
  const int pot_after_call = state.pot() + to_call;
  return action == kActionRaiseHalfPot ? pot_after_call / 2 : pot_after_call;
}

LegalActionSet HoldemEnvironment::legal_actions(const GameState& state,
                                                int player) const {
  LegalActionSet actions;
  if (state.finished || player != state.current_player) return actions;
  const int opponent = 1 - player;
  const int to_call = state.bets[opponent] - state.bets[player];
  const int stack = state.stacks[player];

  if (to_call > 0) actions.push_back(kActionFold);
  actions.push_back(kActionCheckCall);
  // Nothing to raise against an all-in opponent.
  if (state.stacks[opponent] > 0) {
    const int min_raise = std::max(params_.big_blind, state.last_raise_size);
    for (Action action : {kActionRaiseHalfPot, kActionRaisePot}) {
      const int size = raise_size(state, player, action);
      if (size >= min_raise && to_call + size < stack) {
        actions.push_back(action);
      }
    }
    if (stack > to_call) actions.push_back(kActionAllIn);
  }
  return actions;
}

void HoldemEnvironment::commit(GameState* state, int player,
                               int amount) const {
  state->stacks[player] -= amount;
  state->bets[player] += amount;
  state->contributions[player] += amount;
}

void HoldemEnvironment::finish_street(GameState* state) const {
  // Return the uncalled part of a bet.
  if (state->bets[0] != state->bets[1]) {
    const int bigger = state->bets[0] > state->bets[1] ? 0 : 1;
    const int excess = state->bets[bigger] - state->bets[1 - bigger];
    state->bets[bigger] -= excess;
    state->contributions[bigger] -= excess;
    state->stacks[bigger] += excess;
  }
  if (state->street == Street::RIVER || state->stacks[0] == 0 ||
      state->stacks[1] == 0) {
    // Showdown, running out the board if somebody is all-in.
    state->street = Street::RIVER;
    state->num_board_cards = 5;
    state->finished = true;
    return;
  }
  state->street = static_cast<Street>(static_cast<int>(state->street) + 1);
  state->num_board_cards = state->street == Street::FLOP ? 3
                           : state->street == Street::TURN ? 4
                                                           : 5;
  state->bets = {0, 0};
  state->num_street_actions = 0;
  state->last_raise_size = params_.big_blind;
  state->current_player = 1 - state->button;
}

Pair<double> HoldemEnvironment::compute_rewards(const GameState& state) const {
  Pair<double> rewards = {0.0, 0.0};
  int winner = -1;
  if (state.folded_player >= 0) {
    winner = 1 - state.folded_player;
  } else {
    Pair<int64_t> ranks;
    for (int player = 0; player < kNumPlayers; ++player) {
      std::vector<Card> cards = state.visible_board();
      cards.insert(cards.end(), state.hole_cards[player].begin(),
                   state.hole_cards[player].end());
      ranks[player] = ranker_->rank(cards);
    }
    if (ranks[0] != ranks[1]) winner = ranks[0] > ranks[1] ? 0 : 1;
  }
  if (winner >= 0) {
    const int loser = 1 - winner;
    rewards[winner] = state.contributions[loser];
    rewards[loser] = -state.contributions[loser];
  }
  return rewards;
}

StepResult HoldemEnvironment::step(const GameState& state, Action action) {
  if (state.finished) {
    throw EnvironmentStateError("step() called on a finished hand");
  }
  const int player = state.current_player;
  if (player < 0 || player >= kNumPlayers) {
    throw EnvironmentStateError("Bad player to act: " +
                                std::to_string(player));
  }
  const auto legal = legal_actions(state, player);
  if (std::find(legal.begin(), legal.end(), action) == legal.end()) {
    throw EnvironmentStateError("Illegal action " + action_to_string(action) +
                                " in " + state_to_string(state));
  }

  StepResult result;
  GameState& next = result.next_state;
  next = state;
  const int opponent = 1 - player;
  const int to_call = state.bets[opponent] - state.bets[player];
  const int stack = state.stacks[player];
  ++next.num_street_actions;

  switch (action) {
    case kActionFold:
      next.folded_player = player;
      next.finished = true;
      break;
    case kActionCheckCall:
      commit(&next, player, std::min(to_call, stack));
      if (next.num_street_actions >= 2 &&
          (next.bets[0] == next.bets[1] || next.stacks[player] == 0)) {
        finish_street(&next);
      } else {
        next.current_player = opponent;
      }
      break;
    case kActionRaiseHalfPot:
    case kActionRaisePot: {
      const int size = raise_size(state, player, action);
      commit(&next, player, to_call + size);
      next.last_raise_size = size;
      next.current_player = opponent;
      break;
    }
    case kActionAllIn:
      commit(&next, player, stack);
      next.last_raise_size = std::max(state.last_raise_size, stack - to_call);
      next.current_player = opponent;
      break;
  }

  if (next.finished) {
    next.current_player = -1;
    result.rewards = compute_rewards(next);
    result.done = true;
  }
  return result;
}

std::string HoldemEnvironment::action_to_string(Action action) const {
  switch (action) {
    case kActionFold:
      return "fold";
    case kActionCheckCall:
      return "check/call";
    case kActionRaiseHalfPot:
      return "raise(half pot)";
    case kActionRaisePot:
      return "raise(pot)";
    case kActionAllIn:
      return "all-in";
  }
  return "unknown(" + std::to_string(action) + ")";
}

std::string HoldemEnvironment::state_to_string(const GameState& state) const {
  std::ostringstream ss;
  ss << "(street=" << static_cast<int>(state.street)
     << ",button=" << state.button
     << ",board=" << cards_to_string(state.visible_board())
     << ",pot=" << state.pot() << ",stacks=" << state.stacks[0] << "/"
     << state.stacks[1] << ",bets=" << state.bets[0] << "/" << state.bets[1]
     << ",to_act=" << state.current_player << ")";
  return ss.str();
}

}  // namespace deep_cfr
