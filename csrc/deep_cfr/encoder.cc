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

#include "encoder.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace deep_cfr {

HandStrengthEncoder::HandStrengthEncoder(
    std::shared_ptr<const IHandRanker> ranker, int total_chips)
    : ranker_(std::move(ranker)), total_chips_(total_chips) {
  if (ranker_ == nullptr) {
    throw std::invalid_argument("HandStrengthEncoder requires a hand ranker");
  }
  if (total_chips_ <= 0) {
    throw std::invalid_argument("total_chips must be positive");
  }
}

double HandStrengthEncoder::preflop_strength(const std::array<Card, 2>& hole) {
  const int low = std::min(card_rank(hole[0]), card_rank(hole[1]));
  const int high = std::max(card_rank(hole[0]), card_rank(hole[1]));
  const bool suited = card_suit(hole[0]) == card_suit(hole[1]);
  if (low == high) return 0.9;
  if (high - low == 1) return suited ? 0.7 : 0.6;
  if (suited) return 0.5;
  return 0.4;
}

double HandStrengthEncoder::hand_strength(
    const std::array<Card, 2>& hole, const std::vector<Card>& board) const {
  if (board.size() < 3) return preflop_strength(hole);

  std::array<bool, kNumCards> used = {};
  for (Card card : hole) used[card] = true;
  for (Card card : board) used[card] = true;

  std::vector<Card> cards = board;
  cards.push_back(hole[0]);
  cards.push_back(hole[1]);
  const int64_t my_rank = ranker_->rank(cards);

  double wins = 0;
  int total = 0;
  for (Card c1 = 0; c1 < kNumCards; ++c1) {
    if (used[c1]) continue;
    for (Card c2 = c1 + 1; c2 < kNumCards; ++c2) {
      if (used[c2]) continue;
      cards[board.size()] = c1;
      cards[board.size() + 1] = c2;
      const int64_t op_rank = ranker_->rank(cards);
      if (my_rank > op_rank) {
        wins += 1.0;
      } else if (my_rank == op_rank) {
        wins += 0.5;
      }
      ++total;
    }
  }
  return wins / total;
}

EncodedState HandStrengthEncoder::encode(const GameState& state,
                                         int player) const {
  if (player < 0 || player >= kNumPlayers) {
    throw std::invalid_argument("Bad player: " + std::to_string(player));
  }
  EncodedState features(kFeatureSize);
  features[0] =
      hand_strength(state.hole_cards[player], state.visible_board());
  features[1] = static_cast<float>(state.pot()) / total_chips_;
  features[2] = state.button == player ? 1.0f : 0.0f;
  features[3] = static_cast<float>(state.street) / 3.0f;
  return features;
}

}  // namespace deep_cfr
