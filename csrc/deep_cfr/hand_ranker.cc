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

#include "hand_ranker.h"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace deep_cfr {

namespace {

void check_cards(const std::vector<Card>& cards) {
  for (size_t i = 0; i < cards.size(); ++i) {
    if (cards[i] < 0 || cards[i] >= kNumCards) {
      throw std::invalid_argument("Invalid card index: " +
                                  std::to_string(cards[i]));
    }
    for (size_t j = 0; j < i; ++j) {
      if (cards[i] == cards[j]) {
        throw std::invalid_argument("Duplicate card: " +
                                    card_to_string(cards[i]));
      }
    }
  }
}

}  // namespace

int64_t BestHandRanker::evaluate_5card_hand(const std::vector<Card>& cards) {
  if (cards.size() != 5) {
    throw std::invalid_argument("evaluate_5card_hand expects 5 cards, got " +
                                std::to_string(cards.size()));
  }
  check_cards(cards);

  std::array<int, kNumRanks> counts = {};
  bool flush = true;
  for (Card card : cards) {
    ++counts[card_rank(card)];
    flush = flush && card_suit(card) == card_suit(cards[0]);
  }

  // (count, rank) for each distinct rank, bigger groups first and higher
  // ranks first within a group size.
  std::vector<std::pair<int, int>> groups;
  for (int r = kNumRanks - 1; r >= 0; --r) {
    if (counts[r] > 0) groups.emplace_back(counts[r], r);
  }
  std::stable_sort(
      groups.begin(), groups.end(),
      [](const std::pair<int, int>& a, const std::pair<int, int>& b) {
        return a.first > b.first;
      });

  int straight_high = -1;
  if (groups.size() == 5) {
    const int high = groups.front().second;
    const int low = groups.back().second;
    if (high - low == 4) {
      straight_high = high;
    } else if (high == kNumRanks - 1 && groups[1].second == 3) {
      // A-5-4-3-2 plays 5-high.
      straight_high = 3;
    }
  }

  HandType type;
  if (straight_high >= 0) {
    type = flush ? HandType::STRAIGHT_FLUSH : HandType::STRAIGHT;
  } else if (flush) {
    type = HandType::FLUSH;
  } else if (groups[0].first == 4) {
    type = HandType::QUADS;
  } else if (groups[0].first == 3) {
    type = groups[1].first == 2 ? HandType::FULL_HOUSE : HandType::TRIPS;
  } else if (groups[0].first == 2) {
    type = groups[1].first == 2 ? HandType::TWO_PAIR : HandType::PAIR;
  } else {
    type = HandType::HIGH_CARD;
  }

  const int64_t value = static_cast<int64_t>(type) << 20;
  if (straight_high >= 0) {
    return value | straight_high;
  }
  // Group ranks as nibbles from bit 16 down. A hand type always has the
  // same number of groups, so values of one type compare lexicographically.
  int64_t tiebreak = 0;
  for (const auto& group : groups) {
    tiebreak = (tiebreak << 4) | group.second;
  }
  return value | (tiebreak << (4 * (5 - groups.size())));
}

int64_t BestHandRanker::rank(const std::vector<Card>& cards) const {
  if (cards.size() < 5 || cards.size() > 7) {
    throw std::invalid_argument("Can rank 5 to 7 cards, got " +
                                std::to_string(cards.size()));
  }
  check_cards(cards);

  // Walk every 5-card subset via the permutations of a selection mask.
  std::vector<bool> chosen(cards.size(), false);
  std::fill(chosen.begin(), chosen.begin() + 5, true);
  int64_t best = -1;
  std::vector<Card> hand(5);
  do {
    size_t k = 0;
    for (size_t i = 0; i < cards.size(); ++i) {
      if (chosen[i]) hand[k++] = cards[i];
    }
    best = std::max(best, evaluate_5card_hand(hand));
  } while (std::prev_permutation(chosen.begin(), chosen.end()));
  return best;
}

HandType BestHandRanker::get_hand_type(int64_t rank) {
  return static_cast<HandType>((rank >> 20) & 0xF);
}

}  // namespace deep_cfr
