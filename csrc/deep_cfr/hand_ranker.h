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

#include <stdint.h>

#include <vector>

#include "cards.h"

namespace deep_cfr {

enum class HandType {
  HIGH_CARD = 0,
  PAIR = 1,
  TWO_PAIR = 2,
  TRIPS = 3,
  STRAIGHT = 4,
  FLUSH = 5,
  FULL_HOUSE = 6,
  QUADS = 7,
  STRAIGHT_FLUSH = 8
};

// Capability to rank poker hands. Only the encoder and the environment
// showdown consume it; the training core never sees cards.
class IHandRanker {
 public:
  virtual ~IHandRanker() = default;

  // Value of the best five-card hand that can be made from `cards`. Higher
  // is better, equal values tie.
  virtual int64_t rank(const std::vector<Card>& cards) const = 0;
};

// Exhaustive best-of-N ranker for 5 to 7 cards.
// Hand encoding: bits 20-23 = hand type, lower nibbles = ranks of the
// cards that break ties, most significant first.
class BestHandRanker : public IHandRanker {
 public:
  int64_t rank(const std::vector<Card>& cards) const override;

  // Exactly 5 cards.
  static int64_t evaluate_5card_hand(const std::vector<Card>& cards);

  static HandType get_hand_type(int64_t rank);
};

}  // namespace deep_cfr
