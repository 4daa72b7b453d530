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

#include <string>
#include <vector>

namespace deep_cfr {

// Cards are encoded as 0-51: rank * 4 + suit, with rank 0-12 (2-A) and suit
// 0-3 (clubs, diamonds, hearts, spades).
using Card = int;

constexpr int kNumCards = 52;
constexpr int kNumRanks = 13;
constexpr int kNumSuits = 4;
constexpr Card kInvalidCard = -1;

inline int card_rank(Card card) { return card / kNumSuits; }
inline int card_suit(Card card) { return card % kNumSuits; }
inline Card make_card(int rank, int suit) { return rank * kNumSuits + suit; }

// "As", "Td", ... Throws std::invalid_argument on anything outside 0-51.
std::string card_to_string(Card card);
std::string cards_to_string(const std::vector<Card>& cards);
// Inverse of card_to_string.
Card card_from_string(const std::string& str);

}  // namespace deep_cfr
