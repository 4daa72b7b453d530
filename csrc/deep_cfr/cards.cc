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

#include "cards.h"

#include <sstream>
#include <stdexcept>

namespace deep_cfr {

namespace {
constexpr char kRankNames[] = "23456789TJQKA";
constexpr char kSuitNames[] = "cdhs";
}  // namespace

std::string card_to_string(Card card) {
  if (card < 0 || card >= kNumCards) {
    throw std::invalid_argument("Invalid card index: " + std::to_string(card));
  }
  std::string result;
  result += kRankNames[card_rank(card)];
  result += kSuitNames[card_suit(card)];
  return result;
}

std::string cards_to_string(const std::vector<Card>& cards) {
  std::ostringstream ss;
  for (size_t i = 0; i < cards.size(); ++i) {
    if (i) ss << " ";
    ss << card_to_string(cards[i]);
  }
  return ss.str();
}

Card card_from_string(const std::string& str) {
  if (str.size() == 2) {
    const std::string ranks = kRankNames;
    const std::string suits = kSuitNames;
    const auto rank = ranks.find(str[0]);
    const auto suit = suits.find(str[1]);
    if (rank != std::string::npos && suit != std::string::npos) {
      return make_card(rank, suit);
    }
  }
  throw std::invalid_argument("Cannot parse card: '" + str + "'");
}

}  // namespace deep_cfr
