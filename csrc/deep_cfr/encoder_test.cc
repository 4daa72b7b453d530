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

#include <sstream>

#include <gtest/gtest.h>

#include "encoder.h"
#include "hand_ranker.h"
#include "holdem.h"

using namespace deep_cfr;

namespace {

std::vector<Card> parse(const std::string& str) {
  std::istringstream ss(str);
  std::vector<Card> cards;
  std::string token;
  while (ss >> token) cards.push_back(card_from_string(token));
  return cards;
}

std::array<Card, 2> hole(const std::string& str) {
  const auto cards = parse(str);
  return {cards[0], cards[1]};
}

}  // namespace

class EncoderTest : public ::testing::Test {
 protected:
  std::shared_ptr<BestHandRanker> ranker;
  HandStrengthEncoder encoder;

  EncoderTest()
      : ranker(std::make_shared<BestHandRanker>()), encoder(ranker, 200) {}
};

TEST_F(EncoderTest, PreflopTable) {
  EXPECT_DOUBLE_EQ(HandStrengthEncoder::preflop_strength(hole("As Ad")), 0.9);
  EXPECT_DOUBLE_EQ(HandStrengthEncoder::preflop_strength(hole("Ks Qs")), 0.7);
  EXPECT_DOUBLE_EQ(HandStrengthEncoder::preflop_strength(hole("Ks Qd")), 0.6);
  EXPECT_DOUBLE_EQ(HandStrengthEncoder::preflop_strength(hole("As 5s")), 0.5);
  EXPECT_DOUBLE_EQ(HandStrengthEncoder::preflop_strength(hole("As 5d")), 0.4);
  EXPECT_DOUBLE_EQ(encoder.hand_strength(hole("7c 7d"), {}), 0.9);
}

TEST_F(EncoderTest, PostflopStrength) {
  // Royal flush cannot be beaten or tied.
  EXPECT_DOUBLE_EQ(
      encoder.hand_strength(hole("Th 3d"), parse("Ah Kh Qh Jh 2c")), 1.0);
  const double quads =
      encoder.hand_strength(hole("9c 9d"), parse("9h 9s 2c"));
  const double air = encoder.hand_strength(hole("3c 4d"), parse("9h Ks Jc"));
  EXPECT_GT(quads, 0.99);
  EXPECT_LT(air, 0.3);
  EXPECT_GE(air, 0.0);
  // Everybody plays the board: all ties.
  EXPECT_DOUBLE_EQ(
      encoder.hand_strength(hole("2c 3d"), parse("Ah Kh Qh Jh Th")), 0.5);
}

TEST_F(EncoderTest, EncodeFeatures) {
  HoldemEnvironment env(ranker, /*seed=*/3);
  const GameState state = env.reset();
  for (int player = 0; player < kNumPlayers; ++player) {
    const auto features = encoder.encode(state, player);
    ASSERT_EQ(features.size(), static_cast<size_t>(encoder.feature_size()));
    EXPECT_FLOAT_EQ(features[0], HandStrengthEncoder::preflop_strength(
                                     state.hole_cards[player]));
    EXPECT_FLOAT_EQ(features[1], 3.0f / 200);
    EXPECT_FLOAT_EQ(features[2], player == state.button ? 1.0f : 0.0f);
    EXPECT_FLOAT_EQ(features[3], 0.0f);
  }
  ASSERT_THROW(encoder.encode(state, 2), std::invalid_argument);
}
