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

#include <gtest/gtest.h>

#include "action_selector.h"
#include "errors.h"
#include "real_net.h"

using namespace deep_cfr;

namespace {

// Advantages fixed per action id.
class FixedAdvantageNet : public IAdvantageEstimator {
 public:
  explicit FixedAdvantageNet(std::vector<double> by_action)
      : by_action_(std::move(by_action)) {}

  std::vector<double> evaluate(const EncodedState& /*state*/,
                               const LegalActionSet& legal) override {
    std::vector<double> values;
    for (Action action : legal) values.push_back(by_action_[action]);
    return values;
  }
  double train_step(const std::vector<AdvantageSample>& /*batch*/) override {
    return 0.0;
  }
  void sync_target(double /*tau*/) override {}
  ParameterList online_parameters() const override { return {}; }
  ParameterList target_parameters() const override { return {}; }
  void load_parameters(const ParameterList& /*online*/,
                       const ParameterList& /*target*/) override {}
  std::string optimizer_state() const override { return {}; }
  void load_optimizer_state(const std::string& /*state*/) override {}

 private:
  const std::vector<double> by_action_;
};

class FixedStrategyNet : public IStrategyEstimator {
 public:
  explicit FixedStrategyNet(std::vector<double> strategy)
      : strategy_(std::move(strategy)) {}

  std::vector<double> evaluate(const EncodedState& /*state*/,
                               const LegalActionSet& /*legal*/) override {
    return strategy_;
  }
  double train_step(const std::vector<StrategySample>& /*batch*/) override {
    return 0.0;
  }
  ParameterList parameters() const override { return {}; }
  void load_parameters(const ParameterList& /*parameters*/) override {}
  std::string optimizer_state() const override { return {}; }
  void load_optimizer_state(const std::string& /*state*/) override {}

 private:
  const std::vector<double> strategy_;
};

const EncodedState kState = {0.5f, 0.1f, 0.0f, 0.0f};
// fold, call, raise
const LegalActionSet kLegal = {0, 1, 2};

}  // namespace

TEST(ActionSelectorTest, GreedyPicksOnlyPositiveAdvantage) {
  ActionSelector selector(
      std::make_shared<FixedAdvantageNet>(std::vector<double>{0.0, -1.0, 2.0}),
      create_uniform_strategy_net(), /*seed=*/0);
  for (int i = 0; i < 100; ++i) {
    const auto decision =
        selector.select_for_training_agent(kState, kLegal, /*epsilon=*/0.0);
    ASSERT_EQ(decision.strategy, std::vector<double>({0.0, 0.0, 1.0}));
    ASSERT_EQ(decision.advantages, std::vector<double>({0.0, -1.0, 2.0}));
    ASSERT_EQ(decision.action, 2);
    ASSERT_EQ(decision.index, 2);
    ASSERT_DOUBLE_EQ(decision.sampling_prob, 1.0);
    ASSERT_FALSE(decision.explored);
  }
}

TEST(ActionSelectorTest, FullExplorationIsUniform) {
  ActionSelector selector(
      std::make_shared<FixedAdvantageNet>(std::vector<double>{0.0, -1.0, 2.0}),
      create_uniform_strategy_net(), /*seed=*/1);
  std::vector<int> counts(3, 0);
  const int kDraws = 6000;
  for (int i = 0; i < kDraws; ++i) {
    const auto decision =
        selector.select_for_training_agent(kState, kLegal, 1.0);
    ASSERT_TRUE(decision.explored);
    ++counts[decision.index];
  }
  for (int count : counts) {
    EXPECT_NEAR(static_cast<double>(count) / kDraws, 1.0 / 3, 0.03);
  }
}

TEST(ActionSelectorTest, SameSeedSameDecisions) {
  auto advantage = create_zero_advantage_net();
  auto strategy = create_uniform_strategy_net();
  ActionSelector a(advantage, strategy, /*seed=*/5);
  ActionSelector b(advantage, strategy, /*seed=*/5);
  for (int i = 0; i < 50; ++i) {
    const auto da = a.select_for_training_agent(kState, kLegal, 0.3);
    const auto db = b.select_for_training_agent(kState, kLegal, 0.3);
    ASSERT_EQ(da.action, db.action);
    ASSERT_EQ(da.explored, db.explored);
    ASSERT_EQ(a.select_for_opponent(kState, kLegal),
              b.select_for_opponent(kState, kLegal));
  }
}

TEST(ActionSelectorTest, OpponentSamplesStrategyNet) {
  ActionSelector selector(
      create_zero_advantage_net(),
      std::make_shared<FixedStrategyNet>(std::vector<double>{0.0, 1.0, 0.0}),
      /*seed=*/2);
  for (int i = 0; i < 50; ++i) {
    ASSERT_EQ(selector.select_for_opponent(kState, {3, 4, 1}), 4);
  }
}

TEST(ActionSelectorTest, NoLegalActions) {
  ActionSelector selector(create_zero_advantage_net(),
                          create_uniform_strategy_net(), /*seed=*/3);
  ASSERT_THROW(selector.select_for_training_agent(kState, {}, 0.1),
               NoLegalActionsError);
  ASSERT_THROW(selector.select_for_opponent(kState, {}), NoLegalActionsError);
}
