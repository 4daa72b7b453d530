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

#include "errors.h"
#include "real_net.h"
#include "test_helpers.h"
#include "training_loop.h"

using namespace deep_cfr;
using namespace deep_cfr::fakes;

class TrainingLoopTest : public ::testing::Test {
 protected:
  std::shared_ptr<CountingAdvantageNet> advantage_net =
      std::make_shared<CountingAdvantageNet>();
  std::shared_ptr<CountingStrategyNet> strategy_net =
      std::make_shared<CountingStrategyNet>();
  std::shared_ptr<RecordingCheckpointer> checkpointer =
      std::make_shared<RecordingCheckpointer>();

  static TrainingConfig small_config() {
    TrainingConfig cfg;
    cfg.iterations = 10;
    cfg.batch_size = 4;
    cfg.save_interval = 5;
    cfg.sync_period = 3;
    cfg.update_period = 1;
    cfg.memory_capacity = 100;
    return cfg;
  }

  // Player 0 decides once among three actions.
  static std::shared_ptr<IEnvironment> one_decision_env() {
    return std::make_shared<ScriptedEnvironment>(
        std::vector<int>{0}, std::vector<LegalActionSet>{{0, 1, 2}},
        Pair<double>{1.0, -1.0});
  }

  TrainingLoop make_loop(const TrainingConfig& cfg,
                         std::shared_ptr<IEnvironment> env) {
    return TrainingLoop(cfg, std::move(env),
                        std::make_shared<ConstantEncoder>(), advantage_net,
                        strategy_net, checkpointer);
  }
};

TEST_F(TrainingLoopTest, CheckpointsOnCadence) {
  auto loop = make_loop(small_config(), one_decision_env());
  const auto stats = loop.train();
  EXPECT_EQ(stats.iteration, 10);
  EXPECT_EQ(loop.iteration(), 10);
  EXPECT_EQ(checkpointer->saved_iterations, std::vector<int64_t>({5, 10}));
}

TEST_F(TrainingLoopTest, EpsilonDecaysToFloor) {
  TrainingConfig cfg = small_config();
  cfg.iterations = 20;
  cfg.epsilon_start = 0.5;
  cfg.epsilon_min = 0.1;
  cfg.epsilon_decay = 0.8;
  auto loop = make_loop(cfg, one_decision_env());
  double previous = loop.epsilon();
  EXPECT_DOUBLE_EQ(previous, 0.5);
  for (int i = 0; i < 20; ++i) {
    const auto stats = loop.tick();
    EXPECT_DOUBLE_EQ(stats.epsilon, previous);
    EXPECT_LE(loop.epsilon(), previous);
    EXPECT_GE(loop.epsilon(), 0.1);
    previous = loop.epsilon();
  }
  EXPECT_DOUBLE_EQ(loop.epsilon(), 0.1);
}

TEST_F(TrainingLoopTest, UpdatesAndSyncs) {
  auto loop = make_loop(small_config(), one_decision_env());
  const auto first = loop.tick();
  EXPECT_TRUE(first.advantage_updated);
  EXPECT_TRUE(first.strategy_updated);
  EXPECT_DOUBLE_EQ(first.advantage_loss, 1.0);
  EXPECT_DOUBLE_EQ(first.strategy_loss, 2.0);
  EXPECT_EQ(first.num_decisions, 1);
  EXPECT_EQ(advantage_net->last_batch_size, 3u);
  loop.train();
  EXPECT_EQ(advantage_net->num_train_steps, 10);
  EXPECT_EQ(strategy_net->num_train_steps, 10);
  // Batches are capped by the batch size.
  EXPECT_EQ(advantage_net->last_batch_size, 4u);
  // Iterations 3, 6 and 9.
  EXPECT_EQ(advantage_net->num_syncs, 3);
  EXPECT_DOUBLE_EQ(advantage_net->last_tau, 0.01);
  EXPECT_EQ(loop.advantage_memory().size(), 30);
  EXPECT_EQ(loop.strategy_memory().size(), 10);
}

TEST_F(TrainingLoopTest, ZeroPeriodsDisableCadences) {
  TrainingConfig cfg = small_config();
  cfg.update_period = 0;
  cfg.sync_period = 0;
  cfg.save_interval = 0;
  auto loop = make_loop(cfg, one_decision_env());
  loop.train();
  EXPECT_EQ(advantage_net->num_train_steps, 0);
  EXPECT_EQ(strategy_net->num_train_steps, 0);
  EXPECT_EQ(advantage_net->num_syncs, 0);
  EXPECT_TRUE(checkpointer->saved_iterations.empty());
  // Samples are still collected.
  EXPECT_EQ(loop.strategy_memory().size(), 10);
}

TEST_F(TrainingLoopTest, EmptyMemorySkipsUpdate) {
  TrainingConfig cfg = small_config();
  // Player 0 is the only one to act, so the training agent never decides.
  cfg.training_player = 1;
  auto loop = make_loop(cfg, one_decision_env());
  const auto stats = loop.tick();
  EXPECT_FALSE(stats.skipped);
  EXPECT_FALSE(stats.advantage_updated);
  EXPECT_FALSE(stats.strategy_updated);
  EXPECT_EQ(stats.reward, -1.0);
  EXPECT_EQ(advantage_net->num_train_steps, 0);
}

TEST_F(TrainingLoopTest, NumericFailureSkipsUpdate) {
  advantage_net->fail_training = true;
  auto loop = make_loop(small_config(), one_decision_env());
  const auto stats = loop.tick();
  EXPECT_FALSE(stats.advantage_updated);
  EXPECT_TRUE(stats.strategy_updated);
  EXPECT_EQ(advantage_net->num_train_steps, 1);
  EXPECT_EQ(loop.iteration(), 1);
}

TEST_F(TrainingLoopTest, NumericFailureInEvaluateSkipsIteration) {
  advantage_net->fail_evaluate = true;
  auto loop = make_loop(small_config(), one_decision_env());
  const auto stats = loop.tick();
  EXPECT_TRUE(stats.skipped);
  EXPECT_EQ(stats.iteration, 1);
  EXPECT_EQ(loop.iteration(), 1);
  EXPECT_EQ(loop.advantage_memory().size(), 0);
  EXPECT_EQ(loop.advantage_memory().num_add(), 0);
  EXPECT_EQ(loop.strategy_memory().size(), 0);
  EXPECT_EQ(loop.strategy_memory().num_add(), 0);
  EXPECT_FALSE(stats.advantage_updated);
  EXPECT_FALSE(stats.strategy_updated);
  // The next hand plays normally.
  advantage_net->fail_evaluate = false;
  EXPECT_FALSE(loop.tick().skipped);
  EXPECT_EQ(loop.iteration(), 2);
}

TEST_F(TrainingLoopTest, NoLegalActionsSkipsIteration) {
  auto env = std::make_shared<ScriptedEnvironment>(
      std::vector<int>{0, 0}, std::vector<LegalActionSet>{{0, 1}, {}},
      Pair<double>{1.0, -1.0});
  auto loop = make_loop(small_config(), env);
  const auto stats = loop.train();
  EXPECT_TRUE(stats.skipped);
  EXPECT_EQ(loop.iteration(), 10);
  EXPECT_EQ(env->num_resets, 10);
  EXPECT_EQ(loop.advantage_memory().size(), 0);
  EXPECT_EQ(loop.strategy_memory().size(), 0);
  // Checkpoints still follow the iteration counter.
  EXPECT_EQ(checkpointer->saved_iterations.size(), 2u);
}

TEST_F(TrainingLoopTest, EnvironmentErrorPropagates) {
  auto env = std::make_shared<ScriptedEnvironment>(
      std::vector<int>{0, -1}, std::vector<LegalActionSet>{{0}, {0}},
      Pair<double>{0.0, 0.0});
  auto loop = make_loop(small_config(), env);
  ASSERT_THROW(loop.train(), EnvironmentStateError);
  EXPECT_EQ(loop.iteration(), 0);
}

TEST_F(TrainingLoopTest, CheckpointFailureIsNotFatal) {
  checkpointer->fail = true;
  auto loop = make_loop(small_config(), one_decision_env());
  IterationStats stats;
  for (int i = 0; i < 5; ++i) stats = loop.tick();
  EXPECT_FALSE(stats.checkpointed);
  const auto last = loop.train();
  EXPECT_EQ(last.iteration, 10);
}

TEST_F(TrainingLoopTest, RestoreResumesCounters) {
  auto loop = make_loop(small_config(), one_decision_env());
  Checkpoint checkpoint;
  checkpoint.iteration = 7;
  checkpoint.epsilon = 0.05;
  loop.restore(checkpoint);
  EXPECT_EQ(loop.iteration(), 7);
  EXPECT_DOUBLE_EQ(loop.epsilon(), 0.05);
  EXPECT_EQ(advantage_net->num_loads, 1);
  EXPECT_EQ(strategy_net->num_loads, 1);
  EXPECT_EQ(advantage_net->loaded_optimizer_state, "");

  const auto stats = loop.train();
  EXPECT_EQ(stats.iteration, 10);
  EXPECT_EQ(strategy_net->num_train_steps, 3);
  EXPECT_EQ(checkpointer->saved_iterations, std::vector<int64_t>({10}));

  const auto saved = loop.make_checkpoint();
  EXPECT_EQ(saved.iteration, 10);
  EXPECT_DOUBLE_EQ(saved.epsilon, loop.epsilon());
  EXPECT_EQ(saved.advantage_optimizer, "advantage-adam");
  EXPECT_EQ(saved.strategy_optimizer, "strategy-adam");
}

TEST_F(TrainingLoopTest, RestoreLoadsOptimizerState) {
  auto loop = make_loop(small_config(), one_decision_env());
  Checkpoint checkpoint;
  checkpoint.iteration = 2;
  checkpoint.epsilon = 0.1;
  checkpoint.advantage_optimizer = "saved-advantage";
  checkpoint.strategy_optimizer = "saved-strategy";
  loop.restore(checkpoint);
  EXPECT_EQ(advantage_net->loaded_optimizer_state, "saved-advantage");
  EXPECT_EQ(strategy_net->loaded_optimizer_state, "saved-strategy");
}

TEST_F(TrainingLoopTest, RestoreRejectsMismatchedCheckpoint) {
  NetParams params;
  params.num_actions = 3;
  params.hidden_sizes = {8};
  TrainingLoop loop(small_config(), one_decision_env(),
                    std::make_shared<ConstantEncoder>(),
                    create_advantage_net(params), create_strategy_net(params),
                    checkpointer);
  Checkpoint checkpoint = loop.make_checkpoint();
  checkpoint.iteration = 4;
  checkpoint.advantage_params.pop_back();
  ASSERT_THROW(loop.restore(checkpoint), CheckpointError);

  checkpoint = loop.make_checkpoint();
  checkpoint.strategy_optimizer = "garbage";
  ASSERT_THROW(loop.restore(checkpoint), CheckpointError);
}

TEST_F(TrainingLoopTest, ValidatesConfig) {
  const auto expect_invalid = [this](TrainingConfig cfg) {
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
    EXPECT_THROW(make_loop(cfg, one_decision_env()), std::invalid_argument);
  };
  small_config().validate();
  {
    auto cfg = small_config();
    cfg.tau = 0;
    expect_invalid(cfg);
  }
  {
    auto cfg = small_config();
    cfg.epsilon_min = 0.5;
    cfg.epsilon_start = 0.2;
    expect_invalid(cfg);
  }
  {
    auto cfg = small_config();
    cfg.epsilon_decay = 1.5;
    expect_invalid(cfg);
  }
  {
    auto cfg = small_config();
    cfg.sync_period = -1;
    expect_invalid(cfg);
  }
  {
    auto cfg = small_config();
    cfg.batch_size = 0;
    expect_invalid(cfg);
  }
  {
    auto cfg = small_config();
    cfg.training_player = 2;
    expect_invalid(cfg);
  }
  {
    auto cfg = small_config();
    cfg.device = "nonsense";
    expect_invalid(cfg);
  }
}
