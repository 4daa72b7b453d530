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

#include "training_loop.h"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <torch/torch.h>

#include "errors.h"
#include "hand_ranker.h"
#include "holdem.h"
#include "real_net.h"

namespace deep_cfr {

namespace {

void check(bool condition, const std::string& message) {
  if (!condition) {
    throw std::invalid_argument("Bad TrainingConfig: " + message);
  }
}

void check_device(const std::string& device) {
  try {
    const torch::Device parsed(device);
    check(!parsed.is_cuda() || torch::cuda::is_available(),
          "device " + device + " needs CUDA, which is not available");
  } catch (const c10::Error& e) {
    check(false, "bad device " + device + ": " + e.what_without_backtrace());
  }
}

const TrainingConfig& validated(const TrainingConfig& config) {
  config.validate();
  return config;
}

bool is_due(int64_t iteration, int period) {
  return period > 0 && iteration % period == 0;
}

}  // namespace

void TrainingConfig::validate() const {
  check(iterations >= 0, "iterations must be non-negative");
  check(batch_size > 0, "batch_size must be positive");
  check(memory_capacity > 0, "memory_capacity must be positive");
  check(save_interval >= 0 && sync_period >= 0 && update_period >= 0,
        "periods must be non-negative");
  check(tau > 0 && tau <= 1, "tau must be in (0, 1]");
  check(epsilon_min >= 0 && epsilon_min <= epsilon_start &&
            epsilon_start <= 1,
        "need 0 <= epsilon_min <= epsilon_start <= 1");
  check(epsilon_decay > 0 && epsilon_decay <= 1,
        "epsilon_decay must be in (0, 1]");
  check(learning_rate > 0, "learning_rate must be positive");
  check(training_player >= 0 && training_player < kNumPlayers,
        "training_player must be 0 or 1");
  check_device(device);
}

TrainingLoop::TrainingLoop(const TrainingConfig& config,
                           std::shared_ptr<IEnvironment> env,
                           std::shared_ptr<const IStateEncoder> encoder,
                           std::shared_ptr<IAdvantageEstimator> advantage_net,
                           std::shared_ptr<IStrategyEstimator> strategy_net,
                           std::shared_ptr<ICheckpointer> checkpointer)
    : config_(validated(config)),
      env_(std::move(env)),
      encoder_(std::move(encoder)),
      advantage_net_(std::move(advantage_net)),
      strategy_net_(std::move(strategy_net)),
      checkpointer_(std::move(checkpointer)),
      advantage_memory_(std::make_shared<ReservoirMemory<AdvantageSample>>(
          config_.memory_capacity, config_.seed + 2)),
      strategy_memory_(std::make_shared<ReservoirMemory<StrategySample>>(
          config_.memory_capacity, config_.seed + 3)),
      driver_(env_, encoder_, advantage_net_, strategy_net_,
              advantage_memory_, strategy_memory_, config_.training_player,
              config_.seed + 1),
      iteration_(0),
      epsilon_(config_.epsilon_start) {}

IterationStats TrainingLoop::tick() {
  IterationStats stats;
  stats.iteration = iteration_ + 1;
  stats.epsilon = epsilon_;
  try {
    const IterationResult result = driver_.run(stats.iteration, epsilon_);
    stats.reward = result.rewards[config_.training_player];
    stats.num_decisions = result.num_decisions;
  } catch (const NoLegalActionsError& e) {
    spdlog::warn("Iteration {} skipped in {}: {}", stats.iteration,
                 phase_name(driver_.phase()), e.what());
    stats.skipped = true;
  } catch (const NumericInstabilityError& e) {
    spdlog::warn("Iteration {} skipped in {}: {}", stats.iteration,
                 phase_name(driver_.phase()), e.what());
    stats.skipped = true;
  }
  iteration_ = stats.iteration;

  if (is_due(iteration_, config_.update_period)) {
    update_networks(&stats);
  }
  if (is_due(iteration_, config_.sync_period)) {
    advantage_net_->sync_target(config_.tau);
    stats.synced = true;
  }
  if (is_due(iteration_, config_.save_interval)) {
    save_checkpoint(&stats);
  }
  epsilon_ = std::max(config_.epsilon_min, epsilon_ * config_.epsilon_decay);

  spdlog::debug(
      "iteration {}: eps {:.4f} reward {} decisions {} adv_loss {} "
      "strat_loss {}",
      stats.iteration, stats.epsilon, stats.reward, stats.num_decisions,
      stats.advantage_loss, stats.strategy_loss);
  return stats;
}

void TrainingLoop::update_networks(IterationStats* stats) {
  try {
    stats->advantage_loss = advantage_net_->train_step(
        advantage_memory_->sample_batch(config_.batch_size));
    stats->advantage_updated = true;
  } catch (const InsufficientSamplesError& e) {
    spdlog::warn("Advantage update skipped at {}: {}", iteration_, e.what());
  } catch (const NumericInstabilityError& e) {
    spdlog::warn("Advantage update skipped at {}: {}", iteration_, e.what());
  }
  try {
    stats->strategy_loss = strategy_net_->train_step(
        strategy_memory_->sample_batch(config_.batch_size));
    stats->strategy_updated = true;
  } catch (const InsufficientSamplesError& e) {
    spdlog::warn("Strategy update skipped at {}: {}", iteration_, e.what());
  } catch (const NumericInstabilityError& e) {
    spdlog::warn("Strategy update skipped at {}: {}", iteration_, e.what());
  }
}

void TrainingLoop::save_checkpoint(IterationStats* stats) {
  if (checkpointer_ == nullptr) {
    return;
  }
  try {
    checkpointer_->save(make_checkpoint());
    stats->checkpointed = true;
  } catch (const CheckpointError& e) {
    spdlog::error("Checkpoint at iteration {} failed: {}", iteration_,
                  e.what());
  }
}

IterationStats TrainingLoop::train() {
  spdlog::info("Training from iteration {} to {}", iteration_,
               config_.iterations);
  IterationStats stats;
  stats.iteration = iteration_;
  stats.epsilon = epsilon_;
  while (iteration_ < config_.iterations) {
    stats = tick();
    if (stats.checkpointed) {
      spdlog::info("iteration {}: epsilon {:.4f}, memories {}/{}",
                   stats.iteration, stats.epsilon, advantage_memory_->size(),
                   strategy_memory_->size());
    }
  }
  spdlog::info("Training done after {} iterations", iteration_);
  return stats;
}

Checkpoint TrainingLoop::make_checkpoint() const {
  Checkpoint checkpoint;
  checkpoint.iteration = iteration_;
  checkpoint.epsilon = epsilon_;
  checkpoint.advantage_params = advantage_net_->online_parameters();
  checkpoint.target_advantage_params = advantage_net_->target_parameters();
  checkpoint.strategy_params = strategy_net_->parameters();
  checkpoint.advantage_optimizer = advantage_net_->optimizer_state();
  checkpoint.strategy_optimizer = strategy_net_->optimizer_state();
  return checkpoint;
}

void TrainingLoop::restore(const Checkpoint& checkpoint) {
  if (checkpoint.iteration < 0) {
    throw CheckpointError("Negative iteration in checkpoint");
  }
  try {
    advantage_net_->load_parameters(checkpoint.advantage_params,
                                    checkpoint.target_advantage_params);
    advantage_net_->load_optimizer_state(checkpoint.advantage_optimizer);
    strategy_net_->load_parameters(checkpoint.strategy_params);
    strategy_net_->load_optimizer_state(checkpoint.strategy_optimizer);
  } catch (const std::invalid_argument& e) {
    throw CheckpointError(
        std::string("Checkpoint does not fit the networks: ") + e.what());
  }
  iteration_ = checkpoint.iteration;
  epsilon_ = std::max(config_.epsilon_min, checkpoint.epsilon);
  spdlog::info("Restored iteration {} with epsilon {:.4f}", iteration_,
               epsilon_);
}

std::unique_ptr<TrainingLoop> build_training_loop(
    const TrainingConfig& config) {
  config.validate();
  torch::manual_seed(config.seed);
  const HoldemParams holdem_params;
  auto ranker = std::make_shared<BestHandRanker>();
  auto env = std::make_shared<HoldemEnvironment>(ranker, config.seed,
                                                 holdem_params);
  auto encoder = std::make_shared<HandStrengthEncoder>(
      ranker, kNumPlayers * holdem_params.stack_size);

  NetParams net_params;
  net_params.input_size = encoder->feature_size();
  net_params.num_actions = env->num_actions();
  net_params.hidden_sizes = config.hidden_sizes;
  net_params.learning_rate = config.learning_rate;
  net_params.device = config.device;

  return std::make_unique<TrainingLoop>(
      config, env, encoder, create_advantage_net(net_params),
      create_strategy_net(net_params),
      std::make_shared<FileCheckpointer>(config.checkpoint_dir));
}

}  // namespace deep_cfr
