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

#include "cfr_iteration.h"

#include <cmath>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "errors.h"
#include "regret_matching.h"

namespace deep_cfr {

const char* phase_name(IterationPhase phase) {
  switch (phase) {
    case IterationPhase::RESET:
      return "RESET";
    case IterationPhase::ENCODE:
      return "ENCODE";
    case IterationPhase::SELECT_ACTIONS:
      return "SELECT_ACTIONS";
    case IterationPhase::STEP_ENVIRONMENT:
      return "STEP_ENVIRONMENT";
    case IterationPhase::COMPUTE_REGRET:
      return "COMPUTE_REGRET";
    case IterationPhase::STORE_SAMPLES:
      return "STORE_SAMPLES";
    case IterationPhase::DONE:
      return "DONE";
  }
  return "UNKNOWN";
}

CfrIterationDriver::CfrIterationDriver(
    std::shared_ptr<IEnvironment> env,
    std::shared_ptr<const IStateEncoder> encoder,
    std::shared_ptr<IAdvantageEstimator> advantage_net,
    std::shared_ptr<IStrategyEstimator> strategy_net,
    std::shared_ptr<ReservoirMemory<AdvantageSample>> advantage_memory,
    std::shared_ptr<ReservoirMemory<StrategySample>> strategy_memory,
    int training_player, int seed)
    : env_(std::move(env)),
      encoder_(std::move(encoder)),
      advantage_memory_(std::move(advantage_memory)),
      strategy_memory_(std::move(strategy_memory)),
      training_player_(training_player),
      selector_(std::move(advantage_net), std::move(strategy_net), seed),
      phase_(IterationPhase::DONE) {
  if (training_player_ < 0 || training_player_ >= kNumPlayers) {
    throw std::invalid_argument("Bad training player: " +
                                std::to_string(training_player_));
  }
}

void CfrIterationDriver::check_legal(const LegalActionSet& legal) const {
  for (const Action action : legal) {
    if (action < 0 || action >= env_->num_actions()) {
      throw EnvironmentStateError("Legal action out of range: " +
                                  std::to_string(action));
    }
  }
}

std::vector<double> CfrIterationDriver::compute_regrets(
    const PendingDecision& pending, double utility) const {
  const TrainingDecision& decision = pending.decision;
  std::vector<double> values = decision.advantages;
  const double baseline = values[decision.index];
  values[decision.index] =
      baseline + (utility - baseline) / decision.sampling_prob;
  double expected = 0;
  for (size_t i = 0; i < values.size(); ++i) {
    expected += decision.strategy[i] * values[i];
  }
  std::vector<double> regrets(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    regrets[i] = values[i] - expected;
    if (!std::isfinite(regrets[i])) {
      throw NumericInstabilityError("Non-finite regret for action " +
                                    std::to_string(pending.legal[i]));
    }
  }
  return regrets;
}

IterationResult CfrIterationDriver::run(int64_t iteration, double epsilon) {
  IterationResult result;
  std::vector<PendingDecision> pending;

  phase_ = IterationPhase::RESET;
  GameState state = env_->reset();
  bool done = state.finished;
  while (!done) {
    if (result.num_steps >= kMaxStepsPerHand) {
      throw EnvironmentStateError("Hand did not terminate after " +
                                  std::to_string(kMaxStepsPerHand) +
                                  " steps");
    }
    const int player = state.current_player;
    if (player < 0 || player >= kNumPlayers) {
      throw EnvironmentStateError("Unfinished state without a player to act: " +
                                  std::to_string(player));
    }

    phase_ = IterationPhase::ENCODE;
    EncodedState encoded = encoder_->encode(state, player);
    LegalActionSet legal = env_->legal_actions(state, player);
    check_legal(legal);

    phase_ = IterationPhase::SELECT_ACTIONS;
    Action action;
    if (player == training_player_) {
      TrainingDecision decision =
          selector_.select_for_training_agent(encoded, legal, epsilon);
      action = decision.action;
      spdlog::debug("iter {} step {}: agent {} p={:.3f}{}", iteration,
                    result.num_steps, env_->action_to_string(action),
                    decision.sampling_prob,
                    decision.explored ? " explore" : "");
      pending.push_back(
          {std::move(encoded), std::move(legal), std::move(decision)});
    } else {
      action = selector_.select_for_opponent(encoded, legal);
      spdlog::debug("iter {} step {}: opponent {}", iteration,
                    result.num_steps, env_->action_to_string(action));
    }

    phase_ = IterationPhase::STEP_ENVIRONMENT;
    StepResult step = env_->step(state, action);
    ++result.num_steps;
    state = std::move(step.next_state);
    done = step.done;
    if (done) {
      for (const double reward : step.rewards) {
        if (!std::isfinite(reward)) {
          throw EnvironmentStateError("Non-finite terminal reward");
        }
      }
      result.rewards = step.rewards;
    }
  }

  phase_ = IterationPhase::COMPUTE_REGRET;
  const double utility = result.rewards[training_player_];
  const float weight = static_cast<float>(iteration);
  std::vector<AdvantageSample> advantage_samples;
  std::vector<StrategySample> strategy_samples;
  for (const PendingDecision& p : pending) {
    const auto regrets = compute_regrets(p, utility);
    for (size_t i = 0; i < p.legal.size(); ++i) {
      advantage_samples.push_back(
          {p.state, p.legal[i], static_cast<float>(regrets[i]), weight});
    }
    strategy_samples.push_back(
        {p.state,
         to_full_strategy(p.decision.strategy, p.legal, env_->num_actions()),
         weight});
  }

  phase_ = IterationPhase::STORE_SAMPLES;
  result.num_decisions = pending.size();
  result.num_advantage_samples = advantage_samples.size();
  result.num_strategy_samples = strategy_samples.size();
  for (auto& sample : advantage_samples) {
    advantage_memory_->insert(std::move(sample));
  }
  for (auto& sample : strategy_samples) {
    strategy_memory_->insert(std::move(sample));
  }

  phase_ = IterationPhase::DONE;
  spdlog::debug("iteration {}: {} steps, {} decisions, reward {}", iteration,
                result.num_steps, result.num_decisions,
                result.rewards[training_player_]);
  return result;
}

}  // namespace deep_cfr
