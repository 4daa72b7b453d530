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

#include "real_net.h"

#include <math.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "errors.h"

namespace deep_cfr {

namespace {

Mlp make_mlp(const NetParams& params, const torch::Device& device) {
  Mlp net(params.input_size, params.hidden_sizes, params.num_actions);
  net->to(device);
  return net;
}

const NetParams& validated(const NetParams& params) {
  if (params.input_size <= 0 || params.num_actions <= 0) {
    throw std::invalid_argument("input_size and num_actions must be positive");
  }
  if (!(params.learning_rate > 0)) {
    throw std::invalid_argument("learning_rate must be positive");
  }
  return params;
}

torch::Tensor make_input(const EncodedState& state, int input_size,
                         const torch::Device& device) {
  if (static_cast<int>(state.size()) != input_size) {
    throw std::invalid_argument("Encoded state has " +
                                std::to_string(state.size()) +
                                " features, network expects " +
                                std::to_string(input_size));
  }
  return torch::tensor(state, torch::kFloat).view({1, input_size}).to(device);
}

void check_legal(const LegalActionSet& legal, int num_actions) {
  if (legal.empty()) {
    throw NoLegalActionsError("Evaluating a state without legal actions");
  }
  for (Action action : legal) {
    if (action < 0 || action >= num_actions) {
      throw std::invalid_argument("Action out of range: " +
                                  std::to_string(action));
    }
  }
}

template <class Sample>
torch::Tensor stack_states(const std::vector<Sample>& batch, int input_size) {
  auto states = torch::empty({static_cast<int64_t>(batch.size()), input_size});
  auto acc = states.accessor<float, 2>();
  for (size_t i = 0; i < batch.size(); ++i) {
    if (static_cast<int>(batch[i].state.size()) != input_size) {
      throw std::invalid_argument("Sample with wrong feature size");
    }
    for (int j = 0; j < input_size; ++j) {
      acc[i][j] = batch[i].state[j];
    }
  }
  return states;
}

template <class Sample>
torch::Tensor stack_weights(const std::vector<Sample>& batch) {
  auto weights = torch::empty({static_cast<int64_t>(batch.size())});
  auto acc = weights.accessor<float, 1>();
  for (size_t i = 0; i < batch.size(); ++i) {
    acc[i] = batch[i].weight;
  }
  return weights;
}

ParameterList copy_out(const std::vector<torch::Tensor>& parameters) {
  ParameterList result;
  for (const auto& p : parameters) {
    result.push_back(p.detach().to(torch::kCPU).clone());
  }
  return result;
}

void copy_in(const ParameterList& source,
             const std::vector<torch::Tensor>& destination) {
  if (source.size() != destination.size()) {
    throw std::invalid_argument(
        "Parameter count mismatch: got " + std::to_string(source.size()) +
        ", expected " + std::to_string(destination.size()));
  }
  torch::NoGradGuard no_grad;
  for (size_t i = 0; i < source.size(); ++i) {
    if (!source[i].sizes().equals(destination[i].sizes())) {
      throw std::invalid_argument("Parameter shape mismatch at index " +
                                  std::to_string(i));
    }
    destination[i].copy_(source[i]);
  }
}

double checked_loss(const torch::Tensor& loss, const char* name) {
  const double value = loss.item<double>();
  if (!std::isfinite(value)) {
    throw NumericInstabilityError(std::string("Non-finite ") + name +
                                  " loss");
  }
  return value;
}

std::string save_optimizer(const torch::optim::Optimizer& optimizer) {
  torch::serialize::OutputArchive archive;
  optimizer.save(archive);
  std::ostringstream stream;
  archive.save_to(stream);
  return stream.str();
}

void load_optimizer(const std::string& state,
                    torch::optim::Optimizer* optimizer) {
  if (state.empty()) {
    return;
  }
  try {
    std::istringstream stream(state);
    torch::serialize::InputArchive archive;
    archive.load_from(stream);
    optimizer->load(archive);
  } catch (const c10::Error& e) {
    throw std::invalid_argument(std::string("Bad optimizer state: ") +
                                e.what_without_backtrace());
  }
}

class ZeroAdvantageNet : public IAdvantageEstimator {
 public:
  std::vector<double> evaluate(const EncodedState& /*state*/,
                               const LegalActionSet& legal) override {
    return std::vector<double>(legal.size(), 0.0);
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
};

class UniformStrategyNet : public IStrategyEstimator {
 public:
  std::vector<double> evaluate(const EncodedState& /*state*/,
                               const LegalActionSet& legal) override {
    return std::vector<double>(legal.size(), 1.0 / legal.size());
  }
  double train_step(const std::vector<StrategySample>& /*batch*/) override {
    return 0.0;
  }
  ParameterList parameters() const override { return {}; }
  void load_parameters(const ParameterList& /*parameters*/) override {}
  std::string optimizer_state() const override { return {}; }
  void load_optimizer_state(const std::string& /*state*/) override {}
};

}  // namespace

MlpImpl::MlpImpl(int64_t input_size, const std::vector<int64_t>& hidden_sizes,
                 int64_t output_size) {
  int64_t last_size = input_size;
  for (int64_t size : hidden_sizes) {
    layers->push_back(torch::nn::Linear(last_size, size));
    layers->push_back(torch::nn::ReLU());
    last_size = size;
  }
  layers->push_back(torch::nn::Linear(last_size, output_size));
  register_module("layers", layers);
}

TorchAdvantageEstimator::TorchAdvantageEstimator(const NetParams& params)
    : params_(validated(params)),
      device_(params.device),
      online_(make_mlp(params, device_)),
      target_(make_mlp(params, device_)),
      optimizer_(online_->parameters(),
                 torch::optim::AdamOptions(params.learning_rate)) {
  // The target starts as an exact copy and is never trained directly.
  copy_in(copy_out(online_->parameters()), target_->parameters());
  for (auto& p : target_->parameters()) {
    p.set_requires_grad(false);
  }
}

std::vector<double> TorchAdvantageEstimator::evaluate(
    const EncodedState& state, const LegalActionSet& legal) {
  check_legal(legal, params_.num_actions);
  torch::NoGradGuard no_grad;
  auto output =
      target_->forward(make_input(state, params_.input_size, device_))
          .to(torch::kCPU);
  auto acc = output.accessor<float, 2>();
  std::vector<double> values;
  values.reserve(legal.size());
  for (Action action : legal) {
    const double value = acc[0][action];
    if (!std::isfinite(value)) {
      throw NumericInstabilityError("Non-finite advantage estimate");
    }
    values.push_back(value);
  }
  return values;
}

double TorchAdvantageEstimator::train_step(
    const std::vector<AdvantageSample>& batch) {
  if (batch.empty()) {
    throw std::invalid_argument("train_step on an empty batch");
  }
  const int64_t batch_size = batch.size();
  auto actions = torch::empty({batch_size}, torch::kLong);
  auto regrets = torch::empty({batch_size});
  {
    auto actions_acc = actions.accessor<int64_t, 1>();
    auto regrets_acc = regrets.accessor<float, 1>();
    for (int64_t i = 0; i < batch_size; ++i) {
      if (batch[i].action < 0 || batch[i].action >= params_.num_actions) {
        throw std::invalid_argument("Sample with action out of range");
      }
      actions_acc[i] = batch[i].action;
      regrets_acc[i] = batch[i].regret;
    }
  }
  const auto states = stack_states(batch, params_.input_size).to(device_);
  const auto weights = stack_weights(batch).to(device_);
  actions = actions.to(device_);
  regrets = regrets.to(device_);

  const auto predicted =
      online_->forward(states).gather(1, actions.unsqueeze(1)).squeeze(1);
  const auto loss =
      (weights * (predicted - regrets).pow(2)).sum() / weights.sum();
  const double loss_value = checked_loss(loss, "advantage");

  optimizer_.zero_grad();
  loss.backward();
  optimizer_.step();
  return loss_value;
}

void TorchAdvantageEstimator::sync_target(double tau) {
  if (!(tau > 0 && tau <= 1)) {
    throw std::invalid_argument("tau must be in (0, 1]");
  }
  torch::NoGradGuard no_grad;
  const auto online = online_->parameters();
  auto target = target_->parameters();
  for (size_t i = 0; i < target.size(); ++i) {
    target[i].add_(online[i] - target[i], tau);
  }
}

ParameterList TorchAdvantageEstimator::online_parameters() const {
  return copy_out(online_->parameters());
}

ParameterList TorchAdvantageEstimator::target_parameters() const {
  return copy_out(target_->parameters());
}

void TorchAdvantageEstimator::load_parameters(const ParameterList& online,
                                              const ParameterList& target) {
  copy_in(online, online_->parameters());
  copy_in(target, target_->parameters());
}

std::string TorchAdvantageEstimator::optimizer_state() const {
  return save_optimizer(optimizer_);
}

void TorchAdvantageEstimator::load_optimizer_state(const std::string& state) {
  load_optimizer(state, &optimizer_);
}

TorchStrategyEstimator::TorchStrategyEstimator(const NetParams& params)
    : params_(validated(params)),
      device_(params.device),
      net_(make_mlp(params, device_)),
      optimizer_(net_->parameters(),
                 torch::optim::AdamOptions(params.learning_rate)) {}

std::vector<double> TorchStrategyEstimator::evaluate(
    const EncodedState& state, const LegalActionSet& legal) {
  check_legal(legal, params_.num_actions);
  torch::NoGradGuard no_grad;
  auto probs =
      torch::softmax(
          net_->forward(make_input(state, params_.input_size, device_)), 1)
          .to(torch::kCPU);
  auto acc = probs.accessor<float, 2>();
  std::vector<double> strategy;
  strategy.reserve(legal.size());
  double total = 0;
  for (Action action : legal) {
    const double p = acc[0][action];
    if (!std::isfinite(p)) {
      throw NumericInstabilityError("Non-finite strategy estimate");
    }
    strategy.push_back(p);
    total += p;
  }
  // Renormalize over the legal actions; uniform if all mass is illegal.
  for (double& p : strategy) {
    p = total > 0 ? p / total : 1.0 / legal.size();
  }
  return strategy;
}

double TorchStrategyEstimator::train_step(
    const std::vector<StrategySample>& batch) {
  if (batch.empty()) {
    throw std::invalid_argument("train_step on an empty batch");
  }
  const int64_t batch_size = batch.size();
  auto targets = torch::empty({batch_size, params_.num_actions});
  {
    auto acc = targets.accessor<float, 2>();
    for (int64_t i = 0; i < batch_size; ++i) {
      if (static_cast<int>(batch[i].strategy.size()) != params_.num_actions) {
        throw std::invalid_argument("Sample with wrong strategy size");
      }
      for (int a = 0; a < params_.num_actions; ++a) {
        acc[i][a] = batch[i].strategy[a];
      }
    }
  }
  const auto states = stack_states(batch, params_.input_size).to(device_);
  const auto weights = stack_weights(batch).to(device_);
  targets = targets.to(device_);

  const auto log_probs = torch::log_softmax(net_->forward(states), 1);
  // Zero-probability targets contribute nothing to the divergence.
  const auto kl =
      (targets * (targets.clamp_min(1e-12).log() - log_probs)).sum(1);
  const auto loss = (weights * kl).sum() / weights.sum();
  const double loss_value = checked_loss(loss, "strategy");

  optimizer_.zero_grad();
  loss.backward();
  optimizer_.step();
  return loss_value;
}

ParameterList TorchStrategyEstimator::parameters() const {
  return copy_out(net_->parameters());
}

void TorchStrategyEstimator::load_parameters(const ParameterList& parameters) {
  copy_in(parameters, net_->parameters());
}

std::string TorchStrategyEstimator::optimizer_state() const {
  return save_optimizer(optimizer_);
}

void TorchStrategyEstimator::load_optimizer_state(const std::string& state) {
  load_optimizer(state, &optimizer_);
}

std::shared_ptr<IAdvantageEstimator> create_advantage_net(
    const NetParams& params) {
  return std::make_shared<TorchAdvantageEstimator>(params);
}

std::shared_ptr<IStrategyEstimator> create_strategy_net(
    const NetParams& params) {
  return std::make_shared<TorchStrategyEstimator>(params);
}

std::shared_ptr<IAdvantageEstimator> create_zero_advantage_net() {
  return std::make_shared<ZeroAdvantageNet>();
}

std::shared_ptr<IStrategyEstimator> create_uniform_strategy_net() {
  return std::make_shared<UniformStrategyNet>();
}

}  // namespace deep_cfr
