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

#include <memory>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "net_interface.h"

namespace deep_cfr {

struct NetParams {
  int input_size = 4;
  int num_actions = 5;
  std::vector<int64_t> hidden_sizes = {128, 64};
  double learning_rate = 1e-4;
  std::string device = "cpu";
};

// Fully connected ReLU network.
struct MlpImpl : torch::nn::Module {
  MlpImpl(int64_t input_size, const std::vector<int64_t>& hidden_sizes,
          int64_t output_size);

  torch::Tensor forward(torch::Tensor x) { return layers->forward(x); }

  torch::nn::Sequential layers;
};
TORCH_MODULE(Mlp);

class TorchAdvantageEstimator : public IAdvantageEstimator {
 public:
  explicit TorchAdvantageEstimator(const NetParams& params);

  std::vector<double> evaluate(const EncodedState& state,
                               const LegalActionSet& legal) override;
  double train_step(const std::vector<AdvantageSample>& batch) override;
  void sync_target(double tau) override;

  ParameterList online_parameters() const override;
  ParameterList target_parameters() const override;
  void load_parameters(const ParameterList& online,
                       const ParameterList& target) override;
  std::string optimizer_state() const override;
  void load_optimizer_state(const std::string& state) override;

 private:
  const NetParams params_;
  const torch::Device device_;
  Mlp online_;
  Mlp target_;
  torch::optim::Adam optimizer_;
};

class TorchStrategyEstimator : public IStrategyEstimator {
 public:
  explicit TorchStrategyEstimator(const NetParams& params);

  std::vector<double> evaluate(const EncodedState& state,
                               const LegalActionSet& legal) override;
  double train_step(const std::vector<StrategySample>& batch) override;

  ParameterList parameters() const override;
  void load_parameters(const ParameterList& parameters) override;
  std::string optimizer_state() const override;
  void load_optimizer_state(const std::string& state) override;

 private:
  const NetParams params_;
  const torch::Device device_;
  Mlp net_;
  torch::optim::Adam optimizer_;
};

std::shared_ptr<IAdvantageEstimator> create_advantage_net(
    const NetParams& params);
std::shared_ptr<IStrategyEstimator> create_strategy_net(
    const NetParams& params);

// Estimators without parameters for tests: zero advantages and the uniform
// strategy.
std::shared_ptr<IAdvantageEstimator> create_zero_advantage_net();
std::shared_ptr<IStrategyEstimator> create_uniform_strategy_net();

}  // namespace deep_cfr
