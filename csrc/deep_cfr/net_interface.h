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

#include <torch/torch.h>

#include "environment.h"
#include "samples.h"

namespace deep_cfr {

// Opaque parameter blob of one network.
using ParameterList = std::vector<torch::Tensor>;

// Maps an encoded state to per-action counterfactual advantages. Keeps an
// online copy, trained by gradient descent, and a target copy that only
// tracks the online one through sync_target.
class IAdvantageEstimator {
 public:
  virtual ~IAdvantageEstimator() = default;

  // Advantages of the actions in `legal`, computed with the target
  // parameters. Throws NumericInstabilityError on non-finite output.
  virtual std::vector<double> evaluate(const EncodedState& state,
                                       const LegalActionSet& legal) = 0;

  // One optimizer step of iteration-weighted MSE of the online network
  // towards the stored regrets. Returns the loss. Throws
  // NumericInstabilityError, without touching the parameters, if the loss
  // is not finite.
  virtual double train_step(const std::vector<AdvantageSample>& batch) = 0;

  // target <- target + tau * (online - target).
  virtual void sync_target(double tau) = 0;

  virtual ParameterList online_parameters() const = 0;
  virtual ParameterList target_parameters() const = 0;
  virtual void load_parameters(const ParameterList& online,
                               const ParameterList& target) = 0;

  // Serialized optimizer state, empty if the estimator has no optimizer.
  virtual std::string optimizer_state() const = 0;
  // Throws std::invalid_argument if `state` cannot be loaded. Empty is a
  // no-op.
  virtual void load_optimizer_state(const std::string& state) = 0;
};

// Maps an encoded state to an approximation of the average strategy.
class IStrategyEstimator {
 public:
  virtual ~IStrategyEstimator() = default;

  // Probability distribution over `legal`.
  virtual std::vector<double> evaluate(const EncodedState& state,
                                       const LegalActionSet& legal) = 0;

  // One optimizer step of iteration-weighted KL(target || predicted).
  virtual double train_step(const std::vector<StrategySample>& batch) = 0;

  virtual ParameterList parameters() const = 0;
  virtual void load_parameters(const ParameterList& parameters) = 0;

  virtual std::string optimizer_state() const = 0;
  virtual void load_optimizer_state(const std::string& state) = 0;
};

}  // namespace deep_cfr
