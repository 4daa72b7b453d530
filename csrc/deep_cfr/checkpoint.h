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

#include <stdint.h>

#include <string>

#include "net_interface.h"

namespace deep_cfr {

// Everything needed to resume training.
struct Checkpoint {
  int64_t iteration = 0;
  double epsilon = 0.0;
  ParameterList advantage_params;
  ParameterList target_advantage_params;
  ParameterList strategy_params;
  // Serialized torch::optim state of each estimator.
  std::string advantage_optimizer;
  std::string strategy_optimizer;
};

// Persistence collaborator. Both methods throw CheckpointError on failure.
class ICheckpointer {
 public:
  virtual ~ICheckpointer() = default;

  virtual void save(const Checkpoint& checkpoint) = 0;
  virtual Checkpoint load(int64_t iteration) = 0;
};

// One torch archive per checkpoint in `dir`, named checkpoint_<iteration>.pt.
class FileCheckpointer : public ICheckpointer {
 public:
  explicit FileCheckpointer(std::string dir) : dir_(std::move(dir)) {}

  void save(const Checkpoint& checkpoint) override;
  Checkpoint load(int64_t iteration) override;

  std::string path_for(int64_t iteration) const;

 private:
  const std::string dir_;
};

}  // namespace deep_cfr
