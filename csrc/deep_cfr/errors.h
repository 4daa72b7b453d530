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

#include <stdexcept>
#include <string>

namespace deep_cfr {

// Base class for all errors raised by the training core.
class DeepCfrError : public std::runtime_error {
 public:
  explicit DeepCfrError(const std::string& what) : std::runtime_error(what) {}
};

// The acting player has no legal action. Fatal for the current iteration
// only.
class NoLegalActionsError : public DeepCfrError {
 public:
  explicit NoLegalActionsError(const std::string& what) : DeepCfrError(what) {}
};

// Raised by ReservoirMemory::sample_batch when the memory is empty.
class InsufficientSamplesError : public DeepCfrError {
 public:
  explicit InsufficientSamplesError(const std::string& what)
      : DeepCfrError(what) {}
};

// The environment broke its contract. This is a collaborator bug and is
// never recovered from.
class EnvironmentStateError : public DeepCfrError {
 public:
  explicit EnvironmentStateError(const std::string& what)
      : DeepCfrError(what) {}
};

// Non-finite loss or estimate.
class NumericInstabilityError : public DeepCfrError {
 public:
  explicit NumericInstabilityError(const std::string& what)
      : DeepCfrError(what) {}
};

class CheckpointError : public DeepCfrError {
 public:
  explicit CheckpointError(const std::string& what) : DeepCfrError(what) {}
};

}  // namespace deep_cfr
