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

#include "checkpoint.h"

#include <string.h>

#include <filesystem>

#include <spdlog/spdlog.h>

#include "errors.h"

namespace deep_cfr {

namespace {

constexpr int64_t kMaxListSize = 1 << 16;

// Opaque byte strings are stored as uint8 tensors.
torch::Tensor bytes_to_tensor(const std::string& bytes) {
  auto tensor =
      torch::empty({static_cast<int64_t>(bytes.size())}, torch::kUInt8);
  if (!bytes.empty()) {
    memcpy(tensor.data_ptr<uint8_t>(), bytes.data(), bytes.size());
  }
  return tensor;
}

std::string tensor_to_bytes(const torch::Tensor& tensor) {
  if (tensor.scalar_type() != torch::kUInt8 || tensor.dim() != 1) {
    throw CheckpointError("Optimizer state is not a byte tensor");
  }
  if (tensor.numel() == 0) {
    return {};
  }
  const auto bytes = tensor.contiguous();
  return std::string(reinterpret_cast<const char*>(bytes.data_ptr<uint8_t>()),
                     bytes.numel());
}

void write_list(torch::serialize::OutputArchive* archive,
                const std::string& name, const ParameterList& params) {
  archive->write(name + ".size",
                 torch::tensor(static_cast<int64_t>(params.size())));
  for (size_t i = 0; i < params.size(); ++i) {
    archive->write(name + "." + std::to_string(i), params[i].detach().cpu());
  }
}

ParameterList read_list(torch::serialize::InputArchive* archive,
                        const std::string& name) {
  torch::Tensor size;
  archive->read(name + ".size", size);
  const int64_t n = size.item<int64_t>();
  if (n < 0 || n > kMaxListSize) {
    throw CheckpointError("Bad size " + std::to_string(n) + " of list " +
                          name);
  }
  ParameterList params(n);
  for (size_t i = 0; i < params.size(); ++i) {
    archive->read(name + "." + std::to_string(i), params[i]);
  }
  return params;
}

}  // namespace

std::string FileCheckpointer::path_for(int64_t iteration) const {
  return (std::filesystem::path(dir_) /
          ("checkpoint_" + std::to_string(iteration) + ".pt"))
      .string();
}

void FileCheckpointer::save(const Checkpoint& checkpoint) {
  const std::string path = path_for(checkpoint.iteration);
  try {
    std::filesystem::create_directories(dir_);
    torch::serialize::OutputArchive archive;
    archive.write("iteration", torch::tensor(checkpoint.iteration));
    archive.write("epsilon",
                  torch::tensor(checkpoint.epsilon, torch::kFloat64));
    write_list(&archive, "advantage", checkpoint.advantage_params);
    write_list(&archive, "target_advantage",
               checkpoint.target_advantage_params);
    write_list(&archive, "strategy", checkpoint.strategy_params);
    archive.write("advantage_optimizer",
                  bytes_to_tensor(checkpoint.advantage_optimizer));
    archive.write("strategy_optimizer",
                  bytes_to_tensor(checkpoint.strategy_optimizer));
    archive.save_to(path);
  } catch (const std::filesystem::filesystem_error& e) {
    throw CheckpointError("Cannot create " + dir_ + ": " + e.what());
  } catch (const c10::Error& e) {
    throw CheckpointError("Cannot write " + path + ": " +
                          e.what_without_backtrace());
  }
  spdlog::info("Saved checkpoint {}", path);
}

Checkpoint FileCheckpointer::load(int64_t iteration) {
  const std::string path = path_for(iteration);
  if (!std::filesystem::exists(path)) {
    throw CheckpointError("No checkpoint at " + path);
  }
  Checkpoint checkpoint;
  try {
    torch::serialize::InputArchive archive;
    archive.load_from(path);
    torch::Tensor value;
    archive.read("iteration", value);
    checkpoint.iteration = value.item<int64_t>();
    archive.read("epsilon", value);
    checkpoint.epsilon = value.item<double>();
    checkpoint.advantage_params = read_list(&archive, "advantage");
    checkpoint.target_advantage_params =
        read_list(&archive, "target_advantage");
    checkpoint.strategy_params = read_list(&archive, "strategy");
    archive.read("advantage_optimizer", value);
    checkpoint.advantage_optimizer = tensor_to_bytes(value);
    archive.read("strategy_optimizer", value);
    checkpoint.strategy_optimizer = tensor_to_bytes(value);
  } catch (const c10::Error& e) {
    throw CheckpointError("Cannot read " + path + ": " +
                          e.what_without_backtrace());
  }
  if (checkpoint.iteration != iteration) {
    throw CheckpointError(path + " holds iteration " +
                          std::to_string(checkpoint.iteration));
  }
  return checkpoint;
}

}  // namespace deep_cfr
