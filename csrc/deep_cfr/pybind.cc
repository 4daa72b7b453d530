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

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <torch/extension.h>

#include "errors.h"
#include "logging.h"
#include "regret_matching.h"
#include "training_loop.h"

namespace py = pybind11;
using namespace deep_cfr;

namespace {

IterationStats train(const TrainingConfig& cfg) {
  auto loop = build_training_loop(cfg);
  IterationStats stats;
  while (loop->iteration() < cfg.iterations) {
    {
      py::gil_scoped_release release;
      stats = loop->tick();
    }
    // Check for Ctrl-C.
    if (PyErr_CheckSignals() != 0) throw py::error_already_set();
  }
  return stats;
}

}  // namespace

PYBIND11_MODULE(deep_cfr, m) {
  auto base = py::register_exception<DeepCfrError>(m, "DeepCfrError");
  py::register_exception<NoLegalActionsError>(m, "NoLegalActionsError",
                                              base.ptr());
  py::register_exception<InsufficientSamplesError>(
      m, "InsufficientSamplesError", base.ptr());
  py::register_exception<EnvironmentStateError>(m, "EnvironmentStateError",
                                                base.ptr());
  py::register_exception<NumericInstabilityError>(
      m, "NumericInstabilityError", base.ptr());
  py::register_exception<CheckpointError>(m, "CheckpointError", base.ptr());

  py::class_<TrainingConfig>(m, "TrainingConfig")
      .def(py::init<>())
      .def_readwrite("iterations", &TrainingConfig::iterations)
      .def_readwrite("batch_size", &TrainingConfig::batch_size)
      .def_readwrite("save_interval", &TrainingConfig::save_interval)
      .def_readwrite("sync_period", &TrainingConfig::sync_period)
      .def_readwrite("update_period", &TrainingConfig::update_period)
      .def_readwrite("epsilon_start", &TrainingConfig::epsilon_start)
      .def_readwrite("epsilon_min", &TrainingConfig::epsilon_min)
      .def_readwrite("epsilon_decay", &TrainingConfig::epsilon_decay)
      .def_readwrite("memory_capacity", &TrainingConfig::memory_capacity)
      .def_readwrite("tau", &TrainingConfig::tau)
      .def_readwrite("learning_rate", &TrainingConfig::learning_rate)
      .def_readwrite("hidden_sizes", &TrainingConfig::hidden_sizes)
      .def_readwrite("training_player", &TrainingConfig::training_player)
      .def_readwrite("seed", &TrainingConfig::seed)
      .def_readwrite("checkpoint_dir", &TrainingConfig::checkpoint_dir)
      .def_readwrite("device", &TrainingConfig::device)
      .def("validate", &TrainingConfig::validate);

  py::class_<IterationStats>(m, "IterationStats")
      .def_readonly("iteration", &IterationStats::iteration)
      .def_readonly("epsilon", &IterationStats::epsilon)
      .def_readonly("reward", &IterationStats::reward)
      .def_readonly("num_decisions", &IterationStats::num_decisions)
      .def_readonly("skipped", &IterationStats::skipped)
      .def_readonly("advantage_updated", &IterationStats::advantage_updated)
      .def_readonly("strategy_updated", &IterationStats::strategy_updated)
      .def_readonly("advantage_loss", &IterationStats::advantage_loss)
      .def_readonly("strategy_loss", &IterationStats::strategy_loss)
      .def_readonly("synced", &IterationStats::synced)
      .def_readonly("checkpointed", &IterationStats::checkpointed);

  m.def("regret_matching", &regret_matching, py::arg("advantages"));
  m.def("set_log_level", &set_log_level, py::arg("name"));
  m.def("init_logging", &init_logging, py::arg("log_file"));
  m.def("train", &train, py::arg("config"));
}
