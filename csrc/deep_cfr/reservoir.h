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

#include <algorithm>
#include <mutex>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

#include "errors.h"

namespace deep_cfr {

// Fixed-capacity store keeping a uniform random subsample of an unbounded
// stream (reservoir sampling, algorithm R). Once full, the n-th inserted item
// replaces a uniformly chosen slot with probability capacity / n, so at any
// time every item seen so far is retained with probability capacity / n.
//
// All methods are thread safe.
template <class T>
class ReservoirMemory {
 public:
  ReservoirMemory(int64_t capacity, int seed)
      : capacity_(capacity), num_add_(0), gen_(seed) {
    if (capacity_ <= 0) {
      throw std::invalid_argument("ReservoirMemory capacity must be positive");
    }
    storage_.reserve(std::min<int64_t>(capacity_, kMaxReserve));
  }

  ReservoirMemory(const ReservoirMemory&) = delete;
  ReservoirMemory& operator=(const ReservoirMemory&) = delete;

  void insert(T item) {
    std::lock_guard<std::mutex> lk(mutex_);
    ++num_add_;
    if (static_cast<int64_t>(storage_.size()) < capacity_) {
      storage_.push_back(std::move(item));
      return;
    }
    std::uniform_int_distribution<int64_t> dist(0, num_add_ - 1);
    const int64_t slot = dist(gen_);
    if (slot < capacity_) {
      storage_[slot] = std::move(item);
    }
  }

  // Draws min(batch_size, size()) distinct items in no particular order.
  std::vector<T> sample_batch(int64_t batch_size) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (storage_.empty()) {
      throw InsufficientSamplesError("Cannot sample from an empty memory");
    }
    const int64_t n = storage_.size();
    const int64_t k = std::min(std::max<int64_t>(batch_size, 0), n);
    // Floyd's algorithm: k distinct indices in O(k).
    std::unordered_set<int64_t> chosen;
    std::vector<T> batch;
    batch.reserve(k);
    for (int64_t j = n - k; j < n; ++j) {
      const int64_t t = std::uniform_int_distribution<int64_t>(0, j)(gen_);
      const int64_t index = chosen.insert(t).second ? t : j;
      if (index == j) chosen.insert(j);
      batch.push_back(storage_[index]);
    }
    return batch;
  }

  int64_t size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return storage_.size();
  }

  int64_t capacity() const { return capacity_; }

  // Total number of items ever inserted.
  int64_t num_add() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return num_add_;
  }

  std::vector<T> items() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return storage_;
  }

 private:
  static constexpr int64_t kMaxReserve = 1 << 16;

  const int64_t capacity_;
  std::vector<T> storage_;
  int64_t num_add_;
  std::mt19937 gen_;
  mutable std::mutex mutex_;
};

}  // namespace deep_cfr
