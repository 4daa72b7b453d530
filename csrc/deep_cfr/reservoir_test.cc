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

#include <set>

#include <gtest/gtest.h>

#include "errors.h"
#include "reservoir.h"

using namespace deep_cfr;

TEST(ReservoirMemoryTest, NeverExceedsCapacity) {
  ReservoirMemory<int> memory(10, /*seed=*/0);
  for (int i = 0; i < 1000; ++i) {
    memory.insert(i);
    ASSERT_LE(memory.size(), 10);
  }
  ASSERT_EQ(memory.size(), 10);
  ASSERT_EQ(memory.capacity(), 10);
  ASSERT_EQ(memory.num_add(), 1000);
}

TEST(ReservoirMemoryTest, KeepsEverythingUntilFull) {
  ReservoirMemory<int> memory(5, /*seed=*/1);
  for (int i = 0; i < 4; ++i) memory.insert(i);
  ASSERT_EQ(memory.items(), std::vector<int>({0, 1, 2, 3}));
}

TEST(ReservoirMemoryTest, RetentionIsUniform) {
  const int kCapacity = 3;
  const int kStream = 10;
  const int kTrials = 20000;
  std::vector<int> retained(kStream, 0);
  for (int trial = 0; trial < kTrials; ++trial) {
    ReservoirMemory<int> memory(kCapacity, trial);
    for (int i = 0; i < kStream; ++i) memory.insert(i);
    for (int item : memory.items()) ++retained[item];
  }
  const double expected = static_cast<double>(kCapacity) / kStream;
  for (int i = 0; i < kStream; ++i) {
    EXPECT_NEAR(static_cast<double>(retained[i]) / kTrials, expected, 0.02)
        << "item " << i;
  }
}

// Requiring item 3 to always survive here would contradict the uniform
// C/N retention rule, under which every item survives with probability 2/3.
// Uniform retention is the rule kept, so any two distinct items may remain.
TEST(ReservoirMemoryTest, CapacityTwoKeepsTwoOfThree) {
  const int kTrials = 6000;
  std::vector<int> retained(4, 0);
  for (int trial = 0; trial < kTrials; ++trial) {
    ReservoirMemory<int> memory(2, trial);
    for (int tag : {1, 2, 3}) memory.insert(tag);
    const auto items = memory.items();
    ASSERT_EQ(items.size(), 2u);
    ASSERT_NE(items[0], items[1]);
    for (int item : items) {
      ASSERT_GE(item, 1);
      ASSERT_LE(item, 3);
      ++retained[item];
    }
  }
  for (int tag : {1, 2, 3}) {
    EXPECT_NEAR(static_cast<double>(retained[tag]) / kTrials, 2.0 / 3, 0.03);
  }
}

TEST(ReservoirMemoryTest, SampleBatchWithoutReplacement) {
  ReservoirMemory<int> memory(100, /*seed=*/2);
  for (int i = 0; i < 100; ++i) memory.insert(i);
  {
    const auto batch = memory.sample_batch(50);
    ASSERT_EQ(batch.size(), 50u);
    ASSERT_EQ(std::set<int>(batch.begin(), batch.end()).size(), 50u);
  }
  {
    // Larger than the memory: everything, once.
    const auto batch = memory.sample_batch(500);
    ASSERT_EQ(std::set<int>(batch.begin(), batch.end()).size(), 100u);
    ASSERT_EQ(batch.size(), 100u);
  }
  ASSERT_EQ(memory.size(), 100);
}

TEST(ReservoirMemoryTest, SampleFromEmptyThrows) {
  ReservoirMemory<int> memory(4, /*seed=*/3);
  ASSERT_THROW(memory.sample_batch(1), InsufficientSamplesError);
  memory.insert(7);
  ASSERT_EQ(memory.sample_batch(3), std::vector<int>({7}));
}

TEST(ReservoirMemoryTest, RejectsBadCapacity) {
  ASSERT_THROW(ReservoirMemory<int>(0, 0), std::invalid_argument);
}
