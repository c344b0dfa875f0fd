/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-test-async.cpp
 * @brief The unit test for prelay-async module.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "prelay-async.hpp"
#include "prelay-proc.hpp"

class Counter : public prelay::Prelay_Async {
public:
  Counter() : prelay::Prelay_Async{"counter"} {}

  void increment() {
    PRELAY_ASYNC_CALL_WITH_REF_CAPTURE({ this->m_count++; });
  }

  void append(int value) {
    PRELAY_ASYNC_CALL_WITH_CAPTURE({ this->m_values.push_back(value); }, this,
                                   value);
  }

  long long m_count{};
  std::vector<int> m_values{};
};

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  Counter cnt{};
  prelay::Prelay_Proc proc1{"proc1", [&cnt]() {
                              for (int n = 0; n < 100; n++) {
                                cnt.increment();
                                prelay::Prelay_Proc::yield();
                              }
                            }};

  prelay::Prelay_Proc proc2{"proc2", [&cnt]() {
                              for (int n = 0; n < 100; n++) {
                                cnt.increment();
                                prelay::Prelay_Proc::yield();
                              }
                            }};

  proc1.exec();
  proc2.exec();
  proc1.wait();
  proc2.wait();

  cnt.waitForEmpty();
  EXPECT_TRUE(200 == cnt.m_count);

  // tasks run in submission order
  for (int n = 0; n < 50; n++) {
    cnt.append(n);
  }

  cnt.waitForEmpty();
  EXPECT_TRUE(50 == cnt.m_values.size());

  bool ordered{true};
  for (int n = 0; n < 50; n++) {
    ordered = ordered && n == cnt.m_values[n];
  }

  EXPECT_TRUE(ordered);

  // an exception reaches the waiter, the executor keeps going
  auto waitHandler = cnt.addExecTaskWithWait(
      []() { throw std::runtime_error("task failed"); });

  bool threw{};
  try {
    waitHandler->wait();
  } catch (const std::runtime_error &e) {
    threw = true;
  }

  EXPECT_TRUE(threw);

  cnt.increment();
  cnt.waitForEmpty();
  EXPECT_TRUE(201 == cnt.m_count);

  // fire and forget exceptions are kept
  cnt.addExecTask([]() { throw std::runtime_error("background failure"); });
  cnt.waitForEmpty();
  EXPECT_TRUE(nullptr != cnt.getLastException());

  // shutdown runs what is queued, later tasks are dropped
  cnt.increment();
  cnt.shutdown();
  EXPECT_TRUE(202 == cnt.m_count);

  cnt.increment();
  cnt.waitForEmpty();
  EXPECT_TRUE(202 == cnt.m_count);

  return RUN_ALL_TESTS();
}
