/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-test-buffer.cpp
 * @brief The unit test for prelay-buffer module.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "prelay-buffer.hpp"
#include "prelay-proc.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  using namespace std::string_literals;

  auto buf = std::make_unique<prelay::Prelay_Buffer<std::string>>();
  std::string popped{};
  auto proc = std::make_unique<prelay::Prelay_Proc>("proc", [&buf, &popped]() {
    auto s = buf->pop();
    if (s) {
      popped = *s;
    }
  });

  proc->exec();
  prelay::Prelay_Proc::yield();

  EXPECT_TRUE(buf->push("hello"s));
  proc->wait();
  EXPECT_TRUE("hello" == popped);

  // FIFO order
  buf->push("a"s);
  buf->push("b"s);
  buf->push("c"s);
  EXPECT_TRUE(3 == buf->size());
  EXPECT_TRUE("a" == buf->pop());
  EXPECT_TRUE("b" == buf->popNoWait());
  EXPECT_TRUE("c" == buf->pop());
  EXPECT_TRUE(!buf->popNoWait());

  // timed pop gives up
  const auto before = std::chrono::steady_clock::now();
  auto nothing = buf->popFor(std::chrono::milliseconds{200});
  const auto waited = std::chrono::steady_clock::now() - before;
  EXPECT_TRUE(!nothing);
  EXPECT_TRUE(waited >= std::chrono::milliseconds{150});

  // close wakes a blocked pop, queued items stay readable
  bool woke_empty{};
  prelay::Prelay_Proc blocked{"blocked", [&buf, &woke_empty]() {
                                auto s = buf->pop();
                                woke_empty = !s.has_value();
                              }};

  blocked.exec();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  buf->close();
  blocked.wait();
  EXPECT_TRUE(woke_empty);
  EXPECT_TRUE(buf->isClosed());
  EXPECT_TRUE(!buf->push("late"s));

  prelay::Prelay_Buffer<int> int_buf{};
  int_buf.push(1);
  int_buf.push(2);
  int_buf.close();
  EXPECT_TRUE(1 == int_buf.pop());
  EXPECT_TRUE(2 == int_buf.pop());
  EXPECT_TRUE(!int_buf.pop());

  // waitForEmpty returns once a consumer drained the buffer
  prelay::Prelay_Buffer<int> drain_buf{};
  for (int n = 0; n < 10; n++) {
    drain_buf.push(n);
  }

  prelay::Prelay_Proc consumer{"consumer", [&drain_buf]() {
                                 for (int n = 0; n < 10; n++) {
                                   drain_buf.pop();
                                   prelay::Prelay_Proc::yield();
                                 }
                               }};

  consumer.exec();
  EXPECT_TRUE(10 == drain_buf.waitForEmpty());
  consumer.wait();

  return RUN_ALL_TESTS();
}
