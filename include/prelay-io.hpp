/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-io.hpp
 * @brief Transport-agnostic read/write interface.
 *
 * Prelay_Io<T> is implemented by the TCP stream socket (T is a chunk of
 * raw bytes held in a std::string) and by event subscriptions (T is an
 * EventPb). read() blocks for the next item and returns std::nullopt at
 * end of stream: peer close for a socket, close() for a subscription.
 * Callers treat std::nullopt as final.
 */

#ifndef PRELAY_IO_HPP_
#define PRELAY_IO_HPP_

#include <optional>

namespace prelay {

template <typename T> class Prelay_Io {
public:
  virtual ~Prelay_Io() noexcept = default;

  virtual auto read() -> std::optional<T> = 0;

  virtual void write(T &item) = 0;

  virtual void write(T &&item) = 0;
};

} // namespace prelay

#endif // PRELAY_IO_HPP_
