/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-socket.hpp
 * @brief IPv4 TCP listener and stream socket wrappers.
 *
 * Prelay_Tcp_Listener owns a bound, listening socket. accept() blocks; a
 * shutdown() issued from another thread makes the blocked accept() return
 * so the accept loop can exit without polling.
 *
 * Prelay_Tcp_Stream owns one connected socket and implements
 * Prelay_Io<std::string>, where each std::string is a chunk of raw bytes
 * (never interpreted as text). It is used on both ends: the relay reads
 * jobs from accepted streams, the send tool and the tests connect and
 * write. shutdown() may be called from another thread to unblock a
 * reader; the descriptor itself is closed only by the destructor.
 *
 * Constructors throw std::system_error carrying the errno of the failing
 * call. Neither class is copyable or movable.
 */

#ifndef PRELAY_SOCKET_HPP_
#define PRELAY_SOCKET_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "prelay-io.hpp"

namespace prelay {

class Prelay_Tcp_Stream : public Prelay_Io<std::string> {
public:
  /**
   * @brief Adopt a connected descriptor returned by accept().
   *
   * @param fd             Connected socket, owned from now on.
   * @param remote_address Peer as "a.b.c.d:port", for reporting.
   */
  Prelay_Tcp_Stream(int fd, std::string remote_address);

  /**
   * @brief Connect to ip4:port_no.
   *
   * @param timeout Connect/send timeout, zero for the system default.
   * @throws std::system_error if the socket can not be created or the
   *         connection fails.
   */
  Prelay_Tcp_Stream(std::string_view ip4, uint16_t port_no,
                    std::chrono::milliseconds timeout =
                        std::chrono::milliseconds{0});

  virtual ~Prelay_Tcp_Stream() noexcept;

  Prelay_Tcp_Stream(const Prelay_Tcp_Stream &obj) = delete;
  const Prelay_Tcp_Stream &operator=(const Prelay_Tcp_Stream &obj) = delete;
  Prelay_Tcp_Stream(Prelay_Tcp_Stream &&obj) = delete;
  Prelay_Tcp_Stream &operator=(Prelay_Tcp_Stream &&obj) = delete;

  /**
   * @brief Read the next chunk; std::nullopt on end of stream or error.
   */
  auto read() -> std::optional<std::string> override;

  /**
   * @brief Read the next chunk, waiting at most idle_timeout for data
   *        (zero waits forever).
   *
   * @return the chunk, an empty string at end of stream, or the error
   *         (std::errc::timed_out when the idle timeout elapsed).
   */
  auto readSome(std::chrono::milliseconds idle_timeout)
      -> std::expected<std::string, std::error_code>;

  /**
   * @brief Send all bytes of item.
   *
   * @throws std::system_error on failure.
   */
  void write(std::string &item) override;
  void write(std::string &&item) override;

  /**
   * @brief Half-close: signal end of job to the peer, reads still work.
   */
  void shutdownWrite();

  /**
   * @brief Shut down both directions; wakes a thread blocked in read().
   */
  void shutdown();

  auto remoteAddress() const -> const std::string &;

private:
  int m_fd{-1};
  std::string m_remote_address{};
};

class Prelay_Tcp_Listener {
public:
  /**
   * @brief Bind ip4:port_no (empty ip4 or "0.0.0.0" for any) and listen.
   *
   * SO_REUSEADDR is set so a restart can rebind while old connections sit
   * in TIME_WAIT. Port 0 binds an ephemeral port, see port().
   *
   * @throws std::system_error if socket(), bind() or listen() fails.
   */
  Prelay_Tcp_Listener(std::string_view ip4, uint16_t port_no,
                      int backlog = 16);
  virtual ~Prelay_Tcp_Listener() noexcept;

  Prelay_Tcp_Listener(const Prelay_Tcp_Listener &obj) = delete;
  const Prelay_Tcp_Listener &operator=(const Prelay_Tcp_Listener &obj) = delete;
  Prelay_Tcp_Listener(Prelay_Tcp_Listener &&obj) = delete;
  Prelay_Tcp_Listener &operator=(Prelay_Tcp_Listener &&obj) = delete;

  /**
   * @brief Block until a client connects.
   *
   * @return the connected stream, or the accept() error. After shutdown()
   *         every call fails immediately.
   */
  auto accept()
      -> std::expected<std::unique_ptr<Prelay_Tcp_Stream>, std::error_code>;

  /**
   * @brief Stop listening and wake a thread blocked in accept().
   */
  void shutdown();

  auto isShutdown() const -> bool;

  /**
   * @brief The bound port (resolves port 0 to the ephemeral port).
   */
  auto port() const -> uint16_t;

private:
  int m_fd{-1};
  uint16_t m_port{};
  std::atomic<bool> m_shutdown{};
};

} // namespace prelay

#endif // PRELAY_SOCKET_HPP_
