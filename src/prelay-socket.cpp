/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-socket.cpp
 * @brief Implementation of the TCP listener and stream wrappers.
 *
 * Streams are read in BUFSIZ sized chunks. When an idle timeout is
 * requested, poll() guards each recv() so a stalled client can not hold
 * its handler thread forever. Writes use MSG_NOSIGNAL so a vanished peer
 * yields EPIPE instead of killing the process with SIGPIPE.
 */

#include "prelay-socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace prelay {

namespace {

auto makeSockAddr(std::string_view ip4, uint16_t port_no) -> sockaddr_in {
  struct sockaddr_in addr{};

  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_no);

  if (ip4.empty() || ip4 == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    const std::string ip4_str{ip4};

    if (inet_pton(AF_INET, ip4_str.c_str(), &addr.sin_addr) != 1) {
      throw std::system_error(EINVAL, std::system_category(),
                              "Invalid IPv4 address: " + ip4_str);
    }
  }

  return addr;
}

auto formatSockAddr(const sockaddr_in &addr) -> std::string {
  std::array<char, INET_ADDRSTRLEN> buf{};

  if (nullptr == inet_ntop(AF_INET, &addr.sin_addr, buf.data(), buf.size())) {
    return "unknown";
  }

  return std::string{buf.data()} + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace

// class Prelay_Tcp_Stream
Prelay_Tcp_Stream::Prelay_Tcp_Stream(int fd, std::string remote_address)
    : m_fd{fd}, m_remote_address{std::move(remote_address)} {}

Prelay_Tcp_Stream::Prelay_Tcp_Stream(std::string_view ip4, uint16_t port_no,
                                     std::chrono::milliseconds timeout) {
  const struct sockaddr_in addr = makeSockAddr(ip4, port_no);

  m_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (m_fd < 0) {
    throw std::system_error(errno, std::system_category(),
                            "Error creating socket");
  }

  if (timeout.count() > 0) {
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    // SO_SNDTIMEO also bounds connect() on Linux.
    setsockopt(m_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }

  if (connect(m_fd,
              reinterpret_cast<const struct sockaddr *>(
                  &addr), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
              sizeof(addr)) < 0) {
    const int err = errno;

    close(m_fd);
    m_fd = -1;

    throw std::system_error(err, std::system_category(),
                            "Error in connect(" + formatSockAddr(addr) + ")");
  }

  m_remote_address = formatSockAddr(addr);
}

Prelay_Tcp_Stream::~Prelay_Tcp_Stream() noexcept {
  if (-1 != m_fd) {
    close(m_fd);
  }
}

auto Prelay_Tcp_Stream::read() -> std::optional<std::string> {
  auto chunk = readSome(std::chrono::milliseconds{0});
  if (!chunk || chunk->empty()) {
    return {};
  }

  return std::move(*chunk);
}

auto Prelay_Tcp_Stream::readSome(std::chrono::milliseconds idle_timeout)
    -> std::expected<std::string, std::error_code> {
  std::array<char, BUFSIZ> buf{};

  while (true) {
    if (idle_timeout.count() > 0) {
      struct pollfd pfd{};
      pfd.fd = m_fd;
      pfd.events = POLLIN;

      const int timeout_ms = static_cast<int>(
          std::min<std::chrono::milliseconds::rep>(
              idle_timeout.count(), std::numeric_limits<int>::max()));

      const int ready = poll(&pfd, 1, timeout_ms);
      if (ready < 0) {
        if (EINTR == errno) {
          continue;
        }

        return std::unexpected(std::error_code(errno, std::system_category()));
      }

      if (0 == ready) {
        return std::unexpected(std::make_error_code(std::errc::timed_out));
      }
    }

    const ssize_t n_read = recv(m_fd, buf.data(), buf.size(), 0);
    if (n_read < 0) {
      if (EINTR == errno) {
        continue;
      }

      return std::unexpected(std::error_code(errno, std::system_category()));
    }

    return std::string(buf.data(), static_cast<size_t>(n_read));
  }
}

void Prelay_Tcp_Stream::write(std::string &item) {
  const char *buf{item.data()};
  size_t remaining{item.size()};

  while (remaining > 0) {
    const ssize_t n_write = send(m_fd, buf, remaining, MSG_NOSIGNAL);
    if (n_write < 0) {
      if (EINTR == errno) {
        continue;
      }

      throw std::system_error(errno, std::system_category(),
                              "Error in send to " + m_remote_address);
    }

    buf += n_write;
    remaining -= static_cast<size_t>(n_write);
  }
}

void Prelay_Tcp_Stream::write(std::string &&item) {
  std::string moved_item = std::move(item);

  write(moved_item);
}

void Prelay_Tcp_Stream::shutdownWrite() { ::shutdown(m_fd, SHUT_WR); }

void Prelay_Tcp_Stream::shutdown() { ::shutdown(m_fd, SHUT_RDWR); }

auto Prelay_Tcp_Stream::remoteAddress() const -> const std::string & {
  return m_remote_address;
}

// class Prelay_Tcp_Listener
Prelay_Tcp_Listener::Prelay_Tcp_Listener(std::string_view ip4, uint16_t port_no,
                                         int backlog) {
  constexpr int reuse{1};
  const struct sockaddr_in addr = makeSockAddr(ip4, port_no);

  m_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (m_fd < 0) {
    throw std::system_error(errno, std::system_category(),
                            "Error creating socket");
  }

  if (setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    const int err = errno;

    close(m_fd);
    throw std::system_error(err, std::system_category(),
                            "Error in setsockopt: SOL_SOCKET, SO_REUSEADDR");
  }

  if (bind(m_fd,
           reinterpret_cast<const struct sockaddr *>(
               &addr), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
           sizeof(addr)) < 0) {
    const int err = errno;

    close(m_fd);
    throw std::system_error(err, std::system_category(),
                            "Error in bind(" + std::to_string(port_no) + ")");
  }

  if (listen(m_fd, backlog) < 0) {
    const int err = errno;

    close(m_fd);
    throw std::system_error(err, std::system_category(), "Error in listen");
  }

  struct sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (getsockname(m_fd,
                  reinterpret_cast<struct sockaddr *>(
                      &bound), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
                  &len) == 0) {
    m_port = ntohs(bound.sin_port);
  } else {
    m_port = port_no;
  }
}

Prelay_Tcp_Listener::~Prelay_Tcp_Listener() noexcept {
  if (-1 != m_fd) {
    close(m_fd);
  }
}

auto Prelay_Tcp_Listener::accept()
    -> std::expected<std::unique_ptr<Prelay_Tcp_Stream>, std::error_code> {
  struct sockaddr_in peer{};
  socklen_t len = sizeof(peer);

  if (m_shutdown) {
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }

  const int fd = accept4(m_fd,
                         reinterpret_cast<struct sockaddr *>(
                             &peer), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
                         &len, SOCK_CLOEXEC);
  if (fd < 0) {
    return std::unexpected(std::error_code(errno, std::system_category()));
  }

  return std::make_unique<Prelay_Tcp_Stream>(fd, formatSockAddr(peer));
}

void Prelay_Tcp_Listener::shutdown() {
  m_shutdown = true;

  // On Linux shutdown() of a listening socket fails any blocked and future
  // accept() with EINVAL, which is what ends the accept loop.
  ::shutdown(m_fd, SHUT_RDWR);
}

auto Prelay_Tcp_Listener::isShutdown() const -> bool { return m_shutdown; }

auto Prelay_Tcp_Listener::port() const -> uint16_t { return m_port; }

} // namespace prelay
