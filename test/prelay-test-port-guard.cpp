/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-test-port-guard.cpp
 * @brief The unit test for prelay-port-guard module.
 *
 * Occupants are forked children listening on an ephemeral loopback port:
 * a "foreign" child execs /bin/sleep with the socket inherited, a "stale"
 * child is a copy of this test binary and so looks like a prior instance.
 */

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <signal.h>
#include <spawn.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

#include "prelay-port-guard.hpp"
#include "prelay-socket.hpp"

/**
 * Fork a child listening on 127.0.0.1:<ephemeral>. Returns once the child
 * is listening and, for a foreign child, has exec'd /bin/sleep.
 */
static auto spawnListener(bool foreign) -> std::pair<pid_t, uint16_t> {
  int fds[2]{};

  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, 0};
  }

  const pid_t pid = fork();
  if (0 == pid) {
    close(fds[0]);

    const int sock = socket(AF_INET, SOCK_STREAM, 0);
    const int one{1};
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    socklen_t len = sizeof(addr);
    if (bind(sock, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) <
            0 ||
        listen(sock, 4) < 0 ||
        getsockname(sock, reinterpret_cast<struct sockaddr *>(&addr), &len) <
            0) {
      _exit(1);
    }

    const uint16_t port = ntohs(addr.sin_port);
    if (write(fds[1], &port, sizeof(port)) != sizeof(port)) {
      _exit(1);
    }

    if (foreign) {
      // the pipe is close-on-exec, so the parent sees EOF once exec'd
      execl("/bin/sleep", "sleep", "30", static_cast<char *>(nullptr));
      _exit(127);
    }

    close(fds[1]);
    while (true) {
      pause();
    }
  }

  close(fds[1]);

  uint16_t port{};
  if (pid < 0 || read(fds[0], &port, sizeof(port)) != sizeof(port)) {
    close(fds[0]);
    return {-1, 0};
  }

  char eof{};
  while (read(fds[0], &eof, 1) > 0) {
  }

  close(fds[0]);

  return {pid, port};
}

static auto exitSignal(pid_t pid) -> int {
  int status{};

  if (waitpid(pid, &status, 0) != pid || !WIFSIGNALED(status)) {
    return 0;
  }

  return WTERMSIG(status);
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  const prelay::Prelay_Port_Guard::Options options{
      "prelay-test", 1, std::chrono::milliseconds{500}};

  // a foreign occupant is reported and left alone
  {
    auto [pid, port] = spawnListener(true);
    EXPECT_TRUE(pid > 0);

    auto conflict = prelay::Prelay_Port_Guard::findListener(port);
    EXPECT_TRUE(conflict.has_value());
    EXPECT_TRUE(conflict && pid == conflict->pid);
    EXPECT_TRUE(conflict && "sleep" == conflict->process_name);

    prelay::Prelay_Port_Guard guard{options};
    EXPECT_TRUE(conflict && !guard.isSelfInstance(*conflict));

    auto available = guard.ensureAvailable(port);
    EXPECT_TRUE(!available.has_value());
    EXPECT_TRUE(!available &&
                prelay::PortErrorCode::kPortBusy == available.error().code);
    EXPECT_TRUE(!available && pid == available.error().pid);
    EXPECT_TRUE(!available && "sleep" == available.error().process_name);

    EXPECT_TRUE(0 == kill(pid, 0));

    kill(pid, SIGKILL);
    EXPECT_TRUE(SIGKILL == exitSignal(pid));
  }

  // a prior instance of the same executable is terminated
  {
    auto [pid, port] = spawnListener(false);
    EXPECT_TRUE(pid > 0);

    prelay::Prelay_Port_Guard guard{options};
    auto conflict = prelay::Prelay_Port_Guard::findListener(port);
    EXPECT_TRUE(conflict && guard.isSelfInstance(*conflict));

    auto available = guard.ensureAvailable(port);
    EXPECT_TRUE(available.has_value());
    EXPECT_TRUE(SIGTERM == exitSignal(pid));
    EXPECT_TRUE(!prelay::Prelay_Port_Guard::findListener(port));
  }

  // a process carrying the service name is a prior instance too
  {
    auto [pid, port] = spawnListener(true);
    EXPECT_TRUE(pid > 0);

    prelay::Prelay_Port_Guard guard{prelay::Prelay_Port_Guard::Options{
        "sleep", 1, std::chrono::milliseconds{500}}};

    auto available = guard.ensureAvailable(port);
    EXPECT_TRUE(available.has_value());
    EXPECT_TRUE(SIGTERM == exitSignal(pid));
  }

  // no retries left: the stale instance is not touched
  {
    auto [pid, port] = spawnListener(false);
    EXPECT_TRUE(pid > 0);

    prelay::Prelay_Port_Guard guard{prelay::Prelay_Port_Guard::Options{
        "prelay-test", 0, std::chrono::milliseconds{100}}};

    auto available = guard.ensureAvailable(port);
    EXPECT_TRUE(!available &&
                prelay::PortErrorCode::kReclaimFailed == available.error().code);
    EXPECT_TRUE(0 == kill(pid, 0));

    kill(pid, SIGKILL);
    EXPECT_TRUE(SIGKILL == exitSignal(pid));
  }

  // this process itself is never a stale instance
  {
    prelay::Prelay_Tcp_Listener listener{"127.0.0.1", 0};

    auto conflict = prelay::Prelay_Port_Guard::findListener(listener.port());
    EXPECT_TRUE(conflict && getpid() == conflict->pid);

    prelay::Prelay_Port_Guard guard{options};
    EXPECT_TRUE(conflict && !guard.isSelfInstance(*conflict));

    auto available = guard.ensureAvailable(listener.port());
    EXPECT_TRUE(!available &&
                prelay::PortErrorCode::kPortBusy == available.error().code);
  }

  // processes exiting during the /proc walk are skipped
  {
    prelay::Prelay_Tcp_Listener listener{"127.0.0.1", 0};
    std::atomic<bool> churning{true};

    std::thread churn{[&churning]() -> void {
      char arg0[] = "true";
      char *args[] = {arg0, nullptr};

      while (churning) {
        pid_t pid{};
        if (0 == posix_spawn(&pid, "/bin/true", nullptr, nullptr, args,
                             environ)) {
          waitpid(pid, nullptr, 0);
        }
      }
    }};

    bool allFound{true};
    for (int i = 0; i < 50; ++i) {
      EXPECT_NO_THROW({
        auto conflict =
            prelay::Prelay_Port_Guard::findListener(listener.port());
        allFound = allFound && conflict && getpid() == conflict->pid;
      });
    }

    churning = false;
    churn.join();

    EXPECT_TRUE(allFound);
  }

  // a free port
  uint16_t freePort{};
  {
    prelay::Prelay_Tcp_Listener scratch{"127.0.0.1", 0};
    freePort = scratch.port();
  }

  EXPECT_TRUE(!prelay::Prelay_Port_Guard::findListener(freePort));
  EXPECT_TRUE(prelay::Prelay_Port_Guard{options}.ensureAvailable(freePort));

  return RUN_ALL_TESTS();
}
