/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-port-guard.cpp
 */

#include "prelay-port-guard.hpp"

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "prelay-debug.hpp"

namespace prelay {

namespace {

constexpr std::string_view kListenState{"0A"};
constexpr std::string_view kDeletedSuffix{" (deleted)"};
constexpr size_t kCommLength{15};
constexpr std::chrono::milliseconds kPollInterval{50};

/**
 * Collect the inodes of sockets in LISTEN state bound to port from one
 * /proc/net/tcp{,6} table. Rows look like
 *
 *   sl local_address rem_address st tx:rx tr:when retrnsmt uid timeout inode
 *   0: 00000000:238C 00000000:0000 0A ...
 */
void collectListenInodes(const char *table, uint16_t port,
                         std::set<std::string> &inodes) {
  std::ifstream in{table};
  std::string line{};

  if (!in || !std::getline(in, line)) {
    return;
  }

  while (std::getline(in, line)) {
    std::istringstream row{line};
    std::string sl{}, local{}, remote{}, state{}, queues{}, timer{},
        retransmits{}, uid{}, timeout{}, inode{};

    if (!(row >> sl >> local >> remote >> state >> queues >> timer >>
          retransmits >> uid >> timeout >> inode)) {
      continue;
    }

    if (state != kListenState) {
      continue;
    }

    const auto colon = local.rfind(':');
    if (std::string::npos == colon) {
      continue;
    }

    unsigned long local_port{};
    try {
      local_port = std::stoul(local.substr(colon + 1), nullptr, 16);
    } catch (const std::exception &) {
      continue;
    }

    if (local_port == port && "0" != inode) {
      inodes.insert(inode);
    }
  }
}

auto readFirstLine(const std::filesystem::path &path) -> std::string {
  std::ifstream in{path};
  std::string line{};

  std::getline(in, line);

  return line;
}

auto readExecutable(const std::filesystem::path &link) -> std::string {
  std::error_code ec{};
  std::string exe = std::filesystem::read_symlink(link, ec).string();

  if (ec) {
    return {};
  }

  if (exe.ends_with(kDeletedSuffix)) {
    exe.resize(exe.size() - kDeletedSuffix.size());
  }

  return exe;
}

/**
 * Pids of the processes holding one of inodes open, in /proc order.
 * Processes whose fd directory is not readable are skipped, and so are
 * processes that exit during the walk.
 */
auto findSocketOwners(const std::set<std::string> &inodes)
    -> std::vector<pid_t> {
  std::vector<pid_t> owners{};
  std::error_code ec{};
  const std::filesystem::directory_iterator end{};

  for (std::filesystem::directory_iterator proc{"/proc", ec};
       !ec && end != proc; proc.increment(ec)) {
    const std::string name = proc->path().filename().string();

    if (name.empty() ||
        !std::all_of(name.begin(), name.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      continue;
    }

    std::error_code fd_ec{};
    for (std::filesystem::directory_iterator fd{proc->path() / "fd", fd_ec};
         !fd_ec && end != fd; fd.increment(fd_ec)) {
      std::error_code link_ec{};
      const std::string target =
          std::filesystem::read_symlink(fd->path(), link_ec).string();

      if (link_ec || !target.starts_with("socket:[")) {
        continue;
      }

      const std::string inode = target.substr(8, target.size() - 9);
      if (inodes.count(inode) > 0) {
        owners.push_back(static_cast<pid_t>(std::stol(name)));
        break;
      }
    }
  }

  return owners;
}

} // namespace

Prelay_Port_Guard::Prelay_Port_Guard(Options options)
    : m_options{std::move(options)} {}

auto Prelay_Port_Guard::ensureAvailable(uint16_t port)
    -> std::expected<void, PortError> {
  if (!std::ifstream{"/proc/net/tcp"}) {
    return std::unexpected(
        PortError{PortErrorCode::kLookupFailed,
                  "can not read /proc/net/tcp to look up port " +
                      std::to_string(port),
                  0, ""});
  }

  for (uint32_t attempt = 0;; ++attempt) {
    const auto conflict = findListener(port);
    if (!conflict) {
      return {};
    }

    if (!isSelfInstance(*conflict)) {
      return std::unexpected(PortError{
          PortErrorCode::kPortBusy,
          "port " + std::to_string(port) + " is in use by " +
              conflict->process_name + " (pid " +
              std::to_string(conflict->pid) + ")",
          conflict->pid, conflict->process_name});
    }

    if (attempt >= m_options.reclaim_retries) {
      return std::unexpected(PortError{
          PortErrorCode::kReclaimFailed,
          "port " + std::to_string(port) + " is still held by " +
              conflict->process_name + " (pid " +
              std::to_string(conflict->pid) + ")",
          conflict->pid, conflict->process_name});
    }

    reclaim(port, *conflict);
  }
}

auto Prelay_Port_Guard::findListener(uint16_t port)
    -> std::optional<PortConflict> {
  std::set<std::string> inodes{};

  collectListenInodes("/proc/net/tcp", port, inodes);
  collectListenInodes("/proc/net/tcp6", port, inodes);

  if (inodes.empty()) {
    return std::nullopt;
  }

  const auto owners = findSocketOwners(inodes);
  if (owners.empty()) {
    return PortConflict{0, "unknown", ""};
  }

  // A socket shared with this process is never reclaimed, so report this
  // process as the owner when it is among them.
  const pid_t self = getpid();
  const pid_t pid = std::find(owners.begin(), owners.end(), self) !=
                            owners.end()
                        ? self
                        : owners.front();

  const std::filesystem::path proc_dir =
      std::filesystem::path{"/proc"} / std::to_string(pid);

  PortConflict conflict{};
  conflict.pid = pid;
  conflict.process_name = readFirstLine(proc_dir / "comm");
  conflict.executable = readExecutable(proc_dir / "exe");

  if (conflict.process_name.empty()) {
    conflict.process_name = "unknown";
  }

  return conflict;
}

auto Prelay_Port_Guard::isSelfInstance(const PortConflict &conflict) const
    -> bool {
  if (conflict.pid <= 0 || conflict.pid == getpid()) {
    return false;
  }

  const std::string self_exe = readExecutable("/proc/self/exe");
  if (!self_exe.empty() && conflict.executable == self_exe) {
    return true;
  }

  return !m_options.service_name.empty() &&
         conflict.process_name == m_options.service_name.substr(0, kCommLength);
}

void Prelay_Port_Guard::reclaim(uint16_t port, const PortConflict &conflict) {
  PRELAY_DEBUG_PRINT(std::cerr << "port guard: terminating stale instance "
                               << conflict.process_name << " (pid "
                               << conflict.pid << ") on port " << port
                               << "\n");

  if (kill(conflict.pid, SIGTERM) < 0) {
    if (ESRCH == errno) {
      return;
    }

    PRELAY_DEBUG_PRINT(std::cerr << "port guard: SIGTERM " << conflict.pid
                                 << ": " << strerror(errno) << "\n");
    return;
  }

  if (waitForRelease(port, conflict.pid)) {
    return;
  }

  PRELAY_DEBUG_PRINT(std::cerr << "port guard: force killing pid "
                               << conflict.pid << "\n");

  if (kill(conflict.pid, SIGKILL) < 0 && ESRCH != errno) {
    PRELAY_DEBUG_PRINT(std::cerr << "port guard: SIGKILL " << conflict.pid
                                 << ": " << strerror(errno) << "\n");
    return;
  }

  waitForRelease(port, conflict.pid);
}

auto Prelay_Port_Guard::waitForRelease(uint16_t port, pid_t pid) -> bool {
  const auto deadline =
      std::chrono::steady_clock::now() + m_options.reclaim_delay;

  do {
    const auto conflict = findListener(port);
    if (!conflict || conflict->pid != pid) {
      return true;
    }

    std::this_thread::sleep_for(kPollInterval);
  } while (std::chrono::steady_clock::now() < deadline);

  return false;
}

} // namespace prelay
