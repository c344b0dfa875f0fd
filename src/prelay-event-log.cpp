/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-event-log.cpp
 */

#include "prelay-event-log.hpp"

#include <time.h>

#include <array>
#include <sstream>
#include <system_error>

#include "prelay-debug.hpp"

namespace prelay {

namespace {

constexpr std::string_view kLogFilePrefix{"prelay_"};
constexpr std::string_view kLogFileSuffix{".log"};

auto formatLocalTime(std::chrono::system_clock::time_point when,
                     const char *format) -> std::string {
  const time_t secs = std::chrono::system_clock::to_time_t(when);
  struct tm local{};
  std::array<char, 64> buf{};

  localtime_r(&secs, &local);
  const size_t len = strftime(buf.data(), buf.size(), format, &local);

  return std::string{buf.data(), len};
}

auto toTimePoint(const google::protobuf::Timestamp &ts)
    -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point{
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds{ts.seconds()} +
          std::chrono::nanoseconds{ts.nanos()})};
}

auto isLogFileName(const std::string &name) -> bool {
  return name.size() > kLogFilePrefix.size() + kLogFileSuffix.size() &&
         name.starts_with(kLogFilePrefix) && name.ends_with(kLogFileSuffix);
}

} // namespace

auto toString(Prelay_Event_Log::Level level) -> std::string_view {
  switch (level) {
  case Prelay_Event_Log::Level::kInfo:
    return "INFO";
  case Prelay_Event_Log::Level::kWarning:
    return "WARNING";
  case Prelay_Event_Log::Level::kError:
    return "ERROR";
  }

  return "INFO";
}

Prelay_Event_Log::Prelay_Event_Log(std::ostream &console,
                                   std::filesystem::path log_dir,
                                   uint32_t retention_days)
    : Prelay_Event_Subscriber{"event-log"}, m_console{console} {
  if (log_dir.empty()) {
    return;
  }

  std::error_code ec{};
  std::filesystem::create_directories(log_dir, ec);
  if (ec) {
    m_console << "failed to create log directory " << log_dir << ": "
              << ec.message() << "\n";

    return;
  }

  removeExpiredLogs(log_dir, retention_days);

  m_log_file_path =
      log_dir / (std::string{kLogFilePrefix} +
                 formatLocalTime(std::chrono::system_clock::now(),
                                 "%Y%m%d_%H%M%S") +
                 std::string{kLogFileSuffix});

  m_log_file.open(m_log_file_path, std::ios::app);
  if (!m_log_file) {
    m_console << "failed to open log file " << m_log_file_path << "\n";
    m_log_file_path.clear();
  }
}

Prelay_Event_Log::~Prelay_Event_Log() noexcept try {
  unsubscribe();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Prelay_Event_Log::notify(const EventPb &event) {
  writeLine(toTimePoint(event.timestamp()), levelOf(event),
            formatEvent(event));
}

void Prelay_Event_Log::log(Level level, std::string_view message) {
  writeLine(std::chrono::system_clock::now(), level, message);
}

auto Prelay_Event_Log::logFilePath() const -> const std::filesystem::path & {
  return m_log_file_path;
}

auto Prelay_Event_Log::levelOf(const EventPb &event) -> Level {
  if (event.has_state_change()) {
    return FAILED == event.state_change().current() ? Level::kError
                                                     : Level::kInfo;
  }

  if (event.has_job_outcome()) {
    return SUCCESS == event.job_outcome().outcome() ? Level::kInfo
                                                     : Level::kWarning;
  }

  return Level::kInfo;
}

auto Prelay_Event_Log::formatEvent(const EventPb &event) -> std::string {
  std::ostringstream os{};

  if (event.has_state_change()) {
    const auto &change = event.state_change();

    switch (change.current()) {
    case STARTING:
      os << "[INFO] Server starting on port " << change.port();
      break;

    case LISTENING:
      os << "[OK] Server listening on port " << change.port();
      if (!change.printer_name().empty()) {
        os << ", printer " << change.printer_name();
      }
      break;

    case STOPPING:
      os << "[INFO] Server stopping";
      break;

    case STOPPED:
      os << "[DONE] Server stopped";
      break;

    case FAILED:
      os << "[!] Server failed";
      break;

    default:
      os << "[INFO] Server state " << ServerStatePb_Name(change.current());
      break;
    }

    if (!change.reason().empty()) {
      os << ": " << change.reason();
    }
  } else if (event.has_job_outcome()) {
    const auto &job = event.job_outcome();

    if (SUCCESS == job.outcome()) {
      os << "[OK] Job " << job.job_id() << " from " << job.remote_address()
         << ": printed " << job.byte_count() << " bytes to "
         << job.printer_name();
    } else {
      os << "[!] Job " << job.job_id() << " from " << job.remote_address()
         << " failed: " << toString(fromPb(job.failure()));
      if (!job.failure_reason().empty()) {
        os << " (" << job.failure_reason() << ")";
      }
      if (job.byte_count() > 0) {
        os << ", " << job.byte_count() << " bytes received";
      }
    }
  } else {
    os << "[INFO] " << EventKindPb_Name(event.kind());
  }

  return os.str();
}

auto Prelay_Event_Log::removeExpiredLogs(const std::filesystem::path &dir,
                                         uint32_t retention_days) -> size_t {
  if (0 == retention_days) {
    return 0;
  }

  std::error_code ec{};
  size_t removed{};

  const auto cutoff = std::filesystem::file_time_type::clock::now() -
                      std::chrono::hours{24} * retention_days;

  std::filesystem::directory_iterator it{dir, ec};

  // Entries may vanish during the walk, so never the throwing operator++.
  for (; !ec && std::filesystem::directory_iterator{} != it; it.increment(ec)) {
    const auto &entry = *it;
    std::error_code entry_ec{};

    if (!entry.is_regular_file(entry_ec) ||
        !isLogFileName(entry.path().filename().string())) {
      continue;
    }

    const auto mtime = entry.last_write_time(entry_ec);
    if (entry_ec || mtime >= cutoff) {
      continue;
    }

    if (std::filesystem::remove(entry.path(), entry_ec)) {
      ++removed;
    } else {
      PRELAY_DEBUG_PRINT(std::cerr << "failed to remove old log "
                                   << entry.path() << ": "
                                   << entry_ec.message() << "\n");
    }
  }

  return removed;
}

void Prelay_Event_Log::writeLine(std::chrono::system_clock::time_point when,
                                 Level level, std::string_view message) {
  const std::string line = formatLocalTime(when, "%Y-%m-%d %H:%M:%S") +
                           " - " + std::string{toString(level)} + " - " +
                           std::string{message} + "\n";

  const std::lock_guard<std::mutex> lock(m_mutex);

  m_console << line << std::flush;

  if (m_log_file.is_open()) {
    m_log_file << line << std::flush;
  }
}

} // namespace prelay
