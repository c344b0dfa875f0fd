/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-event-log.hpp
 * @brief Event feed subscriber that writes one timestamped line per event.
 *
 * Lines look like
 *
 *   2025-01-01 10:00:00 - INFO - [OK] Server listening on port 9100
 *
 * and go to the console stream and, when a log directory is given, to a
 * prelay_YYYYMMDD_HHMMSS.log file created in it. Log files in that
 * directory older than the retention period are removed on construction.
 */

#ifndef PRELAY_EVENT_LOG_HPP_
#define PRELAY_EVENT_LOG_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

#include "prelay-event.hpp"

namespace prelay {

class Prelay_Event_Log : public Prelay_Event_Subscriber {
public:
  enum class Level { kInfo, kWarning, kError };

  /**
   * @param console        Stream every line is written to.
   * @param log_dir        Directory for the log file, empty for console only.
   * @param retention_days Age after which old log files are removed, 0 to
   *                       keep them all.
   */
  Prelay_Event_Log(std::ostream &console, std::filesystem::path log_dir = {},
                   uint32_t retention_days = 30);
  virtual ~Prelay_Event_Log() noexcept;

  Prelay_Event_Log(const Prelay_Event_Log &obj) = delete;
  const Prelay_Event_Log &operator=(const Prelay_Event_Log &obj) = delete;
  Prelay_Event_Log(Prelay_Event_Log &&obj) = delete;
  Prelay_Event_Log &operator=(Prelay_Event_Log &&obj) = delete;

  void notify(const EventPb &event) override;

  /**
   * @brief Write a line that did not come from the event feed.
   */
  void log(Level level, std::string_view message);

  auto logFilePath() const -> const std::filesystem::path &;

  static auto formatEvent(const EventPb &event) -> std::string;
  static auto levelOf(const EventPb &event) -> Level;

  /**
   * @brief Remove prelay_*.log files in dir last written more than
   *        retention_days ago.
   *
   * @return number of files removed.
   */
  static auto removeExpiredLogs(const std::filesystem::path &dir,
                                uint32_t retention_days) -> size_t;

private:
  void writeLine(std::chrono::system_clock::time_point when, Level level,
                 std::string_view message);

  std::mutex m_mutex{};
  std::ostream &m_console;
  std::filesystem::path m_log_file_path{};
  std::ofstream m_log_file{};
};

auto toString(Prelay_Event_Log::Level level) -> std::string_view;

} // namespace prelay

#endif // PRELAY_EVENT_LOG_HPP_
