/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-test-event-log.cpp
 * @brief The unit test for the event log writer.
 */

#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>

#include "prelay-event-log.hpp"

static auto slurp(const std::filesystem::path &path) -> std::string {
  std::ifstream in{path};
  std::ostringstream content{};

  content << in.rdbuf();

  return content.str();
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  const auto dir = std::filesystem::temp_directory_path() /
                   ("prelay-test-event-log-" + std::to_string(getpid()));
  std::filesystem::create_directories(dir);

  // an expired log, a fresh log and an unrelated file
  const auto expired = dir / "prelay_20000101_000000.log";
  const auto fresh = dir / "prelay_20990101_000000.log";
  const auto unrelated = dir / "notes.txt";
  std::ofstream{expired}.close();
  std::ofstream{fresh}.close();
  std::ofstream{unrelated}.close();

  const auto old_time =
      std::filesystem::file_time_type::clock::now() - std::chrono::hours{24 * 40};
  std::filesystem::last_write_time(expired, old_time);
  std::filesystem::last_write_time(unrelated, old_time);

  std::ostringstream console{};

  {
    prelay::Prelay_Event_Feed feed{};
    prelay::Prelay_Event_Log log{console, dir, 30};

    EXPECT_TRUE(!std::filesystem::exists(expired));
    EXPECT_TRUE(std::filesystem::exists(fresh));
    EXPECT_TRUE(std::filesystem::exists(unrelated));
    EXPECT_TRUE(!log.logFilePath().empty());
    EXPECT_TRUE(std::filesystem::exists(log.logFilePath()));

    feed.registerSubscriber(&log);

    feed.publishStateChange(prelay::ServerState::kStarting,
                            prelay::ServerState::kListening, "", 9100, "lp0");

    prelay::Job job{};
    job.id = 1;
    job.remote_address = "127.0.0.1:40000";
    job.byte_count = 11;
    job.outcome = prelay::JobOutcome::kSuccess;
    job.printer_name = "lp0";
    feed.publishJobOutcome(job);

    job.id = 2;
    job.byte_count = 0;
    job.outcome = prelay::JobOutcome::kFailed;
    job.failure = prelay::JobFailure::kEmptyJob;
    job.failure_reason = "peer closed without sending data";
    feed.publishJobOutcome(job);

    log.log(prelay::Prelay_Event_Log::Level::kWarning, "[WARN] by hand");

    feed.waitForEmpty();
    log.waitForEmpty();

    const std::string text = console.str();
    EXPECT_TRUE(text.find(" - INFO - [OK] Server listening on port 9100, "
                          "printer lp0\n") != std::string::npos);
    EXPECT_TRUE(text.find(" - INFO - [OK] Job 1 from 127.0.0.1:40000: printed "
                          "11 bytes to lp0\n") != std::string::npos);
    EXPECT_TRUE(text.find(" - WARNING - [!] Job 2 from 127.0.0.1:40000 failed: "
                          "EmptyJob (peer closed without sending data)\n") !=
                std::string::npos);
    EXPECT_TRUE(text.find(" - WARNING - [WARN] by hand\n") !=
                std::string::npos);

    const std::regex line{
        R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} - (INFO|WARNING|ERROR) - .*)"};
    std::istringstream lines{text};
    std::string one{};
    size_t count{};
    while (std::getline(lines, one)) {
      EXPECT_TRUE(std::regex_match(one, line));
      count++;
    }

    EXPECT_TRUE(4 == count);
    EXPECT_TRUE(text == slurp(log.logFilePath()));
  }

  // formatting alone
  prelay::EventPb failed{};
  failed.set_kind(prelay::STATE_CHANGE);
  failed.mutable_state_change()->set_previous(prelay::STARTING);
  failed.mutable_state_change()->set_current(prelay::FAILED);
  failed.mutable_state_change()->set_reason("port 9100 is in use by cupsd");
  EXPECT_TRUE("[!] Server failed: port 9100 is in use by cupsd" ==
              prelay::Prelay_Event_Log::formatEvent(failed));
  EXPECT_TRUE(prelay::Prelay_Event_Log::Level::kError ==
              prelay::Prelay_Event_Log::levelOf(failed));

  prelay::EventPb stopped{};
  stopped.set_kind(prelay::STATE_CHANGE);
  stopped.mutable_state_change()->set_current(prelay::STOPPED);
  EXPECT_TRUE("[DONE] Server stopped" ==
              prelay::Prelay_Event_Log::formatEvent(stopped));

  EXPECT_TRUE(0 == prelay::Prelay_Event_Log::removeExpiredLogs(dir, 0));

  // a directory named like a log is left alone, a missing directory is
  // not an error
  const auto logLikeDir = dir / "prelay_20000101_000000.log";
  std::filesystem::create_directories(logLikeDir);
  std::filesystem::last_write_time(logLikeDir, old_time);

  EXPECT_NO_THROW(prelay::Prelay_Event_Log::removeExpiredLogs(dir, 30));
  EXPECT_TRUE(std::filesystem::is_directory(logLikeDir));
  EXPECT_TRUE(0 == prelay::Prelay_Event_Log::removeExpiredLogs(
                       dir / "no-such-dir", 30));

  // sweeping while another thread deletes the candidates never throws
  for (int i = 0; i < 200; ++i) {
    const auto file = dir / ("prelay_churn_" + std::to_string(i) + ".log");
    std::ofstream{file} << "old\n";
    std::filesystem::last_write_time(file, old_time);
  }

  std::thread remover{[&dir]() -> void {
    for (int i = 199; i >= 0; --i) {
      std::error_code ec{};
      std::filesystem::remove(
          dir / ("prelay_churn_" + std::to_string(i) + ".log"), ec);
    }
  }};

  size_t swept{};
  EXPECT_NO_THROW(swept =
                      prelay::Prelay_Event_Log::removeExpiredLogs(dir, 30));
  remover.join();

  EXPECT_TRUE(swept <= 200);
  EXPECT_TRUE(!std::filesystem::exists(dir / "prelay_churn_0.log"));

  std::filesystem::remove_all(dir);

  return RUN_ALL_TESTS();
}
