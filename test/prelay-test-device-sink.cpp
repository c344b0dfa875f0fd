/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-test-device-sink.cpp
 * @brief The unit test for the device print sink, using regular files in
 *        a scratch directory as printer devices.
 */

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "prelay-device-print-sink.hpp"

static auto slurp(const std::filesystem::path &path) -> std::string {
  std::ifstream in{path, std::ios::binary};
  std::ostringstream content{};

  content << in.rdbuf();

  return content.str();
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  const auto dir = std::filesystem::temp_directory_path() /
                   ("prelay-test-device-" + std::to_string(getpid()));
  std::filesystem::create_directories(dir / "subdir");
  std::ofstream{dir / "lp0"}.close();
  std::ofstream{dir / "lp1"}.close();

  prelay::Prelay_Device_Print_Sink sink{dir};

  EXPECT_TRUE(dir / "lp0" == sink.resolve("lp0"));
  EXPECT_TRUE("/dev/usb/lp0" == sink.resolve("/dev/usb/lp0"));

  std::string job{"\x1b@raw ESC/POS job"};
  job.push_back('\0');
  job += "\xff\xfe";

  auto delivered = sink.deliver("lp0", job);
  EXPECT_TRUE(delivered.has_value());
  EXPECT_TRUE(job == slurp(dir / "lp0"));

  // the device is opened without truncation, like a real printer node
  auto second = sink.deliver((dir / "lp0").string(), "more");
  EXPECT_TRUE(second.has_value());
  EXPECT_TRUE(job + "more" == slurp(dir / "lp0"));

  auto unknown = sink.deliver("lp7", "data");
  EXPECT_TRUE(!unknown &&
              prelay::SinkErrorCode::kNotFound == unknown.error().code);
  EXPECT_TRUE(!std::filesystem::exists(dir / "lp7"));

  auto unnamed = sink.deliver("", "data");
  EXPECT_TRUE(!unnamed &&
              prelay::SinkErrorCode::kNotFound == unnamed.error().code);

  auto directory = sink.deliver("subdir", "data");
  EXPECT_TRUE(!directory &&
              prelay::SinkErrorCode::kNotFound == directory.error().code);

  // not writable
  std::filesystem::permissions(dir / "lp1", std::filesystem::perms::owner_read,
                               std::filesystem::perm_options::replace);
  if (0 != geteuid()) {
    auto readOnly = sink.deliver("lp1", "data");
    EXPECT_TRUE(!readOnly && prelay::SinkErrorCode::kDeliveryFailed ==
                                 readOnly.error().code);
  }

  auto printers = sink.listPrinters();
  EXPECT_TRUE(2 == printers.size());
  EXPECT_TRUE(2 == printers.size() && "lp0" == printers[0] &&
              "lp1" == printers[1]);

  prelay::Prelay_Device_Print_Sink empty{dir / "does-not-exist"};
  EXPECT_TRUE(empty.listPrinters().empty());

  std::filesystem::remove_all(dir);

  return RUN_ALL_TESTS();
}
