/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-device-print-sink.cpp
 */

#include "prelay-device-print-sink.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace prelay {

Prelay_Device_Print_Sink::Prelay_Device_Print_Sink(
    std::filesystem::path device_dir)
    : m_device_dir{std::move(device_dir)} {}

auto Prelay_Device_Print_Sink::resolve(const std::string &printer_name) const
    -> std::filesystem::path {
  const std::filesystem::path name{printer_name};

  if (name.is_absolute()) {
    return name;
  }

  return m_device_dir / name;
}

auto Prelay_Device_Print_Sink::deliver(const std::string &printer_name,
                                       const std::string &data)
    -> std::expected<void, SinkError> {
  if (printer_name.empty()) {
    return std::unexpected(
        SinkError{SinkErrorCode::kNotFound, "no printer configured"});
  }

  const auto device = resolve(printer_name);

  struct stat st{};
  if (stat(device.c_str(), &st) < 0 || S_ISDIR(st.st_mode)) {
    return std::unexpected(SinkError{
        SinkErrorCode::kNotFound,
        "printer device " + device.string() + " does not exist"});
  }

  const std::lock_guard<std::mutex> lock(m_mutex);

  const int fd = open(device.c_str(), O_WRONLY | O_CLOEXEC | O_NOCTTY);
  if (fd < 0) {
    const int err = errno;
    const auto code = (ENOENT == err || ENXIO == err || ENODEV == err)
                          ? SinkErrorCode::kNotFound
                          : SinkErrorCode::kDeliveryFailed;

    return std::unexpected(SinkError{
        code, "open " + device.string() + ": " + strerror(err)});
  }

  size_t written{};
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (EINTR == errno) {
        continue;
      }

      const int err = errno;
      close(fd);

      return std::unexpected(SinkError{
          SinkErrorCode::kDeliveryFailed,
          "write " + device.string() + ": " + strerror(err)});
    }

    written += static_cast<size_t>(n);
  }

  if (close(fd) < 0 && EINTR != errno) {
    return std::unexpected(SinkError{
        SinkErrorCode::kDeliveryFailed,
        "close " + device.string() + ": " + strerror(errno)});
  }

  return {};
}

auto Prelay_Device_Print_Sink::listPrinters() -> std::vector<std::string> {
  std::vector<std::string> printers{};
  std::error_code ec{};

  for (const auto &entry :
       std::filesystem::directory_iterator{m_device_dir, ec}) {
    std::error_code type_ec{};
    const auto status = entry.status(type_ec);

    if (type_ec) {
      continue;
    }

    if (std::filesystem::is_character_file(status) ||
        std::filesystem::is_fifo(status) ||
        std::filesystem::is_regular_file(status)) {
      printers.push_back(entry.path().filename().string());
    }
  }

  std::sort(printers.begin(), printers.end());

  return printers;
}

} // namespace prelay
