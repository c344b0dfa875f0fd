/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-device-print-sink.hpp
 * @brief Print sink writing jobs straight to a device node such as
 *        /dev/usb/lp0 (or to a regular file or FIFO).
 *
 * A printer name is either an absolute path or a name relative to the
 * device directory. The target must already exist; it is never created.
 * Deliveries are serialized so concurrent jobs never interleave on a
 * device.
 */

#ifndef PRELAY_DEVICE_PRINT_SINK_HPP_
#define PRELAY_DEVICE_PRINT_SINK_HPP_

#include <filesystem>
#include <mutex>

#include "prelay-print-sink.hpp"

namespace prelay {

class Prelay_Device_Print_Sink : public Prelay_Print_Sink {
public:
  explicit Prelay_Device_Print_Sink(std::filesystem::path device_dir);
  virtual ~Prelay_Device_Print_Sink() noexcept = default;

  Prelay_Device_Print_Sink(const Prelay_Device_Print_Sink &obj) = delete;
  const Prelay_Device_Print_Sink &
  operator=(const Prelay_Device_Print_Sink &obj) = delete;
  Prelay_Device_Print_Sink(Prelay_Device_Print_Sink &&obj) = delete;
  Prelay_Device_Print_Sink &operator=(Prelay_Device_Print_Sink &&obj) = delete;

  auto deliver(const std::string &printer_name, const std::string &data)
      -> std::expected<void, SinkError> override;

  /**
   * @brief Character devices, FIFOs and regular files in the device
   *        directory, sorted by name.
   */
  auto listPrinters() -> std::vector<std::string> override;

  auto resolve(const std::string &printer_name) const
      -> std::filesystem::path;

private:
  std::filesystem::path m_device_dir{};
  std::mutex m_mutex{};
};

} // namespace prelay

#endif // PRELAY_DEVICE_PRINT_SINK_HPP_
