/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-cups-print-sink.hpp
 * @brief Print sink submitting jobs to a CUPS destination as raw data.
 *
 * Only built when the CUPS development library is available
 * (PRELAY_HAVE_CUPS).
 */

#ifndef PRELAY_CUPS_PRINT_SINK_HPP_
#define PRELAY_CUPS_PRINT_SINK_HPP_

#include <string>

#include "prelay-print-sink.hpp"

namespace prelay {

class Prelay_Cups_Print_Sink : public Prelay_Print_Sink {
public:
  explicit Prelay_Cups_Print_Sink(std::string job_title = "prelay job");
  virtual ~Prelay_Cups_Print_Sink() noexcept = default;

  Prelay_Cups_Print_Sink(const Prelay_Cups_Print_Sink &obj) = delete;
  const Prelay_Cups_Print_Sink &
  operator=(const Prelay_Cups_Print_Sink &obj) = delete;
  Prelay_Cups_Print_Sink(Prelay_Cups_Print_Sink &&obj) = delete;
  Prelay_Cups_Print_Sink &operator=(Prelay_Cups_Print_Sink &&obj) = delete;

  auto deliver(const std::string &printer_name, const std::string &data)
      -> std::expected<void, SinkError> override;

  auto listPrinters() -> std::vector<std::string> override;

private:
  std::string m_job_title{};
};

} // namespace prelay

#endif // PRELAY_CUPS_PRINT_SINK_HPP_
