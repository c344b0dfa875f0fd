/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-cups-print-sink.cpp
 */

#include "prelay-cups-print-sink.hpp"

#include <cups/cups.h>

#include <utility>

namespace prelay {

namespace {

auto lastCupsError() -> std::string {
  const char *msg = cupsLastErrorString();

  return nullptr != msg ? std::string{msg} : std::string{"unknown error"};
}

} // namespace

Prelay_Cups_Print_Sink::Prelay_Cups_Print_Sink(std::string job_title)
    : m_job_title{std::move(job_title)} {}

auto Prelay_Cups_Print_Sink::deliver(const std::string &printer_name,
                                     const std::string &data)
    -> std::expected<void, SinkError> {
  if (printer_name.empty()) {
    return std::unexpected(
        SinkError{SinkErrorCode::kNotFound, "no printer configured"});
  }

  cups_dest_t *dest =
      cupsGetNamedDest(CUPS_HTTP_DEFAULT, printer_name.c_str(), nullptr);
  if (nullptr == dest) {
    return std::unexpected(SinkError{
        SinkErrorCode::kNotFound,
        "CUPS destination " + printer_name + " not found: " + lastCupsError()});
  }

  cupsFreeDests(1, dest);

  const int job_id = cupsCreateJob(CUPS_HTTP_DEFAULT, printer_name.c_str(),
                                   m_job_title.c_str(), 0, nullptr);
  if (job_id <= 0) {
    return std::unexpected(
        SinkError{SinkErrorCode::kDeliveryFailed,
                  "cupsCreateJob " + printer_name + ": " + lastCupsError()});
  }

  if (HTTP_STATUS_CONTINUE !=
      cupsStartDocument(CUPS_HTTP_DEFAULT, printer_name.c_str(), job_id,
                        m_job_title.c_str(), CUPS_FORMAT_RAW, 1)) {
    cupsCancelJob(printer_name.c_str(), job_id);

    return std::unexpected(
        SinkError{SinkErrorCode::kDeliveryFailed,
                  "cupsStartDocument " + printer_name + ": " +
                      lastCupsError()});
  }

  if (HTTP_STATUS_CONTINUE != cupsWriteRequestData(CUPS_HTTP_DEFAULT,
                                                   data.data(), data.size())) {
    const std::string reason = lastCupsError();

    cupsFinishDocument(CUPS_HTTP_DEFAULT, printer_name.c_str());
    cupsCancelJob(printer_name.c_str(), job_id);

    return std::unexpected(
        SinkError{SinkErrorCode::kDeliveryFailed,
                  "cupsWriteRequestData " + printer_name + ": " + reason});
  }

  if (IPP_STATUS_OK !=
      cupsFinishDocument(CUPS_HTTP_DEFAULT, printer_name.c_str())) {
    return std::unexpected(
        SinkError{SinkErrorCode::kDeliveryFailed,
                  "cupsFinishDocument " + printer_name + ": " +
                      lastCupsError()});
  }

  return {};
}

auto Prelay_Cups_Print_Sink::listPrinters() -> std::vector<std::string> {
  std::vector<std::string> printers{};
  cups_dest_t *dests{};

  const int count = cupsGetDests2(CUPS_HTTP_DEFAULT, &dests);
  for (int i = 0; i < count; ++i) {
    printers.emplace_back(dests[i].name);
  }

  cupsFreeDests(count, dests);

  return printers;
}

} // namespace prelay
