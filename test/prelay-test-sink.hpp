/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file prelay-test-sink.hpp
 * @brief Print sink for tests: records deliveries in memory, or fails on
 *        request.
 */

#ifndef PRELAY_TEST_SINK_HPP_
#define PRELAY_TEST_SINK_HPP_

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "prelay-print-sink.hpp"

class Prelay_Recording_Sink : public prelay::Prelay_Print_Sink {
public:
  struct Delivery {
    std::string printer_name{};
    std::string data{};
  };

  auto deliver(const std::string &printer_name, const std::string &data)
      -> std::expected<void, prelay::SinkError> override {
    const std::lock_guard<std::mutex> lock(m_mutex);

    if (m_failure) {
      return std::unexpected(*m_failure);
    }

    m_deliveries.push_back(Delivery{printer_name, data});

    return {};
  }

  auto listPrinters() -> std::vector<std::string> override {
    return {"recording"};
  }

  auto deliveries() -> std::vector<Delivery> {
    const std::lock_guard<std::mutex> lock(m_mutex);

    return m_deliveries;
  }

  void failWith(prelay::SinkError error) {
    const std::lock_guard<std::mutex> lock(m_mutex);

    m_failure = std::move(error);
  }

private:
  std::mutex m_mutex{};
  std::vector<Delivery> m_deliveries{};
  std::optional<prelay::SinkError> m_failure{};
};

#endif // PRELAY_TEST_SINK_HPP_
