// File: include/pc/core/report/text_report_sink.hpp
#pragma once

#include <ostream>
#include <string>

#include "pc/core/report/report_sink.hpp"

namespace pc {

// Human-readable announcements, one line per party:
//   Suspected party with A, B and C within a radius of 42 meters around
//   Kreuzberg and Mitte (22:10, 22:14, 22:31).
class TextReportSink final : public ReportSink {
 public:
  explicit TextReportSink(std::ostream& out) : out_(out) {}

  Status open(const RunInfo& run) override;
  Status emit(const PartyReport& r) override;
  Status flush() override;
  void close() override {}

  static std::string format(const PartyReport& r);

 private:
  std::ostream& out_;
};

}  // namespace pc
