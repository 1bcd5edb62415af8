// File: include/pc/core/report/jsonl_report_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "pc/core/report/report_sink.hpp"
#include "pc/core/status.hpp"

namespace pc {

// JSONL sink for party reports.
// Writes every line to:
//   1) a unique per-run file: parties_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: parties_latest.jsonl (truncated each run)
// Older per-run files beyond `keep_last` are pruned on open.
class JsonlReportSink final : public ReportSink {
 public:
  explicit JsonlReportSink(std::size_t keep_last = 50) : keep_last_(keep_last) {}
  ~JsonlReportSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const PartyReport& r) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);
  static void prune_out_dir_(const std::string& out_dir, std::size_t keep_last);

  std::size_t keep_last_;
  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

// JSON string literal (quotes included) with the mandatory escapes.
std::string json_quote(const std::string& s);

}  // namespace pc
