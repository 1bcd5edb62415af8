// File: src/core/report/jsonl_report_sink.cpp
#include "pc/core/report/jsonl_report_sink.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace pc {
namespace {

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

// parties_<digits>.jsonl -> digits, anything else -> -1.
std::int64_t parse_run_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "parties_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "parties_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid) || mid.size() > 18) return -1;
  return std::stoll(mid);
}

}  // namespace

std::string json_quote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
  return out;
}

JsonlReportSink::~JsonlReportSink() { close(); }

void JsonlReportSink::prune_out_dir_(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::int64_t k = parse_run_epoch_ns_from_name(it.path().filename().string());
    if (k < 0) continue;
    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status JsonlReportSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }
  prune_out_dir_(run.out_dir, keep_last_ > 0 ? keep_last_ - 1 : 0);

  const std::int64_t wall0 = run.wall_start_time_ns.ns;

  path_ = join_path(run.out_dir, "parties_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "parties_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"t_wall_s\":" << ns_to_s(wall0) << ","
     << "\"threshold_m\":" << run.threshold_m << ","
     << "\"feed_count\":" << run.feed_count << ","
     << "\"event_count\":" << run.event_count << ","
     << "\"config_path\":" << json_quote(run.config_path) << ","
     << "\"config_hash\":" << json_quote(run.config_hash) << ","
     << "\"events_hash\":" << json_quote(run.events_hash)
     << "}";

  PC_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlReportSink::emit(const PartyReport& r) {
  if (!open_) return Status::invalid_argument("JsonlReportSink::emit called while not open");

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":\"party\","
     << "\"size\":" << r.members.size() << ","
     << "\"threshold_m\":" << r.threshold_m << ","
     << "\"max_spatial_m\":" << r.max_spatial_m << ","
     << "\"max_temporal_s\":" << r.max_temporal_s << ","
     << "\"participants\":[";

  const std::vector<std::string> keys = r.participant_keys();
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) ss << ",";
    ss << json_quote(keys[i]);
  }
  ss << "],\"members\":[";

  for (std::size_t i = 0; i < r.members.size(); ++i) {
    const Event& e = r.members[i];
    if (i > 0) ss << ",";
    ss << "{"
       << "\"name\":" << json_quote(e.name()) << ","
       << "\"uri\":" << json_quote(e.identity_uri()) << ","
       << "\"t_ns\":" << e.timestamp().ns << ","
       << "\"utc_offset_min\":" << e.utc_offset_min() << ","
       << "\"lat\":" << e.latitude() << ","
       << "\"lon\":" << e.longitude();
    if (i < r.place_names.size()) {
      ss << ",\"place\":" << json_quote(r.place_names[i]);
    }
    ss << "}";
  }
  ss << "]}";

  return write_line_(ss.str());
}

Status JsonlReportSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlReportSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlReportSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace pc
