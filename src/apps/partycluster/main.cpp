// File: src/apps/partycluster/main.cpp
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "pc/adapters/geonames/geonames_geocoder.hpp"
#include "pc/adapters/http/http_feed_source.hpp"
#include "pc/core/io/feed_source.hpp"
#include "pc/core/model/party_finder.hpp"
#include "pc/core/report/jsonl_report_sink.hpp"
#include "pc/core/report/text_report_sink.hpp"
#include "pc/core/util/config_loader.hpp"

namespace {

struct Args {
  std::string feed_list_path;
  std::optional<double> threshold_m;
  std::string config_path;
  bool no_geocode{false};
  bool jsonl{false};
  bool help{false};
  std::string error;  // non-empty: usage error
};

std::optional<double> parse_number(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') return std::nullopt;
  return v;
}

Args parse_args(int argc, char** argv) {
  Args a;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config") {
      if (i + 1 >= argc) {
        a.error = "--config needs a path";
        return a;
      }
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--no-geocode") {
      a.no_geocode = true;
      continue;
    }
    if (s == "--jsonl") {
      a.jsonl = true;
      continue;
    }
    if (s.size() > 1 && s[0] == '-' && !parse_number(s)) {
      a.error = "unknown option " + s;
      return a;
    }
    positional.push_back(s);
  }

  if (positional.size() > 2) {
    a.error = "too many arguments";
    return a;
  }
  if (!positional.empty()) a.feed_list_path = positional[0];
  if (positional.size() == 2) {
    a.threshold_m = parse_number(positional[1]);
    if (!a.threshold_m) a.error = "threshold is not a number: " + positional[1];
  }
  return a;
}

void print_usage(std::ostream& os) {
  os << "Usage: partycluster <feed-list> <threshold> [--config <path>] [--no-geocode] [--jsonl]\n"
     << "\n"
     << "feed-list  file with one Atom feed URL per line\n"
     << "threshold  largest space-time interval (meters) between party guests\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help) {
    print_usage(std::cout);
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << "partycluster: " << args.error << "\n\n";
    print_usage(std::cerr);
    return 1;
  }
  if (args.feed_list_path.empty()) {
    print_usage(std::cerr);
    return 1;
  }

  pc::Config cfg;
  if (!args.config_path.empty()) {
    auto cfg_r = pc::load_config(args.config_path);
    if (!cfg_r.ok()) {
      std::cerr << cfg_r.status().to_string() << "\n";
      return 1;
    }
    cfg = cfg_r.take_value();
  }
  if (args.jsonl) cfg.output.jsonl = true;

  // CLI threshold wins over the config file.
  const std::optional<double> threshold = args.threshold_m ? args.threshold_m : cfg.clustering.threshold_m;
  if (!threshold) {
    print_usage(std::cerr);
    return 1;
  }
  const pc::Status st_threshold = pc::validate_threshold(*threshold);
  if (!st_threshold.ok()) {
    std::cerr << "partycluster: " << st_threshold.message() << "\n\n";
    print_usage(std::cerr);
    return 1;
  }

  auto feeds_r = pc::read_feed_list(args.feed_list_path);
  if (!feeds_r.ok()) {
    std::cerr << feeds_r.status().to_string() << "\n\n";
    print_usage(std::cerr);
    return 1;
  }
  const std::vector<std::string> feeds = feeds_r.take_value();

  pc::HttpFeedSourceConfig src_cfg;
  src_cfg.http.timeout_ms = cfg.feeds.timeout_ms;
  src_cfg.http.user_agent = cfg.feeds.user_agent;
  src_cfg.cache.dir = cfg.feeds.cache_dir;
  src_cfg.cache.ttl_s = cfg.feeds.cache_ttl_s;
  pc::HttpFeedSource source(src_cfg);

  pc::PartyFinder finder(cfg, args.config_path);

  std::size_t failed = 0;
  for (std::size_t i = 0; i < feeds.size(); ++i) {
    std::cerr << "[" << (i + 1) << "/" << feeds.size() << "] " << feeds[i] << "\n";
    const pc::Status st = finder.ingest_feed(source, feeds[i]);
    if (!st.ok()) {
      std::cerr << "warning: skipping feed: " << st.to_string() << "\n";
      ++failed;
    }
  }
  std::cerr << "ingested " << finder.feeds_ingested() << " feeds (" << failed << " failed, "
            << source.cache_hits() << " from cache, " << source.skipped_entries()
            << " entries skipped), " << finder.store().size() << " distinct authors\n";

  std::vector<pc::PartyReport> reports = finder.find_parties(*threshold);

  if (cfg.geocoder.enabled && !args.no_geocode && !reports.empty()) {
    pc::GeonamesGeocoderConfig gc;
    gc.base_url = cfg.geocoder.base_url;
    gc.username = cfg.geocoder.username;
    gc.http.timeout_ms = cfg.geocoder.timeout_ms;
    gc.http.user_agent = cfg.feeds.user_agent;
    pc::GeonamesGeocoder geocoder(gc);
    (void)finder.enrich(reports, geocoder, std::cerr);
  }

  pc::TextReportSink text(std::cout);
  const pc::Status st_text = finder.publish(reports, *threshold, text);
  if (!st_text.ok()) {
    std::cerr << st_text.to_string() << "\n";
    return 2;
  }

  if (cfg.output.jsonl) {
    pc::JsonlReportSink jsonl;
    const pc::Status st_jsonl = finder.publish(reports, *threshold, jsonl);
    if (!st_jsonl.ok()) {
      std::cerr << st_jsonl.to_string() << "\n";
      return 2;
    }
    std::cerr << "reports: " << jsonl.path() << " (latest: " << jsonl.latest_path() << ")\n";
  }

  std::cerr << reports.size() << " suspected part" << (reports.size() == 1 ? "y" : "ies") << "\n";
  return 0;
}
