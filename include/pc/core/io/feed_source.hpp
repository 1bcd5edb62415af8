// File: include/pc/core/io/feed_source.hpp
#pragma once

#include <string>
#include <vector>

#include "pc/core/status.hpp"
#include "pc/core/types.hpp"

namespace pc {

class IFeedSource {
 public:
  virtual ~IFeedSource() = default;

  // Returns:
  //  - OK with the feed's well-formed events (possibly none); records lacking
  //    author identity, coordinates or a timestamp are already dropped
  //  - io_error / parse_error when the feed as a whole is unusable
  // Content may be stale within the source's cache window.
  virtual Result<std::vector<Event>> fetch(const std::string& feed_id) = 0;

  virtual std::string name() const = 0;
};

// Feed list file: one feed identifier per line. Whitespace is trimmed; blank
// lines and '#' comments are skipped.
Result<std::vector<std::string>> read_feed_list(const std::string& path);

}  // namespace pc
