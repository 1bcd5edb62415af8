// File: src/core/io/feed_list.cpp
#include "pc/core/io/feed_source.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace pc {
namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

}  // namespace

Result<std::vector<std::string>> read_feed_list(const std::string& path) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<std::vector<std::string>>::err(Status::not_found("feed list not found: " + path));
  }
  if (fs::is_directory(path, ec)) {
    return Result<std::vector<std::string>>::err(
        Status::invalid_argument("feed list is a directory: " + path));
  }

  std::ifstream f(path);
  if (!f.is_open()) {
    return Result<std::vector<std::string>>::err(Status::io_error("failed opening '" + path + "'"));
  }

  std::vector<std::string> feeds;
  std::string line;
  while (std::getline(f, line)) {
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;
    feeds.push_back(t);
  }
  if (f.bad()) {
    return Result<std::vector<std::string>>::err(Status::io_error("failed reading '" + path + "'"));
  }
  return Result<std::vector<std::string>>::ok(std::move(feeds));
}

}  // namespace pc
