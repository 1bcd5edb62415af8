// File: src/core/util/config_loader.cpp
#include "pc/core/util/config_loader.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace pc {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

// `chain` holds the files currently being expanded, to refuse include cycles.
static Result<YAML::Node> load_with_includes(const fs::path& path, std::set<std::string>& chain) {
  std::error_code ec;
  const fs::path resolved = fs::weakly_canonical(path, ec);
  const std::string canonical = ec ? path.string() : resolved.string();
  if (chain.count(canonical) != 0) {
    return Result<YAML::Node>::err(Status::invalid_argument("include cycle at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]. Only a map root can
  // carry them; anything else is rejected later by config_from_yaml.
  if (root.IsMap() && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    chain.insert(canonical);
    for (std::size_t i = 0; i < inc.size(); ++i) {
      if (!inc[i].IsScalar()) {
        return Result<YAML::Node>::err(Status::invalid_argument(
            "includes[" + std::to_string(i) + "] in " + path.string() + " must be a file path"));
      }
      const auto rel = inc[i].Scalar();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, chain);
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
    chain.erase(canonical);
    root.remove("includes");
  }

  return Result<YAML::Node>::ok(merge_yaml(merged, root));
}

static Result<Config> config_from_yaml(const YAML::Node& y) {
  Config cfg;  // defaults
  if (!y || y.IsNull()) {
    const Status s = validate_config(cfg);
    if (!s.ok()) return Result<Config>::err(s);
    return Result<Config>::ok(cfg);
  }
  if (!y.IsMap()) {
    return Result<Config>::err(Status::invalid_argument("config root must be a YAML map"));
  }

  try {
    // --- clustering (top-level keys)
    if (y["threshold_m"]) cfg.clustering.threshold_m = y["threshold_m"].as<double>();
    maybe_set(y, "min_party_size", cfg.clustering.min_party_size);

    // --- feeds
    if (is_map(y["feeds"])) {
      const auto f = y["feeds"];
      maybe_set(f, "cache_dir", cfg.feeds.cache_dir);
      maybe_set(f, "cache_ttl_s", cfg.feeds.cache_ttl_s);
      maybe_set(f, "timeout_ms", cfg.feeds.timeout_ms);
      maybe_set(f, "user_agent", cfg.feeds.user_agent);
    }

    // --- geocoder
    if (is_map(y["geocoder"])) {
      const auto g = y["geocoder"];
      maybe_set(g, "enabled", cfg.geocoder.enabled);
      maybe_set(g, "base_url", cfg.geocoder.base_url);
      maybe_set(g, "username", cfg.geocoder.username);
      maybe_set(g, "timeout_ms", cfg.geocoder.timeout_ms);
    }

    // --- output
    if (is_map(y["output"])) {
      const auto o = y["output"];
      maybe_set(o, "out_dir", cfg.output.out_dir);
      maybe_set(o, "jsonl", cfg.output.jsonl);
    }
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("bad config value: ") + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path_str) {
  std::set<std::string> chain;
  try {
    auto yaml_r = load_with_includes(fs::path(path_str), chain);
    if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
    return config_from_yaml(yaml_r.value());
  } catch (const YAML::Exception& e) {
    // Merging layers with odd keys (sequences as map keys, ...).
    return Result<Config>::err(Status::parse_error("YAML error in " + path_str + ": " + e.what()));
  }
}

Result<Config> load_config_from_string(const std::string& yaml) {
  try {
    return config_from_yaml(YAML::Load(yaml));
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
}

}  // namespace pc
