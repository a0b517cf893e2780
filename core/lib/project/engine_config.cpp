// cwcheck/project/engine_config.cpp - Engine configuration implementation
//
#include "cwcheck/project/engine_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <system_error>

#include "cwcheck/basic/interner.hpp"

namespace cwcheck
{

namespace
{

namespace fs = std::filesystem;

std::optional<sema::UnexpectedKeyPolicy> parse_policy(std::string_view text)
{
  for (const auto p : {sema::UnexpectedKeyPolicy::Error, sema::UnexpectedKeyPolicy::Warning,
                       sema::UnexpectedKeyPolicy::Ignore}) {
    if (iequals(text, to_string(p))) {
      return p;
    }
  }
  return std::nullopt;
}

/// Read a list of paths; a single scalar is accepted as a one-element list.
bool read_paths(const YAML::Node & node, std::vector<fs::path> & out)
{
  if (node.IsScalar()) {
    out.emplace_back(node.as<std::string>());
    return true;
  }
  if (!node.IsSequence()) {
    return false;
  }
  for (const auto & item : node) {
    out.emplace_back(item.as<std::string>());
  }
  return true;
}

EngineConfigLoadResult parse_root(const YAML::Node & root, fs::path config_root)
{
  EngineConfig config;
  config.config_root = std::move(config_root);

  if (!root || root.IsNull()) {
    return EngineConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return EngineConfigLoadResult::fail("configuration root must be a map");
  }

  // 'schema' section
  if (const auto schema = root["schema"]) {
    if (schema["root"]) {
      config.schema.root = schema["root"].as<std::string>();
    }
    if (schema["files"] && !read_paths(schema["files"], config.schema.files)) {
      return EngineConfigLoadResult::fail("schema.files must be a list");
    }
  }

  // 'workspace' section
  if (const auto ws = root["workspace"]) {
    if (ws["roots"] && !read_paths(ws["roots"], config.workspace.roots)) {
      return EngineConfigLoadResult::fail("workspace.roots must be a list");
    }
  }

  // 'validation' section
  if (const auto val = root["validation"]) {
    if (val["unexpected_keys"]) {
      const auto text = val["unexpected_keys"].as<std::string>();
      const auto policy = parse_policy(text);
      if (!policy) {
        return EngineConfigLoadResult::fail(
          "invalid validation.unexpected_keys: '" + text +
          "' (must be 'error', 'warning' or 'ignore')");
      }
      config.validation.unexpected_keys = *policy;
    }
    if (val["check_localisation"]) {
      config.validation.check_localisation = val["check_localisation"].as<bool>();
    }
    if (val["max_diagnostics_per_file"]) {
      const auto max = val["max_diagnostics_per_file"].as<long long>();
      if (max < 0) {
        return EngineConfigLoadResult::fail("validation.max_diagnostics_per_file must not be negative");
      }
      config.validation.max_diagnostics_per_file = static_cast<size_t>(max);
    }
  }

  // 'analysis' section
  if (const auto analysis = root["analysis"]) {
    if (analysis["workers"]) {
      const auto workers = analysis["workers"].as<long long>();
      if (workers < 0) {
        return EngineConfigLoadResult::fail("analysis.workers must not be negative");
      }
      config.analysis.workers = static_cast<size_t>(workers);
    }
  }

  // 'logging' section
  if (const auto logging = root["logging"]) {
    if (logging["level"]) {
      const auto text = logging["level"].as<std::string>();
      const auto level = log::parse_level(text);
      if (!level) {
        return EngineConfigLoadResult::fail("invalid logging.level: '" + text + "'");
      }
      config.logging.level = *level;
    }
  }

  return EngineConfigLoadResult::ok(std::move(config));
}

}  // namespace

sema::ValidationOptions EngineConfig::validation_options() const
{
  sema::ValidationOptions opts;
  opts.unexpected_keys = validation.unexpected_keys;
  opts.check_localisation = validation.check_localisation;
  opts.max_diagnostics = validation.max_diagnostics_per_file;
  return opts;
}

std::vector<fs::path> EngineConfig::schema_paths() const
{
  const fs::path base = config_root / schema.root;
  std::vector<fs::path> out;
  if (!schema.files.empty()) {
    for (const auto & f : schema.files) {
      out.push_back((base / f).lexically_normal());
    }
  } else {
    std::error_code ec;
    for (fs::recursive_directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec)) {
      if (it->is_regular_file() && iequals(it->path().extension().string(), ".cwt")) {
        out.push_back(it->path().lexically_normal());
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<fs::path> EngineConfig::workspace_roots() const
{
  std::vector<fs::path> out;
  out.reserve(workspace.roots.size());
  for (const auto & r : workspace.roots) {
    out.push_back((config_root / r).lexically_normal());
  }
  return out;
}

EngineConfigLoadResult load_engine_config(const fs::path & config_path)
{
  if (!fs::exists(config_path)) {
    return EngineConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return EngineConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return EngineConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

EngineConfigLoadResult parse_engine_config(const std::string & yaml_text, const fs::path & config_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), config_root);
  } catch (const YAML::Exception & e) {
    return EngineConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<fs::path> find_engine_config(const fs::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_engine_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

void apply_logging(const EngineConfig & config)
{
  log::Logger::instance().set_level(config.logging.level);
}

}  // namespace cwcheck
