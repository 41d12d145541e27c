// cfgcat/project/preferences.cpp - Compiler preferences implementation
//
#include "cfgcat/project/preferences.hpp"

#include <yaml-cpp/yaml.h>

namespace cfgcat
{

namespace
{

std::filesystem::path resolve(const std::filesystem::path & root, const std::string & text)
{
  const std::filesystem::path p(text);
  return p.is_absolute() ? p : root / p;
}

/// Parse the 'paths' section
bool parse_paths(
  const YAML::Node & node, const std::filesystem::path & root, PathsConfig & paths,
  std::string & error)
{
  if (!node.IsMap()) {
    error = "paths must be a map";
    return false;
  }
  if (node["manifests"]) {
    paths.manifests = resolve(root, node["manifests"].as<std::string>());
  }
  if (node["modules"]) {
    paths.modules = resolve(root, node["modules"].as<std::string>());
  }
  if (node["templates"]) {
    paths.templates = resolve(root, node["templates"].as<std::string>());
  }
  return true;
}

}  // namespace

Preferences default_preferences(const std::filesystem::path & base_dir)
{
  Preferences prefs;
  prefs.project_root = std::filesystem::absolute(base_dir);
  prefs.paths.manifests = prefs.project_root / "manifests";
  prefs.paths.modules = prefs.project_root / "modules";
  prefs.paths.templates = prefs.project_root / "templates";
  return prefs;
}

ConfigLoadResult load_preferences(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  Preferences prefs = default_preferences(fs::absolute(config_path).parent_path());
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(prefs));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of " + config_path.string() + " must be a map");
  }

  // Scalar conversions throw on values of the wrong shape
  try {
    if (root["paths"]) {
      std::string error;
      if (!parse_paths(root["paths"], prefs.project_root, prefs.paths, error)) {
        return ConfigLoadResult::fail(error);
      }
    }

    if (root["strict"]) {
      prefs.strict = root["strict"].as<bool>();
    }
    if (root["extra_tests"]) {
      prefs.extra_tests = root["extra_tests"].as<bool>();
    }

    if (root["log_level"]) {
      const auto text = root["log_level"].as<std::string>();
      auto level = parse_log_level(text);
      if (!level) {
        return ConfigLoadResult::fail(
          "invalid log_level: '" + text + "' (must be debug, info, notice, warning or error)");
      }
      prefs.log_level = *level;
    }

    if (root["ignored_modules"]) {
      if (!root["ignored_modules"].IsSequence()) {
        return ConfigLoadResult::fail("ignored_modules must be a list");
      }
      for (const auto & module : root["ignored_modules"]) {
        prefs.ignored_modules.insert(module.as<std::string>());
      }
    }

    if (root["facts"]) {
      if (!root["facts"].IsMap()) {
        return ConfigLoadResult::fail("facts must be a map");
      }
      for (const auto & entry : root["facts"]) {
        prefs.facts[entry.first.as<std::string>()] = entry.second.as<std::string>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid value in " + config_path.string() + ": " + e.what());
  }

  return ConfigLoadResult::ok(std::move(prefs));
}

std::optional<std::filesystem::path> find_preferences(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_preferences_file_name;
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

}  // namespace cfgcat
