// cfgcat/project/preferences.hpp - Compiler preferences (cfgcat.yaml)
//
// Parses and validates cfgcat.yaml. Relative paths are resolved against
// the directory holding the file.
//
#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "cfgcat/basic/logging.hpp"
#include "cfgcat/facts/facts.hpp"

namespace cfgcat
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Where manifests, modules and templates live.
 */
struct PathsConfig
{
  /// Holds site.pp
  std::filesystem::path manifests = "manifests";

  /// Holds <module>/manifests/*.pp and <module>/files
  std::filesystem::path modules = "modules";

  std::filesystem::path templates = "templates";
};

/**
 * Complete compiler configuration (cfgcat.yaml).
 */
struct Preferences
{
  PathsConfig paths;

  /// Unknown variables are errors
  bool strict = false;

  /// Run the catalog checks after each successful compilation
  bool extra_tests = false;

  LogLevel log_level = LogLevel::Warning;

  /// Modules whose classes and defines are not evaluated
  std::set<std::string, std::less<>> ignored_modules;

  /// Facts merged under the facts of every request
  Facts facts;

  /// Directory containing cfgcat.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

/// Preferences for a tree laid out under base_dir, without any file
[[nodiscard]] Preferences default_preferences(const std::filesystem::path & base_dir);

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a preferences file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  Preferences config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(Preferences cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load preferences from a cfgcat.yaml file.
 *
 * @param config_path Path to cfgcat.yaml
 * @return ConfigLoadResult with the loaded preferences or error message
 */
[[nodiscard]] ConfigLoadResult load_preferences(const std::filesystem::path & config_path);

/**
 * Search for cfgcat.yaml from start_dir up to the filesystem root.
 *
 * @return Path to cfgcat.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_preferences(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_preferences_file_name = "cfgcat.yaml";

}  // namespace cfgcat
