#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "cfgcat/project/preferences.hpp"

namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  explicit TempDir(fs::path p) : path(std::move(p)) { fs::create_directories(path); }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

fs::path unique_dir()
{
  const auto * info = ::testing::UnitTest::GetInstance()->current_test_info();
  return fs::temp_directory_path() / (std::string("cfgcat_prefs_") + info->name());
}

fs::path write_config(const fs::path & dir, const std::string & yaml)
{
  const fs::path path = dir / cfgcat::k_preferences_file_name;
  std::ofstream(path) << yaml;
  return path;
}

}  // namespace

TEST(Preferences, DefaultsLiveUnderBaseDir)
{
  const auto prefs = cfgcat::default_preferences("/srv/config");
  EXPECT_EQ(prefs.paths.manifests, fs::path("/srv/config/manifests"));
  EXPECT_EQ(prefs.paths.modules, fs::path("/srv/config/modules"));
  EXPECT_EQ(prefs.paths.templates, fs::path("/srv/config/templates"));
  EXPECT_FALSE(prefs.strict);
  EXPECT_FALSE(prefs.extra_tests);
  EXPECT_EQ(prefs.log_level, cfgcat::LogLevel::Warning);
}

TEST(Preferences, LoadsEveryKey)
{
  const TempDir dir(unique_dir());
  const auto path = write_config(
    dir.path,
    "paths:\n"
    "  manifests: site\n"
    "  modules: /opt/modules\n"
    "strict: true\n"
    "extra_tests: yes\n"
    "log_level: DEBUG\n"
    "ignored_modules: [legacy, vendor]\n"
    "facts:\n"
    "  environment: staging\n");

  const auto result = cfgcat::load_preferences(path);
  ASSERT_TRUE(result.success) << result.error;

  const auto & prefs = result.config;
  EXPECT_EQ(prefs.paths.manifests, fs::absolute(dir.path) / "site");
  EXPECT_EQ(prefs.paths.modules, fs::path("/opt/modules"));
  EXPECT_EQ(prefs.paths.templates, fs::absolute(dir.path) / "templates");
  EXPECT_TRUE(prefs.strict);
  EXPECT_TRUE(prefs.extra_tests);
  EXPECT_EQ(prefs.log_level, cfgcat::LogLevel::Debug);
  EXPECT_EQ(prefs.ignored_modules.count("vendor"), 1U);
  EXPECT_EQ(prefs.facts.at("environment"), "staging");
  EXPECT_EQ(prefs.project_root, fs::absolute(dir.path));
}

TEST(Preferences, EmptyFileGivesDefaults)
{
  const TempDir dir(unique_dir());
  const auto result = cfgcat::load_preferences(write_config(dir.path, ""));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.paths.modules, fs::absolute(dir.path) / "modules");
}

TEST(Preferences, RejectsInvalidValues)
{
  const TempDir dir(unique_dir());

  auto result = cfgcat::load_preferences(write_config(dir.path, "log_level: verbose\n"));
  ASSERT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid log_level: 'verbose'"), std::string::npos);

  result = cfgcat::load_preferences(write_config(dir.path, "strict: maybe\n"));
  ASSERT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid value"), std::string::npos);

  result = cfgcat::load_preferences(write_config(dir.path, "ignored_modules: legacy\n"));
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error, "ignored_modules must be a list");

  result = cfgcat::load_preferences(write_config(dir.path, "paths: [a]\n"));
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error, "paths must be a map");

  result = cfgcat::load_preferences(write_config(dir.path, "- a\n- b\n"));
  ASSERT_FALSE(result.success);

  result = cfgcat::load_preferences(write_config(dir.path, "key: [unclosed\n"));
  ASSERT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST(Preferences, MissingFileFails)
{
  const auto result = cfgcat::load_preferences("/nonexistent/cfgcat.yaml");
  ASSERT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}

TEST(Preferences, FindSearchesParentDirectories)
{
  const TempDir dir(unique_dir());
  const auto config = write_config(dir.path, "strict: true\n");
  const fs::path nested = dir.path / "modules" / "ntp" / "manifests";
  fs::create_directories(nested);

  const auto found = cfgcat::find_preferences(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(config));
}
