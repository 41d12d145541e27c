// cfgcat/catalog/catalog_checks.hpp - Optional consistency checks on a compiled catalog
#pragma once

#include <filesystem>
#include <optional>

#include "cfgcat/basic/diagnostic.hpp"
#include "cfgcat/catalog/catalog.hpp"

namespace cfgcat
{

/**
 * File sources of the form puppet:///modules/<module>/<path> must exist
 * as <modules_dir>/<module>/files/<path>.
 */
[[nodiscard]] std::optional<Diagnostic> check_file_sources(
  const Catalog & catalog, const std::filesystem::path & modules_dir);

/**
 * Non-numeric gid and every groups entry of a user must be a group of the
 * catalog or a well-known system group.
 */
[[nodiscard]] std::optional<Diagnostic> check_user_groups(const Catalog & catalog);

/// All checks in order; the first failure is a CatalogTestFailure
[[nodiscard]] std::optional<Diagnostic> check_catalog(
  const Catalog & catalog, const std::filesystem::path & modules_dir);

}  // namespace cfgcat
