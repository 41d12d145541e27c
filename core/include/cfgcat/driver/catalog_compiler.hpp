// cfgcat/driver/catalog_compiler.hpp - Per-node catalog compilation
//
// Drives one compilation per request: locate and parse manifests (through
// the parse cache), interpret them for the node, validate every resource,
// assemble the catalog and its dependency edges. Many compilations may run
// concurrently on one CatalogCompiler.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "cfgcat/basic/logging.hpp"
#include "cfgcat/basic/result.hpp"
#include "cfgcat/catalog/catalog.hpp"
#include "cfgcat/driver/compute_cache.hpp"
#include "cfgcat/driver/stats.hpp"
#include "cfgcat/facts/facts.hpp"
#include "cfgcat/interp/interpreter.hpp"
#include "cfgcat/interp/services.hpp"
#include "cfgcat/project/preferences.hpp"
#include "cfgcat/syntax/frontend.hpp"
#include "cfgcat/types/type_registry.hpp"

namespace cfgcat
{

/**
 * File holding a top-level unit.
 *
 *   node          -> <manifests>/site.pp
 *   class a       -> <modules>/a/manifests/init.pp
 *   class a::b::c -> <modules>/a/manifests/b/c.pp
 *
 * A name without segments is an InternalError.
 */
[[nodiscard]] Result<std::filesystem::path> manifest_path_for(
  const PathsConfig & paths, TopLevelType type, std::string_view name);

/**
 * Statements of a parsed file that belong to a unit.
 *
 * For a node: every non-node statement plus the node block naming it
 * exactly, or `node default` when none does (InterpreterError when
 * neither exists). For classes and defines: the whole file.
 */
[[nodiscard]] Result<std::vector<const Stmt *>> filter_statements(
  TopLevelType type, std::string_view name, const ParsedManifest & manifest);

/// Collaborators of a compiler; null members get the null implementations
struct CompilerServices
{
  std::shared_ptr<TemplateEvaluator> templates;
  std::shared_ptr<HieraLookup> hiera;
  std::shared_ptr<ExportedResourceStore> store;
  LoggerPtr logger;
};

class CatalogCompiler
{
public:
  explicit CatalogCompiler(Preferences prefs, CompilerServices services = {});
  CatalogCompiler(Preferences prefs, TypeRegistry types, CompilerServices services);

  CatalogCompiler(const CatalogCompiler &) = delete;
  CatalogCompiler & operator=(const CatalogCompiler &) = delete;

  /**
   * Compile the catalog of a node.
   *
   * The first failure aborts the compilation with exactly one diagnostic.
   * On success the node's exported resources are published to the store.
   */
  [[nodiscard]] Result<Catalog> compile(std::string_view node, const Facts & facts);

  /// Parsed manifest of a file, parsed at most once per compiler
  [[nodiscard]] Result<ParsedManifestPtr> load_file(const std::filesystem::path & path);

  [[nodiscard]] const MeasurementStore & parser_stats() const noexcept { return parser_stats_; }
  [[nodiscard]] const MeasurementStore & catalog_stats() const noexcept { return catalog_stats_; }
  [[nodiscard]] const MeasurementStore & template_stats() const noexcept { return template_stats_; }

  [[nodiscard]] const Preferences & preferences() const noexcept { return prefs_; }
  [[nodiscard]] const TypeRegistry & types() const noexcept { return types_; }
  [[nodiscard]] std::size_t cached_files() const { return parse_cache_.size(); }

private:
  Result<ParsedManifestPtr> load_unit(TopLevelType type, std::string_view name);
  Result<Catalog> compile_node(const std::string & node, const Facts & facts);
  Result<std::vector<Resource>> validate_resources(std::vector<Resource> resources) const;
  void log_warnings(const std::string & node, const std::vector<Diagnostic> & warnings);
  InterpreterServices make_interpreter_services();

  Preferences prefs_;
  TypeRegistry types_;
  CompilerServices services_;
  LoggerPtr interpreter_logger_;

  ComputeCache<std::string, ParsedManifestPtr> parse_cache_;
  MeasurementStore parser_stats_;
  MeasurementStore catalog_stats_;
  MeasurementStore template_stats_;

  ManifestInterpreter interpreter_;
};

}  // namespace cfgcat
