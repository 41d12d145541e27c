// cfgcat/driver/catalog_compiler.cpp - Per-node catalog compilation
#include "cfgcat/driver/catalog_compiler.hpp"

#include <fmt/core.h>

#include <exception>
#include <system_error>
#include <utility>

#include "cfgcat/basic/casting.hpp"
#include "cfgcat/catalog/catalog_checks.hpp"
#include "cfgcat/types/native_types.hpp"

namespace cfgcat
{

namespace fs = std::filesystem;

namespace
{

/// Records every rendering in the templates store under the template name
class MeasuredTemplateEvaluator : public TemplateEvaluator
{
public:
  MeasuredTemplateEvaluator(std::shared_ptr<TemplateEvaluator> inner, MeasurementStore & stats)
  : inner_(std::move(inner)), stats_(stats)
  {
  }

  [[nodiscard]] Result<std::string> render(const TemplateRequest & request) override
  {
    const std::string key = request.source == TemplateRequest::Source::File
                              ? request.text
                              : std::string("inline_template");
    return measure(stats_, key, [&]() { return inner_->render(request); });
  }

private:
  std::shared_ptr<TemplateEvaluator> inner_;
  MeasurementStore & stats_;
};

CompilerServices with_defaults(CompilerServices services, const Preferences & prefs)
{
  if (!services.templates) {
    services.templates = std::make_shared<NullTemplateEvaluator>();
  }
  if (!services.hiera) {
    services.hiera = std::make_shared<NullHieraLookup>();
  }
  if (!services.store) {
    services.store = std::make_shared<NullResourceStore>();
  }
  if (!services.logger) {
    services.logger = std::make_shared<Logger>(k_daemon_logger_name, prefs.log_level);
  }
  return services;
}

LogLevel log_level_for(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return LogLevel::Error;
    case Severity::Warning:
      return LogLevel::Warning;
    case Severity::Notice:
      return LogLevel::Notice;
  }
  return LogLevel::Warning;
}

std::vector<std::string_view> split_name(std::string_view name)
{
  if (name.substr(0, 2) == "::") {
    name.remove_prefix(2);
  }
  std::vector<std::string_view> parts;
  while (!name.empty()) {
    const size_t sep = name.find("::");
    parts.push_back(name.substr(0, sep));
    if (sep == std::string_view::npos) {
      break;
    }
    name.remove_prefix(sep + 2);
  }
  return parts;
}

}  // namespace

// ============================================================================
// Unit lookup
// ============================================================================

Result<fs::path> manifest_path_for(
  const PathsConfig & paths, TopLevelType type, std::string_view name)
{
  if (type == TopLevelType::Node) {
    return Result<fs::path>::ok(paths.manifests / "site.pp");
  }

  const auto parts = split_name(name);
  bool empty_part = parts.empty();
  for (const auto & part : parts) {
    empty_part = empty_part || part.empty();
  }
  if (empty_part) {
    return Result<fs::path>::fail(Diagnostic::error(
      DiagnosticKind::InternalError,
      fmt::format("cannot map {} '{}' to a manifest: no name segments", to_string(type), name)));
  }

  fs::path path = paths.modules / std::string(parts.front()) / "manifests";
  if (parts.size() == 1) {
    return Result<fs::path>::ok(path / "init.pp");
  }
  for (size_t i = 1; i + 1 < parts.size(); ++i) {
    path /= std::string(parts[i]);
  }
  path /= std::string(parts.back()) + ".pp";
  return Result<fs::path>::ok(std::move(path));
}

Result<std::vector<const Stmt *>> filter_statements(
  TopLevelType type, std::string_view name, const ParsedManifest & manifest)
{
  using Selected = Result<std::vector<const Stmt *>>;

  std::vector<const Stmt *> selected;
  if (manifest.program == nullptr) {
    return Selected::ok(std::move(selected));
  }

  if (type != TopLevelType::Node) {
    for (const Stmt * stmt : manifest.program->stmts) {
      selected.push_back(stmt);
    }
    return Selected::ok(std::move(selected));
  }

  const NodeStmt * exact = nullptr;
  const NodeStmt * fallback = nullptr;
  for (const Stmt * stmt : manifest.program->stmts) {
    const auto * node = dyn_cast<NodeStmt>(stmt);
    if (node == nullptr) {
      selected.push_back(stmt);
      continue;
    }
    for (const auto & candidate : node->names) {
      if (exact == nullptr && candidate == name) {
        exact = node;
      } else if (fallback == nullptr && candidate == "default") {
        fallback = node;
      }
    }
  }

  const NodeStmt * chosen = exact != nullptr ? exact : fallback;
  if (chosen == nullptr) {
    Diagnostic diag = Diagnostic::error(
      DiagnosticKind::InterpreterError,
      fmt::format("no node definition matches '{}' and there is no default node", name));
    diag.notes.push_back("looked in " + manifest.source.path().string());
    return Selected::fail(std::move(diag));
  }
  selected.push_back(chosen);
  return Selected::ok(std::move(selected));
}

// ============================================================================
// CatalogCompiler
// ============================================================================

CatalogCompiler::CatalogCompiler(Preferences prefs, CompilerServices services)
: CatalogCompiler(std::move(prefs), make_native_type_registry(), std::move(services))
{
}

CatalogCompiler::CatalogCompiler(Preferences prefs, TypeRegistry types, CompilerServices services)
: prefs_(std::move(prefs)),
  types_(std::move(types)),
  services_(with_defaults(std::move(services), prefs_)),
  interpreter_logger_(std::make_shared<Logger>(k_interpreter_logger_name, prefs_.log_level)),
  interpreter_(make_interpreter_services())
{
}

InterpreterServices CatalogCompiler::make_interpreter_services()
{
  InterpreterServices services;
  services.statements = [this](TopLevelType type, std::string_view name) {
    return load_unit(type, name);
  };
  services.templates = std::make_shared<MeasuredTemplateEvaluator>(
    std::make_shared<SerializedTemplateEvaluator>(services_.templates), template_stats_);
  services.hiera = services_.hiera;
  services.store = services_.store;
  services.types = &types_;
  services.strict = prefs_.strict;
  services.ignored_modules = prefs_.ignored_modules;
  services.logger = interpreter_logger_;
  return services;
}

Result<ParsedManifestPtr> CatalogCompiler::load_file(const fs::path & path)
{
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    absolute = path;
  }
  const std::string key = absolute.lexically_normal().string();

  // Cache hits are timed as well
  return measure(parser_stats_, key, [this, &key]() {
    return parse_cache_.get(key, [&key]() { return parse_manifest_file(key); });
  });
}

Result<ParsedManifestPtr> CatalogCompiler::load_unit(TopLevelType type, std::string_view name)
{
  auto path = manifest_path_for(prefs_.paths, type, name);
  if (!path) {
    return Result<ParsedManifestPtr>::fail(std::move(path).error());
  }

  std::error_code ec;
  if (type != TopLevelType::Node && !fs::exists(path.value(), ec)) {
    services_.logger->debug("no manifest for {} '{}' at {}", to_string(type), name, path.value().string());
    return Result<ParsedManifestPtr>::ok(nullptr);
  }
  return load_file(path.value());
}

Result<Catalog> CatalogCompiler::compile(std::string_view node, const Facts & facts)
{
  const std::string name(node);
  services_.logger->debug("received query for node {}", name);

  return measure(catalog_stats_, name, [&]() {
    try {
      return compile_node(name, facts);
    } catch (const std::exception & e) {
      return Result<Catalog>::fail(Diagnostic::error(
        DiagnosticKind::InternalError,
        fmt::format("compilation of '{}' aborted: {}", name, e.what())));
    }
  });
}

Result<Catalog> CatalogCompiler::compile_node(const std::string & node, const Facts & facts)
{
  auto site = load_unit(TopLevelType::Node, node);
  if (!site) {
    return Result<Catalog>::fail(std::move(site).error());
  }

  InterpreterRequest request;
  request.node = node;
  request.facts = merge_facts(prefs_.facts, facts);
  request.manifest = std::move(site).value();

  auto statements = filter_statements(TopLevelType::Node, node, *request.manifest);
  if (!statements) {
    return Result<Catalog>::fail(std::move(statements).error());
  }
  request.statements = std::move(statements).value();

  auto interpreted = interpreter_.interpret(request);
  if (!interpreted) {
    return Result<Catalog>::fail(std::move(interpreted).error());
  }
  InterpreterOutput output = std::move(interpreted).value();
  log_warnings(node, output.warnings);

  auto validated = validate_resources(std::move(output.resources));
  if (!validated) {
    return Result<Catalog>::fail(std::move(validated).error());
  }

  auto assembled =
    assemble_catalog(node, std::move(validated).value(), std::move(output.warnings));
  if (!assembled) {
    return assembled;
  }
  Catalog catalog = std::move(assembled).value();

  if (prefs_.extra_tests) {
    if (auto failure = check_catalog(catalog, prefs_.paths.modules)) {
      return Result<Catalog>::fail(std::move(*failure));
    }
  }

  std::vector<Resource> exported;
  exported.reserve(catalog.exported.size());
  for (const auto & [id, res] : catalog.exported) {
    exported.push_back(res);
  }
  auto published = services_.store->replace_exported(node, std::move(exported));
  if (!published) {
    Diagnostic diag = std::move(published).error();
    diag.notes.push_back(fmt::format("while publishing the exported resources of '{}'", node));
    return Result<Catalog>::fail(std::move(diag));
  }

  services_.logger->info(
    "{}: {} resources, {} exported, {} edges", node, catalog.resources.size(),
    catalog.exported.size(), catalog.edge_count());
  return Result<Catalog>::ok(std::move(catalog));
}

Result<std::vector<Resource>> CatalogCompiler::validate_resources(
  std::vector<Resource> resources) const
{
  std::vector<Resource> validated;
  validated.reserve(resources.size());

  for (auto & res : resources) {
    // Collected from the store: validated by the node that exported it
    if (!res.exported_by.empty()) {
      validated.push_back(std::move(res));
      continue;
    }
    auto checked = types_.validate(std::move(res));
    if (!checked) {
      return Result<std::vector<Resource>>::fail(std::move(checked).error());
    }
    validated.push_back(std::move(checked).value());
  }
  return Result<std::vector<Resource>>::ok(std::move(validated));
}

void CatalogCompiler::log_warnings(const std::string & node, const std::vector<Diagnostic> & warnings)
{
  for (const auto & w : warnings) {
    services_.logger->log(log_level_for(w.severity), fmt::format("{}: {}", node, w.message));
  }
}

}  // namespace cfgcat
