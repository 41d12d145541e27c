// cfgcat/interp/services.hpp - Collaborators the interpreter calls out to
//
// Templates, hierarchical data and the exported-resource store are external
// engines. They are reached through these interfaces; the null and in-memory
// implementations here are what runs when nothing else is configured.
//
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "cfgcat/basic/logging.hpp"
#include "cfgcat/basic/result.hpp"
#include "cfgcat/facts/facts.hpp"
#include "cfgcat/model/resource.hpp"
#include "cfgcat/model/value.hpp"
#include "cfgcat/syntax/frontend.hpp"

namespace cfgcat
{

class TypeRegistry;

/// Variables visible from a scope, nearest definition first
using VariableMap = std::map<std::string, Value, std::less<>>;

// ============================================================================
// Templates
// ============================================================================

struct TemplateRequest
{
  enum class Source : uint8_t {
    File,    ///< text names a template file
    Inline,  ///< text is the template source
  };

  Source source = Source::File;
  std::string text;
  std::string node;
  std::string scope;  ///< Class or define the call was made from
  VariableMap variables;
};

class TemplateEvaluator
{
public:
  virtual ~TemplateEvaluator() = default;

  [[nodiscard]] virtual Result<std::string> render(const TemplateRequest & request) = 0;
};

/// Fails every request; used when no template engine is configured
class NullTemplateEvaluator : public TemplateEvaluator
{
public:
  [[nodiscard]] Result<std::string> render(const TemplateRequest & request) override;
};

/**
 * Single-owner wrapper: one request at a time reaches the wrapped engine.
 * Exceptions thrown by the engine come back as InterpreterError diagnostics.
 */
class SerializedTemplateEvaluator : public TemplateEvaluator
{
public:
  explicit SerializedTemplateEvaluator(std::shared_ptr<TemplateEvaluator> inner)
  : inner_(std::move(inner))
  {
  }

  [[nodiscard]] Result<std::string> render(const TemplateRequest & request) override;

private:
  std::shared_ptr<TemplateEvaluator> inner_;
  std::mutex mutex_;
};

// ============================================================================
// Hierarchical data lookup
// ============================================================================

class HieraLookup
{
public:
  virtual ~HieraLookup() = default;

  /// nullopt when the key is not found
  [[nodiscard]] virtual Result<std::optional<Value>> lookup(
    std::string_view key, const VariableMap & scope) = 0;
};

class NullHieraLookup : public HieraLookup
{
public:
  [[nodiscard]] Result<std::optional<Value>> lookup(
    std::string_view key, const VariableMap & scope) override;
};

// ============================================================================
// Exported-resource store
// ============================================================================

/// Exported resources of one type, optionally filtered on one attribute
struct ResourceQuery
{
  enum class Op : uint8_t {
    Any,       ///< No filter
    Equal,     ///< attribute == value
    NotEqual,  ///< attribute != value
  };

  std::string type;
  std::string attribute;
  Op op = Op::Any;
  Value value;

  /// Resources exported by this node are left out
  std::string exclude_node;

  [[nodiscard]] bool matches(const Resource & res) const;
};

class ExportedResourceStore
{
public:
  virtual ~ExportedResourceStore() = default;

  [[nodiscard]] virtual Result<Facts> get_facts(std::string_view node) = 0;

  /// Matching resources, each with exported_by set to the node that exported it
  [[nodiscard]] virtual Result<std::vector<Resource>> get_resources(const ResourceQuery & query) = 0;

  /// Replace everything node exported; returns the number of stored resources
  [[nodiscard]] virtual Result<std::size_t> replace_exported(
    std::string_view node, std::vector<Resource> resources) = 0;
};

/// Holds nothing and accepts (then forgets) every update
class NullResourceStore : public ExportedResourceStore
{
public:
  [[nodiscard]] Result<Facts> get_facts(std::string_view node) override;
  [[nodiscard]] Result<std::vector<Resource>> get_resources(const ResourceQuery & query) override;
  [[nodiscard]] Result<std::size_t> replace_exported(
    std::string_view node, std::vector<Resource> resources) override;
};

/// Process-local store shared by concurrent compilations
class MemoryResourceStore : public ExportedResourceStore
{
public:
  void set_facts(std::string node, Facts facts);

  [[nodiscard]] Result<Facts> get_facts(std::string_view node) override;
  [[nodiscard]] Result<std::vector<Resource>> get_resources(const ResourceQuery & query) override;
  [[nodiscard]] Result<std::size_t> replace_exported(
    std::string_view node, std::vector<Resource> resources) override;

  [[nodiscard]] std::size_t exported_count() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, Facts, std::less<>> facts_;
  std::map<std::string, std::vector<Resource>, std::less<>> exported_;
};

// ============================================================================
// Service bundle
// ============================================================================

/// Kinds of top-level units that live in their own file
enum class TopLevelType : uint8_t {
  Node,
  Class,
  Define,
};

[[nodiscard]] std::string_view to_string(TopLevelType type) noexcept;

/**
 * Loads the manifest that holds a class or define. A null manifest means
 * the unit has no file; a failure means the file exists but cannot be used.
 */
using StatementSource =
  std::function<Result<ParsedManifestPtr>(TopLevelType type, std::string_view name)>;

struct InterpreterServices
{
  StatementSource statements;
  std::shared_ptr<TemplateEvaluator> templates;
  std::shared_ptr<HieraLookup> hiera;
  std::shared_ptr<ExportedResourceStore> store;

  /// Types known here are plain resources, never looked up as defines
  const TypeRegistry * types = nullptr;

  /// Unknown variables are errors rather than warnings
  bool strict = false;

  /// Modules whose classes and defines are skipped
  std::set<std::string, std::less<>> ignored_modules;

  LoggerPtr logger;
};

}  // namespace cfgcat
