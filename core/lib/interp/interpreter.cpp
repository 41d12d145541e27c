// cfgcat/interp/interpreter.cpp - Manifest evaluation into declared resources
#include "cfgcat/interp/interpreter.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>

#include "cfgcat/basic/casting.hpp"
#include "cfgcat/types/type_registry.hpp"

namespace cfgcat
{
namespace
{

// ============================================================================
// Evaluation state
// ============================================================================

/// Aborts an evaluation; interpret() turns it into the failed Result
class EvaluationError : public std::exception
{
public:
  explicit EvaluationError(Diagnostic diag) : diag_(std::move(diag)) {}

  [[nodiscard]] const char * what() const noexcept override { return diag_.message.c_str(); }
  [[nodiscard]] const Diagnostic & diagnostic() const noexcept { return diag_; }

private:
  Diagnostic diag_;
};

struct Scope
{
  std::string name;  ///< "" for the top scope, "node", a class name or a define instance
  Scope * parent = nullptr;
  VariableMap variables;

  /// Resource defaults by type name
  std::map<std::string, Attributes, std::less<>> defaults;
};

template <typename Decl>
struct Definition
{
  const Decl * stmt = nullptr;
  ParsedManifestPtr manifest;
};

struct Declared
{
  Resource resource;
  Scope * scope = nullptr;  ///< nullptr for collected resources
};

struct PendingChain
{
  std::vector<ResourceId> from;
  ChainOp op = ChainOp::Before;
  std::vector<ResourceId> to;
  SourcePosition position;
};

struct PendingCollector
{
  ResourceQuery query;
  SourcePosition position;
};

/// Nesting limit for class and define bodies evaluated inside one another
constexpr size_t k_max_expansion_depth = 200;

/// Sets a slot for the lifetime of the guard
template <typename T>
class Restore
{
public:
  Restore(T & slot, T value) : slot_(slot), saved_(std::move(slot)) { slot_ = std::move(value); }
  ~Restore() { slot_ = std::move(saved_); }

  Restore(const Restore &) = delete;
  Restore & operator=(const Restore &) = delete;

private:
  T & slot_;
  T saved_;
};

/// "::Foo::Bar" -> "foo::bar"
std::string normalize_class_name(std::string_view name)
{
  if (name.substr(0, 2) == "::") {
    name.remove_prefix(2);
  }
  std::string out;
  out.reserve(name.size());
  for (const char c : name) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string_view module_of(std::string_view name)
{
  const size_t sep = name.find("::");
  return sep == std::string_view::npos ? name : name.substr(0, sep);
}

std::string join_interpolated(const std::vector<Value> & values)
{
  std::string out;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += " ";
    }
    out += values[i].to_interpolated();
  }
  return out;
}

void add_reference(Attributes & attrs, const std::string & name, const std::string & reference)
{
  auto it = attrs.find(name);
  if (it == attrs.end() || it->second.is_undef()) {
    attrs[name] = Value::make_string(reference);
    return;
  }

  std::vector<Value> refs;
  if (it->second.is_array()) {
    refs = it->second.as_array();
  } else {
    refs.push_back(it->second);
  }
  for (const auto & existing : refs) {
    if (existing.is_string() && existing.as_string() == reference) {
      return;
    }
  }
  refs.push_back(Value::make_string(reference));
  it->second = Value::make_array(std::move(refs));
}

// ============================================================================
// Evaluator
// ============================================================================

class Evaluator
{
public:
  Evaluator(const InterpreterServices & services, const InterpreterRequest & request)
  : services_(services), request_(request)
  {
  }

  InterpreterOutput run();

private:
  // === Scopes and definitions ===
  Scope * new_scope(std::string name, Scope * parent);

  template <typename Range>
  void register_definitions(const ParsedManifestPtr & manifest, const Range & stmts);
  bool load_unit(TopLevelType type, const std::string & name);
  const Definition<ClassStmt> * find_class(const std::string & name);
  const Definition<DefineStmt> * find_define(const std::string & type);
  [[nodiscard]] bool is_ignored(std::string_view name) const;

  // === Statements ===
  template <typename Range>
  void eval_block(const Range & stmts);
  void eval_stmt(const Stmt * stmt);
  void eval_node(const NodeStmt * stmt);
  void eval_include(const IncludeStmt * stmt);
  void eval_resource(const ResourceStmt * stmt);
  void eval_defaults(const ResourceDefaultsStmt * stmt);
  void eval_assign(const AssignStmt * stmt);
  void eval_if(const IfStmt * stmt);
  void eval_case(const CaseStmt * stmt);
  void eval_call_stmt(const CallStmt * stmt);
  void eval_collector(const CollectorStmt * stmt);
  void eval_chain(const ChainStmt * stmt);

  // === Declarations ===
  void declare(
    const std::string & type, const std::string & title, const Attributes & attrs, bool exported,
    const AstNode * at);
  void declare_class(std::string_view name, const Attributes * params, const AstNode * at);
  void expand_define(
    const Definition<DefineStmt> & def, const std::string & type, const std::string & title,
    Attributes attrs, const AstNode * at);
  void bind_parameters(
    gsl::span<ParamDecl *> params, Attributes given, const std::string & owner,
    const SourcePosition & call_position);
  void add_resource(Resource res, Scope * scope, const AstNode * at);
  Attributes eval_attributes(gsl::span<AttributeDecl *> attrs, std::string_view owner);

  // === Expressions ===
  Value eval(const Expr * expr);
  Value eval_call(const FunctionCallExpr * call);
  Value eval_selector(const SelectorExpr * expr);
  Value render_templates(TemplateRequest::Source source, const FunctionCallExpr * call);
  Value lookup_hiera(const FunctionCallExpr * call);
  Value lookup_variable(std::string_view name, const AstNode * at);
  std::vector<std::string> titles_of(const Value & v, const AstNode * at);
  std::vector<ResourceId> references_of(const Value & v, const AstNode * at);
  [[nodiscard]] VariableMap visible_variables() const;

  // === Finalization ===
  void run_collectors();
  [[nodiscard]] bool same_declaration(const Resource & local, const Resource & collected) const;
  void apply_defaults();
  void apply_chains();

  // === Diagnostics ===
  [[nodiscard]] std::optional<SourcePosition> position_of(const AstNode * node) const;
  [[noreturn]] void fail(DiagnosticKind kind, const AstNode * at, std::string message) const;
  [[noreturn]] void fail_at(
    DiagnosticKind kind, std::optional<SourcePosition> position, std::string message) const;
  void check_expansion_depth(
    const std::string & what, const std::optional<SourcePosition> & at) const;
  void warn(Severity severity, const AstNode * at, std::string message);

  template <typename... Args>
  void debug(fmt::format_string<Args...> format, Args &&... args)
  {
    if (services_.logger) {
      services_.logger->debug(format, std::forward<Args>(args)...);
    }
  }

  const InterpreterServices & services_;
  const InterpreterRequest & request_;

  std::vector<std::unique_ptr<Scope>> scopes_;
  Scope * top_ = nullptr;
  Scope * scope_ = nullptr;
  ParsedManifestPtr manifest_;

  std::map<std::string, Definition<ClassStmt>, std::less<>> classes_;
  std::map<std::string, Definition<DefineStmt>, std::less<>> defines_;
  std::set<std::string, std::less<>> attempted_units_;
  std::set<std::string, std::less<>> declared_classes_;
  std::map<std::string, Scope *, std::less<>> class_scopes_;
  std::set<ResourceId> define_instances_;
  size_t expansion_depth_ = 0;

  std::vector<Declared> declared_;
  std::map<ResourceId, size_t> local_index_;
  std::map<ResourceId, size_t> exported_index_;

  std::vector<PendingChain> chains_;
  std::vector<PendingCollector> collectors_;
  DiagnosticBag warnings_;
};

// ============================================================================
// Diagnostics
// ============================================================================

std::optional<SourcePosition> Evaluator::position_of(const AstNode * node) const
{
  if (node == nullptr || !manifest_ || !node->get_range().is_valid()) {
    return std::nullopt;
  }
  return manifest_->position(node);
}

void Evaluator::fail(DiagnosticKind kind, const AstNode * at, std::string message) const
{
  fail_at(kind, position_of(at), std::move(message));
}

void Evaluator::fail_at(
  DiagnosticKind kind, std::optional<SourcePosition> position, std::string message) const
{
  throw EvaluationError(Diagnostic::error(kind, std::move(message), std::move(position)));
}

void Evaluator::check_expansion_depth(
  const std::string & what, const std::optional<SourcePosition> & at) const
{
  if (expansion_depth_ >= k_max_expansion_depth) {
    fail_at(
      DiagnosticKind::InterpreterError, at,
      fmt::format(
        "expanding {} exceeds the nesting limit of {} class and define bodies", what,
        k_max_expansion_depth));
  }
}

void Evaluator::warn(Severity severity, const AstNode * at, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.kind = DiagnosticKind::InterpreterError;
  d.message = std::move(message);
  d.location = position_of(at);
  warnings_.add(std::move(d));
}

// ============================================================================
// Scopes and definitions
// ============================================================================

Scope * Evaluator::new_scope(std::string name, Scope * parent)
{
  auto scope = std::make_unique<Scope>();
  scope->name = std::move(name);
  scope->parent = parent;
  scopes_.push_back(std::move(scope));
  return scopes_.back().get();
}

template <typename Range>
void Evaluator::register_definitions(const ParsedManifestPtr & manifest, const Range & stmts)
{
  for (const Stmt * stmt : stmts) {
    if (const auto * cls = dyn_cast<ClassStmt>(stmt)) {
      classes_.emplace(std::string(cls->name), Definition<ClassStmt>{cls, manifest});
    } else if (const auto * def = dyn_cast<DefineStmt>(stmt)) {
      defines_.emplace(std::string(def->name), Definition<DefineStmt>{def, manifest});
    }
  }
}

bool Evaluator::load_unit(TopLevelType type, const std::string & name)
{
  if (!services_.statements) {
    return false;
  }
  const std::string key = fmt::format("{}:{}", to_string(type), name);
  if (!attempted_units_.insert(key).second) {
    return false;
  }

  debug("loading {} '{}'", to_string(type), name);
  auto loaded = services_.statements(type, name);
  if (!loaded) {
    Diagnostic diag = std::move(loaded).error();
    diag.notes.push_back(fmt::format("while loading {} '{}'", to_string(type), name));
    throw EvaluationError(std::move(diag));
  }
  ParsedManifestPtr manifest = std::move(loaded).value();
  if (!manifest || manifest->program == nullptr) {
    return false;
  }
  register_definitions(manifest, manifest->program->stmts);
  return true;
}

const Definition<ClassStmt> * Evaluator::find_class(const std::string & name)
{
  auto it = classes_.find(name);
  if (it == classes_.end() && load_unit(TopLevelType::Class, name)) {
    it = classes_.find(name);
  }
  return it == classes_.end() ? nullptr : &it->second;
}

const Definition<DefineStmt> * Evaluator::find_define(const std::string & type)
{
  if (services_.types != nullptr && services_.types->contains(type)) {
    return nullptr;
  }
  auto it = defines_.find(type);
  if (it == defines_.end() && load_unit(TopLevelType::Define, type)) {
    it = defines_.find(type);
  }
  return it == defines_.end() ? nullptr : &it->second;
}

bool Evaluator::is_ignored(std::string_view name) const
{
  return services_.ignored_modules.count(module_of(name)) != 0;
}

// ============================================================================
// Run
// ============================================================================

InterpreterOutput Evaluator::run()
{
  top_ = new_scope("", nullptr);
  for (const auto & [name, value] : request_.facts) {
    top_->variables[name] = Value::make_string(value);
  }

  register_definitions(request_.manifest, request_.statements);
  {
    Restore<ParsedManifestPtr> manifest(manifest_, request_.manifest);
    Restore<Scope *> scope(scope_, top_);
    eval_block(request_.statements);
  }

  run_collectors();
  apply_defaults();
  apply_chains();

  InterpreterOutput out;
  out.resources.reserve(declared_.size());
  for (auto & entry : declared_) {
    out.resources.push_back(std::move(entry.resource));
  }
  out.warnings = warnings_.all();
  return out;
}

// ============================================================================
// Statements
// ============================================================================

template <typename Range>
void Evaluator::eval_block(const Range & stmts)
{
  for (const Stmt * stmt : stmts) {
    eval_stmt(stmt);
  }
}

void Evaluator::eval_stmt(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::NodeDef:
      eval_node(cast<NodeStmt>(stmt));
      break;
    case NodeKind::ClassDef:
      classes_.emplace(
        std::string(cast<ClassStmt>(stmt)->name),
        Definition<ClassStmt>{cast<ClassStmt>(stmt), manifest_});
      break;
    case NodeKind::DefineDef:
      defines_.emplace(
        std::string(cast<DefineStmt>(stmt)->name),
        Definition<DefineStmt>{cast<DefineStmt>(stmt), manifest_});
      break;
    case NodeKind::Include:
      eval_include(cast<IncludeStmt>(stmt));
      break;
    case NodeKind::Resource:
      eval_resource(cast<ResourceStmt>(stmt));
      break;
    case NodeKind::ResourceDefaults:
      eval_defaults(cast<ResourceDefaultsStmt>(stmt));
      break;
    case NodeKind::Assign:
      eval_assign(cast<AssignStmt>(stmt));
      break;
    case NodeKind::If:
      eval_if(cast<IfStmt>(stmt));
      break;
    case NodeKind::Case:
      eval_case(cast<CaseStmt>(stmt));
      break;
    case NodeKind::Call:
      eval_call_stmt(cast<CallStmt>(stmt));
      break;
    case NodeKind::Collector:
      eval_collector(cast<CollectorStmt>(stmt));
      break;
    case NodeKind::Chain:
      eval_chain(cast<ChainStmt>(stmt));
      break;
    default:
      fail(
        DiagnosticKind::InternalError, stmt,
        fmt::format("unexpected {} in statement position", to_string(stmt->get_kind())));
  }
}

void Evaluator::eval_node(const NodeStmt * stmt)
{
  if (scope_ != top_) {
    fail(DiagnosticKind::InterpreterError, stmt, "node definitions are only allowed at top level");
  }
  Restore<Scope *> scope(scope_, new_scope("node", top_));
  eval_block(stmt->body);
}

void Evaluator::eval_include(const IncludeStmt * stmt)
{
  for (const Expr * expr : stmt->classes) {
    for (const auto & name : titles_of(eval(expr), expr)) {
      declare_class(name, nullptr, expr);
    }
  }
}

void Evaluator::eval_resource(const ResourceStmt * stmt)
{
  const std::string type(stmt->type_name);
  if (type != "class" && is_ignored(type)) {
    debug("skipping resources of ignored module type '{}'", type);
    return;
  }

  for (const ResourceBody * body : stmt->bodies) {
    const Value title = eval(body->title);
    const auto titles = titles_of(title, body->title);
    const Attributes attrs = eval_attributes(
      body->attrs, fmt::format("{}[{}]", capitalize_type_name(type), title.to_interpolated()));
    for (const auto & t : titles) {
      declare(type, t, attrs, stmt->exported, body);
    }
  }
}

void Evaluator::eval_defaults(const ResourceDefaultsStmt * stmt)
{
  const std::string type(stmt->type_name);
  Attributes attrs = eval_attributes(stmt->attrs, capitalize_type_name(type));
  Attributes & defaults = scope_->defaults[type];
  for (auto & [name, value] : attrs) {
    defaults[name] = std::move(value);
  }
}

void Evaluator::eval_assign(const AssignStmt * stmt)
{
  const std::string name(stmt->name);
  if (scope_->variables.count(name) != 0) {
    fail(
      DiagnosticKind::InterpreterError, stmt,
      fmt::format("cannot reassign variable ${}", name));
  }
  scope_->variables[name] = eval(stmt->value);
}

void Evaluator::eval_if(const IfStmt * stmt)
{
  for (const IfBranch * branch : stmt->branches) {
    if (branch->condition == nullptr || is_truthy(eval(branch->condition))) {
      eval_block(branch->body);
      return;
    }
  }
}

void Evaluator::eval_case(const CaseStmt * stmt)
{
  const Value subject = eval(stmt->subject);
  const CaseClause * fallback = nullptr;

  for (const CaseClause * clause : stmt->clauses) {
    if (clause->is_default) {
      fallback = clause;
      continue;
    }
    for (const Expr * candidate : clause->values) {
      if (loosely_equal(eval(candidate), subject)) {
        eval_block(clause->body);
        return;
      }
    }
  }
  if (fallback != nullptr) {
    eval_block(fallback->body);
  }
}

void Evaluator::eval_call_stmt(const CallStmt * stmt)
{
  const FunctionCallExpr * call = stmt->call;
  const std::string_view name = call->name;

  const auto message = [&]() {
    std::vector<Value> args;
    for (const Expr * arg : call->args) {
      args.push_back(eval(arg));
    }
    return join_interpolated(args);
  };

  if (name == "notice" || name == "info" || name == "debug") {
    warn(Severity::Notice, call, message());
  } else if (name == "warning") {
    warn(Severity::Warning, call, message());
  } else if (name == "err" || name == "alert" || name == "crit" || name == "emerg") {
    warn(Severity::Error, call, message());
  } else if (name == "include" || name == "contain") {
    for (const Expr * arg : call->args) {
      for (const auto & cls : titles_of(eval(arg), arg)) {
        declare_class(cls, nullptr, arg);
      }
    }
  } else {
    (void)eval_call(call);
  }
}

void Evaluator::eval_collector(const CollectorStmt * stmt)
{
  PendingCollector pending;
  pending.query.type = std::string(stmt->type_name);
  pending.query.exclude_node = request_.node;
  if (!stmt->attr.empty()) {
    pending.query.attribute = std::string(stmt->attr);
    pending.query.op = stmt->op == BinaryOp::Ne ? ResourceQuery::Op::NotEqual
                                                : ResourceQuery::Op::Equal;
    pending.query.value = eval(stmt->value);
  }
  if (auto pos = position_of(stmt)) {
    pending.position = *pos;
  }
  collectors_.push_back(std::move(pending));
}

void Evaluator::eval_chain(const ChainStmt * stmt)
{
  std::vector<std::vector<ResourceId>> operands;
  for (const Expr * operand : stmt->operands) {
    operands.push_back(references_of(eval(operand), operand));
  }

  const auto position = position_of(stmt);
  for (size_t i = 0; i < stmt->ops.size() && i + 1 < operands.size(); ++i) {
    PendingChain link;
    link.from = operands[i];
    link.op = stmt->ops[i];
    link.to = operands[i + 1];
    if (position) {
      link.position = *position;
    }
    chains_.push_back(std::move(link));
  }
}

// ============================================================================
// Declarations
// ============================================================================

Attributes Evaluator::eval_attributes(gsl::span<AttributeDecl *> attrs, std::string_view owner)
{
  Attributes out;
  for (const AttributeDecl * attr : attrs) {
    if (!out.emplace(std::string(attr->name), eval(attr->value)).second) {
      fail(
        DiagnosticKind::InterpreterError, attr,
        fmt::format("parameter '{}' is set twice for {}", attr->name, owner));
    }
  }
  return out;
}

void Evaluator::declare(
  const std::string & type, const std::string & title, const Attributes & attrs, bool exported,
  const AstNode * at)
{
  if (type == "class") {
    declare_class(title, &attrs, at);
    return;
  }
  if (const auto * def = find_define(type)) {
    expand_define(*def, type, title, attrs, at);
    return;
  }

  Resource res;
  res.id = ResourceId(type, title);
  res.attributes = attrs;
  res.position = position_of(at);
  res.exported = exported;
  add_resource(std::move(res), scope_, at);
}

void Evaluator::add_resource(Resource res, Scope * scope, const AstNode * at)
{
  auto & index = res.exported ? exported_index_ : local_index_;
  auto it = index.find(res.id);
  if (it != index.end()) {
    const Resource & previous = declared_[it->second].resource;
    Diagnostic diag = Diagnostic::error(
      DiagnosticKind::InterpreterError,
      fmt::format("duplicate declaration: {} is already declared", res.id.reference()),
      res.position ? res.position : position_of(at));
    if (previous.position) {
      diag.notes.push_back("previous declaration at " + previous.position->to_string());
    }
    throw EvaluationError(std::move(diag));
  }

  index.emplace(res.id, declared_.size());
  declared_.push_back(Declared{std::move(res), scope});
}

void Evaluator::declare_class(std::string_view name, const Attributes * params, const AstNode * at)
{
  const std::string cname = normalize_class_name(name);
  if (cname.empty()) {
    fail(DiagnosticKind::InterpreterError, at, "empty class name");
  }
  if (is_ignored(cname)) {
    debug("skipping class '{}' of an ignored module", cname);
    return;
  }
  if (declared_classes_.count(cname) != 0) {
    if (params != nullptr) {
      fail(
        DiagnosticKind::InterpreterError, at,
        fmt::format("duplicate declaration: class '{}' is already declared", cname));
    }
    return;
  }

  const Definition<ClassStmt> * def = find_class(cname);
  if (def == nullptr) {
    fail(DiagnosticKind::InterpreterError, at, fmt::format("unknown class '{}'", cname));
  }
  const auto call_position = position_of(at);
  check_expansion_depth(fmt::format("Class[{}]", cname), call_position);
  Restore<size_t> depth(expansion_depth_, expansion_depth_ + 1);
  declared_classes_.insert(cname);

  Scope * parent = top_;
  if (!def->stmt->parent.empty()) {
    const std::string parent_name = normalize_class_name(def->stmt->parent);
    {
      Restore<ParsedManifestPtr> manifest(manifest_, def->manifest);
      declare_class(parent_name, nullptr, def->stmt);
    }
    auto it = class_scopes_.find(parent_name);
    if (it == class_scopes_.end()) {
      fail_at(
        DiagnosticKind::InterpreterError, call_position,
        fmt::format("class '{}' inherits from '{}', which could not be evaluated", cname, parent_name));
    }
    parent = it->second;
  }

  debug("evaluating class '{}'", cname);
  Scope * scope = new_scope(cname, parent);
  class_scopes_[cname] = scope;
  scope->variables["title"] = Value::make_string(cname);
  scope->variables["name"] = Value::make_string(cname);

  Restore<ParsedManifestPtr> manifest(manifest_, def->manifest);
  Restore<Scope *> current(scope_, scope);
  bind_parameters(
    def->stmt->params, params != nullptr ? *params : Attributes{},
    fmt::format("Class[{}]", cname), call_position.value_or(SourcePosition{}));
  eval_block(def->stmt->body);
}

void Evaluator::expand_define(
  const Definition<DefineStmt> & def, const std::string & type, const std::string & title,
  Attributes attrs, const AstNode * at)
{
  const ResourceId instance(type, title);
  const auto call_position = position_of(at);
  check_expansion_depth(instance.reference(), call_position);
  Restore<size_t> depth(expansion_depth_, expansion_depth_ + 1);
  if (!define_instances_.insert(instance).second) {
    fail_at(
      DiagnosticKind::InterpreterError, call_position,
      fmt::format("duplicate declaration: {} is already declared", instance.reference()));
  }

  // Metaparameters of the instance are handed down to what it declares
  Attributes inherited;
  for (auto it = attrs.begin(); it != attrs.end();) {
    const bool is_param = std::any_of(
      def.stmt->params.begin(), def.stmt->params.end(),
      [&](const ParamDecl * p) { return p->name == it->first; });
    if (is_metaparameter(it->first) && !is_param) {
      inherited.emplace(it->first, std::move(it->second));
      it = attrs.erase(it);
    } else {
      ++it;
    }
  }

  Scope * scope = new_scope(instance.reference(), top_);
  scope->variables["title"] = Value::make_string(title);
  const Value * name = nullptr;
  auto name_it = attrs.find("name");
  if (name_it != attrs.end() && !name_it->second.is_undef()) {
    name = &name_it->second;
  }
  scope->variables["name"] = name != nullptr ? *name : Value::make_string(title);

  const size_t first = declared_.size();
  {
    Restore<ParsedManifestPtr> manifest(manifest_, def.manifest);
    Restore<Scope *> current(scope_, scope);
    bind_parameters(
      def.stmt->params, std::move(attrs), instance.reference(),
      call_position.value_or(SourcePosition{}));
    eval_block(def.stmt->body);
  }

  for (size_t i = first; i < declared_.size(); ++i) {
    for (const auto & [meta, value] : inherited) {
      declared_[i].resource.attributes.emplace(meta, value);
    }
  }
}

void Evaluator::bind_parameters(
  gsl::span<ParamDecl *> params, Attributes given, const std::string & owner,
  const SourcePosition & call_position)
{
  const auto where = call_position.line > 0 ? std::optional<SourcePosition>(call_position)
                                            : std::nullopt;
  for (const ParamDecl * param : params) {
    const std::string pname(param->name);
    auto it = given.find(pname);
    if (it != given.end()) {
      Value value = std::move(it->second);
      given.erase(it);
      if (!value.is_undef()) {
        scope_->variables[pname] = std::move(value);
        continue;
      }
    }
    if (param->default_value == nullptr) {
      fail_at(
        DiagnosticKind::InterpreterError, where,
        fmt::format("missing parameter '{}' for {}", pname, owner));
    }
    scope_->variables[pname] = eval(param->default_value);
  }

  for (const auto & [name, value] : given) {
    if (name == "name" || is_metaparameter(name)) {
      continue;
    }
    fail_at(
      DiagnosticKind::InterpreterError, where,
      fmt::format("unknown parameter '{}' for {}", name, owner));
  }
}

// ============================================================================
// Expressions
// ============================================================================

Value Evaluator::eval(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::StringLiteral:
      return Value::make_string(std::string(cast<StringLiteralExpr>(expr)->value));

    case NodeKind::InterpolatedString: {
      std::string out;
      for (const Expr * part : cast<InterpolatedStringExpr>(expr)->parts) {
        out += eval(part).to_interpolated();
      }
      return Value::make_string(std::move(out));
    }

    case NodeKind::NumberLiteral: {
      const auto * num = cast<NumberLiteralExpr>(expr);
      auto parsed = Decimal::parse(num->text);
      if (!parsed) {
        fail(DiagnosticKind::InterpreterError, expr, fmt::format("invalid number '{}'", num->text));
      }
      return Value::make_number(std::move(*parsed));
    }

    case NodeKind::BoolLiteral:
      return Value::make_bool(cast<BoolLiteralExpr>(expr)->value);

    case NodeKind::UndefLiteral:
      return Value::make_undef();

    case NodeKind::VarRef:
      return lookup_variable(cast<VarRefExpr>(expr)->name, expr);

    case NodeKind::BareWord:
      return Value::make_string(std::string(cast<BareWordExpr>(expr)->word));

    case NodeKind::Array: {
      std::vector<Value> elements;
      for (const Expr * element : cast<ArrayExpr>(expr)->elements) {
        elements.push_back(eval(element));
      }
      return Value::make_array(std::move(elements));
    }

    case NodeKind::ResourceRef: {
      const auto * ref = cast<ResourceRefExpr>(expr);
      const std::string type(ref->type_name);
      std::vector<Value> refs;
      for (const Expr * title_expr : ref->titles) {
        for (auto & title : titles_of(eval(title_expr), title_expr)) {
          if (type == "class") {
            title = normalize_class_name(title);
          }
          refs.push_back(Value::make_string(ResourceId(type, title).reference()));
        }
      }
      if (refs.size() == 1) {
        return refs.front();
      }
      return Value::make_array(std::move(refs));
    }

    case NodeKind::FunctionCall:
      return eval_call(cast<FunctionCallExpr>(expr));

    case NodeKind::Unary:
      return Value::make_bool(!is_truthy(eval(cast<UnaryExpr>(expr)->operand)));

    case NodeKind::Binary: {
      const auto * bin = cast<BinaryExpr>(expr);
      switch (bin->op) {
        case BinaryOp::And:
          return Value::make_bool(is_truthy(eval(bin->lhs)) && is_truthy(eval(bin->rhs)));
        case BinaryOp::Or:
          return Value::make_bool(is_truthy(eval(bin->lhs)) || is_truthy(eval(bin->rhs)));
        case BinaryOp::Eq:
          return Value::make_bool(loosely_equal(eval(bin->lhs), eval(bin->rhs)));
        case BinaryOp::Ne:
          return Value::make_bool(!loosely_equal(eval(bin->lhs), eval(bin->rhs)));
      }
      break;
    }

    case NodeKind::Selector:
      return eval_selector(cast<SelectorExpr>(expr));

    case NodeKind::Missing:
      fail(DiagnosticKind::InterpreterError, expr, "cannot evaluate an incomplete expression");

    default:
      break;
  }
  fail(
    DiagnosticKind::InternalError, expr,
    fmt::format("unexpected {} in expression position", to_string(expr->get_kind())));
}

Value Evaluator::eval_selector(const SelectorExpr * expr)
{
  const Value subject = eval(expr->subject);
  const SelectorCase * fallback = nullptr;
  for (const SelectorCase * c : expr->cases) {
    if (c->match == nullptr) {
      fallback = c;
      continue;
    }
    if (loosely_equal(eval(c->match), subject)) {
      return eval(c->result);
    }
  }
  if (fallback == nullptr) {
    fail(
      DiagnosticKind::InterpreterError, expr,
      fmt::format("no selector case matches {}", subject.to_display()));
  }
  return eval(fallback->result);
}

Value Evaluator::eval_call(const FunctionCallExpr * call)
{
  const std::string_view name = call->name;

  if (name == "template") {
    return render_templates(TemplateRequest::Source::File, call);
  }
  if (name == "inline_template") {
    return render_templates(TemplateRequest::Source::Inline, call);
  }
  if (name == "hiera") {
    return lookup_hiera(call);
  }
  if (name == "fail") {
    std::vector<Value> args;
    for (const Expr * arg : call->args) {
      args.push_back(eval(arg));
    }
    fail(DiagnosticKind::InterpreterError, call, join_interpolated(args));
  }
  fail(DiagnosticKind::InterpreterError, call, fmt::format("unknown function '{}'", name));
}

Value Evaluator::render_templates(TemplateRequest::Source source, const FunctionCallExpr * call)
{
  if (call->args.empty()) {
    fail(
      DiagnosticKind::InterpreterError, call,
      fmt::format("{}() expects at least one argument", call->name));
  }
  if (!services_.templates) {
    fail(DiagnosticKind::InterpreterError, call, "no template evaluator is configured");
  }

  std::string out;
  for (const Expr * arg : call->args) {
    const Value text = eval(arg);
    if (!text.is_string()) {
      fail(
        DiagnosticKind::InterpreterError, arg,
        fmt::format("{}() expects strings, not {}", call->name, text.to_display()));
    }

    TemplateRequest request;
    request.source = source;
    request.text = text.as_string();
    request.node = request_.node;
    request.scope = scope_->name;
    request.variables = visible_variables();

    auto rendered = services_.templates->render(request);
    if (!rendered) {
      Diagnostic diag = std::move(rendered).error();
      if (!diag.location) {
        diag.location = position_of(call);
      }
      diag.notes.push_back(fmt::format("while evaluating {}('{}')", call->name, request.text));
      throw EvaluationError(std::move(diag));
    }
    out += rendered.value();
  }
  return Value::make_string(std::move(out));
}

Value Evaluator::lookup_hiera(const FunctionCallExpr * call)
{
  if (call->args.empty() || call->args.size() > 2) {
    fail(DiagnosticKind::InterpreterError, call, "hiera() expects a key and an optional default");
  }
  const Value key = eval(call->args[0]);
  if (!key.is_string()) {
    fail(
      DiagnosticKind::InterpreterError, call->args[0],
      fmt::format("hiera() key must be a string, not {}", key.to_display()));
  }

  if (services_.hiera) {
    auto found = services_.hiera->lookup(key.as_string(), visible_variables());
    if (!found) {
      Diagnostic diag = std::move(found).error();
      if (!diag.location) {
        diag.location = position_of(call);
      }
      diag.notes.push_back(fmt::format("while looking up '{}'", key.as_string()));
      throw EvaluationError(std::move(diag));
    }
    if (found.value()) {
      return *found.value();
    }
  }
  if (call->args.size() == 2) {
    return eval(call->args[1]);
  }
  fail(
    DiagnosticKind::InterpreterError, call,
    fmt::format("hiera lookup of '{}' found nothing and no default was given", key.as_string()));
}

Value Evaluator::lookup_variable(std::string_view name, const AstNode * at)
{
  std::string_view bare = name;
  const bool from_top = bare.substr(0, 2) == "::";
  if (from_top) {
    bare.remove_prefix(2);
  }

  const size_t sep = bare.rfind("::");
  if (sep != std::string_view::npos) {
    const std::string cls = normalize_class_name(bare.substr(0, sep));
    const std::string_view var = bare.substr(sep + 2);
    auto scope = class_scopes_.find(cls);
    if (scope != class_scopes_.end()) {
      auto it = scope->second->variables.find(var);
      if (it != scope->second->variables.end()) {
        return it->second;
      }
    }
  } else if (from_top) {
    auto it = top_->variables.find(bare);
    if (it != top_->variables.end()) {
      return it->second;
    }
  } else {
    for (const Scope * s = scope_; s != nullptr; s = s->parent) {
      auto it = s->variables.find(bare);
      if (it != s->variables.end()) {
        return it->second;
      }
    }
  }

  if (services_.strict) {
    fail(DiagnosticKind::InterpreterError, at, fmt::format("unknown variable ${}", name));
  }
  warn(Severity::Warning, at, fmt::format("unknown variable ${}", name));
  return Value::make_undef();
}

std::vector<std::string> Evaluator::titles_of(const Value & v, const AstNode * at)
{
  std::vector<std::string> titles;
  switch (v.kind()) {
    case ValueKind::String:
      if (v.as_string().empty()) {
        fail(DiagnosticKind::InterpreterError, at, "empty title");
      }
      titles.push_back(v.as_string());
      break;
    case ValueKind::Number:
      titles.push_back(v.as_number().to_string());
      break;
    case ValueKind::Array:
      for (const auto & element : v.as_array()) {
        for (auto & t : titles_of(element, at)) {
          titles.push_back(std::move(t));
        }
      }
      break;
    case ValueKind::Boolean:
    case ValueKind::Undefined:
      fail(
        DiagnosticKind::InterpreterError, at,
        fmt::format("invalid title {}", v.to_display()));
  }
  return titles;
}

std::vector<ResourceId> Evaluator::references_of(const Value & v, const AstNode * at)
{
  std::vector<ResourceId> ids;
  if (v.is_array()) {
    for (const auto & element : v.as_array()) {
      for (auto & id : references_of(element, at)) {
        ids.push_back(std::move(id));
      }
    }
    return ids;
  }

  auto id = v.is_string() ? ResourceId::parse_reference(v.as_string()) : std::nullopt;
  if (!id) {
    fail(
      DiagnosticKind::UnresolvedReference, at,
      fmt::format("{} is not a resource reference", v.to_display()));
  }
  ids.push_back(std::move(*id));
  return ids;
}

VariableMap Evaluator::visible_variables() const
{
  VariableMap vars;
  for (const Scope * s = scope_; s != nullptr; s = s->parent) {
    for (const auto & [name, value] : s->variables) {
      vars.emplace(name, value);
    }
  }
  for (const auto & [name, value] : top_->variables) {
    vars.emplace("::" + name, value);
  }
  return vars;
}

// ============================================================================
// Finalization
// ============================================================================

void Evaluator::run_collectors()
{
  for (const auto & pending : collectors_) {
    std::vector<Resource> found;

    for (const auto & entry : declared_) {
      if (entry.resource.exported && pending.query.matches(entry.resource)) {
        Resource own = entry.resource;
        own.exported = false;
        found.push_back(std::move(own));
      }
    }

    if (services_.store) {
      auto stored = services_.store->get_resources(pending.query);
      if (!stored) {
        Diagnostic diag = std::move(stored).error();
        diag.location = pending.position;
        diag.notes.push_back("while collecting exported " + capitalize_type_name(pending.query.type));
        throw EvaluationError(std::move(diag));
      }
      for (auto & res : stored.value()) {
        res.exported = false;
        found.push_back(std::move(res));
      }
    }

    for (auto & res : found) {
      auto it = local_index_.find(res.id);
      if (it != local_index_.end()) {
        const Resource & existing = declared_[it->second].resource;
        if (!existing.exported_by.empty() || same_declaration(existing, res)) {
          continue;
        }
        fail_at(
          DiagnosticKind::InterpreterError, pending.position,
          fmt::format(
            "collected resource {} conflicts with a local declaration", res.id.reference()));
      }
      debug("collected {} exported by '{}'", res.id.reference(), res.exported_by);
      local_index_.emplace(res.id, declared_.size());
      declared_.push_back(Declared{std::move(res), nullptr});
    }
  }
}

/// Store copies went through type validation; the local one has not yet
bool Evaluator::same_declaration(const Resource & local, const Resource & collected) const
{
  if (local.attributes == collected.attributes) {
    return true;
  }
  if (services_.types == nullptr) {
    return false;
  }
  auto lhs = services_.types->validate(local);
  auto rhs = services_.types->validate(collected);
  return lhs && rhs && lhs.value().attributes == rhs.value().attributes;
}

void Evaluator::apply_defaults()
{
  for (auto & entry : declared_) {
    for (const Scope * s = entry.scope; s != nullptr; s = s->parent) {
      auto it = s->defaults.find(entry.resource.id.type);
      if (it == s->defaults.end()) {
        continue;
      }
      for (const auto & [name, value] : it->second) {
        entry.resource.attributes.emplace(name, value);
      }
    }
  }
}

void Evaluator::apply_chains()
{
  const auto require_declared = [&](const ResourceId & id, const SourcePosition & position) {
    auto it = local_index_.find(id);
    if (it == local_index_.end()) {
      fail_at(
        DiagnosticKind::UnresolvedReference,
        position.line > 0 ? std::optional<SourcePosition>(position) : std::nullopt,
        fmt::format("relationship with {}, which is not declared", id.reference()));
    }
    return it->second;
  };

  for (const auto & link : chains_) {
    const std::string meta = link.op == ChainOp::Before ? "before" : "notify";
    for (const auto & to : link.to) {
      require_declared(to, link.position);
    }
    for (const auto & from : link.from) {
      const size_t index = require_declared(from, link.position);
      for (const auto & to : link.to) {
        add_reference(declared_[index].resource.attributes, meta, to.reference());
      }
    }
  }
}

}  // namespace

// ============================================================================
// ManifestInterpreter
// ============================================================================

ManifestInterpreter::ManifestInterpreter(InterpreterServices services)
: services_(std::move(services))
{
}

Result<InterpreterOutput> ManifestInterpreter::interpret(const InterpreterRequest & request) const
{
  if (!request.manifest) {
    return Result<InterpreterOutput>::fail(Diagnostic::error(
      DiagnosticKind::InternalError, "interpreter request for '" + request.node + "' has no manifest"));
  }

  try {
    Evaluator evaluator(services_, request);
    return Result<InterpreterOutput>::ok(evaluator.run());
  } catch (const EvaluationError & e) {
    return Result<InterpreterOutput>::fail(e.diagnostic());
  } catch (const std::exception & e) {
    return Result<InterpreterOutput>::fail(Diagnostic::error(
      DiagnosticKind::InterpreterError,
      fmt::format("interpreter failure for '{}': {}", request.node, e.what())));
  }
}

}  // namespace cfgcat
