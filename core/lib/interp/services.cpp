// cfgcat/interp/services.cpp - Null and in-memory collaborators
#include "cfgcat/interp/services.hpp"

#include <fmt/core.h>

#include <exception>

namespace cfgcat
{

std::string_view to_string(TopLevelType type) noexcept
{
  switch (type) {
    case TopLevelType::Node:
      return "node";
    case TopLevelType::Class:
      return "class";
    case TopLevelType::Define:
      return "define";
  }
  return "node";
}

// ============================================================================
// Templates
// ============================================================================

Result<std::string> NullTemplateEvaluator::render(const TemplateRequest & request)
{
  const char * what = request.source == TemplateRequest::Source::File ? "template" : "inline template";
  return Result<std::string>::fail(Diagnostic::error(
    DiagnosticKind::InterpreterError,
    fmt::format("cannot render {} '{}': no template evaluator is configured", what, request.text)));
}

Result<std::string> SerializedTemplateEvaluator::render(const TemplateRequest & request)
{
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    return inner_->render(request);
  } catch (const std::exception & e) {
    return Result<std::string>::fail(Diagnostic::error(
      DiagnosticKind::InterpreterError,
      fmt::format("template evaluator failed on '{}': {}", request.text, e.what())));
  }
}

// ============================================================================
// Hierarchical data lookup
// ============================================================================

Result<std::optional<Value>> NullHieraLookup::lookup(
  std::string_view /*key*/, const VariableMap & /*scope*/)
{
  return Result<std::optional<Value>>::ok(std::nullopt);
}

// ============================================================================
// Exported-resource store
// ============================================================================

bool ResourceQuery::matches(const Resource & res) const
{
  if (res.id.type != type) {
    return false;
  }
  if (op == Op::Any) {
    return true;
  }

  bool found = false;
  if (attribute == "title") {
    found = loosely_equal(Value::make_string(res.id.title), value);
  } else if (const Value * v = res.find(attribute)) {
    if (v->is_array() && !value.is_array()) {
      for (const auto & element : v->as_array()) {
        found = found || loosely_equal(element, value);
      }
    } else {
      found = loosely_equal(*v, value);
    }
  }
  return op == Op::Equal ? found : !found;
}

Result<Facts> NullResourceStore::get_facts(std::string_view /*node*/)
{
  return Result<Facts>::ok({});
}

Result<std::vector<Resource>> NullResourceStore::get_resources(const ResourceQuery & /*query*/)
{
  return Result<std::vector<Resource>>::ok({});
}

Result<std::size_t> NullResourceStore::replace_exported(
  std::string_view /*node*/, std::vector<Resource> /*resources*/)
{
  return Result<std::size_t>::ok(0);
}

void MemoryResourceStore::set_facts(std::string node, Facts facts)
{
  std::lock_guard<std::mutex> lock(mutex_);
  facts_[std::move(node)] = std::move(facts);
}

Result<Facts> MemoryResourceStore::get_facts(std::string_view node)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = facts_.find(node);
  return Result<Facts>::ok(it == facts_.end() ? Facts{} : it->second);
}

Result<std::vector<Resource>> MemoryResourceStore::get_resources(const ResourceQuery & query)
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Resource> found;
  for (const auto & [node, resources] : exported_) {
    if (node == query.exclude_node) {
      continue;
    }
    for (const auto & res : resources) {
      if (query.matches(res)) {
        found.push_back(res);
      }
    }
  }
  return Result<std::vector<Resource>>::ok(std::move(found));
}

Result<std::size_t> MemoryResourceStore::replace_exported(
  std::string_view node, std::vector<Resource> resources)
{
  for (auto & res : resources) {
    res.exported = true;
    res.exported_by = std::string(node);
  }
  const std::size_t count = resources.size();

  std::lock_guard<std::mutex> lock(mutex_);
  if (resources.empty()) {
    auto it = exported_.find(node);
    if (it != exported_.end()) {
      exported_.erase(it);
    }
  } else {
    exported_[std::string(node)] = std::move(resources);
  }
  return Result<std::size_t>::ok(count);
}

std::size_t MemoryResourceStore::exported_count() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto & [node, resources] : exported_) {
    count += resources.size();
  }
  return count;
}

}  // namespace cfgcat
