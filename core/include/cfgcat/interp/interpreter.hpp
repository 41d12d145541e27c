// cfgcat/interp/interpreter.hpp - Manifest evaluation into declared resources
#pragma once

#include <string>
#include <vector>

#include "cfgcat/ast/ast.hpp"
#include "cfgcat/basic/diagnostic.hpp"
#include "cfgcat/basic/result.hpp"
#include "cfgcat/facts/facts.hpp"
#include "cfgcat/interp/services.hpp"
#include "cfgcat/model/resource.hpp"
#include "cfgcat/syntax/frontend.hpp"

namespace cfgcat
{

/// What to evaluate for one node
struct InterpreterRequest
{
  std::string node;
  Facts facts;

  /// Manifest the statements belong to; keeps them alive
  ParsedManifestPtr manifest;

  /// Top-level statements selected for the node, in source order
  std::vector<const Stmt *> statements;
};

struct InterpreterOutput
{
  /**
   * Declared resources in declaration order: local ones, exported ones
   * (exported == true) and ones collected from the store (exported_by set).
   * Define instances are expanded and do not appear.
   */
  std::vector<Resource> resources;

  /// notice/warning/err calls and non-strict unknown variables, in order
  std::vector<Diagnostic> warnings;
};

/**
 * Evaluates manifest statements for a node.
 *
 * Stateless between calls; one instance serves concurrent requests as
 * long as its services are thread-safe.
 */
class ManifestInterpreter
{
public:
  explicit ManifestInterpreter(InterpreterServices services);

  /// Fails with the first error met; no partial output
  [[nodiscard]] Result<InterpreterOutput> interpret(const InterpreterRequest & request) const;

  [[nodiscard]] const InterpreterServices & services() const noexcept { return services_; }

private:
  InterpreterServices services_;
};

}  // namespace cfgcat
