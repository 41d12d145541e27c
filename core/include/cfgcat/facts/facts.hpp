// cfgcat/facts/facts.hpp - Node facts and where they come from
#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace cfgcat
{

class ExportedResourceStore;

/// Fact name -> value. A missing fact is legitimate.
using Facts = std::map<std::string, std::string>;

/**
 * Source of the facts of a node.
 */
class FactProvider
{
public:
  virtual ~FactProvider() = default;

  [[nodiscard]] virtual Facts facts_for(std::string_view node) = 0;
};

/**
 * Facts the store holds for a node, or a minimal synthesized set
 * (fqdn, hostname, domain, clientcert and placeholders) when the store has none or fails.
 */
class StoreFactProvider : public FactProvider
{
public:
  explicit StoreFactProvider(std::shared_ptr<ExportedResourceStore> store)
  : store_(std::move(store))
  {
  }

  [[nodiscard]] Facts facts_for(std::string_view node) override;

private:
  std::shared_ptr<ExportedResourceStore> store_;
};

/// fqdn, hostname (up to the first '.'), domain (after it, or empty) and clientcert,
/// plus fixed operatingsystem, puppetversion, virtual, is_virtual and rootrsa values
[[nodiscard]] Facts synthesize_node_facts(std::string_view node);

/// Facts of overrides win over base
[[nodiscard]] Facts merge_facts(Facts base, const Facts & overrides);

}  // namespace cfgcat
