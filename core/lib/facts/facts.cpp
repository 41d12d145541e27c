// cfgcat/facts/facts.cpp - Node facts and where they come from
#include "cfgcat/facts/facts.hpp"

#include "cfgcat/interp/services.hpp"

namespace cfgcat
{

Facts synthesize_node_facts(std::string_view node)
{
  const std::string fqdn(node);
  const size_t dot = fqdn.find('.');

  Facts facts;
  facts["fqdn"] = fqdn;
  facts["hostname"] = fqdn.substr(0, dot);
  facts["domain"] = dot == std::string::npos ? std::string() : fqdn.substr(dot + 1);
  facts["clientcert"] = fqdn;

  // Placeholders for a host that was never inventoried
  facts["operatingsystem"] = "Ubuntu";
  facts["puppetversion"] = "cfgcat";
  facts["virtual"] = "xenu";
  facts["is_virtual"] = "true";
  facts["rootrsa"] = "xxx";
  return facts;
}

Facts merge_facts(Facts base, const Facts & overrides)
{
  for (const auto & [name, value] : overrides) {
    base[name] = value;
  }
  return base;
}

Facts StoreFactProvider::facts_for(std::string_view node)
{
  if (store_) {
    auto stored = store_->get_facts(node);
    if (stored && !stored.value().empty()) {
      return std::move(stored).value();
    }
  }
  return synthesize_node_facts(node);
}

}  // namespace cfgcat
