#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "cfgcat/facts/facts.hpp"
#include "cfgcat/interp/services.hpp"

using cfgcat::Facts;

namespace
{

/// Store whose lookups always fail
class BrokenStore : public cfgcat::NullResourceStore
{
public:
  cfgcat::Result<Facts> get_facts(std::string_view) override
  {
    return cfgcat::Result<Facts>::fail(
      cfgcat::Diagnostic::error(cfgcat::DiagnosticKind::InternalError, "store unreachable"));
  }
};

}  // namespace

TEST(Facts, SynthesizedFromNodeName)
{
  const Facts facts = cfgcat::synthesize_node_facts("web1.dc1.example.com");
  EXPECT_EQ(facts.at("fqdn"), "web1.dc1.example.com");
  EXPECT_EQ(facts.at("hostname"), "web1");
  EXPECT_EQ(facts.at("domain"), "dc1.example.com");
  EXPECT_EQ(facts.at("clientcert"), "web1.dc1.example.com");
  EXPECT_EQ(facts.at("operatingsystem"), "Ubuntu");
  EXPECT_EQ(facts.at("is_virtual"), "true");
  EXPECT_EQ(facts.count("rootrsa"), 1U);
  EXPECT_EQ(facts.size(), 9U);

  const Facts bare = cfgcat::synthesize_node_facts("localhost");
  EXPECT_EQ(bare.at("hostname"), "localhost");
  EXPECT_EQ(bare.at("domain"), "");
}

TEST(Facts, OverridesWin)
{
  const Facts merged = cfgcat::merge_facts(
    {{"osfamily", "RedHat"}, {"environment", "production"}}, {{"osfamily", "Debian"}});
  EXPECT_EQ(merged.at("osfamily"), "Debian");
  EXPECT_EQ(merged.at("environment"), "production");
}

TEST(StoreFactProvider, PrefersStoredFacts)
{
  auto store = std::make_shared<cfgcat::MemoryResourceStore>();
  store->set_facts("db1.example.com", {{"osfamily", "Debian"}});

  cfgcat::StoreFactProvider provider(store);
  const Facts stored = provider.facts_for("db1.example.com");
  EXPECT_EQ(stored.size(), 1U);
  EXPECT_EQ(stored.at("osfamily"), "Debian");

  const Facts synthesized = provider.facts_for("web1.example.com");
  EXPECT_EQ(synthesized.at("hostname"), "web1");
}

TEST(StoreFactProvider, FallsBackWhenStoreFailsOrIsMissing)
{
  cfgcat::StoreFactProvider broken(std::make_shared<BrokenStore>());
  EXPECT_EQ(broken.facts_for("web1.example.com").at("fqdn"), "web1.example.com");

  cfgcat::StoreFactProvider none(nullptr);
  EXPECT_EQ(none.facts_for("web1.example.com").at("domain"), "example.com");
}
