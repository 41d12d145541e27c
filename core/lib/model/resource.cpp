// cfgcat/model/resource.cpp - Resource identity and metaparameters
#include "cfgcat/model/resource.hpp"

#include <algorithm>
#include <cctype>

namespace cfgcat
{

std::string capitalize_type_name(std::string_view type_name)
{
  std::string out(type_name);
  bool segment_start = true;
  for (char & c : out) {
    if (c == ':') {
      segment_start = true;
      continue;
    }
    if (segment_start) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      segment_start = false;
    }
  }
  return out;
}

std::string ResourceId::reference() const { return capitalize_type_name(type) + "[" + title + "]"; }

std::optional<ResourceId> ResourceId::parse_reference(std::string_view text)
{
  const size_t open = text.find('[');
  if (open == std::string_view::npos || open == 0 || text.size() < open + 3 || text.back() != ']') {
    return std::nullopt;
  }

  std::string type(text.substr(0, open));
  for (char & c : type) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && c != '_' && c != ':') {
      return std::nullopt;
    }
    c = static_cast<char>(std::tolower(uc));
  }
  if (type.front() == ':' || type.back() == ':') {
    return std::nullopt;
  }

  std::string title(text.substr(open + 1, text.size() - open - 2));
  return ResourceId(std::move(type), std::move(title));
}

std::string Resource::describe() const
{
  if (!position) {
    return id.reference();
  }
  return id.reference() + " (" + position->to_string() + ")";
}

const std::set<std::string, std::less<>> & metaparameters()
{
  static const std::set<std::string, std::less<>> k_metaparameters = {
    "alias", "audit",   "before", "after",    "loglevel",  "noop",
    "notify", "require", "schedule", "stage", "subscribe", "tag",
  };
  return k_metaparameters;
}

bool is_metaparameter(std::string_view name) { return metaparameters().count(name) != 0; }

bool is_dependency_metaparameter(std::string_view name)
{
  return name == "require" || name == "after" || name == "subscribe";
}

bool is_dependent_metaparameter(std::string_view name)
{
  return name == "before" || name == "notify";
}

}  // namespace cfgcat
