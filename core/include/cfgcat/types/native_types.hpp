// cfgcat/types/native_types.hpp - Built-in resource types
#pragma once

#include "cfgcat/types/type_registry.hpp"

namespace cfgcat
{

/**
 * Registry of the built-in types: file, package, service, user, group,
 * exec, host, cron, mount, notify, sshkey, plus anchor (no checks) and
 * stage (parameter list unchecked).
 */
[[nodiscard]] TypeRegistry make_native_type_registry();

}  // namespace cfgcat
