// cfgcat/types/native_types.cpp - Built-in resource types
#include "cfgcat/types/native_types.hpp"

namespace cfgcat
{
namespace
{

namespace v = validators;

using Rules = std::vector<ParamValidator>;

const std::vector<std::string> k_present_absent = {"present", "absent"};
const std::vector<std::string> k_booleans = {"true", "false"};

/// Parameters only checked for membership in the legal set
void add_plain(ParameterRules & rules, std::initializer_list<const char *> names)
{
  for (const char * name : names) {
    rules.emplace_back(name, Rules{});
  }
}

/// Parameters that must hold a string
void add_strings(ParameterRules & rules, std::initializer_list<const char *> names)
{
  for (const char * name : names) {
    rules.emplace_back(name, Rules{v::string});
  }
}

/// Parameters that hold one string or a list of strings
void add_string_lists(ParameterRules & rules, std::initializer_list<const char *> names)
{
  for (const char * name : names) {
    rules.emplace_back(name, Rules{v::rarray, v::strings});
  }
}

TypeMethods file_type()
{
  ParameterRules rules = {
    {"path", {v::nameval, v::fully_qualified, v::no_trailing_slash}},
    {"ensure",
     {v::default_value("present"), v::string,
      v::values({"present", "absent", "file", "directory", "link"})}},
    {"content", {v::string}},
    {"source", {v::rarray, v::strings}},
    {"recurse", {v::string, v::values({"true", "false", "remote", "inf"})}},
    {"force", {v::string, v::values(k_booleans)}},
    {"purge", {v::string, v::values(k_booleans)}},
    {"replace", {v::string, v::values(k_booleans)}},
    {"links", {v::string, v::values({"follow", "manage"})}},
    {"recurselimit", {v::integer}},
  };
  add_strings(rules, {"owner", "group", "mode", "target", "backup", "checksum", "provider"});
  add_strings(rules, {"seltype", "selrange", "selrole", "seluser", "sourceselect"});
  add_strings(rules, {"validate_cmd", "validate_replacement"});
  add_string_lists(rules, {"ignore"});
  add_plain(rules, {"selinux_ignore_defaults"});
  return make_type_methods(std::move(rules), v::validate_source_or_content);
}

TypeMethods package_type()
{
  ParameterRules rules = {
    {"name", {v::nameval}},
    {"ensure", {v::default_value("present"), v::string}},
  };
  add_strings(rules, {"provider", "source", "adminfile", "responsefile", "category"});
  add_strings(rules, {"description", "flavor", "instance", "platform", "root", "status", "vendor"});
  add_string_lists(rules, {"install_options", "uninstall_options"});
  add_plain(rules, {"allowcdrom", "configfiles"});
  return make_type_methods(std::move(rules));
}

TypeMethods service_type()
{
  ParameterRules rules = {
    {"name", {v::nameval}},
    {"ensure", {v::string, v::values({"stopped", "running", "true", "false"})}},
    {"enable", {v::string, v::values({"true", "false", "manual", "mask"})}},
    {"hasrestart", {v::string, v::values(k_booleans)}},
    {"hasstatus", {v::string, v::values(k_booleans)}},
  };
  add_strings(rules, {"binary", "control", "manifest", "pattern", "provider", "flags"});
  add_strings(rules, {"restart", "start", "status", "stop"});
  add_string_lists(rules, {"path"});
  return make_type_methods(std::move(rules));
}

TypeMethods user_type()
{
  ParameterRules rules = {
    {"name", {v::nameval}},
    {"ensure", {v::string, v::values({"present", "absent", "role"})}},
    {"uid", {v::integer}},
    {"gid", {v::string}},
    {"groups", {v::rarray, v::strings}},
    {"home", {v::string, v::fully_qualified}},
    {"shell", {v::string, v::fully_qualified}},
    {"managehome", {v::string, v::values(k_booleans)}},
    {"system", {v::string, v::values(k_booleans)}},
    {"allowdupe", {v::string, v::values(k_booleans)}},
    {"membership", {v::string, v::values({"inclusive", "minimum"})}},
    {"password_max_age", {v::integer}},
    {"password_min_age", {v::integer}},
  };
  add_strings(rules, {"comment", "password", "expiry", "provider", "purge_ssh_keys"});
  return make_type_methods(std::move(rules));
}

TypeMethods group_type()
{
  ParameterRules rules = {
    {"name", {v::nameval}},
    {"ensure", {v::string, v::values(k_present_absent)}},
    {"gid", {v::integer}},
    {"members", {v::rarray, v::strings}},
    {"system", {v::string, v::values(k_booleans)}},
    {"allowdupe", {v::string, v::values(k_booleans)}},
  };
  add_strings(rules, {"provider"});
  return make_type_methods(std::move(rules));
}

TypeMethods exec_type()
{
  ParameterRules rules = {
    {"command", {v::nameval}},
    {"cwd", {v::string, v::fully_qualified}},
    {"creates", {v::rarray, v::strings, v::fully_qualifieds}},
    {"environment", {v::rarray, v::strings}},
    {"path", {v::rarray, v::strings}},
    {"refreshonly", {v::string, v::values(k_booleans)}},
    {"logoutput", {v::string, v::values({"true", "false", "on_failure"})}},
    {"returns", {v::rarray, v::integers}},
    {"timeout", {v::integer}},
    {"tries", {v::integer}},
    {"try_sleep", {v::integer}},
  };
  add_strings(rules, {"user", "group", "onlyif", "unless", "refresh", "umask", "provider"});
  return make_type_methods(std::move(rules));
}

TypeMethods host_type()
{
  ParameterRules rules = {
    {"name", {v::nameval}},
    {"ensure", {v::string, v::values(k_present_absent)}},
    {"ip", {v::mandatory_if_not_absent, v::string, v::ipaddr}},
    {"host_aliases", {v::rarray, v::strings}},
    {"comment", {v::string}},
    {"target", {v::string, v::fully_qualified}},
  };
  add_strings(rules, {"provider"});
  return make_type_methods(std::move(rules));
}

TypeMethods cron_type()
{
  ParameterRules rules = {
    {"name", {v::nameval}},
    {"ensure", {v::string, v::values(k_present_absent)}},
    {"command", {v::mandatory_if_not_absent, v::string}},
    {"environment", {v::rarray, v::strings}},
  };
  add_strings(rules, {"user", "special", "target", "provider"});
  add_string_lists(rules, {"minute", "hour", "monthday", "month", "weekday"});
  return make_type_methods(std::move(rules));
}

TypeMethods mount_type()
{
  ParameterRules rules = {
    {"name", {v::nameval, v::fully_qualified, v::no_trailing_slash}},
    {"ensure",
     {v::default_value("present"), v::string,
      v::values({"present", "absent", "mounted", "unmounted", "defined"})}},
    {"device", {v::mandatory_if_not_absent, v::string}},
    {"fstype", {v::mandatory_if_not_absent, v::string}},
    {"options", {v::string}},
    {"dump", {v::integer, v::inrange(0, 2)}},
    {"pass", {v::integer}},
    {"atboot", {v::string, v::values({"yes", "no", "true", "false"})}},
    {"remounts", {v::string, v::values(k_booleans)}},
  };
  add_strings(rules, {"blockdevice", "target", "provider"});
  return make_type_methods(std::move(rules));
}

TypeMethods notify_type()
{
  ParameterRules rules = {
    {"message", {v::string}},
    {"name", {v::string}},
    {"withpath", {v::string, v::values(k_booleans)}},
  };
  return make_type_methods(std::move(rules));
}

TypeMethods sshkey_type()
{
  ParameterRules rules = {
    {"name", {v::nameval}},
    {"ensure", {v::string, v::values(k_present_absent)}},
    {"key", {v::mandatory_if_not_absent, v::string}},
    {"type",
     {v::mandatory_if_not_absent, v::string,
      v::values(
        {"ssh-dss", "ssh-rsa", "ecdsa-sha2-nistp256", "ecdsa-sha2-nistp384",
         "ecdsa-sha2-nistp521", "ssh-ed25519", "dsa", "rsa"})}},
    {"host_aliases", {v::rarray, v::strings}},
    {"target", {v::string, v::fully_qualified}},
  };
  add_strings(rules, {"provider"});
  return make_type_methods(std::move(rules));
}

}  // namespace

TypeRegistry make_native_type_registry()
{
  TypeRegistry::TypeMap types;
  types.emplace("file", file_type());
  types.emplace("package", package_type());
  types.emplace("service", service_type());
  types.emplace("user", user_type());
  types.emplace("group", group_type());
  types.emplace("exec", exec_type());
  types.emplace("host", host_type());
  types.emplace("cron", cron_type());
  types.emplace("mount", mount_type());
  types.emplace("notify", notify_type());
  types.emplace("sshkey", sshkey_type());
  types.emplace("anchor", fake_type());
  types.emplace("stage", default_type());
  return TypeRegistry(std::move(types));
}

}  // namespace cfgcat
