#include "app/Config.hpp"
#include "util/AsciiLower.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>

namespace wildrex::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("WILDREX_", 0) == 0) {
    alt = std::string("wildrex_") + n.substr(8);
  } else if (n.rfind("wildrex_", 0) == 0) {
    alt = std::string("WILDREX_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool getenv_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/wildrex/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/wildrex/config.toml";
  return {};
}

bool parse_mode(std::string_view text, match::MatchMode& out) {
  auto s = util::ascii_lower(text);
  if (s == "exact" || s == "exactmatch" || s == "full") { out = match::MatchMode::ExactMatch; return true; }
  if (s == "partial" || s == "substring" || s == "like") { out = match::MatchMode::Partial; return true; }
  return false;
}

bool parse_dialect(std::string_view text, match::RegexDialect& out) {
  auto s = util::ascii_lower(text);
  if (s == "standard" || s == "regex") { out = match::RegexDialect::Standard; return true; }
  if (s == "sql" || s == "sqlquoted") { out = match::RegexDialect::SQLQuoted; return true; }
  return false;
}

bool parse_token(std::string_view text, char& out) {
  if (text.size() != 1) return false;
  out = text[0];
  return true;
}

const char* mode_name(match::MatchMode mode) {
  return mode == match::MatchMode::Partial ? "partial" : "exact";
}

const char* dialect_name(match::RegexDialect dialect) {
  return dialect == match::RegexDialect::SQLQuoted ? "sql" : "standard";
}

// Resolve one field from TOML -> env -> compiled default. 'parse' rejects
// malformed text, which is reported and skipped.
template <typename T, typename Parse>
static T resolve(const util::TomlReader& toml, bool have_toml,
                 const char* section, const char* key, const char* env_name,
                 T def, Parse parse) {
  T value = def;
  if (have_toml && toml.has(section, key)) {
    std::string raw = toml.get_string(section, key);
    if (parse(raw, value)) return value;
    std::fprintf(stderr, "wildrex: Config: invalid [%s] %s = \"%s\", ignored\n",
                 section, key, raw.c_str());
  }
  if (const char* v = getenv_compat(env_name)) {
    if (parse(std::string_view(v), value)) return value;
    std::fprintf(stderr, "wildrex: Config: invalid %s=\"%s\", ignored\n", env_name, v);
  }
  return def;
}

ToolConfig resolve_config(const util::TomlReader& toml, bool have_toml) {
  ToolConfig cfg;
  cfg.unknown_token = resolve(toml, have_toml, "pattern", "unknown_token", "WILDREX_UNKNOWN",
                              cfg.unknown_token, parse_token);
  cfg.anything_token = resolve(toml, have_toml, "pattern", "anything_token", "WILDREX_ANYTHING",
                               cfg.anything_token, parse_token);
  cfg.mode = resolve(toml, have_toml, "pattern", "mode", "WILDREX_MODE", cfg.mode, parse_mode);
  cfg.dialect = resolve(toml, have_toml, "regex", "dialect", "WILDREX_DIALECT", cfg.dialect, parse_dialect);
  if (have_toml && toml.has("output", "verbose"))
    cfg.verbose = toml.get_bool("output", "verbose", false);
  else
    cfg.verbose = getenv_flag("WILDREX_VERBOSE", false);
  return cfg;
}

ToolConfig load_config(const std::string& path) {
  bool explicit_path = !path.empty();
  std::string file = explicit_path ? path : config_file_path();

  util::TomlReader toml;
  bool have_toml = !file.empty() && toml.load(file);
  if (!have_toml && explicit_path) {
    std::fprintf(stderr, "wildrex: Config: cannot read %s, using defaults\n", file.c_str());
  }
  if (have_toml) {
    for (int line : toml.bad_lines())
      std::fprintf(stderr, "wildrex: Config: %s:%d: not a key = value line\n", file.c_str(), line);
  }
  return resolve_config(toml, have_toml);
}

} // namespace wildrex::app
