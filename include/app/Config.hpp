#pragma once

#include <string>
#include <string_view>
#include "match/WildcardPattern.hpp"
#include "util/TomlReader.hpp"

namespace wildrex::app {

// Settings of the wildrex tool. Resolution order per field:
// command line > config file > environment > compiled default.
struct ToolConfig {
  char unknown_token{match::WildcardPattern::DEFAULT_UNKNOWN};
  char anything_token{match::WildcardPattern::DEFAULT_ANYTHING};
  match::MatchMode mode{match::MatchMode::ExactMatch};
  match::RegexDialect dialect{match::RegexDialect::Standard};
  bool verbose{false};
};

// Environment variable helpers (WILDREX_X and wildrex_X are both accepted)
const char* getenv_compat(const char* name);
bool getenv_flag(const char* name, bool defv);

// $XDG_CONFIG_HOME/wildrex/config.toml, else ~/.config/wildrex/config.toml,
// else empty.
std::string config_file_path();

// Reads 'path' (config_file_path() when empty). A missing default file is
// silent; a missing explicit file and bad values are reported on stderr and
// fall back to the next source.
ToolConfig load_config(const std::string& path = {});

// Same resolution over an already-parsed document; 'have_toml' false skips it.
ToolConfig resolve_config(const util::TomlReader& toml, bool have_toml);

bool parse_mode(std::string_view text, match::MatchMode& out);
bool parse_dialect(std::string_view text, match::RegexDialect& out);
bool parse_token(std::string_view text, char& out);

const char* mode_name(match::MatchMode mode);
const char* dialect_name(match::RegexDialect dialect);

} // namespace wildrex::app
