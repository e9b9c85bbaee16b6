#include "app/Config.hpp"
#include "app/LineFilter.hpp"
#include "match/WildcardPattern.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using wildrex::match::MatchMode;
using wildrex::match::RegexDialect;
using wildrex::match::WildcardPattern;

static void print_usage(std::ostream& os) {
  os << "Usage: wildrex [options] PATTERN [FILE...]\n"
        "  -e, --exact           whole line must match (default)\n"
        "  -p, --partial         pattern may match anywhere in the line\n"
        "  -o, --only-matching   print each match instead of the line\n"
        "  -c, --count           print the number of selected lines\n"
        "  -v, --invert-match    select lines that do not match\n"
        "  -n, --line-number     prefix output with line numbers\n"
        "      --regex           print the equivalent regular expression and exit\n"
        "      --sql             same, as a quoted SQL literal\n"
        "      --unknown C       single-character wildcard (default '?')\n"
        "      --anything C      multi-character wildcard (default '*')\n"
        "      --config PATH     read settings from PATH\n"
        "      --verbose         dump the compiled pattern to stderr\n"
        "  -h, --help            show this help\n"
        "Exit status: 0 if a line was selected, 1 if none, 2 on error.\n";
}

static void dump_pattern(const WildcardPattern& p) {
  std::fprintf(stderr, "wildrex: pattern \"%s\" mode=%s anchors=%s%s min_chars=%d sections=%zu\n",
               p.format().c_str(), wildrex::app::mode_name(p.mode()),
               p.anchored_start() ? "^" : "-", p.anchored_end() ? "$" : "-",
               p.min_total_chars(), p.sections().size());
  for (const auto& s : p.sections()) {
    std::string lit(s.literal(p.format()));
    std::string search(s.search_substring(p.format()));
    std::fprintf(stderr, "wildrex:   [%d?] \"%s\" [%d?] search=\"%s\"@%d\n",
                 s.leading_unknowns, lit.c_str(), s.trailing_unknowns,
                 search.c_str(), s.search_offset);
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  std::vector<std::string> positional;
  wildrex::app::LineFilterSpec spec;
  std::optional<MatchMode> mode;
  std::optional<char> unknown, anything;
  std::optional<RegexDialect> dialect;
  bool print_regex = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto next_char = [&](std::optional<char>& dst) -> bool {
      char c;
      if (i + 1 >= argc || !wildrex::app::parse_token(argv[i + 1], c)) return false;
      dst = c; ++i; return true;
    };
    if (a == "-e" || a == "--exact") mode = MatchMode::ExactMatch;
    else if (a == "-p" || a == "--partial") mode = MatchMode::Partial;
    else if (a == "-o" || a == "--only-matching") spec.only_matching = true;
    else if (a == "-c" || a == "--count") spec.count_only = true;
    else if (a == "-v" || a == "--invert-match") spec.invert = true;
    else if (a == "-n" || a == "--line-number") spec.line_numbers = true;
    else if (a == "--regex") print_regex = true;
    else if (a == "--sql") { print_regex = true; dialect = RegexDialect::SQLQuoted; }
    else if (a == "--verbose") verbose = true;
    else if (a == "--unknown" || a == "--anything") {
      if (!next_char(a == "--unknown" ? unknown : anything)) {
        std::fprintf(stderr, "wildrex: %s expects a single character\n", a.c_str());
        return 2;
      }
    }
    else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "-h" || a == "--help") { print_usage(std::cout); return 0; }
    else if (a == "--") { for (++i; i < argc; ++i) positional.emplace_back(argv[i]); }
    else if (a.size() > 1 && a[0] == '-') {
      std::fprintf(stderr, "wildrex: unknown option %s\n", a.c_str());
      print_usage(std::cerr);
      return 2;
    }
    else positional.push_back(std::move(a));
  }

  if (positional.empty()) {
    print_usage(std::cerr);
    return 2;
  }

  wildrex::app::ToolConfig cfg = wildrex::app::load_config(config_path);
  if (mode) cfg.mode = *mode;
  if (unknown) cfg.unknown_token = *unknown;
  if (anything) cfg.anything_token = *anything;
  if (dialect) cfg.dialect = *dialect;
  if (verbose) cfg.verbose = true;

  try {
    WildcardPattern pattern(positional.front(), cfg.mode, cfg.unknown_token, cfg.anything_token);
    if (cfg.verbose) dump_pattern(pattern);

    if (print_regex) {
      std::cout << pattern.to_pattern_text(cfg.dialect) << "\n";
      return 0;
    }

    wildrex::app::LineFilter filter(pattern, spec);
    std::size_t selected = 0;
    bool had_error = false;
    if (positional.size() == 1) {
      selected = filter.run(std::cin, std::cout);
    } else {
      bool label = positional.size() > 2;
      for (size_t i = 1; i < positional.size(); ++i) {
        const std::string& path = positional[i];
        std::ifstream in(path);
        if (!in) {
          std::fprintf(stderr, "wildrex: %s: cannot open\n", path.c_str());
          had_error = true;
          continue;
        }
        selected += filter.run(in, std::cout, label ? std::string_view(path) : std::string_view());
      }
    }
    if (had_error) return 2;
    return selected > 0 ? 0 : 1;
  } catch (const wildrex::match::InvalidPatternError& e) {
    std::fprintf(stderr, "wildrex: Pattern: %s\n", e.what());
  } catch (const wildrex::match::RangeError& e) {
    std::fprintf(stderr, "wildrex: Match: %s\n", e.what());
  }
  return 2;
}
