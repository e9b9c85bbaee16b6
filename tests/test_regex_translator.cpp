#include "minitest.hpp"
#include "match/WildcardPattern.hpp"

#include <regex>
#include <string>

using wildrex::match::MatchMode;
using wildrex::match::RegexDialect;
using wildrex::match::WildcardPattern;

static std::string rx(const char* format, MatchMode mode = MatchMode::ExactMatch,
                      RegexDialect dialect = RegexDialect::Standard) {
  return WildcardPattern(format, mode).to_pattern_text(dialect);
}

TEST(regex_date_pattern) {
  ASSERT_EQ(rx("20??-01*"), "^20..-01.*");
}

TEST(regex_anchors_follow_mode) {
  ASSERT_EQ(rx("abc"), "^abc$");
  ASSERT_EQ(rx("abc", MatchMode::Partial), "abc");
  ASSERT_EQ(rx("*abc"), ".*abc$");
  ASSERT_EQ(rx("*abc*"), ".*abc.*");
  ASSERT_EQ(rx("*abc*", MatchMode::Partial), ".*abc.*");
}

TEST(regex_only_anything_tokens) {
  ASSERT_EQ(rx("*"), ".*");
  ASSERT_EQ(rx("***"), ".*");
  ASSERT_EQ(rx("*", MatchMode::Partial), ".*");
  ASSERT_EQ(rx("*", MatchMode::ExactMatch, RegexDialect::SQLQuoted), "'.*'");
}

TEST(regex_unknowns_become_dots) {
  ASSERT_EQ(rx("??x?y??"), "^..x.y..$");
  ASSERT_EQ(rx("??*x"), "^...*x$");
}

TEST(regex_merged_and_kept_gaps) {
  ASSERT_EQ(rx("abc*??*456"), "^abc...*456$");
  ASSERT_EQ(rx("abc*??"), "^abc.*..$");
}

TEST(regex_escapes_metacharacters) {
  ASSERT_EQ(rx("a.b"), "^a\\.b$");
  ASSERT_EQ(rx("(x)+[y]{2}|$^\\"), "^\\(x\\)\\+\\[y\\]\\{2\\}\\|\\$\\^\\\\$");
  ASSERT_EQ(rx("a-b c_d"), "^a-b c_d$");
}

TEST(regex_custom_tokens_escape_star_and_question) {
  WildcardPattern p("a*b?_%", MatchMode::ExactMatch, '_', '%');
  ASSERT_EQ(p.to_pattern_text(), "^a\\*b\\?..*");
}

TEST(regex_sql_dialect) {
  ASSERT_EQ(rx("it's*", MatchMode::ExactMatch, RegexDialect::SQLQuoted), "'^it''s.*'");
  ASSERT_EQ(rx("a.b", MatchMode::Partial, RegexDialect::SQLQuoted), "'a\\.b'");
  ASSERT_EQ(rx("it's"), "^it's$");
}

TEST(regex_is_deterministic) {
  const char* format = "?x*y?z*";
  ASSERT_EQ(WildcardPattern(format).to_pattern_text(), WildcardPattern(format).to_pattern_text());
  ASSERT_EQ(WildcardPattern::to_regex(format), WildcardPattern(format).to_pattern_text());
  ASSERT_EQ(WildcardPattern::to_regex(format, MatchMode::Partial, '?', '*', RegexDialect::SQLQuoted),
            WildcardPattern(format, MatchMode::Partial).to_pattern_text(RegexDialect::SQLQuoted));
}

TEST(regex_output_compiles_and_agrees) {
  WildcardPattern p("*20??-0?-01*.log");
  std::regex re(p.to_pattern_text());
  for (const char* s : {"app-2024-03-01.log", "2024-03-01.log", "x2024-03-01.logx", "2024-3-01.log"}) {
    ASSERT_EQ(std::regex_search(s, re), p.is_match(s));
  }
}
