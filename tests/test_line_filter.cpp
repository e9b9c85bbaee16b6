#include "minitest.hpp"
#include "app/LineFilter.hpp"
#include <sstream>
#include <string>

using wildrex::app::LineFilter;
using wildrex::app::LineFilterSpec;
using wildrex::match::MatchMode;
using wildrex::match::WildcardPattern;

static const char* LOG =
  "2024-01-01 start\n"
  "2024-01-02 error: disk\n"
  "2023-12-31 error: net\r\n"
  "2024-02-01 stop\n";

TEST(filter_prints_matching_lines) {
  WildcardPattern p("2024-01-??*");
  LineFilter f(p, {});
  std::istringstream in(LOG);
  std::ostringstream out;
  ASSERT_EQ(f.run(in, out), 2u);
  ASSERT_EQ(out.str(), "2024-01-01 start\n2024-01-02 error: disk\n");
}

TEST(filter_count_and_invert) {
  WildcardPattern p("*error*");
  LineFilterSpec spec;
  spec.count_only = true;
  LineFilter f(p, spec);
  std::istringstream in(LOG);
  std::ostringstream out;
  ASSERT_EQ(f.run(in, out), 2u);
  ASSERT_EQ(out.str(), "2\n");

  spec.count_only = false;
  spec.invert = true;
  spec.line_numbers = true;
  LineFilter inv(p, spec);
  std::istringstream in2(LOG);
  std::ostringstream out2;
  ASSERT_EQ(inv.run(in2, out2), 2u);
  ASSERT_EQ(out2.str(), "1:2024-01-01 start\n4:2024-02-01 stop\n");
}

TEST(filter_only_matching_prints_each_match) {
  WildcardPattern p("e?r", MatchMode::Partial);
  LineFilterSpec spec;
  spec.only_matching = true;
  LineFilter f(p, spec);
  std::istringstream in("error err\nnothing\n");
  std::ostringstream out;
  ASSERT_EQ(f.run(in, out, "log"), 1u);
  ASSERT_EQ(out.str(), "log:err\nlog:err\n");
}

TEST(filter_only_matching_skips_empty_star_match) {
  WildcardPattern p("*", MatchMode::Partial);
  LineFilterSpec spec;
  spec.only_matching = true;
  LineFilter f(p, spec);
  std::istringstream in("a\nb\n");
  std::ostringstream out;
  ASSERT_EQ(f.run(in, out), 2u);
  ASSERT_EQ(out.str(), "");
}
