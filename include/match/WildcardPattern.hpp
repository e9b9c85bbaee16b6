#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "match/Errors.hpp"
#include "match/Section.hpp"
#include "util/BoyerMoore.hpp"

namespace wildrex::match {

enum class MatchMode : uint8_t {
    ExactMatch,  // value = 'pattern'
    Partial,     // value LIKE '%pattern%'
};

enum class RegexDialect : uint8_t {
    Standard,
    SQLQuoted,   // single-quoted literal for "where column ~ <text>"
};

// Result of a single match. length == -1: not found (start is the query start).
// length == 0: only produced by patterns made of anything tokens.
struct Match {
    int start{0};
    int length{-1};

    [[nodiscard]] bool found() const { return length >= 0; }
    [[nodiscard]] int end() const { return start + length; }
    bool operator==(const Match&) const = default;
};

class MatchSequence;  // match/MatchSequence.hpp

// Compiled wildcard pattern. '?' matches exactly one character, '*' matches
// zero or more (both tokens configurable).
// Immutable after construction; const member functions are safe to call
// concurrently.
class WildcardPattern {
public:
    static constexpr char DEFAULT_UNKNOWN = '?';
    static constexpr char DEFAULT_ANYTHING = '*';

    // Throws InvalidPatternError on an empty format or identical tokens.
    explicit WildcardPattern(std::string_view format,
                             MatchMode mode = MatchMode::ExactMatch,
                             char unknown = DEFAULT_UNKNOWN,
                             char anything = DEFAULT_ANYTHING);

    [[nodiscard]] const std::string& format() const { return format_; }
    [[nodiscard]] MatchMode mode() const { return mode_; }
    [[nodiscard]] char unknown_token() const { return unknown_; }
    [[nodiscard]] char anything_token() const { return anything_; }
    [[nodiscard]] bool anchored_start() const { return anchored_start_; }
    [[nodiscard]] bool anchored_end() const { return anchored_end_; }
    [[nodiscard]] int min_total_chars() const { return min_total_chars_; }
    [[nodiscard]] const std::vector<Section>& sections() const { return sections_; }

    // Range overloads throw RangeError when [start_index, start_index+length)
    // is not inside subject.
    [[nodiscard]] bool is_match(std::string_view subject) const;
    [[nodiscard]] bool is_match(std::string_view subject, int start_index) const;
    [[nodiscard]] bool is_match(std::string_view subject, int start_index, int length) const;

    [[nodiscard]] Match find(std::string_view subject) const;
    [[nodiscard]] Match find(std::string_view subject, int start_index) const;
    [[nodiscard]] Match find(std::string_view subject, int start_index, int length) const;

    // Lazy non-overlapping matches. The sequence borrows subject and *this.
    [[nodiscard]] MatchSequence matches(std::string_view subject) const;
    [[nodiscard]] MatchSequence matches(std::string_view subject, int start_index) const;
    [[nodiscard]] MatchSequence matches(std::string_view subject, int start_index, int length) const;

    [[nodiscard]] std::string to_pattern_text(RegexDialect dialect = RegexDialect::Standard) const;

    [[nodiscard]] static std::string to_regex(std::string_view format,
                                              MatchMode mode = MatchMode::ExactMatch,
                                              char unknown = DEFAULT_UNKNOWN,
                                              char anything = DEFAULT_ANYTHING,
                                              RegexDialect dialect = RegexDialect::Standard);

private:
    // Compilation (PatternCompiler.cpp)
    void compile();
    [[nodiscard]] std::vector<Section> split_sections() const;
    void trim_unknowns(Section& s) const;
    void merge_gaps(std::vector<Section>& sections) const;
    static void shift_leading_unknowns(std::vector<Section>& sections);
    void choose_search(Section& s) const;

    // Matching (MatchEngine.cpp)
    static void check_range(std::string_view subject, int start_index, int length);
    // Length of [start_index, subject end); throws RangeError when start_index is outside.
    static int tail_length(std::string_view subject, int start_index);
    [[nodiscard]] bool equals_with_unknowns(std::string_view subject, int pos,
                                            int format_pos, int count) const;
    [[nodiscard]] int locate(std::string_view subject, int from, int limit, size_t index) const;

    std::string format_;
    MatchMode mode_;
    char unknown_;
    char anything_;
    bool anchored_start_{false};
    bool anchored_end_{false};
    int min_total_chars_{0};
    std::vector<Section> sections_;
    std::vector<util::BoyerMooreSearch> searchers_;  // parallel to sections_
};

[[nodiscard]] WildcardPattern compile(std::string_view format,
                                      MatchMode mode = MatchMode::ExactMatch,
                                      char unknown = WildcardPattern::DEFAULT_UNKNOWN,
                                      char anything = WildcardPattern::DEFAULT_ANYTHING);

// Heuristic quality of a candidate search run; higher means fewer expected
// false positives (distinct characters minus adjacent repeats).
[[nodiscard]] int search_run_score(std::string_view run);

} // namespace wildrex::match
