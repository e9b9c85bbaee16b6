#include "match/WildcardPattern.hpp"
#include <climits>
#include <cstddef>
#include <limits>

namespace wildrex::match {

// Compile pipeline, e.g. "?ab?cd*??*x??" (ExactMatch):
//   split   {?ab?cd} {??} {x??}
//   trim    {1|ab?cd|0} {0||2} {0|x|2}
//   merge   {1|ab?cd|2} {0|x|2}        gap folded into its predecessor
//   shift   nothing to move (only the first section keeps leading unknowns)
//   search  "ab" vs "cd": equal score and length, leftmost wins

WildcardPattern::WildcardPattern(std::string_view format, MatchMode mode,
                                 char unknown, char anything)
    : format_(format), mode_(mode), unknown_(unknown), anything_(anything) {
    if (format_.empty())
        throw InvalidPatternError("wildcard pattern is empty");
    if (unknown_ == anything_)
        throw InvalidPatternError(std::string("unknown and anything tokens are both '") + unknown_ + "'");
    if (format_.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
        throw InvalidPatternError("wildcard pattern too long");

    if (mode_ == MatchMode::ExactMatch) {
        anchored_start_ = format_.front() != anything_;
        anchored_end_   = format_.back() != anything_;
    }
    compile();
}

WildcardPattern compile(std::string_view format, MatchMode mode, char unknown, char anything) {
    return WildcardPattern(format, mode, unknown, anything);
}

void WildcardPattern::compile() {
    std::vector<Section> sections = split_sections();
    for (auto& s : sections) trim_unknowns(s);
    merge_gaps(sections);
    shift_leading_unknowns(sections);

    min_total_chars_ = 0;
    searchers_.reserve(sections.size());
    for (auto& s : sections) {
        choose_search(s);
        min_total_chars_ += s.width();
        searchers_.emplace_back(s.search_substring(format_));
    }
    sections_ = std::move(sections);
}

// format.split(anything_), without the empty pieces ("aa**aa", "*aa", "aa*").
std::vector<Section> WildcardPattern::split_sections() const {
    std::vector<Section> out;
    int n = static_cast<int>(format_.size());
    int start = 0;
    for (int i = 0; i <= n; ++i) {
        if (i < n && format_[i] != anything_) continue;
        if (i > start) {
            Section s;
            s.literal_start = start;
            s.literal_len = i - start;
            out.push_back(s);
        }
        start = i + 1;
    }
    return out;
}

// Trailing side first: a span of unknowns only ends up entirely in
// trailing_unknowns.
void WildcardPattern::trim_unknowns(Section& s) const {
    while (s.literal_len > 0 && format_[s.literal_start + s.literal_len - 1] == unknown_) {
        --s.literal_len;
        ++s.trailing_unknowns;
    }
    while (s.literal_len > 0 && format_[s.literal_start] == unknown_) {
        ++s.literal_start;
        --s.literal_len;
        ++s.leading_unknowns;
    }
}

// "abc*??*456" -> "abc??*456". The first section has no predecessor, and a
// gap in front of the end anchor stays: "abc*??" is not "abc??".
void WildcardPattern::merge_gaps(std::vector<Section>& sections) const {
    size_t keep_tail = anchored_end_ ? 1 : 0;
    size_t i = 1;
    while (i + keep_tail < sections.size()) {
        if (sections[i].is_gap()) {
            sections[i - 1].trailing_unknowns += sections[i].leading_unknowns + sections[i].trailing_unknowns;
            sections.erase(sections.begin() + static_cast<std::ptrdiff_t>(i));
        } else {
            ++i;
        }
    }
}

// "abc?*??456" -> "abc???*456"
void WildcardPattern::shift_leading_unknowns(std::vector<Section>& sections) {
    for (size_t i = 1; i < sections.size(); ++i) {
        if (sections[i].leading_unknowns == 0) continue;
        sections[i - 1].trailing_unknowns += sections[i].leading_unknowns;
        sections[i].leading_unknowns = 0;
    }
}

int search_run_score(std::string_view run) {
    bool seen[256] = {};
    int distinct = 0;
    int repeats = 0;
    for (size_t i = 0; i < run.size(); ++i) {
        auto c = static_cast<unsigned char>(run[i]);
        if (!seen[c]) { seen[c] = true; ++distinct; }
        if (i > 0 && run[i] == run[i - 1]) ++repeats;
    }
    return distinct - repeats;
}

// Pick the run between internal unknowns that drives the substring search.
// Ties: longer run, then leftmost.
void WildcardPattern::choose_search(Section& s) const {
    s.search_offset = 0;
    s.search_len = s.literal_len;
    if (s.is_gap()) return;

    std::string_view lit = s.literal(format_);
    if (lit.find(unknown_) == std::string_view::npos) return;

    int best_score = INT_MIN;
    int best_offset = 0;
    int best_len = 0;
    int run_start = 0;
    for (int i = 0; i <= s.literal_len; ++i) {
        if (i < s.literal_len && lit[i] != unknown_) continue;
        int run_len = i - run_start;
        if (run_len > 0) {
            int score = search_run_score(lit.substr(run_start, run_len));
            if (score > best_score || (score == best_score && run_len > best_len)) {
                best_score = score;
                best_offset = run_start;
                best_len = run_len;
            }
        }
        run_start = i + 1;
    }
    s.search_offset = best_offset;
    s.search_len = best_len;
}

} // namespace wildrex::match
