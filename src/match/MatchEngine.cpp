#include "match/WildcardPattern.hpp"
#include <limits>
#include <string>

namespace wildrex::match {

// Single left-to-right scan, e.g. format = "123*456*?678" (ExactMatch):
//   sections {123} {456} {?678}
//   1. the range must start with 123 (anchored start)
//   2. the range must end with ?678 (anchored end), not before the cursor
//   3. 456 is searched between the two
// Sections are placed leftmost-first and never revisited: with only '*'
// between them, the leftmost placement leaves the most room for the rest.

void WildcardPattern::check_range(std::string_view subject, int start_index, int length) {
    if (subject.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
        throw RangeError("subject longer than INT_MAX");
    int size = static_cast<int>(subject.size());
    if (start_index < 0 || length < 0 || start_index > size - length) {
        throw RangeError("range [" + std::to_string(start_index) + ", +" + std::to_string(length)
                         + ") outside subject of size " + std::to_string(size));
    }
}

int WildcardPattern::tail_length(std::string_view subject, int start_index) {
    if (subject.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
        throw RangeError("subject longer than INT_MAX");
    int size = static_cast<int>(subject.size());
    if (start_index < 0 || start_index > size) {
        throw RangeError("start " + std::to_string(start_index)
                         + " outside subject of size " + std::to_string(size));
    }
    return size - start_index;
}

bool WildcardPattern::equals_with_unknowns(std::string_view subject, int pos,
                                           int format_pos, int count) const {
    for (int i = 0; i < count; ++i) {
        char d = format_[format_pos + i];
        if (d != unknown_ && subject[pos + i] != d) return false;
    }
    return true;
}

// Leftmost start (leading unknowns included) of sections_[index] placed
// entirely inside [from, limit), or -1.
int WildcardPattern::locate(std::string_view subject, int from, int limit, size_t index) const {
    const Section& s = sections_[index];
    const util::BoyerMooreSearch& searcher = searchers_[index];

    int suffix_len = s.literal_len - s.search_offset - s.search_len;
    int lo = from + s.leading_unknowns + s.search_offset;
    int hi = limit - s.trailing_unknowns - suffix_len;  // search substring ends at or before hi
    if (hi - lo < s.search_len) return -1;

    std::string_view window = subject.substr(0, static_cast<size_t>(hi));
    int pos = lo;
    while (true) {
        pos = searcher.search(window, pos);
        if (pos < 0) return -1;

        int lit = pos - s.search_offset;
        bool ok = (!s.has_prefix() ||
                   equals_with_unknowns(subject, lit, s.literal_start, s.search_offset)) &&
                  (!s.has_suffix() ||
                   equals_with_unknowns(subject, pos + s.search_len,
                                        s.literal_start + s.search_offset + s.search_len, suffix_len));
        if (ok) return lit - s.leading_unknowns;

        // False positive: the search substring matched but its surroundings
        // did not. Retry one past it.
        ++pos;
    }
}

Match WildcardPattern::find(std::string_view subject, int start_index, int length) const {
    check_range(subject, start_index, length);

    const Match not_found{start_index, -1};
    if (length < min_total_chars_) return not_found;
    // format made of anything tokens only
    if (sections_.empty()) return {start_index, 0};

    const int end = start_index + length;
    const size_t count = sections_.size();
    int cursor = start_index;
    int first = -1;      // start of the first placed section
    int last_end = -1;   // end of the last placed section
    int limit = end;     // interior sections end at or before this
    size_t next = 0;
    size_t stop = count;

    if (anchored_start_) {
        const Section& s = sections_.front();
        if (!equals_with_unknowns(subject, cursor + s.leading_unknowns, s.literal_start, s.literal_len))
            return not_found;
        if (anchored_end_ && count == 1)
            return s.width() == length ? Match{start_index, length} : not_found;
        first = cursor;
        cursor += s.width();
        last_end = cursor;
        next = 1;
    }

    if (anchored_end_) {
        const Section& s = sections_.back();
        int tail = end - s.width();
        if (tail < cursor ||
            !equals_with_unknowns(subject, tail + s.leading_unknowns, s.literal_start, s.literal_len))
            return not_found;
        limit = tail;
        stop = count - 1;
    }

    for (size_t i = next; i < stop; ++i) {
        const Section& s = sections_[i];
        int at;
        if (s.is_gap()) {
            if (limit - cursor < s.width()) return not_found;
            at = cursor;
        } else {
            at = locate(subject, cursor, limit, i);
            if (at < 0) return not_found;
        }
        if (first < 0) first = at;
        cursor = at + s.width();
        last_end = cursor;
    }

    if (anchored_end_) {
        if (first < 0) first = limit;
        last_end = end;
    }

    // ExactMatch covers the whole range: an outer '*' absorbs whatever lies
    // between the range bounds and the first/last section.
    if (mode_ == MatchMode::ExactMatch) return {start_index, length};
    return {first, last_end - first};
}

Match WildcardPattern::find(std::string_view subject) const {
    return find(subject, 0, static_cast<int>(subject.size()));
}

Match WildcardPattern::find(std::string_view subject, int start_index) const {
    return find(subject, start_index, tail_length(subject, start_index));
}

bool WildcardPattern::is_match(std::string_view subject) const {
    return find(subject).found();
}

bool WildcardPattern::is_match(std::string_view subject, int start_index) const {
    return find(subject, start_index).found();
}

bool WildcardPattern::is_match(std::string_view subject, int start_index, int length) const {
    return find(subject, start_index, length).found();
}

} // namespace wildrex::match
