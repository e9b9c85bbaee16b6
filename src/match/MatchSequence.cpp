#include "match/MatchSequence.hpp"

namespace wildrex::match {

MatchIterator::MatchIterator(const WildcardPattern* pattern, std::string_view subject,
                             int start, int end)
    : pattern_(pattern), subject_(subject), cursor_(start), end_(end), done_(false) {
    advance();
}

MatchIterator& MatchIterator::operator++() {
    advance();
    return *this;
}

MatchIterator MatchIterator::operator++(int) {
    MatchIterator prev = *this;
    advance();
    return prev;
}

void MatchIterator::advance() {
    if (done_) return;
    if (last_) {
        done_ = true;
        return;
    }

    Match m = pattern_->find(subject_, cursor_, end_ - cursor_);
    if (!m.found()) {
        done_ = true;
        return;
    }
    current_ = m;

    // '*' alone would match the empty string forever; ExactMatch has only
    // the one whole-range match.
    if (m.length == 0 || pattern_->mode() == MatchMode::ExactMatch) {
        last_ = true;
        return;
    }
    cursor_ = m.end();
    if (cursor_ >= end_) last_ = true;
}

std::vector<Match> MatchSequence::collect() const {
    std::vector<Match> out;
    for (const Match& m : *this) out.push_back(m);
    return out;
}

MatchSequence WildcardPattern::matches(std::string_view subject) const {
    return matches(subject, 0, static_cast<int>(subject.size()));
}

MatchSequence WildcardPattern::matches(std::string_view subject, int start_index) const {
    return matches(subject, start_index, tail_length(subject, start_index));
}

MatchSequence WildcardPattern::matches(std::string_view subject, int start_index, int length) const {
    check_range(subject, start_index, length);
    return MatchSequence(*this, subject, start_index, length);
}

} // namespace wildrex::match
