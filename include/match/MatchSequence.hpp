#pragma once

#include <cstddef>
#include <iterator>
#include <string_view>
#include <vector>
#include "match/WildcardPattern.hpp"

namespace wildrex::match {

// Input iterator over successive non-overlapping matches.
// A default-constructed iterator is the end sentinel.
class MatchIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = Match;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const Match*;
    using reference         = const Match&;

    MatchIterator() = default;
    MatchIterator(const WildcardPattern* pattern, std::string_view subject, int start, int end);

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }

    MatchIterator& operator++();
    MatchIterator operator++(int);

    friend bool operator==(const MatchIterator& a, const MatchIterator& b) {
        if (a.done_ || b.done_) return a.done_ == b.done_;
        return a.pattern_ == b.pattern_ && a.subject_.data() == b.subject_.data()
            && a.current_ == b.current_;
    }

private:
    void advance();

    const WildcardPattern* pattern_{nullptr};
    std::string_view subject_;
    int cursor_{0};
    int end_{0};
    Match current_{};
    bool done_{true};
    bool last_{false};   // current_ is the final element
};

// Restartable view of the matches of one pattern over one subject range:
// every begin() rescans from the range start.
class MatchSequence {
public:
    MatchSequence(const WildcardPattern& pattern, std::string_view subject, int start, int length)
        : pattern_(&pattern), subject_(subject), start_(start), length_(length) {}

    [[nodiscard]] MatchIterator begin() const {
        return MatchIterator(pattern_, subject_, start_, start_ + length_);
    }
    [[nodiscard]] MatchIterator end() const { return {}; }

    [[nodiscard]] std::vector<Match> collect() const;

private:
    const WildcardPattern* pattern_;
    std::string_view subject_;
    int start_;
    int length_;
};

} // namespace wildrex::match
