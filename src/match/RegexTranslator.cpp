#include "match/WildcardPattern.hpp"
#include <cstring>

namespace wildrex::match {

// Characters with a meaning in POSIX ERE / PCRE outside a bracket expression.
static bool is_regex_meta(char c) {
    return c != '\0' && std::strchr(".^$|?*+()[]{}\\", c) != nullptr;
}

std::string WildcardPattern::to_pattern_text(RegexDialect dialect) const {
    const bool sql = dialect == RegexDialect::SQLQuoted;

    std::string out;
    out.reserve(format_.size() * 2 + 6);

    if (sql) out += '\'';
    if (anchored_start_) out += '^';

    // format made of anything tokens only
    if (sections_.empty()) {
        out += ".*";
        if (sql) out += '\'';
        return out;
    }

    if (format_.front() == anything_) out += ".*";

    for (size_t j = 0; j < sections_.size(); ++j) {
        const Section& s = sections_[j];
        if (j > 0) out += ".*";

        out.append(static_cast<size_t>(s.leading_unknowns), '.');
        for (char c : s.literal(format_)) {
            if (c == unknown_) {
                out += '.';
            } else if (sql && c == '\'') {
                out += "''";
            } else {
                if (is_regex_meta(c)) out += '\\';
                out += c;
            }
        }
        out.append(static_cast<size_t>(s.trailing_unknowns), '.');
    }

    if (format_.back() == anything_) out += ".*";
    if (anchored_end_) out += '$';
    if (sql) out += '\'';
    return out;
}

std::string WildcardPattern::to_regex(std::string_view format, MatchMode mode,
                                      char unknown, char anything, RegexDialect dialect) {
    return WildcardPattern(format, mode, unknown, anything).to_pattern_text(dialect);
}

} // namespace wildrex::match
