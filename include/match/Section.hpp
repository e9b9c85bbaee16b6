#pragma once

#include <string_view>

namespace wildrex::match {

// One maximal run of pattern text between anything tokens.
// Offsets index into the owning pattern's format string.
// The literal may still contain unknown tokens internally, never at its ends.
struct Section {
    int literal_start{0};
    int literal_len{0};
    int leading_unknowns{0};   // only ever nonzero on the first section
    int trailing_unknowns{0};
    int search_offset{0};      // relative to literal_start
    int search_len{0};

    [[nodiscard]] int width() const { return leading_unknowns + literal_len + trailing_unknowns; }
    [[nodiscard]] bool is_gap() const { return literal_len == 0; }
    [[nodiscard]] bool has_prefix() const { return search_offset > 0; }
    [[nodiscard]] bool has_suffix() const { return search_offset + search_len < literal_len; }

    [[nodiscard]] std::string_view literal(std::string_view format) const {
        return format.substr(literal_start, literal_len);
    }
    [[nodiscard]] std::string_view search_substring(std::string_view format) const {
        return format.substr(literal_start + search_offset, search_len);
    }
};

} // namespace wildrex::match
