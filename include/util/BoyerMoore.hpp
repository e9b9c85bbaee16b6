#pragma once

#include <string>
#include <string_view>

namespace wildrex::util {

// Boyer-Moore-Horspool literal search, ordinal (byte-for-byte).
// O(1) extra space (fixed 256-entry bad character table).
// Average case: O(n/m) sublinear. Worst case: O(n*m).
// Needles shorter than SHORT_NEEDLE go through std::string_view::find,
// whose memchr scan beats the shift table there.
class BoyerMooreSearch {
public:
    explicit BoyerMooreSearch(std::string_view pattern);

    // Position of the first match at or after 'from', or -1 if not found.
    [[nodiscard]] int search(std::string_view text, int from = 0) const;

    static constexpr int SHORT_NEEDLE = 4;

private:
    static constexpr int ALPHABET_SIZE = 256;

    int bad_char_[ALPHABET_SIZE];
    std::string pattern_;
    int pattern_len_;

    void compute_bad_char();
};

} // namespace wildrex::util
