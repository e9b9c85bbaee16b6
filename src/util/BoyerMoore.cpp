#include "util/BoyerMoore.hpp"

namespace wildrex::util {

BoyerMooreSearch::BoyerMooreSearch(std::string_view pattern)
    : pattern_(pattern),
      pattern_len_(static_cast<int>(pattern.length())) {
    compute_bad_char();
}

void BoyerMooreSearch::compute_bad_char() {
    // All characters default to maximum shift (pattern length)
    for (int i = 0; i < ALPHABET_SIZE; ++i) {
        bad_char_[i] = pattern_len_;
    }
    // Characters in pattern (except last) get actual shift distances
    for (int i = 0; i < pattern_len_ - 1; ++i) {
        bad_char_[static_cast<unsigned char>(pattern_[i])] = pattern_len_ - 1 - i;
    }
}

int BoyerMooreSearch::search(std::string_view text, int from) const {
    int n = static_cast<int>(text.length());
    int m = pattern_len_;

    if (from < 0) from = 0;
    if (from > n) return -1;
    if (m == 0) return from; // empty pattern matches immediately
    if (m > n - from) return -1;

    if (m < SHORT_NEEDLE) {
        auto pos = text.find(pattern_, static_cast<size_t>(from));
        return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
    }

    int i = from;
    while (i <= n - m) {
        int j = m - 1;

        // Compare right to left
        while (j >= 0 && text[i + j] == pattern_[j]) {
            --j;
        }

        if (j < 0) return i; // match

        // Bad character shift
        int shift = bad_char_[static_cast<unsigned char>(text[i + m - 1])];
        i += (shift > 0) ? shift : 1;
    }

    return -1;
}

} // namespace wildrex::util
