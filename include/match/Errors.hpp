#pragma once

#include <stdexcept>

namespace wildrex::match {

// Empty pattern, or unknown and anything tokens that collide.
struct InvalidPatternError : public std::invalid_argument { using std::invalid_argument::invalid_argument; };

// start/length outside the subject string.
struct RangeError : public std::out_of_range { using std::out_of_range::out_of_range; };

} // namespace wildrex::match
