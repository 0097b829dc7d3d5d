// Error taxonomy
// Every failure in seqnet is reported by throwing one of these types.

#pragma once

#include <stdexcept>
#include <string>

namespace seqnet {

// Out-of-range or otherwise invalid value (batch size, split fraction,
// label index, malformed preprocessing output, ...)
struct ValueError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Value of the wrong kind (JSON field of the wrong type, null layer)
struct TypeError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Tensor dimensions that do not line up
struct ShapeError : ValueError {
    using ValueError::ValueError;
};

// Second-phase call (backward, update) without its first phase (forward)
struct StateError : std::logic_error {
    using std::logic_error::logic_error;
};

}  // namespace seqnet
