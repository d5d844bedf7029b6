// Copyright (c) MiXaiLL76
#pragma once

#include <stdexcept>

namespace detection_eval {

// Invalid request: unknown dataset or source, empty prediction set,
// out-of-range threshold, malformed annotation row or config value.
class ValidationError : public std::invalid_argument {
       public:
        using std::invalid_argument::invalid_argument;
};

}  // namespace detection_eval
