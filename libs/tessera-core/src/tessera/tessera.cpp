#include <tessera/tessera.hpp>

#include <climits>
#include <limits>

static_assert(CHAR_BIT == 8, "char is expected to have 8 bits");
static_assert(std::numeric_limits<float32>::is_iec559, "IEEE 754 single precision floats are required");
static_assert(std::numeric_limits<float64>::is_iec559, "IEEE 754 double precision floats are required");
