#include "rounding.hpp"
#include <cstdio>

namespace hashcalc {

std::string format_fixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

} // namespace hashcalc
