#ifndef STX_NUMBER_FORMAT_H
#define STX_NUMBER_FORMAT_H

#include "stx_string.h"

// Rounds half away from zero to the given number of decimal places
double stx_round(double value, int decimals);

// Fixed notation rounded to `decimals`, trailing zeros trimmed but one
// decimal kept: 1 -> "1.0", 0.1560 -> "0.156". Negative zero prints "0.0".
stx_string stx_format_number(double value, int decimals);

#endif // STX_NUMBER_FORMAT_H
