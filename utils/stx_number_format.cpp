#include "stx_number_format.h"
#include <cmath>
#include <cstdio>

double stx_round(double value, int decimals) {
  double factor = std::pow(10.0, decimals);
  return std::round(value * factor) / factor;
}

stx_string stx_format_number(double value, int decimals) {
  double rounded = stx_round(value, decimals);
  if (rounded == 0.0) {
    rounded = 0.0;  // drops the sign of -0.0
  }

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, rounded);
  std::string text(buffer);

  size_t dot = text.find('.');
  if (dot == std::string::npos) {
    return stx_string(text + ".0");
  }
  size_t last = text.find_last_not_of('0');
  if (last == dot) {
    last = dot + 1;  // keep one zero after the point
  }
  text.erase(last + 1);
  if (text == "-0.0") {
    text = "0.0";
  }
  return stx_string(text);
}
