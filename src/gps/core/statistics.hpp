#pragma once

#include <vector>

namespace gps::core {

double mean(const std::vector<double>& v);       //!< Arithmetic mean. 0 for an empty list.
double roundTo(double value, unsigned decimals); //!< Round the exact value to a fixed number of decimals.

} // namespace gps::core
