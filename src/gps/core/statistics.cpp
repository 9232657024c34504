#include "statistics.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <numeric>

namespace gps::core {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double roundTo(double value, unsigned decimals) {
	// Decimal rounding of the exact binary value. Scaling first would round an already inexact product.
	std::array<char, 512> buffer{};
	const auto written = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed, static_cast<int>(decimals));
	if (written.ec == std::errc{}) {
		double rounded{};
		const auto read = std::from_chars(buffer.data(), written.ptr, rounded);
		if (read.ec == std::errc{}) {
			return rounded;
		}
	}

	const double scale = std::pow(10.0, static_cast<double>(decimals));
	return std::round(value * scale) / scale;
}

} // namespace gps::core
