#include "gps/core/record.hpp"

#include "textUtils.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <format>
#include <iostream>

namespace gps::core {

static constexpr char FIELD_DELIMITER       = ':';
static constexpr char COMMENT_MARKER        = '#';
static constexpr std::size_t MIN_FIELDS     = 7u; //!< "GPS", name, x, y, z, colour, notes
static constexpr std::string_view GPS_MAGIC = "GPS";

//! Parse a single coordinate component. Python-style float text (surrounding spaces, leading '+').
static std::optional<double> parseComponent(std::string_view text) {
	text = trim(text);
	if (!text.empty() && text.front() == '+') {
		text.remove_prefix(1);
	}
	if (text.empty()) {
		return std::nullopt;
	}

	double value{};
	const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || end != text.data() + text.size() || !std::isfinite(value)) {
		return std::nullopt;
	}
	return value;
}

ParseResult parseRecord(std::string_view line) {
	line = trim(line);
	if (line.empty() || line.front() == COMMENT_MARKER) {
		return {ParseStatus::Skipped};
	}

	const std::vector<std::string_view> fields = split(line, FIELD_DELIMITER);
	if (fields.size() < MIN_FIELDS) {
		std::cerr << "[Warning] Bad coordinate, wrong number of tokens: " << line << '\n';
		return {ParseStatus::Malformed};
	}

	CoordinateRecord record;
	record.name   = std::string(fields[1]);
	record.colour = std::string(fields[5]);
	record.notes  = std::string(fields[6]);

	double* components[] = {&record.position.x, &record.position.y, &record.position.z};
	for (std::size_t i = 0; i < 3u; ++i) {
		const auto value = parseComponent(fields[2u + i]);
		if (!value) {
			std::cerr << "[Error] Bad coordinate value '" << fields[2u + i] << "': " << line << '\n';
			return {ParseStatus::BadNumber};
		}
		*components[i] = *value;
	}

	return {ParseStatus::Ok, std::move(record)};
}

//! Shortest text that reads back to the same value, never in exponent notation (100000 instead of 1e+05).
static std::string formatComponent(double value) {
	std::array<char, 512> buffer{};
	const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed);
	if (ec != std::errc{}) {
		return std::format("{}", value);
	}
	return std::string(buffer.data(), end);
}

std::string toGpsLine(const CoordinateRecord& record) {
	return std::format("{}:{}:{}:{}:{}:{}:{}:", GPS_MAGIC, record.name, formatComponent(record.position.x), formatComponent(record.position.y),
	                   formatComponent(record.position.z), record.colour, record.notes);
}

std::int64_t distance(const CoordinateRecord& a, const CoordinateRecord& b) {
	const cv::Point3d d = b.position - a.position;
	return std::llround(std::sqrt(d.dot(d)));
}

bool isClusterMarker(const CoordinateRecord& record, std::string_view clusterPrefix) {
	return std::string_view(record.name).starts_with(clusterPrefix);
}

std::string sanitizeFolderName(std::string_view name) {
	std::string folder;
	folder.reserve(name.size());
	for (const char c: name) {
		switch (c) {
		case ' ':
			folder.push_back('_');
			break;
		case '(':
		case ')':
		case ',':
			break;
		default:
			folder.push_back(c);
		}
	}
	return folder;
}

} // namespace gps::core
