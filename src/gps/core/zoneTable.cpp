#include "gps/core/zoneTable.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <regex>

namespace gps::core {

std::optional<double> parseZoneRadius(std::string_view name) {
	static const std::regex RADIUS_PATTERN(R"(\(R(\d+)km\))");

	std::match_results<std::string_view::const_iterator> match;
	if (!std::regex_search(name.begin(), name.end(), match, RADIUS_PATTERN)) {
		return std::nullopt;
	}
	return std::stod(match[1].str()) * 1000.0;
}

//! Zone b lies completely inside zone a.
static bool isWithin(const Zone& b, const Zone& a) {
	const cv::Point3d d = b.center.position - a.center.position;
	return std::sqrt(d.dot(d)) + b.radius <= a.radius;
}

std::optional<ZoneTable> ZoneTable::create(const std::vector<ZoneDefinition>& definitions) {
	ZoneTable table;
	table.m_zones.reserve(definitions.size());

	for (const auto& definition: definitions) {
		if (definition.abbreviation.empty()) {
			std::cerr << "[Error] Zone without abbreviation: " << definition.coordinate << '\n';
			return std::nullopt;
		}
		if (table.contains(definition.abbreviation)) {
			std::cerr << "[Error] Zone abbreviation listed twice: " << definition.abbreviation << '\n';
			return std::nullopt;
		}

		ParseResult parsed = parseRecord(definition.coordinate);
		if (parsed.status != ParseStatus::Ok) {
			std::cerr << "[Error] Unexpected zone coordinate: " << definition.coordinate << '\n';
			return std::nullopt;
		}

		const auto radius = parseZoneRadius(parsed.record.name);
		if (!radius) {
			std::cerr << "[Error] Unexpected zone GPS name: " << parsed.record.name << '\n';
			return std::nullopt;
		}

		parsed.record.zone = definition.abbreviation;
		table.m_zones.push_back(Zone{definition.abbreviation, definition.header, std::move(parsed.record), *radius});
	}

	// A later zone inside an earlier one is shadowed completely.
	for (std::size_t i = 0; i < table.m_zones.size(); ++i) {
		for (std::size_t j = i + 1; j < table.m_zones.size(); ++j) {
			if (isWithin(table.m_zones[j], table.m_zones[i])) {
				std::cerr << "[Error] Zone " << table.m_zones[j].abbreviation << " must be listed before " << table.m_zones[i].abbreviation << '\n';
				return std::nullopt;
			}
		}
	}

	return table;
}

const Zone* ZoneTable::classify(const CoordinateRecord& record) const {
	for (const auto& zone: m_zones) {
		if (static_cast<double>(distance(zone.center, record)) < zone.radius) {
			return &zone;
		}
	}
	return nullptr;
}

std::optional<std::size_t> ZoneTable::indexOf(std::string_view abbreviation) const {
	const auto it = std::find_if(m_zones.begin(), m_zones.end(), [&](const Zone& zone) { return zone.abbreviation == abbreviation; });
	if (it == m_zones.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(std::distance(m_zones.begin(), it));
}

const Zone* ZoneTable::find(std::string_view abbreviation) const {
	const auto index = indexOf(abbreviation);
	return index ? &m_zones[*index] : nullptr;
}

} // namespace gps::core
