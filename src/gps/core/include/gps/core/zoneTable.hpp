#pragma once

#include "gps/core/record.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gps::core {

//! Zone as written in the catalog.
struct ZoneDefinition {
	std::string abbreviation; //!< Short tag used in labels, e.g. "AP".
	std::string header;       //!< Section header written to the output.
	std::string coordinate;   //!< Center in GPS line format. The name encodes the radius as "(R<n>km)".
};

struct Zone {
	std::string abbreviation;
	std::string header;
	CoordinateRecord center; //!< Center marker. Its zone is the zone itself.
	double radius;           //!< Meters.
};

/*! Priority ordered list of named spherical zones.
 *  A coordinate belongs to the first zone (in table order) whose center is closer than its radius.
 *  Nested zones therefore have to be listed before the zones containing them. create() rejects a table where a zone is
 *  wholly contained in an earlier zone, because such a zone could never be matched.
 *  An empty table means zoning is inactive.
 */
class ZoneTable {
public:
	ZoneTable() = default;

	//! Build the table from catalog definitions.
	//! \returns Null if a coordinate cannot be parsed, a radius is missing, an abbreviation repeats or the priority order is violated.
	static std::optional<ZoneTable> create(const std::vector<ZoneDefinition>& definitions);

	//! Find the innermost zone of a coordinate.
	//! \returns Null if the coordinate is outside of all zones.
	const Zone* classify(const CoordinateRecord& record) const;

	//! Index of a zone in table order. Null for unknown abbreviations.
	std::optional<std::size_t> indexOf(std::string_view abbreviation) const;

	const Zone* find(std::string_view abbreviation) const;
	bool contains(std::string_view abbreviation) const { return indexOf(abbreviation).has_value(); }

	bool active() const { return !m_zones.empty(); }
	const std::vector<Zone>& zones() const { return m_zones; }

private:
	std::vector<Zone> m_zones{};
};

//! Extract the radius in meters from a zone marker name like "Auroria Planet - (R250km)".
std::optional<double> parseZoneRadius(std::string_view name);

} // namespace gps::core
