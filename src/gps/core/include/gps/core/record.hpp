#pragma once

#include <opencv2/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gps::core {

//! A single GPS marker as exported by the game: `GPS:<name>:<x>:<y>:<z>:<colour>:<notes>:`
struct CoordinateRecord {
	std::string name;                          //!< Free text label.
	cv::Point3d position;                      //!< World position in meters.
	std::string colour;                        //!< ARGB colour (`#AARRGGBB`), kept verbatim.
	std::string notes;                         //!< Free text. Used as GPS folder tag.
	std::optional<std::string> zone{};         //!< Zone abbreviation. Only set when zoning is active.
	bool duplicate{false};                     //!< Marked by the duplicate resolver. Never unset.
	std::vector<CoordinateRecord> resources{}; //!< Resources attached to a cluster marker.
};

enum class ParseStatus {
	Ok,        //!< Record parsed.
	Skipped,   //!< Blank or comment line.
	Malformed, //!< Not enough fields. Recoverable.
	BadNumber, //!< Coordinate component is not a finite number. Fatal.
};

struct ParseResult {
	ParseStatus status;
	CoordinateRecord record{}; //!< Valid only for ParseStatus::Ok.
};

//! Parse one line of the GPS line protocol.
//! \note Diagnostics for malformed lines and bad numbers are written to std::cerr.
ParseResult parseRecord(std::string_view line);

//! Serialize a record back to the GPS line protocol (including trailing ':').
std::string toGpsLine(const CoordinateRecord& record);

//! Euclidean distance between two records, rounded to the nearest meter.
std::int64_t distance(const CoordinateRecord& a, const CoordinateRecord& b);

//! Records are compared for grouping only if they are in the same zone (or zoning is inactive for both).
inline bool sameZone(const CoordinateRecord& a, const CoordinateRecord& b) {
	return a.zone == b.zone;
}

//! A record whose name starts with the cluster prefix is a cluster marker. Every other record is a resource marker.
bool isClusterMarker(const CoordinateRecord& record, std::string_view clusterPrefix);

//! Folder tag derived from a name: spaces become '_', parentheses and commas are dropped.
std::string sanitizeFolderName(std::string_view name);

} // namespace gps::core
