#pragma once

#include "gps/core/oreVocabulary.hpp"
#include "gps/core/zoneTable.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace gps::core {

//! Thresholds and naming of the sorting run.
struct SorterSettings {
	std::string clusterPrefix{"Cluster"};           //!< Names starting with this are cluster markers.
	std::int64_t duplicateResourceDistance{2'000};  //!< Resources closer than this are duplicates (m).
	std::int64_t duplicateClusterDistance{500'000}; //!< Cluster markers closer than this are duplicates (m).
	std::int64_t clusterAssignmentRadius{500'000};  //!< Max distance between a resource and its cluster (m).
	unsigned syntheticNameLength{4u};               //!< Random letters in a generated cluster name.
};

//! Immutable configuration of a run: zones, ore vocabulary and settings.
struct Catalog {
	ZoneTable zones;
	OreVocabulary ores;
	SorterSettings settings{};
};

/*! Load a catalog from an OpenCV FileStorage YAML file.
 *  Keys: clusterPrefix, duplicateResourceDistance, duplicateClusterDistance, clusterAssignmentRadius, syntheticNameLength (all optional),
 *  zones (sequence of {abbr, header, coordinate}, optional) and ores (sequence of {code, description}, required).
 * \returns Null if the file cannot be read or a table is invalid. The reason is logged.
 */
std::optional<Catalog> loadCatalog(const std::filesystem::path& path);

} // namespace gps::core
