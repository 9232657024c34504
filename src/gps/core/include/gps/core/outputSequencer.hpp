#pragma once

#include "gps/core/oreVocabulary.hpp"
#include "gps/core/record.hpp"
#include "gps/core/zoneTable.hpp"

#include <ostream>
#include <string_view>
#include <vector>

namespace gps::core {

//! Make resource names unique by text. The first occurrence of a name is kept, later ones get " _2", " _3", ...
void makeNamesUnique(std::vector<CoordinateRecord>& resources);

//! Output order: clusters by descending zone table index (outer zones first), stable otherwise.
//! Resources of a cluster by the priority of their leading ore, stable on ties.
void orderClusters(std::vector<CoordinateRecord>& clusters, const ZoneTable& zones, const OreVocabulary& ores);

//! Comment block at the top of the output: date, import hint and the ore order of precedence.
void writePreamble(std::ostream& out, const OreVocabulary& ores, std::string_view date);

//! Write clusters with their resources in GPS line format. A zone header precedes every change of zone.
//! Clusters without resources are left out.
void writeClusters(std::ostream& out, const std::vector<CoordinateRecord>& clusters, const ZoneTable& zones);

} // namespace gps::core
