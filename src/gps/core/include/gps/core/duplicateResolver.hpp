#pragma once

#include "gps/core/decisionOracle.hpp"
#include "gps/core/record.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace gps::core {

struct DuplicateMatch {
	std::size_t index;     //!< Index into the record list.
	std::int64_t distance; //!< Distance to the anchor (m).
};

/*! Collect the duplicate group of an anchor record.
 *  Members are records not yet marked duplicate, in the same zone, strictly closer than minDistance. List order is preserved.
 * \returns The anchor (distance 0) followed by its duplicates. Empty if the anchor has no duplicates.
 */
std::vector<DuplicateMatch> findDuplicates(std::size_t anchor, const std::vector<CoordinateRecord>& records, std::int64_t minDistance);

/*! Single pass over the records in list order. Every duplicate group is shown to the oracle, all members except the chosen one
 *  are marked duplicate. A record marked by an earlier group is never used as anchor or member again.
 * \returns False if the oracle could not answer. Records may then be partially marked.
 */
bool markDuplicates(std::vector<CoordinateRecord>& records, std::int64_t minDistance, DecisionOracle& oracle);

//! markDuplicates() followed by dropping the marked records.
//! \returns Surviving records in their original order. Null if the oracle could not answer.
std::optional<std::vector<CoordinateRecord>> removeDuplicates(std::vector<CoordinateRecord> records, std::int64_t minDistance, DecisionOracle& oracle);

} // namespace gps::core
