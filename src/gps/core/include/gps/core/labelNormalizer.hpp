#pragma once

#include "gps/core/decisionOracle.hpp"
#include "gps/core/oreVocabulary.hpp"
#include "gps/core/record.hpp"
#include "gps/core/zoneTable.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gps::core {

/*! Canonical resource labels.
 *  A label is `<token> <ores>[_<digits>]`. The token is a zone abbreviation (or a free cluster tag when zoning is inactive).
 *  Each ore code may be followed by a size phrase running up to the next comma. A trailing `_<digits>` is dropped.
 *  The canonical form lists the ores by vocabulary priority: `<token> <ORE>[ <size>] , <ORE>[ <size>]`.
 */
class LabelNormalizer {
public:
	LabelNormalizer(const ZoneTable& zones, const OreVocabulary& ores);

	/*! Normalize one label.
	 * \param [in] label Free text label as typed by the player.
	 * \param [in] zone  Zone of the record, if known. Replaces the token in the output. Allows labels without a token.
	 * \returns    Canonical label or null if a token is invalid. The offending token is logged.
	 */
	std::optional<std::string> normalize(std::string_view label, const std::optional<std::string>& zone) const;

	//! Priority of the first ore of a canonical label (its second word). Null if there is none.
	std::optional<std::size_t> leadingOrePriority(std::string_view canonicalLabel) const;

private:
	const ZoneTable& m_zones;
	const OreVocabulary& m_ores;
};

//! Normalize the names of all resources. Invalid labels are sent to the oracle until a valid replacement comes back.
//! \returns False if the oracle could not answer.
bool normalizeLabels(std::vector<CoordinateRecord>& resources, const LabelNormalizer& normalizer, DecisionOracle& oracle);

} // namespace gps::core
