#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gps::core {

//! One member of a duplicate group as presented to the user.
struct DuplicateCandidate {
	std::string label;     //!< Display name of the record.
	std::int64_t distance; //!< Distance to the first member of the group (m). The first member has distance 0.
};

/*! Human in the loop. The pipeline blocks on these calls until an answer is available.
 *  Production binds this to the terminal, tests bind it to canned answers.
 */
class DecisionOracle {
public:
	virtual ~DecisionOracle() = default;

	//! Choose the member of a duplicate group to keep.
	//! \returns 1-based index into group. Out of range answers are rejected by the caller and the oracle is asked again.
	//!          Null if no answer can ever be given (input closed).
	virtual std::optional<std::size_t> chooseSurvivor(const std::vector<DuplicateCandidate>& group) = 0;

	//! Ask for a replacement of a label that could not be normalized.
	//! \returns Null if no answer can ever be given (input closed).
	virtual std::optional<std::string> supplyReplacementLabel(const std::string& invalidLabel) = 0;
};

} // namespace gps::core
