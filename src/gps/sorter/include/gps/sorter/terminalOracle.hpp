#pragma once

#include "gps/core/decisionOracle.hpp"

#include <istream>
#include <ostream>

namespace gps::sorter {

//! Asks the user on a text terminal. Re-prompts on answers that are not a valid choice.
class TerminalOracle : public core::DecisionOracle {
public:
	TerminalOracle(std::istream& in, std::ostream& out);

	std::optional<std::size_t> chooseSurvivor(const std::vector<core::DuplicateCandidate>& group) override;
	std::optional<std::string> supplyReplacementLabel(const std::string& invalidLabel) override;

private:
	std::optional<std::string> readLine();

private:
	std::istream& m_in;
	std::ostream& m_out;
};

} // namespace gps::sorter
