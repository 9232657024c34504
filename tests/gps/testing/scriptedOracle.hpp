#pragma once

#include "gps/core/decisionOracle.hpp"
#include "gps/core/oreVocabulary.hpp"
#include "gps/core/record.hpp"
#include "gps/core/zoneTable.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace gps::gtest {

//! Decision oracle answering from canned lists. Records every question. Returns null once a list runs dry.
class ScriptedOracle : public core::DecisionOracle {
public:
	std::deque<std::size_t> choices{};      //!< Answers for chooseSurvivor(), 1-based.
	std::deque<std::string> replacements{}; //!< Answers for supplyReplacementLabel().

	std::vector<std::vector<core::DuplicateCandidate>> groups{}; //!< Every group shown to chooseSurvivor().
	std::vector<std::string> invalidLabels{};                    //!< Every label passed to supplyReplacementLabel().

	std::optional<std::size_t> chooseSurvivor(const std::vector<core::DuplicateCandidate>& group) override {
		groups.push_back(group);
		if (choices.empty()) {
			return std::nullopt;
		}
		const std::size_t choice = choices.front();
		choices.pop_front();
		return choice;
	}

	std::optional<std::string> supplyReplacementLabel(const std::string& invalidLabel) override {
		invalidLabels.push_back(invalidLabel);
		if (replacements.empty()) {
			return std::nullopt;
		}
		std::string replacement = replacements.front();
		replacements.pop_front();
		return replacement;
	}
};

//! Record at a position, optionally with a zone.
inline core::CoordinateRecord makeRecord(std::string name, double x, double y, double z, std::optional<std::string> zone = std::nullopt) {
	core::CoordinateRecord record;
	record.name     = std::move(name);
	record.position = {x, y, z};
	record.colour   = "#FF75C9F1";
	record.zone     = std::move(zone);
	return record;
}

//! Two zones sharing a center at the origin (inner "ZA" of 1000 km, outer "ZB" of 5000 km) and one far away ("ZC").
inline core::ZoneTable makeTestZones() {
	const auto zones = core::ZoneTable::create({
	        {"ZA", "Zone A", "GPS:Zone A - (R1000km):0:0:0:#FFFFFF00:"},
	        {"ZB", "Zone B", "GPS:Zone B - (R5000km):0:0:0:#FFFFFF00:"},
	        {"ZC", "Zone C", "GPS:Zone C - (R1000km):20000000:0:0:#FFFFFF00:"},
	});
	return zones.value();
}

//! U before FE, as in the shipped catalog.
inline core::OreVocabulary makeTestOres() {
	const auto ores = core::OreVocabulary::create({{"U", "Uranium"}, {"PT", "Platinum"}, {"ICE", ""}, {"SI", "Silicon"}, {"FE", "Iron"}});
	return ores.value();
}

} // namespace gps::gtest
