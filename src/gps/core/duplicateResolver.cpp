#include "gps/core/duplicateResolver.hpp"

#include <algorithm>
#include <iostream>

namespace gps::core {

std::vector<DuplicateMatch> findDuplicates(std::size_t anchor, const std::vector<CoordinateRecord>& records, std::int64_t minDistance) {
	const CoordinateRecord& anchorRecord = records[anchor];

	std::vector<DuplicateMatch> group;
	for (std::size_t i = 0; i < records.size(); ++i) {
		const CoordinateRecord& candidate = records[i];
		if (i == anchor || candidate.duplicate || !sameZone(anchorRecord, candidate)) {
			continue;
		}

		const std::int64_t d = distance(anchorRecord, candidate);
		if (d < minDistance) {
			group.push_back({i, d});
		}
	}

	if (!group.empty()) {
		group.insert(group.begin(), DuplicateMatch{anchor, 0});
	}
	return group;
}

//! Ask the oracle until it returns an index inside the group.
static std::optional<std::size_t> askSurvivor(const std::vector<DuplicateMatch>& group, const std::vector<CoordinateRecord>& records, DecisionOracle& oracle) {
	std::vector<DuplicateCandidate> candidates;
	candidates.reserve(group.size());
	for (const auto& match: group) {
		candidates.push_back({records[match.index].name, match.distance});
	}

	for (;;) {
		const auto choice = oracle.chooseSurvivor(candidates);
		if (!choice) {
			return std::nullopt;
		}
		if (*choice >= 1u && *choice <= candidates.size()) {
			return *choice - 1u;
		}
		std::cerr << "[Warning] Invalid duplicate choice " << *choice << ", expected 1-" << candidates.size() << ".\n";
	}
}

bool markDuplicates(std::vector<CoordinateRecord>& records, std::int64_t minDistance, DecisionOracle& oracle) {
	for (std::size_t anchor = 0; anchor < records.size(); ++anchor) {
		if (records[anchor].duplicate) {
			continue;
		}

		const std::vector<DuplicateMatch> group = findDuplicates(anchor, records, minDistance);
		if (group.empty()) {
			continue;
		}

		const auto keep = askSurvivor(group, records, oracle);
		if (!keep) {
			std::cerr << "[Error] No duplicate choice available for " << records[anchor].name << ".\n";
			return false;
		}

		for (std::size_t i = 0; i < group.size(); ++i) {
			if (i != *keep) {
				records[group[i].index].duplicate = true;
			}
		}
	}
	return true;
}

std::optional<std::vector<CoordinateRecord>> removeDuplicates(std::vector<CoordinateRecord> records, std::int64_t minDistance, DecisionOracle& oracle) {
	if (!markDuplicates(records, minDistance, oracle)) {
		return std::nullopt;
	}

	records.erase(std::remove_if(records.begin(), records.end(), [](const CoordinateRecord& record) { return record.duplicate; }), records.end());
	return records;
}

} // namespace gps::core
