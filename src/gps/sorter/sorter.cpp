#include "gps/sorter/sorter.hpp"

#include "gps/core/duplicateResolver.hpp"
#include "gps/core/labelNormalizer.hpp"
#include "gps/core/outputSequencer.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace gps::sorter {

Sorter::Sorter(const core::Catalog& catalog, core::DecisionOracle& oracle, SorterOptions options)
    : m_catalog{catalog}, m_oracle{oracle}, m_options{std::move(options)} {
}

std::optional<std::vector<core::CoordinateRecord>> Sorter::readRecords(std::istream& input) const {
	std::vector<core::CoordinateRecord> records;

	std::string line;
	while (std::getline(input, line)) {
		core::ParseResult parsed = core::parseRecord(line);
		switch (parsed.status) {
		case core::ParseStatus::Skipped:
		case core::ParseStatus::Malformed:
			continue;
		case core::ParseStatus::BadNumber:
			return std::nullopt;
		case core::ParseStatus::Ok:
			break;
		}

		if (m_catalog.zones.active()) {
			const core::Zone* zone = m_catalog.zones.classify(parsed.record);
			if (!zone) {
				std::cerr << "[Error] No zone found for coordinate: " << core::toGpsLine(parsed.record) << '\n';
				return std::nullopt;
			}
			parsed.record.zone = zone->abbreviation;
		}
		records.push_back(std::move(parsed.record));
	}

	return records;
}

bool Sorter::run(std::istream& input, std::ostream& output, std::string_view date) {
	m_summary = SortSummary{};
	const core::SorterSettings& settings = m_catalog.settings;

	auto records = readRecords(input);
	if (!records) {
		return false;
	}
	m_summary.records = records->size();

	// 1) Split markers
	std::vector<core::CoordinateRecord> clusters;
	std::vector<core::CoordinateRecord> resources;
	for (auto& record: *records) {
		if (core::isClusterMarker(record, settings.clusterPrefix)) {
			clusters.push_back(std::move(record));
		} else {
			resources.push_back(std::move(record));
		}
	}

	// 2) Duplicates. Cluster markers first, they use the larger distance.
	auto uniqueClusters = core::removeDuplicates(std::move(clusters), settings.duplicateClusterDistance, m_oracle);
	if (!uniqueClusters) {
		return false;
	}
	auto uniqueResources = core::removeDuplicates(std::move(resources), settings.duplicateResourceDistance, m_oracle);
	if (!uniqueResources) {
		return false;
	}
	m_summary.duplicatesRemoved = m_summary.records - uniqueClusters->size() - uniqueResources->size();

	// 3) Names
	const core::LabelNormalizer normalizer(m_catalog.zones, m_catalog.ores);
	if (!core::normalizeLabels(*uniqueResources, normalizer, m_oracle)) {
		return false;
	}
	core::makeNamesUnique(*uniqueResources);

	// 4) Clusters
	core::AssemblyConfig assemblyConfig{settings.clusterPrefix, settings.clusterAssignmentRadius, settings.syntheticNameLength, m_options.policy};
	core::ClusterAssembler assembler = m_options.seed ? core::ClusterAssembler(std::move(assemblyConfig), *m_options.seed)
	                                                  : core::ClusterAssembler(std::move(assemblyConfig));
	const core::AssemblyResult assembly = assembler.assemble(*uniqueClusters, std::move(*uniqueResources));
	m_summary.synthesized = assembly.synthesized;
	m_summary.unassigned  = assembly.unassigned.size();

	// 5) Output. Rendered completely before anything reaches the output stream.
	core::orderClusters(*uniqueClusters, m_catalog.zones, m_catalog.ores);

	std::ostringstream text;
	core::writePreamble(text, m_catalog.ores, date);
	core::writeClusters(text, *uniqueClusters, m_catalog.zones);

	for (const auto& cluster: *uniqueClusters) {
		if (!cluster.resources.empty()) {
			++m_summary.clusters;
			m_summary.resources += cluster.resources.size();
		}
	}

	output << text.str();
	return static_cast<bool>(output);
}

std::string currentDate() {
	const std::time_t now = std::time(nullptr);
	std::tm local{};
#ifdef _WIN32
	const bool converted = localtime_s(&local, &now) == 0;
#else
	const bool converted = localtime_r(&now, &local) != nullptr;
#endif
	if (!converted) {
		std::cerr << "[Warning] Could not read the local date.\n";
		return {};
	}

	std::ostringstream date;
	date << std::put_time(&local, "%Y.%m.%d");
	return date.str();
}

} // namespace gps::sorter
