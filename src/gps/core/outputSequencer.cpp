#include "gps/core/outputSequencer.hpp"

#include "gps/core/labelNormalizer.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>

namespace gps::core {

static constexpr std::string_view IMPORT_HINT = "# You can easily add GPSs to your list by making an LCD, opening the text edit\n"
                                                "# by hitting 'F', and pasting your desired GPSs into it.  Then go into your GPS\n"
                                                "# list, and turn them on.\n";

void makeNamesUnique(std::vector<CoordinateRecord>& resources) {
	std::unordered_map<std::string, unsigned> nextSuffix;
	for (auto& resource: resources) {
		const auto it = nextSuffix.find(resource.name);
		if (it == nextSuffix.end()) {
			nextSuffix.emplace(resource.name, 2u);
			continue;
		}
		resource.name += " _" + std::to_string(it->second++);
	}
}

void orderClusters(std::vector<CoordinateRecord>& clusters, const ZoneTable& zones, const OreVocabulary& ores) {
	// Records without a known zone go last, like an index of -1.
	const auto zoneRank = [&zones](const CoordinateRecord& cluster) -> long {
		const auto index = cluster.zone ? zones.indexOf(*cluster.zone) : std::nullopt;
		return index ? static_cast<long>(*index) : -1L;
	};
	std::stable_sort(clusters.begin(), clusters.end(), [&](const CoordinateRecord& a, const CoordinateRecord& b) { return zoneRank(a) > zoneRank(b); });

	// Labels without a known leading ore go last.
	const LabelNormalizer normalizer(zones, ores);
	const auto oreRank = [&](const CoordinateRecord& resource) { return normalizer.leadingOrePriority(resource.name).value_or(ores.size()); };
	for (auto& cluster: clusters) {
		std::stable_sort(cluster.resources.begin(), cluster.resources.end(),
		                 [&](const CoordinateRecord& a, const CoordinateRecord& b) { return oreRank(a) < oreRank(b); });
	}
}

void writePreamble(std::ostream& out, const OreVocabulary& ores, std::string_view date) {
	out << "# Up-to-date as of " << date << "\n#\n";
	out << IMPORT_HINT;
	out << "#\n# Order of Precedence:\n";
	for (const auto& type: ores.types()) {
		out << "#   " << type.code;
		if (!type.description.empty()) {
			out << " (" << type.description << ')';
		}
		out << '\n';
	}
	out << '\n';
}

void writeClusters(std::ostream& out, const std::vector<CoordinateRecord>& clusters, const ZoneTable& zones) {
	const Zone* currentZone = nullptr;
	for (const auto& cluster: clusters) {
		if (cluster.resources.empty()) {
			continue;
		}

		const Zone* zone = cluster.zone ? zones.find(*cluster.zone) : nullptr;
		if (zone && zone != currentZone) {
			out << "\n# " << zone->header << ":\n\n";
			currentZone = zone;
		}

		out << toGpsLine(cluster) << '\n';
		for (const auto& resource: cluster.resources) {
			out << toGpsLine(resource) << '\n';
		}
		out << '\n';
	}
}

} // namespace gps::core
