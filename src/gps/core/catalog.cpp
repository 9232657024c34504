#include "gps/core/catalog.hpp"

#include <opencv2/core/persistence.hpp>

#include <iostream>
#include <limits>

namespace gps::core {

static std::string readString(const cv::FileNode& node, const std::string& fallback = {}) {
	return node.isString() ? node.string() : fallback;
}

//! Integers are read through double so values beyond int range (or written as 5e5) are accepted.
static bool readDistance(const cv::FileNode& node, const char* key, std::int64_t& value) {
	if (node.isNone()) {
		return true;
	}
	if (!node.isInt() && !node.isReal()) {
		std::cerr << "[Error] Catalog value '" << key << "' is not a number.\n";
		return false;
	}
	const double read = static_cast<double>(node);
	if (!(read >= 0.0)) {
		std::cerr << "[Error] Catalog value '" << key << "' is negative.\n";
		return false;
	}
	// 2^63 itself is out of range, the cast would be undefined.
	if (read >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
		std::cerr << "[Error] Catalog value '" << key << "' is too large.\n";
		return false;
	}
	value = static_cast<std::int64_t>(read);
	return true;
}

static std::optional<SorterSettings> readSettings(const cv::FileStorage& fs) {
	SorterSettings settings;
	settings.clusterPrefix = readString(fs["clusterPrefix"], settings.clusterPrefix);
	if (settings.clusterPrefix.empty()) {
		std::cerr << "[Error] Catalog cluster prefix is empty.\n";
		return std::nullopt;
	}

	if (!readDistance(fs["duplicateResourceDistance"], "duplicateResourceDistance", settings.duplicateResourceDistance) ||
	    !readDistance(fs["duplicateClusterDistance"], "duplicateClusterDistance", settings.duplicateClusterDistance) ||
	    !readDistance(fs["clusterAssignmentRadius"], "clusterAssignmentRadius", settings.clusterAssignmentRadius)) {
		return std::nullopt;
	}

	const cv::FileNode nameLength = fs["syntheticNameLength"];
	if (!nameLength.isNone()) {
		const int length = static_cast<int>(nameLength);
		if (length <= 0) {
			std::cerr << "[Error] Catalog value 'syntheticNameLength' must be positive.\n";
			return std::nullopt;
		}
		settings.syntheticNameLength = static_cast<unsigned>(length);
	}

	return settings;
}

std::optional<Catalog> loadCatalog(const std::filesystem::path& path) {
	try {
		cv::FileStorage fs(path.string(), cv::FileStorage::READ);
		if (!fs.isOpened()) {
			std::cerr << "[Error] Could not open catalog: " << path << '\n';
			return std::nullopt;
		}

		auto settings = readSettings(fs);
		if (!settings) {
			return std::nullopt;
		}

		std::vector<ZoneDefinition> zoneDefinitions;
		const cv::FileNode zonesNode = fs["zones"];
		if (!zonesNode.isNone() && !zonesNode.isSeq()) {
			std::cerr << "[Error] Catalog 'zones' must be a sequence.\n";
			return std::nullopt;
		}
		for (const auto& node: zonesNode) {
			zoneDefinitions.push_back({readString(node["abbr"]), readString(node["header"]), readString(node["coordinate"])});
		}

		std::vector<OreType> oreTypes;
		const cv::FileNode oresNode = fs["ores"];
		if (!oresNode.isSeq()) {
			std::cerr << "[Error] Catalog 'ores' must be a sequence.\n";
			return std::nullopt;
		}
		for (const auto& node: oresNode) {
			oreTypes.push_back({readString(node["code"]), readString(node["description"])});
		}

		auto zones = ZoneTable::create(zoneDefinitions);
		if (!zones) {
			return std::nullopt;
		}
		auto ores = OreVocabulary::create(std::move(oreTypes));
		if (!ores) {
			return std::nullopt;
		}

		return Catalog{std::move(*zones), std::move(*ores), std::move(*settings)};
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Could not parse catalog " << path << ": " << e.what() << '\n';
		return std::nullopt;
	}
}

} // namespace gps::core
