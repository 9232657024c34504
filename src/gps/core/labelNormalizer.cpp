#include "gps/core/labelNormalizer.hpp"

#include "textUtils.hpp"

#include <algorithm>
#include <iostream>
#include <regex>

namespace gps::core {

namespace {

struct OreEntry {
	std::string code;
	std::optional<std::string> size;
	std::size_t priority;
};

} // namespace

LabelNormalizer::LabelNormalizer(const ZoneTable& zones, const OreVocabulary& ores) : m_zones(zones), m_ores(ores) {
}

std::optional<std::string> LabelNormalizer::normalize(std::string_view label, const std::optional<std::string>& zone) const {
	static const std::regex LABEL_PATTERN(R"(\s*(\S+)\s+(.+?)(_\d+)?)");
	static const std::regex ORE_PATTERN(R"(\s*([A-Za-z]+)(\s+([^,]+)\s*,?)?)");

	const std::string text(label);
	std::smatch labelMatch;
	if (!std::regex_match(text, labelMatch, LABEL_PATTERN)) {
		std::cerr << "[Warning] Unexpected label format: " << text << '\n';
		return std::nullopt;
	}

	const std::string token = labelMatch[1].str();
	std::string ores        = labelMatch[2].str();

	std::string canonicalToken;
	if (m_ores.contains(token)) {
		// Token left out. The first word is already an ore.
		if (!zone) {
			std::cerr << "[Warning] Missing zone in: " << text << '\n';
			return std::nullopt;
		}
		ores           = token + ' ' + ores;
		canonicalToken = *zone;
	} else if (m_zones.active() && !m_zones.contains(toUpper(token))) {
		std::cerr << "[Warning] Invalid zone: " << toUpper(token) << '\n';
		return std::nullopt;
	} else {
		canonicalToken = zone ? *zone : token;
	}

	std::vector<OreEntry> entries;
	for (auto it = std::sregex_iterator(ores.begin(), ores.end(), ORE_PATTERN); it != std::sregex_iterator(); ++it) {
		const std::smatch& oreMatch = *it;

		std::string code    = toUpper(oreMatch[1].str());
		const auto priority = m_ores.priority(code);
		if (!priority) {
			std::cerr << "[Warning] Invalid ore: " << code << '\n';
			return std::nullopt;
		}

		// A size phrase of blanks only (e.g. "SI   , ICE") is no size.
		std::optional<std::string> size;
		const std::string rawSize = oreMatch[3].str();
		if (!trim(rawSize).empty()) {
			size = std::string(trim(rawSize));
		}
		entries.push_back({std::move(code), std::move(size), *priority});
	}

	if (entries.empty()) {
		std::cerr << "[Warning] No ore found in: " << text << '\n';
		return std::nullopt;
	}

	std::stable_sort(entries.begin(), entries.end(), [](const OreEntry& a, const OreEntry& b) { return a.priority < b.priority; });

	std::string canonical = canonicalToken;
	for (std::size_t i = 0; i < entries.size(); ++i) {
		canonical += (i == 0u) ? " " : " , ";
		canonical += entries[i].code;
		if (entries[i].size) {
			canonical += ' ';
			canonical += *entries[i].size;
		}
	}
	return canonical;
}

std::optional<std::size_t> LabelNormalizer::leadingOrePriority(std::string_view canonicalLabel) const {
	const auto words = splitWords(canonicalLabel);
	if (words.size() < 2u) {
		return std::nullopt;
	}
	return m_ores.priority(words[1]);
}

bool normalizeLabels(std::vector<CoordinateRecord>& resources, const LabelNormalizer& normalizer, DecisionOracle& oracle) {
	for (auto& resource: resources) {
		std::string label = resource.name;
		auto normalized   = normalizer.normalize(label, resource.zone);
		while (!normalized) {
			auto replacement = oracle.supplyReplacementLabel(label);
			if (!replacement) {
				std::cerr << "[Error] No replacement available for label: " << label << '\n';
				return false;
			}
			label      = std::move(*replacement);
			normalized = normalizer.normalize(label, resource.zone);
		}
		resource.name = std::move(*normalized);
	}
	return true;
}

} // namespace gps::core
