#include "gps/core/oreVocabulary.hpp"

#include "textUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace gps::core {

static bool isValidCode(std::string_view code) {
	return !code.empty() && std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
}

std::optional<OreVocabulary> OreVocabulary::create(std::vector<OreType> types) {
	if (types.empty()) {
		std::cerr << "[Error] Ore vocabulary is empty.\n";
		return std::nullopt;
	}

	OreVocabulary vocabulary;
	vocabulary.m_types.reserve(types.size());
	for (auto& type: types) {
		if (!isValidCode(type.code)) {
			std::cerr << "[Error] Invalid ore code: '" << type.code << "'\n";
			return std::nullopt;
		}
		type.code = toUpper(type.code);
		if (vocabulary.contains(type.code)) {
			std::cerr << "[Error] Ore code listed twice: " << type.code << '\n';
			return std::nullopt;
		}
		vocabulary.m_types.push_back(std::move(type));
	}
	return vocabulary;
}

std::optional<std::size_t> OreVocabulary::priority(std::string_view code) const {
	const std::string upper = toUpper(code);
	for (std::size_t i = 0; i < m_types.size(); ++i) {
		if (m_types[i].code == upper) {
			return i;
		}
	}
	return std::nullopt;
}

} // namespace gps::core
