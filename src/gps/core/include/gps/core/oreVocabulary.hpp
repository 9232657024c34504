#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gps::core {

struct OreType {
	std::string code;        //!< Label token, e.g. "PT". Upper-case letters only.
	std::string description; //!< Human readable name for the output preamble, e.g. "Platinum". May be empty.
};

//! Resource type codes in priority order. The order defines validity and the canonical sort order.
class OreVocabulary {
public:
	OreVocabulary() = default;

	//! \returns Null for an empty list, a code that is not made of letters only, or a repeated code.
	static std::optional<OreVocabulary> create(std::vector<OreType> types);

	//! Priority of a code (0 = highest). The lookup is case-insensitive.
	std::optional<std::size_t> priority(std::string_view code) const;
	bool contains(std::string_view code) const { return priority(code).has_value(); }

	const std::vector<OreType>& types() const { return m_types; }
	std::size_t size() const { return m_types.size(); }

private:
	std::vector<OreType> m_types{};
};

} // namespace gps::core
