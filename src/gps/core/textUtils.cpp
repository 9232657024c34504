#include "textUtils.hpp"

#include <algorithm>
#include <cctype>

namespace gps::core {

static bool isSpace(char c) {
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
	while (!text.empty() && isSpace(text.front())) {
		text.remove_prefix(1);
	}
	while (!text.empty() && isSpace(text.back())) {
		text.remove_suffix(1);
	}
	return text;
}

std::vector<std::string_view> split(std::string_view text, char delimiter) {
	std::vector<std::string_view> fields;
	std::size_t begin = 0;
	for (std::size_t pos = text.find(delimiter); pos != std::string_view::npos; pos = text.find(delimiter, begin)) {
		fields.push_back(text.substr(begin, pos - begin));
		begin = pos + 1;
	}
	fields.push_back(text.substr(begin));
	return fields;
}

std::vector<std::string_view> splitWords(std::string_view text) {
	std::vector<std::string_view> words;
	std::size_t i = 0;
	while (i < text.size()) {
		while (i < text.size() && isSpace(text[i])) {
			++i;
		}
		const std::size_t begin = i;
		while (i < text.size() && !isSpace(text[i])) {
			++i;
		}
		if (i > begin) {
			words.push_back(text.substr(begin, i - begin));
		}
	}
	return words;
}

std::string toUpper(std::string_view text) {
	std::string upper(text);
	std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	return upper;
}

} // namespace gps::core
