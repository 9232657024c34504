#include "gps/sorter/terminalOracle.hpp"

#include <charconv>
#include <string>
#include <string_view>

namespace gps::sorter {

static std::string_view trimmed(std::string_view text) {
	static constexpr std::string_view WHITESPACE = " \t\r\n\v\f";
	const auto begin = text.find_first_not_of(WHITESPACE);
	if (begin == std::string_view::npos) {
		return {};
	}
	const auto end = text.find_last_not_of(WHITESPACE);
	return text.substr(begin, end - begin + 1);
}

TerminalOracle::TerminalOracle(std::istream& in, std::ostream& out) : m_in{in}, m_out{out} {
}

std::optional<std::string> TerminalOracle::readLine() {
	std::string line;
	if (!std::getline(m_in, line)) {
		return std::nullopt;
	}
	return std::string(trimmed(line));
}

std::optional<std::size_t> TerminalOracle::chooseSurvivor(const std::vector<core::DuplicateCandidate>& group) {
	m_out << "Duplicate coordinates found!\n\n";
	for (std::size_t i = 0; i < group.size(); ++i) {
		m_out << '\t' << (i + 1u) << ") " << group[i].label << " (" << group[i].distance << "m)\n";
	}
	m_out << '\n';

	for (;;) {
		m_out << "Choose which coordinate to keep: " << std::flush;
		const auto response = readLine();
		if (!response) {
			return std::nullopt;
		}

		std::size_t choice{};
		const auto [end, ec] = std::from_chars(response->data(), response->data() + response->size(), choice);
		if (ec == std::errc{} && end == response->data() + response->size() && choice >= 1u && choice <= group.size()) {
			m_out << '\n';
			return choice;
		}
		m_out << "Invalid response.\n";
	}
}

std::optional<std::string> TerminalOracle::supplyReplacementLabel(const std::string& invalidLabel) {
	m_out << "Invalid name: " << invalidLabel << '\n';
	m_out << "Enter a new name: " << std::flush;
	return readLine();
}

} // namespace gps::sorter
