#include "gps/core/catalog.hpp"
#include "gps/sorter/sorter.hpp"
#include "gps/sorter/terminalOracle.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string_view>

namespace {

struct Arguments {
	std::filesystem::path catalog{PATH_CATALOG};
	std::filesystem::path input;
	std::filesystem::path output;
};

void usage() {
	std::cout << "Usage:\n";
	std::cout << "\tgpsSorter [--catalog <catalog_file>] <input_file> <output_file>\n";
}

std::optional<Arguments> parseArguments(int argc, char** argv) {
	Arguments arguments;

	int positional = 1;
	if (argc > 1 && std::string_view(argv[1]) == "--catalog") {
		if (argc < 3) {
			return std::nullopt;
		}
		arguments.catalog = argv[2];
		positional        = 3;
	}

	if (argc - positional != 2) {
		return std::nullopt;
	}
	arguments.input  = argv[positional];
	arguments.output = argv[positional + 1];
	return arguments;
}

} // namespace

// Reads a GPS list, drops duplicates, fixes the resource names and groups resources into clusters.
// Duplicates and broken names are resolved interactively on the terminal.
int main(int argc, char** argv) {
	const auto arguments = parseArguments(argc, argv);
	if (!arguments) {
		std::cerr << "Wrong number of arguments!\n";
		usage();
		return 1;
	}

	if (!std::filesystem::is_regular_file(arguments->input)) {
		std::cerr << "Input file does not exist: " << arguments->input.string() << '\n';
		usage();
		return 1;
	}

	if (std::filesystem::exists(arguments->output)) {
		std::cerr << "Output file already exists: " << arguments->output.string() << '\n';
		usage();
		return 1;
	}

	const auto catalog = gps::core::loadCatalog(arguments->catalog);
	if (!catalog) {
		std::cerr << "Could not load catalog: " << arguments->catalog.string() << '\n';
		return 1;
	}

	std::ifstream input(arguments->input);
	if (!input) {
		std::cerr << "Could not open input file: " << arguments->input.string() << '\n';
		return 1;
	}

	gps::sorter::TerminalOracle oracle(std::cin, std::cout);
	gps::sorter::Sorter sorter(*catalog, oracle);

	// The output file is only created after the whole list was processed.
	std::ostringstream sorted;
	if (!sorter.run(input, sorted, gps::sorter::currentDate())) {
		std::cerr << "[Error] Sorting failed. No output written.\n";
		return 1;
	}

	std::ofstream output(arguments->output);
	output << sorted.str();
	if (!output) {
		std::cerr << "Could not write output file: " << arguments->output.string() << '\n';
		return 1;
	}

	const auto& summary = sorter.summary();
	std::clog << summary.records << " coordinates read, " << summary.duplicatesRemoved << " duplicates removed, " << summary.clusters << " clusters ("
	          << summary.synthesized << " new) with " << summary.resources << " resources.\n";
	std::cout << "Coordinates output to " << arguments->output.string() << '\n';
	return 0;
}
