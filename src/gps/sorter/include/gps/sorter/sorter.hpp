#pragma once

#include "gps/core/catalog.hpp"
#include "gps/core/clusterAssembler.hpp"
#include "gps/core/decisionOracle.hpp"
#include "gps/core/record.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace gps::sorter {

struct SorterOptions {
	core::AssignmentPolicy policy{core::AssignmentPolicy::SynthesizeCluster};
	std::optional<std::uint64_t> seed{}; //!< Seed for synthetic cluster names. Random if not set.
};

//! Counters of the last run. Printed as a summary by the command line tool.
struct SortSummary {
	std::size_t records{0u};           //!< Records read from the input.
	std::size_t duplicatesRemoved{0u}; //!< Cluster and resource markers dropped as duplicates.
	std::size_t clusters{0u};          //!< Cluster markers written.
	std::size_t resources{0u};         //!< Resource markers written.
	std::size_t synthesized{0u};       //!< Cluster markers created for orphan resources.
	std::size_t unassigned{0u};        //!< Resources left out (ReportUnassigned only).
};

/*! Sorts a GPS list exported from the game.
 *  Stages, in this order:
 *   - Read and parse every line, classify records into zones.
 *   - Split cluster markers from resource markers.
 *   - Remove duplicate cluster markers, then duplicate resource markers (oracle picks the survivor).
 *   - Normalize resource labels (oracle supplies replacements) and make them unique.
 *   - Attach resources to clusters.
 *   - Order and write.
 *  The catalog and the oracle must outlive the Sorter.
 */
class Sorter {
public:
	Sorter(const core::Catalog& catalog, core::DecisionOracle& oracle, SorterOptions options = SorterOptions{});

	//! Run the whole pipeline.
	//! \param [in]  input  GPS list.
	//! \param [out] output Sorted GPS list. Nothing is written if the run fails.
	//! \param [in]  date   Date printed in the output preamble.
	//! \returns     False on a fatal error (bad coordinate value, coordinate outside of all zones, oracle gone).
	bool run(std::istream& input, std::ostream& output, std::string_view date);

	//! Parse all records of a GPS list and assign their zones.
	//! \returns Null on a fatal error. Malformed lines are skipped.
	std::optional<std::vector<core::CoordinateRecord>> readRecords(std::istream& input) const;

	const SortSummary& summary() const { return m_summary; }

private:
	const core::Catalog& m_catalog;
	core::DecisionOracle& m_oracle;
	SorterOptions m_options;
	SortSummary m_summary{};
};

//! Local date as YYYY.MM.DD.
std::string currentDate();

} // namespace gps::sorter
