#pragma once

#include "gps/core/record.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gps::core {

//! What happens to a resource without a cluster marker in range.
enum class AssignmentPolicy {
	SynthesizeCluster, //!< Create a new cluster marker for it and move that marker to the centroid of its resources.
	ReportUnassigned,  //!< Report it and leave it out of every cluster.
};

struct AssemblyConfig {
	std::string clusterPrefix{"Cluster"};
	std::int64_t assignmentRadius{500'000}; //!< Max distance between a resource and its cluster (m), inclusive.
	unsigned syntheticNameLength{4u};
	AssignmentPolicy policy{AssignmentPolicy::SynthesizeCluster};
};

struct AssemblyResult {
	std::size_t synthesized{0u};                //!< Number of cluster markers created.
	std::vector<CoordinateRecord> unassigned{}; //!< Resources left out (ReportUnassigned only).
};

struct NearestCluster {
	std::size_t index;
	std::int64_t distance;
};

//! Nearest cluster marker in the same zone as the resource. Ties keep the earlier cluster.
//! \returns Null if there is no cluster marker in the zone.
std::optional<NearestCluster> findNearestCluster(const CoordinateRecord& resource, const std::vector<CoordinateRecord>& clusters);

/*! Attaches every resource marker to a cluster marker.
 *  1) Every cluster marker gets a folder tag derived from its name (stored in notes).
 *  2) Each resource goes to the nearest cluster marker in its zone if that one is within the assignment radius. The resource
 *     takes over the folder tag of the cluster. Otherwise the policy decides. Synthesized markers join the cluster list at once
 *     and can collect later resources.
 *  3) Synthesized markers are moved to the centroid of their resources (rounded to 2 decimals per axis).
 */
class ClusterAssembler {
public:
	explicit ClusterAssembler(AssemblyConfig config);
	ClusterAssembler(AssemblyConfig config, std::uint64_t seed); //!< Fixed seed for reproducible names.

	AssemblyResult assemble(std::vector<CoordinateRecord>& clusters, std::vector<CoordinateRecord> resources);

private:
	CoordinateRecord synthesizeCluster(const CoordinateRecord& resource, const std::vector<CoordinateRecord>& clusters);
	std::string randomName();

private:
	AssemblyConfig m_config;
	cv::RNG m_rng;
};

} // namespace gps::core
