#include "gps/core/clusterAssembler.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <iostream>
#include <random>

namespace gps::core {

static constexpr unsigned CENTROID_DECIMALS  = 2u;
static constexpr unsigned MAX_NAME_ATTEMPTS = 1000u; //!< Random names tried before a collision is accepted.

std::optional<NearestCluster> findNearestCluster(const CoordinateRecord& resource, const std::vector<CoordinateRecord>& clusters) {
	std::optional<NearestCluster> nearest;
	for (std::size_t i = 0; i < clusters.size(); ++i) {
		if (!sameZone(resource, clusters[i])) {
			continue;
		}
		const std::int64_t d = distance(resource, clusters[i]);
		if (!nearest || d < nearest->distance) {
			nearest = NearestCluster{i, d};
		}
	}
	return nearest;
}

//! Mean position of the resources of a cluster.
static cv::Point3d centroid(const std::vector<CoordinateRecord>& resources) {
	std::vector<double> xs, ys, zs;
	xs.reserve(resources.size());
	ys.reserve(resources.size());
	zs.reserve(resources.size());
	for (const auto& resource: resources) {
		xs.push_back(resource.position.x);
		ys.push_back(resource.position.y);
		zs.push_back(resource.position.z);
	}
	return {roundTo(mean(xs), CENTROID_DECIMALS), roundTo(mean(ys), CENTROID_DECIMALS), roundTo(mean(zs), CENTROID_DECIMALS)};
}

ClusterAssembler::ClusterAssembler(AssemblyConfig config) : ClusterAssembler(std::move(config), std::random_device{}()) {
}

ClusterAssembler::ClusterAssembler(AssemblyConfig config, std::uint64_t seed) : m_config(std::move(config)), m_rng(seed) {
}

AssemblyResult ClusterAssembler::assemble(std::vector<CoordinateRecord>& clusters, std::vector<CoordinateRecord> resources) {
	AssemblyResult result;

	for (auto& cluster: clusters) {
		cluster.notes = sanitizeFolderName(cluster.name);
	}

	std::vector<std::size_t> synthesized;
	for (auto& resource: resources) {
		const auto nearest = findNearestCluster(resource, clusters);

		std::size_t target{};
		if (nearest && nearest->distance <= m_config.assignmentRadius) {
			target = nearest->index;
		} else if (m_config.policy == AssignmentPolicy::ReportUnassigned) {
			std::cerr << "[Warning] No cluster near resource: " << toGpsLine(resource) << '\n';
			result.unassigned.push_back(std::move(resource));
			continue;
		} else {
			clusters.push_back(synthesizeCluster(resource, clusters));
			target = clusters.size() - 1u;
			synthesized.push_back(target);
		}

		resource.notes = clusters[target].notes;
		clusters[target].resources.push_back(std::move(resource));
	}

	// Membership is only complete now. Move new markers into the middle of their resources.
	for (const std::size_t index: synthesized) {
		clusters[index].position = centroid(clusters[index].resources);
	}

	result.synthesized = synthesized.size();
	return result;
}

CoordinateRecord ClusterAssembler::synthesizeCluster(const CoordinateRecord& resource, const std::vector<CoordinateRecord>& clusters) {
	const auto nameTaken = [&clusters](const std::string& name) {
		return std::any_of(clusters.begin(), clusters.end(), [&name](const CoordinateRecord& cluster) { return cluster.name == name; });
	};

	std::string name = randomName();
	for (unsigned attempt = 1u; nameTaken(name); ++attempt) {
		if (attempt == MAX_NAME_ATTEMPTS) {
			std::cerr << "[Warning] No free cluster name left, reusing: " << name << '\n';
			break;
		}
		name = randomName();
	}

	CoordinateRecord cluster;
	cluster.notes    = sanitizeFolderName(name);
	cluster.name     = std::move(name);
	cluster.position = resource.position;
	cluster.colour   = resource.colour;
	cluster.zone     = resource.zone;
	return cluster;
}

std::string ClusterAssembler::randomName() {
	std::string name = m_config.clusterPrefix + ' ';
	for (unsigned i = 0; i < m_config.syntheticNameLength; ++i) {
		name.push_back(static_cast<char>('A' + m_rng.uniform(0, 26)));
	}
	return name;
}

} // namespace gps::core
