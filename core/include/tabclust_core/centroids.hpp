#pragma once
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "models.hpp"
#include "normalizer.hpp"
#include "session.hpp"

namespace tabclust {

  // Component-wise mean of the normalized vectors of the given members.
  // Unknown ids are ignored; std::nullopt when none resolve.
  [[nodiscard]] std::optional<std::vector<float>> centroid_of(
      std::span<const std::string> member_ids, const NormalizedSet& set);

  // Store each cluster's centroid on the cluster and in the session's centroid table
  void compute_centroids(std::vector<Cluster>& clusters, const NormalizedSet& set,
                         ClusteringSession& session);

}  // namespace tabclust
