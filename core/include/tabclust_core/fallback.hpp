#pragma once
#include <optional>
#include <vector>

#include "models.hpp"
#include "normalizer.hpp"
#include "partition_backend.hpp"
#include "session.hpp"

namespace tabclust {

  struct FallbackResult {
    std::vector<Cluster> clusters;
    std::optional<int> k;  // cluster count that produced `clusters`; empty on total failure
  };

  // Partitional fallback for when density clustering finds nothing: k-means for each
  // candidate k in order, stopping at the first k that yields a group of at least
  // `min_group_size` members
  class FallbackPartitioner {
  public:
    FallbackPartitioner(std::vector<int> cluster_counts, int min_group_size, CentroidSpec kmeans);

    [[nodiscard]] FallbackResult partition(const NormalizedSet& set,
                                           ClusteringSession& session) const;

  private:
    std::vector<int> cluster_counts_;
    int min_group_size_;
    CentroidSpec kmeans_;
  };

}  // namespace tabclust
