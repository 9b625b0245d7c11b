#pragma once
#include <string>
#include <vector>

#include "models.hpp"
#include "normalizer.hpp"
#include "partition_backend.hpp"
#include "session.hpp"

namespace tabclust {

  struct SizeLimitResult {
    std::vector<Cluster> clusters;
    std::vector<std::string> dropped_ids;  // members of undersized split fragments
    int n_splits = 0;
    int n_failed_splits = 0;
  };

  // Splits clusters larger than `max_cluster_size` with k-means,
  // k = max(2, ceil(size / max_cluster_size)). Fragments smaller than
  // `min_cluster_size` are dropped; fragments still too large are split again.
  // A cluster whose split fails (k-means error, no viable fragment, or a fragment
  // as large as the cluster itself) is kept as is.
  class SizeLimiter {
  public:
    SizeLimiter(int min_cluster_size, int max_cluster_size, CentroidSpec kmeans);

    [[nodiscard]] SizeLimitResult apply(std::vector<Cluster> clusters, const NormalizedSet& set,
                                        ClusteringSession& session) const;

  private:
    void limit(Cluster cluster, const NormalizedSet& set, ClusteringSession& session,
               SizeLimitResult& out) const;

    int min_cluster_size_;
    int max_cluster_size_;
    CentroidSpec kmeans_;
  };

}  // namespace tabclust
