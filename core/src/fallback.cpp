#include <spdlog/spdlog.h>
#include <stdexcept>
#include <tabclust_core/fallback.hpp>

namespace tabclust {

  FallbackPartitioner::FallbackPartitioner(std::vector<int> cluster_counts, int min_group_size,
                                           CentroidSpec kmeans)
      : cluster_counts_(std::move(cluster_counts)),
        min_group_size_(min_group_size),
        kmeans_(kmeans) {}

  FallbackResult FallbackPartitioner::partition(const NormalizedSet& set,
                                                ClusteringSession& session) const {
    FallbackResult result;

    for (int k : cluster_counts_) {
      if (k > set.size()) {
        spdlog::warn("k-means with {} clusters skipped: only {} samples", k, set.size());
        continue;
      }

      PartitionResult partition;
      try {
        CentroidSpec spec = kmeans_;
        spec.n_clusters = k;
        partition = create_backend(spec)->partition(set.vectors);
      } catch (const std::exception& e) {
        spdlog::warn("k-means with {} clusters failed: {}", k, e.what());
        continue;
      }

      for (const auto& group : partition.groups()) {
        if (static_cast<int>(group.size()) < min_group_size_) continue;

        std::vector<std::string> member_ids;
        member_ids.reserve(group.size());
        for (Eigen::Index row : group) member_ids.push_back(set.ids[static_cast<size_t>(row)]);

        auto cluster = session.new_cluster(std::move(member_ids));
        cluster.metadata["method"] = std::string("kmeans_fallback");
        cluster.metadata["n_clusters"] = static_cast<std::int64_t>(k);
        result.clusters.push_back(std::move(cluster));
      }

      if (!result.clusters.empty()) {
        result.k = k;
        spdlog::info("Fallback clustering found {} clusters using k-means (k={})",
                     result.clusters.size(), k);
        return result;
      }
    }

    spdlog::warn("All clustering methods failed for {} samples", set.size());
    return result;
  }

}  // namespace tabclust
