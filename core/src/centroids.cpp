#include <spdlog/spdlog.h>
#include <tabclust_core/centroids.hpp>

namespace tabclust {

  std::optional<std::vector<float>> centroid_of(std::span<const std::string> member_ids,
                                                const NormalizedSet& set) {
    EmbeddingVector sum = EmbeddingVector::Zero(set.dim());
    int resolved = 0;
    for (const auto& id : member_ids) {
      auto it = set.rows.find(id);
      if (it == set.rows.end()) continue;
      sum += set.vectors.row(it->second).transpose();
      ++resolved;
    }
    if (resolved == 0) return std::nullopt;

    sum /= static_cast<float>(resolved);
    return std::vector<float>(sum.data(), sum.data() + sum.size());
  }

  void compute_centroids(std::vector<Cluster>& clusters, const NormalizedSet& set,
                         ClusteringSession& session) {
    for (auto& cluster : clusters) {
      auto centroid = centroid_of(cluster.member_ids, set);
      if (!centroid) {
        spdlog::warn("No resolvable members for {}, centroid skipped", cluster.id);
        continue;
      }
      session.store_centroid(cluster.id, *centroid);
      cluster.centroid = std::move(centroid);
    }
  }

}  // namespace tabclust
